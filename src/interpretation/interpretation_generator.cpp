/// @file src/interpretation/interpretation_generator.cpp
/// @brief Sentence templates for the analysis report.

#include "mktpsych/interpretation.hpp"

#include <exception>

namespace mktpsych {

std::string_view InterpretationGenerator::crowd_sentence(const PsychologyRatios& r) noexcept {
    if (r.buyers > 0.6) {
        return "Buying interest dominates the crowd.";
    }
    if (r.sellers > 0.5) {
        return "Selling pressure is elevated.";
    }
    return "Most participants are holding and waiting for direction.";
}

std::string_view InterpretationGenerator::sentiment_sentence(double sentiment) noexcept {
    if (sentiment > 0.5) {
        return "Greed is running high; watch for overheating.";
    }
    if (sentiment < -0.5) {
        return "Fear is running high; the move may be overdone.";
    }
    return "Sentiment is broadly balanced.";
}

std::string_view InterpretationGenerator::risk_sentence(RiskTier tier) noexcept {
    switch (tier) {
        case RiskTier::Low:
            return "Risk is low and conditions look stable.";
        case RiskTier::Medium:
            return "Risk is moderate; a measured approach is advisable.";
        case RiskTier::High:
            return "Risk is high; caution is warranted.";
        case RiskTier::Extreme:
            return "Risk is extreme; exercise great caution.";
    }
    return "Review the risk assessment.";
}

std::string_view
InterpretationGenerator::position_sentence(double current,
                                           double lower_quartile,
                                           double upper_quartile) noexcept {
    if (current > upper_quartile) {
        return "The latest move is in the top quarter of recent returns, near a local high.";
    }
    if (current < lower_quartile) {
        return "The latest move is in the bottom quarter of recent returns, near a local low.";
    }
    return "The latest move is within the normal range of recent returns.";
}

std::string InterpretationGenerator::generate(const InterpretationInput& in) noexcept {
    if (!in.ratios || !in.sentiment || !in.risk ||
        !in.current_return || !in.lower_quartile || !in.upper_quartile) {
        return std::string(INSUFFICIENT_SIGNAL);
    }

    try {
        std::string out;
        out.reserve(256);
        out += crowd_sentence(*in.ratios);
        out += ' ';
        out += sentiment_sentence(*in.sentiment);
        out += ' ';
        out += risk_sentence(*in.risk);
        out += ' ';
        out += position_sentence(*in.current_return, *in.lower_quartile, *in.upper_quartile);
        return out;
    } catch (const std::exception&) {
        return std::string(INSUFFICIENT_SIGNAL);
    }
}

}  // namespace mktpsych
