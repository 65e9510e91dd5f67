#pragma once

/// @file include/mktpsych/interpretation.hpp
/// @brief InterpretationGenerator: fixed sentence templates keyed on the
///        analysis outputs.
///
/// Four sentences, in order: crowd intent, sentiment, risk, position within the
/// return distribution. No numbers are computed here. If any input is missing
/// the generator returns `INSUFFICIENT_SIGNAL` instead.

#include "mktpsych/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mktpsych {

/// Inputs to the generator. Every field is optional so partially built
/// analyses can still be described.
struct InterpretationInput {
    std::optional<PsychologyRatios> ratios;
    std::optional<double>           sentiment;
    std::optional<RiskTier>         risk;
    std::optional<double>           current_return;
    std::optional<double>           lower_quartile;  ///< 25th percentile of returns
    std::optional<double>           upper_quartile;  ///< 75th percentile of returns
};

class InterpretationGenerator {
public:
    static constexpr std::string_view INSUFFICIENT_SIGNAL =
        "Insufficient signal to interpret the current market psychology.";

    /// Never throws.
    [[nodiscard]] static std::string generate(const InterpretationInput& in) noexcept;

    [[nodiscard]] static std::string_view crowd_sentence(const PsychologyRatios& r) noexcept;
    [[nodiscard]] static std::string_view sentiment_sentence(double sentiment) noexcept;
    [[nodiscard]] static std::string_view risk_sentence(RiskTier tier) noexcept;
    [[nodiscard]] static std::string_view
    position_sentence(double current, double lower_quartile, double upper_quartile) noexcept;
};

} // namespace mktpsych
