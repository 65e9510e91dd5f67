/// @file src/scoring/risk_classifier.cpp
/// @brief RiskClassifier: sentiment magnitude and ratio extremity → tier.

#include "mktpsych/scoring.hpp"

#include <cmath>

namespace mktpsych {

RiskTier RiskClassifier::classify(double sentiment,
                                  const PsychologyRatios& ratios,
                                  const RiskThresholds& t) noexcept {
    if (std::isnan(sentiment)) {
        return RiskTier::Extreme;
    }

    const double magnitude = std::abs(sentiment);
    const double extremity = ratios.max_component();

    if (magnitude < t.low_sentiment && extremity < t.low_ratio) {
        return RiskTier::Low;
    }
    if (magnitude < t.medium_sentiment && extremity < t.medium_ratio) {
        return RiskTier::Medium;
    }
    if (magnitude < t.high_sentiment) {
        return RiskTier::High;
    }
    return RiskTier::Extreme;
}

}  // namespace mktpsych
