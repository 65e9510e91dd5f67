#pragma once

/// @file include/mktpsych/scoring.hpp
/// @brief SentimentScorer and RiskClassifier.
///
/// # Sentiment
///   base = (buyers − sellers)·2 − 0.1
///   adj  = min(0.3, 100 · Var[f(x_j)])   f sampled at 500 points on [−0.05, 0.05]
///   s    = clamp(base + sign(base)·adj, −1, 1)
/// A zero base receives no adjustment.
///
/// # Risk
/// First matching tier wins:
///   low      |s| < 0.3  and max(ratio) < 0.6
///   medium   |s| < 0.6  and max(ratio) < 0.75
///   high     |s| < 0.85
///   extreme  otherwise
/// All bounds come from `RiskThresholds`.

#include "mktpsych/config.hpp"
#include "mktpsych/distribution.hpp"
#include "mktpsych/types.hpp"

namespace mktpsych {

class SentimentScorer {
public:
    /// Signed sentiment in [−1, 1].
    [[nodiscard]] static double
    score(const PsychologyRatios& ratios,
          const FittedDistribution& dist,
          const SentimentConfig& config = SentimentConfig{});

    /// Volatility term in [0, max_adjustment].
    [[nodiscard]] static double
    volatility_adjustment(const FittedDistribution& dist,
                          const SentimentConfig& config = SentimentConfig{});

    /// Combine a ratio tilt with a volatility term; exposed for testing.
    [[nodiscard]] static double
    combine(const PsychologyRatios& ratios,
            double adjustment,
            double base_offset = constants::SENTIMENT_BASE_OFFSET) noexcept;
};

class RiskClassifier {
public:
    [[nodiscard]] static RiskTier
    classify(double sentiment,
             const PsychologyRatios& ratios,
             const RiskThresholds& thresholds = RiskThresholds{}) noexcept;
};

} // namespace mktpsych
