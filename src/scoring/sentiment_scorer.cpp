/// @file src/scoring/sentiment_scorer.cpp
/// @brief SentimentScorer: ratio tilt amplified by density dispersion.

#include "mktpsych/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace mktpsych {

double SentimentScorer::volatility_adjustment(const FittedDistribution& dist,
                                              const SentimentConfig& config) {
    const Eigen::ArrayXd dens =
        dist.density_grid(config.grid_min, config.grid_max, config.grid_points);
    if (dens.size() == 0) {
        return 0.0;
    }

    // Population variance of the sampled density values.
    const double variance = (dens - dens.mean()).square().mean();
    if (!std::isfinite(variance)) {
        return config.max_adjustment;
    }
    return std::clamp(variance * config.variance_scale, 0.0, config.max_adjustment);
}

double SentimentScorer::combine(const PsychologyRatios& ratios,
                                double adjustment,
                                double base_offset) noexcept {
    const double base = (ratios.buyers - ratios.sellers) * 2.0 - base_offset;

    double score = base;
    if (base > 0.0) {
        score += adjustment;
    } else if (base < 0.0) {
        score -= adjustment;
    }
    return std::clamp(score, -1.0, 1.0);
}

double SentimentScorer::score(const PsychologyRatios& ratios,
                              const FittedDistribution& dist,
                              const SentimentConfig& config) {
    return combine(ratios, volatility_adjustment(dist, config), config.base_offset);
}

}  // namespace mktpsych
