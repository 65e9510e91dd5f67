/// @file src/position/position_mapper.cpp
/// @brief PositionMapper: three-band percentile → ratio rule.

#include "mktpsych/position.hpp"
#include "mktpsych/constants.hpp"

#include <algorithm>

namespace mktpsych {

PsychologyRatios
PositionMapper::clamp_and_normalize(double buyers, double holders, double sellers) noexcept {
    buyers  = std::clamp(buyers,  0.0, constants::MAX_BUYERS);
    holders = std::clamp(holders, 0.0, constants::MAX_HOLDERS);
    sellers = std::clamp(sellers, 0.0, constants::MAX_SELLERS);

    const double total = buyers + holders + sellers;
    if (total <= 0.0) {
        // Unreachable for percentiles in [0, 1]; keep the invariant anyway.
        return PsychologyRatios{.buyers = 1.0 / 3.0, .holders = 1.0 / 3.0, .sellers = 1.0 / 3.0};
    }

    buyers  /= total;
    sellers /= total;
    // Absorb rounding drift in the remaining component so the sum is exact.
    holders = std::max(0.0, 1.0 - buyers - sellers);

    return PsychologyRatios{.buyers = buyers, .holders = holders, .sellers = sellers};
}

PsychologyRatios
PositionMapper::ratios_for_percentile(double p, const PositionConfig& config) noexcept {
    p = std::clamp(p, 0.0, 1.0);

    double buyers  = 0.0;
    double sellers = 0.0;

    if (p < config.oversold_percentile) {
        // Oversold: below −1σ.
        buyers  = 0.70 + (config.oversold_percentile - p) * 0.5;
        sellers = 0.10;
    } else if (p > config.overbought_percentile) {
        // Overbought: above +1σ.
        sellers = 0.60 + (p - config.overbought_percentile) * 0.8;
        buyers  = 0.15;
    } else {
        buyers  = 0.40 + (0.5 - p) * 0.6;
        sellers = 0.20 + (p - 0.5) * 0.6;
    }

    const double holders = 1.0 - buyers - sellers;
    return clamp_and_normalize(buyers, holders, sellers);
}

Position PositionMapper::map(const FittedDistribution& dist,
                             double current,
                             const PositionConfig& config) noexcept {
    const double p = dist.percentile(current);
    return Position{
        .percentile = p,
        .ratios     = ratios_for_percentile(p, config),
    };
}

}  // namespace mktpsych
