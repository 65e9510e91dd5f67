#pragma once

/// @file include/mktpsych/position.hpp
/// @brief PositionMapper: where the current return sits, as buyer / holder /
///        seller shares.
///
/// # Module: Position Mapping
///
/// ## Bands (p = percentile of the current return under the fitted KDE)
///   p < 0.16   oversold:    buyers  = 0.70 + (0.16 − p)·0.5, sellers = 0.10
///   p > 0.84   overbought:  sellers = 0.60 + (p − 0.84)·0.8, buyers  = 0.15
///   otherwise  normal:      buyers  = 0.40 + (0.5 − p)·0.6,
///                           sellers = 0.20 + (p − 0.5)·0.6
///   holders = 1 − buyers − sellers in every band.
///
/// The band edges are the ±1σ points of a standard normal applied to the
/// fitted distribution's percentile; comparisons are strict, so p = 0.16 and
/// p = 0.84 fall in the normal band.
///
/// ## Post-processing
/// buyers ∈ [0, 0.9], holders ∈ [0, 0.8], sellers ∈ [0, 0.9], then the triple
/// is renormalized to sum to exactly 1.

#include "mktpsych/config.hpp"
#include "mktpsych/distribution.hpp"
#include "mktpsych/types.hpp"

namespace mktpsych {

/// Percentile of the current return plus the ratios derived from it.
struct Position {
    double           percentile;
    PsychologyRatios ratios;
};

class PositionMapper {
public:
    /// Locate `current` in `dist` and map it to ratios.
    [[nodiscard]] static Position
    map(const FittedDistribution& dist,
        double current,
        const PositionConfig& config = PositionConfig{}) noexcept;

    /// Ratios for a given percentile p ∈ [0, 1].
    [[nodiscard]] static PsychologyRatios
    ratios_for_percentile(double p,
                          const PositionConfig& config = PositionConfig{}) noexcept;

    /// Clamp each component to its bound and rescale to sum 1.
    [[nodiscard]] static PsychologyRatios
    clamp_and_normalize(double buyers, double holders, double sellers) noexcept;
};

} // namespace mktpsych
