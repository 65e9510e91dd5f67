#pragma once

/// @file include/mktpsych/returns.hpp
/// @brief ReturnSeriesBuilder: price bars to a cleaned log-return sample.
///
/// # Module: Return Series
///
/// ## Formula
///   r_t = ln(close_t / close_{t−1})      for t = 1 … N−1
///
/// ## Edge Cases
/// - Empty series or non-increasing timestamps → DataUnavailableError
///   (the collector broke the PriceSeries contract)
/// - A pair with a non-finite or non-positive close yields no return
/// - Fewer than `min_returns` valid returns → InsufficientDataError
///
/// ## Guarantees
/// - Pure: no state, no side effects
/// - Output contains only finite values

#include "mktpsych/constants.hpp"
#include "mktpsych/types.hpp"

#include <cstddef>
#include <span>

namespace mktpsych {

/// Log returns plus the observation the analysis is anchored on.
struct ReturnSeries {
    ReturnSample returns;         ///< Chronological, finite
    double       current_return;  ///< returns.back()
    double       current_price;   ///< Close of the last valid bar
};

class ReturnSeriesBuilder {
public:
    /// Build the return series.
    ///
    /// # Throws
    /// - `DataUnavailableError` for an empty or mis-ordered series
    /// - `InsufficientDataError` if fewer than `min_returns` returns remain
    [[nodiscard]] static ReturnSeries
    build(std::span<const PriceBar> series,
          std::size_t min_returns = constants::MIN_RETURN_SAMPLES);

    /// Log returns only, no minimum enforced. Never throws.
    [[nodiscard]] static ReturnSample
    log_returns(std::span<const PriceBar> series) noexcept;

    /// True if timestamps are strictly increasing (vacuously true for < 2 bars).
    [[nodiscard]] static bool
    is_chronological(std::span<const PriceBar> series) noexcept;
};

} // namespace mktpsych
