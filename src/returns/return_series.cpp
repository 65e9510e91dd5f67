/// @file src/returns/return_series.cpp
/// @brief ReturnSeriesBuilder: close-to-close log returns.

#include "mktpsych/returns.hpp"
#include "mktpsych/errors.hpp"

#include <cmath>

namespace mktpsych {

namespace {

[[nodiscard]] bool usable_close(double c) noexcept {
    return std::isfinite(c) && c > 0.0;
}

}  // namespace

// ─── is_chronological ─────────────────────────────────────────────────────────

bool ReturnSeriesBuilder::is_chronological(std::span<const PriceBar> series) noexcept {
    for (std::size_t i = 1; i < series.size(); ++i) {
        if (!(series[i].timestamp > series[i - 1].timestamp)) {
            return false;
        }
    }
    return true;
}

// ─── log_returns ──────────────────────────────────────────────────────────────

ReturnSample ReturnSeriesBuilder::log_returns(std::span<const PriceBar> series) noexcept {
    ReturnSample out;
    if (series.size() < 2) {
        return out;
    }
    out.reserve(series.size() - 1);

    for (std::size_t i = 1; i < series.size(); ++i) {
        const double prev = series[i - 1].close;
        const double curr = series[i].close;
        if (!usable_close(prev) || !usable_close(curr)) {
            continue;
        }
        const double r = std::log(curr / prev);
        if (std::isfinite(r)) {
            out.push_back(r);
        }
    }
    return out;
}

// ─── build ────────────────────────────────────────────────────────────────────

ReturnSeries ReturnSeriesBuilder::build(std::span<const PriceBar> series,
                                        std::size_t min_returns) {
    if (series.empty()) {
        throw DataUnavailableError("price series is empty");
    }
    if (!is_chronological(series)) {
        throw DataUnavailableError("price series timestamps are not strictly increasing");
    }

    ReturnSample returns = log_returns(series);
    if (returns.size() < min_returns || returns.empty()) {
        throw InsufficientDataError(returns.size(), min_returns);
    }

    // The anchor price is the last bar with a usable close.
    double current_price = 0.0;
    for (auto it = series.rbegin(); it != series.rend(); ++it) {
        if (usable_close(it->close)) {
            current_price = it->close;
            break;
        }
    }

    const double current_return = returns.back();
    return ReturnSeries{
        .returns        = std::move(returns),
        .current_return = current_return,
        .current_price  = current_price,
    };
}

}  // namespace mktpsych
