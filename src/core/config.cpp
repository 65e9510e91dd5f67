/// @file src/core/config.cpp
/// @brief Environment overrides and validation for AnalysisConfig.

#include "mktpsych/config.hpp"
#include "mktpsych/log.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <string>

namespace mktpsych {

namespace {

/// Parse a whole string as a double; `nullopt` on trailing garbage or non-finite.
std::optional<double> parse_double(const std::string& s) noexcept {
    if (s.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Parse a whole string as a non-negative integer.
std::optional<long long> parse_count(const std::string& s) noexcept {
    if (s.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(s, &pos);
        if (pos != s.size() || v < 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr) return std::nullopt;
    return std::string(v);
}

void ignored(const char* name, const std::string& value) {
    log::logger()->warn("ignoring {}='{}': not a valid value", name, value);
}

}  // namespace

// ─── AnalysisConfig::from_env ─────────────────────────────────────────────────

AnalysisConfig AnalysisConfig::from_env() {
    AnalysisConfig cfg;

    if (auto v = env("MKTPSYCH_CACHE_TTL")) {
        if (auto n = parse_count(*v)) cfg.cache.ttl = std::chrono::seconds{*n};
        else ignored("MKTPSYCH_CACHE_TTL", *v);
    }
    if (auto v = env("MKTPSYCH_CACHE_MAX_ENTRIES")) {
        if (auto n = parse_count(*v)) cfg.cache.max_entries = static_cast<std::size_t>(*n);
        else ignored("MKTPSYCH_CACHE_MAX_ENTRIES", *v);
    }
    if (auto v = env("MKTPSYCH_CACHE_WAIT_MS")) {
        if (auto n = parse_count(*v)) cfg.cache.wait_timeout = std::chrono::milliseconds{*n};
        else ignored("MKTPSYCH_CACHE_WAIT_MS", *v);
    }
    if (auto v = env("MKTPSYCH_MIN_RETURNS")) {
        if (auto n = parse_count(*v)) cfg.min_returns = static_cast<std::size_t>(*n);
        else ignored("MKTPSYCH_MIN_RETURNS", *v);
    }
    if (auto v = env("MKTPSYCH_LOG_LEVEL")) {
        if (log::parse_level(*v)) cfg.logging.level = *v;
        else ignored("MKTPSYCH_LOG_LEVEL", *v);
    }
    if (auto v = env("MKTPSYCH_BANDWIDTH_SCALE")) {
        if (auto d = parse_double(*v)) cfg.estimator.bandwidth_scale = *d;
        else ignored("MKTPSYCH_BANDWIDTH_SCALE", *v);
    }
    if (auto v = env("MKTPSYCH_GRID_MIN")) {
        if (auto d = parse_double(*v)) cfg.estimator.grid_min = *d;
        else ignored("MKTPSYCH_GRID_MIN", *v);
    }
    if (auto v = env("MKTPSYCH_GRID_MAX")) {
        if (auto d = parse_double(*v)) cfg.estimator.grid_max = *d;
        else ignored("MKTPSYCH_GRID_MAX", *v);
    }

    return cfg;
}

// ─── AnalysisConfig::validate ─────────────────────────────────────────────────

std::optional<std::string> AnalysisConfig::validate() const {
    if (min_returns < 2) {
        return fmt::format("min_returns must be at least 2 (got {})", min_returns);
    }
    if (visualization_points < 2) {
        return fmt::format("visualization_points must be at least 2 (got {})",
                           visualization_points);
    }

    if (!(estimator.outlier_sigma > 0.0)) {
        return "estimator.outlier_sigma must be positive";
    }
    if (!(estimator.bandwidth_scale > 0.0)) {
        return "estimator.bandwidth_scale must be positive";
    }
    if (!(estimator.grid_min < estimator.grid_max)) {
        return fmt::format("estimator grid [{}, {}] is empty",
                           estimator.grid_min, estimator.grid_max);
    }
    if (estimator.grid_points < 2) {
        return "estimator.grid_points must be at least 2";
    }

    if (!(0.0 < position.oversold_percentile &&
          position.oversold_percentile < 0.5 &&
          0.5 < position.overbought_percentile &&
          position.overbought_percentile < 1.0)) {
        return fmt::format("position bands ({}, {}) must satisfy 0 < low < 0.5 < high < 1",
                           position.oversold_percentile, position.overbought_percentile);
    }

    if (!(sentiment.grid_min < sentiment.grid_max) || sentiment.grid_points < 2) {
        return "sentiment grid must have grid_min < grid_max and at least 2 points";
    }
    if (sentiment.variance_scale < 0.0 || sentiment.max_adjustment < 0.0) {
        return "sentiment variance_scale and max_adjustment must be non-negative";
    }

    if (!(risk.low_sentiment <= risk.medium_sentiment &&
          risk.medium_sentiment <= risk.high_sentiment)) {
        return "risk sentiment thresholds must be non-decreasing (low <= medium <= high)";
    }
    if (!(risk.low_ratio <= risk.medium_ratio)) {
        return "risk ratio thresholds must be non-decreasing (low <= medium)";
    }

    if (cache.ttl.count() <= 0) {
        return "cache.ttl must be positive";
    }
    if (!log::parse_level(logging.level)) {
        return fmt::format("unknown log level '{}'", logging.level);
    }
    return std::nullopt;
}

}  // namespace mktpsych
