#pragma once

/// @file include/mktpsych/config.hpp
/// @brief Tunable parameters for every pipeline stage.
///
/// All structs are aggregates with documented defaults taken from
/// `constants.hpp`, so `AnalysisConfig{}` reproduces the reference behaviour.
/// Deployments override fields in code or through `MKTPSYCH_*` environment
/// variables (`AnalysisConfig::from_env`).

#include "mktpsych/constants.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace mktpsych {

/// Outlier filter, KDE bandwidth and percentile integration grid.
struct EstimatorConfig {
    double      outlier_sigma   = constants::OUTLIER_SIGMA;
    double      bandwidth_scale = constants::BANDWIDTH_SCALE;
    double      grid_min        = constants::PERCENTILE_GRID_MIN;
    double      grid_max        = constants::PERCENTILE_GRID_MAX;
    std::size_t grid_points     = constants::PERCENTILE_GRID_POINTS;
};

/// Percentile bands for the oversold / overbought regimes.
struct PositionConfig {
    double oversold_percentile   = constants::OVERSOLD_PERCENTILE;
    double overbought_percentile = constants::OVERBOUGHT_PERCENTILE;
};

/// Volatility adjustment of the sentiment score.
struct SentimentConfig {
    double      grid_min        = constants::SENTIMENT_GRID_MIN;
    double      grid_max        = constants::SENTIMENT_GRID_MAX;
    std::size_t grid_points     = constants::SENTIMENT_GRID_POINTS;
    double      variance_scale  = constants::DENSITY_VARIANCE_SCALE;
    double      max_adjustment  = constants::MAX_VOLATILITY_ADJUSTMENT;
    double      base_offset     = constants::SENTIMENT_BASE_OFFSET;
};

/// Risk tier boundaries. A tier applies when |sentiment| is strictly below its
/// sentiment bound and (for low/medium) the largest ratio is strictly below its
/// ratio bound; the first matching tier wins, `extreme` otherwise.
struct RiskThresholds {
    double low_sentiment    = 0.3;
    double low_ratio        = 0.6;
    double medium_sentiment = 0.6;
    double medium_ratio     = 0.75;
    double high_sentiment   = 0.85;
};

struct CacheConfig {
    std::chrono::seconds ttl{constants::DEFAULT_CACHE_TTL_SECONDS};

    /// LRU bound on stored results. 0 = unbounded.
    std::size_t max_entries = 0;

    /// How long a caller waits on another caller's in-flight computation.
    /// `nullopt` waits indefinitely.
    std::optional<std::chrono::milliseconds> wait_timeout{};
};

struct LoggingConfig {
    /// trace | debug | info | warn | error | off
    std::string level = "info";
};

/// Top-level configuration for AnalysisOrchestrator and its cache.
struct AnalysisConfig {
    std::size_t     min_returns          = constants::MIN_RETURN_SAMPLES;
    std::size_t     visualization_points = constants::VISUALIZATION_POINTS;
    EstimatorConfig estimator{};
    PositionConfig  position{};
    SentimentConfig sentiment{};
    RiskThresholds  risk{};
    CacheConfig     cache{};
    LoggingConfig   logging{};

    /// Defaults overridden by any of:
    ///   MKTPSYCH_CACHE_TTL          seconds
    ///   MKTPSYCH_CACHE_MAX_ENTRIES  count
    ///   MKTPSYCH_CACHE_WAIT_MS      milliseconds
    ///   MKTPSYCH_MIN_RETURNS        count
    ///   MKTPSYCH_LOG_LEVEL          level name
    ///   MKTPSYCH_BANDWIDTH_SCALE    factor
    ///   MKTPSYCH_GRID_MIN / MKTPSYCH_GRID_MAX  return bounds
    /// Unparseable values are ignored with a warning.
    [[nodiscard]] static AnalysisConfig from_env();

    /// Returns a description of the first inconsistent field, or `nullopt`
    /// when the configuration is usable.
    [[nodiscard]] std::optional<std::string> validate() const;
};

} // namespace mktpsych
