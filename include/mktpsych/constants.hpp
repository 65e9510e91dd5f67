#pragma once

#include <cstddef>

/// @file include/mktpsych/constants.hpp
/// @brief Numerical and model constants for the market psychology estimator.
///
/// Every value here is the default for a field in `config.hpp`; code reads the
/// config, not these constants directly, except where noted.

namespace mktpsych::constants {

// ─── Return Series ────────────────────────────────────────────────────────────

/// Minimum number of valid log returns for density estimation.
/// Below this, the KDE is too noisy to place the current observation.
static constexpr std::size_t MIN_RETURN_SAMPLES = 10;

// ─── Density Estimation ───────────────────────────────────────────────────────

/// Outlier cut: samples with |r − mean| > k·σ are dropped (one pass).
static constexpr double OUTLIER_SIGMA = 3.0;

/// Multiplier applied to Scott's rule-of-thumb bandwidth factor.
static constexpr double BANDWIDTH_SCALE = 0.8;

/// Percentile integration grid: returns outside are clamped to the edges.
static constexpr double PERCENTILE_GRID_MIN    = -0.10;
static constexpr double PERCENTILE_GRID_MAX    =  0.10;
static constexpr std::size_t PERCENTILE_GRID_POINTS = 1000;

/// Below this integrated grid mass the percentile falls back to the closed-form
/// kernel CDF (sample lies almost entirely outside the grid).
static constexpr double MIN_GRID_MASS = 1e-9;

/// Variance threshold under which a sample is considered flat.
static constexpr double MIN_SAMPLE_VARIANCE = 1e-18;

// ─── Position Mapping ─────────────────────────────────────────────────────────

/// Percentile of −1σ / +1σ under a standard normal.
static constexpr double OVERSOLD_PERCENTILE   = 0.16;
static constexpr double OVERBOUGHT_PERCENTILE = 0.84;

/// Upper clamp per ratio component.
static constexpr double MAX_BUYERS  = 0.9;
static constexpr double MAX_HOLDERS = 0.8;
static constexpr double MAX_SELLERS = 0.9;

// ─── Sentiment ────────────────────────────────────────────────────────────────

static constexpr double SENTIMENT_GRID_MIN    = -0.05;
static constexpr double SENTIMENT_GRID_MAX    =  0.05;
static constexpr std::size_t SENTIMENT_GRID_POINTS = 500;
static constexpr double DENSITY_VARIANCE_SCALE = 100.0;
static constexpr double MAX_VOLATILITY_ADJUSTMENT = 0.3;
static constexpr double SENTIMENT_BASE_OFFSET = 0.1;

// ─── Caching ──────────────────────────────────────────────────────────────────

/// Result time-to-live in seconds (15 minutes).
static constexpr long long DEFAULT_CACHE_TTL_SECONDS = 900;

// ─── Presentation ─────────────────────────────────────────────────────────────

/// Number of (x, y) samples of the density curve kept for plotting.
static constexpr std::size_t VISUALIZATION_POINTS = 100;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace mktpsych::constants
