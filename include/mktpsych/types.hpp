#pragma once

/// @file include/mktpsych/types.hpp
/// @brief Shared value types for the market psychology estimator.
///
/// All modules include this file. It defines the price input, the per-stage
/// outputs and the cacheable `AnalysisResult`.

#include <chrono>
#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mktpsych {

// ─── Market Input ─────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct PriceBar {
    double timestamp;  ///< Unix epoch seconds (or bar index)
    double open;       ///< Opening price
    double high;       ///< High price
    double low;        ///< Low price
    double close;      ///< Closing price
    double volume;     ///< Traded volume
};

/// Bars for one instrument over one period, oldest first.
/// Invariant (checked by ReturnSeriesBuilder): non-empty, timestamps strictly
/// increasing.
using PriceSeries = std::vector<PriceBar>;

/// Log returns derived from a PriceSeries. Finite values only.
using ReturnSample = std::vector<double>;

/// Kind of market an instrument trades on.
enum class MarketKind {
    Stock,
    Crypto,
};

[[nodiscard]] std::string_view to_string(MarketKind kind) noexcept;

/// Parse "stock" / "crypto" (case-insensitive).
[[nodiscard]] std::optional<MarketKind> parse_market_kind(std::string_view s) noexcept;

// ─── Stage Outputs ────────────────────────────────────────────────────────────

/// Estimated share of market participants by intent.
/// Invariant: each component in [0, 1], buyers + holders + sellers == 1.
struct PsychologyRatios {
    double buyers;
    double holders;
    double sellers;

    /// Largest of the three components.
    [[nodiscard]] double max_component() const noexcept;

    bool operator==(const PsychologyRatios&) const = default;
};

/// Ordered risk classification, lowest first.
enum class RiskTier {
    Low,
    Medium,
    High,
    Extreme,
};

[[nodiscard]] std::string_view to_string(RiskTier tier) noexcept;

/// Summary statistics of the fitted return sample.
struct DistributionStats {
    double mean;           ///< Sample mean
    double std_dev;        ///< Sample standard deviation (n − 1)
    double skewness;       ///< Biased sample skewness
    double kurtosis;       ///< Excess (Fisher) kurtosis, biased
    double peak_position;  ///< Grid point of maximum KDE density
    double percentile_5;
    double percentile_25;
    double percentile_50;
    double percentile_75;
    double percentile_95;
    std::size_t sample_size;  ///< Observations after outlier filtering
    double bandwidth;         ///< Kernel standard deviation used by the KDE

    bool operator==(const DistributionStats&) const = default;
};

/// A named shaded region of the density plot.
struct Zone {
    std::string name;
    double start;
    double end;

    bool operator==(const Zone&) const = default;
};

/// Plot coordinates of the fitted density.
struct VisualizationData {
    std::vector<double> x_values;
    std::vector<double> y_values;   ///< Same length as x_values
    double current_position;        ///< Current return, marked on the x axis
    std::vector<Zone> zones;        ///< oversold / normal / overbought

    bool operator==(const VisualizationData&) const = default;
};

// ─── Cache Key ────────────────────────────────────────────────────────────────

/// Identity of one analysis: (instrument, market kind, period).
struct AnalysisKey {
    std::string instrument;
    MarketKind  market;
    std::string period;

    auto operator<=>(const AnalysisKey&) const = default;
    bool operator==(const AnalysisKey&) const = default;

    /// "analysis:<market>:<instrument>:<period>"
    [[nodiscard]] std::string to_string() const;
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// The cacheable unit produced by AnalysisOrchestrator.
struct AnalysisResult {
    std::string       instrument;
    MarketKind        market;
    std::string       period;
    double            current_price;
    double            current_return;      ///< Most recent log return
    double            position_percentile; ///< KDE mass at or below current_return
    PsychologyRatios  ratios;
    double            sentiment;           ///< In [−1, 1]
    RiskTier          risk;
    std::string       interpretation;
    DistributionStats stats;
    VisualizationData visualization;
    double            confidence;          ///< In [0.1, 1]
    std::size_t       data_points;         ///< Bars in the analysed series
    std::chrono::system_clock::time_point created_at;

    bool operator==(const AnalysisResult&) const = default;

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

/// Reduced view of an AnalysisResult for quick lookups.
struct AnalysisSummary {
    std::string      instrument;
    double           current_price;
    PsychologyRatios ratios;
    double           sentiment;
    RiskTier         risk;
    std::string      interpretation;
    double           confidence;
    std::chrono::system_clock::time_point created_at;

    [[nodiscard]] static AnalysisSummary from(const AnalysisResult& result);
};

} // namespace mktpsych
