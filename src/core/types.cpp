/// @file src/core/types.cpp
/// @brief String conversions and report formatting for the shared types.

#include "mktpsych/types.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <string>

namespace mktpsych {

// ─── MarketKind ───────────────────────────────────────────────────────────────

std::string_view to_string(MarketKind kind) noexcept {
    switch (kind) {
        case MarketKind::Stock:  return "stock";
        case MarketKind::Crypto: return "crypto";
    }
    return "unknown";
}

std::optional<MarketKind> parse_market_kind(std::string_view s) noexcept {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "stock")  return MarketKind::Stock;
    if (lower == "crypto") return MarketKind::Crypto;
    return std::nullopt;
}

// ─── RiskTier ─────────────────────────────────────────────────────────────────

std::string_view to_string(RiskTier tier) noexcept {
    switch (tier) {
        case RiskTier::Low:     return "low";
        case RiskTier::Medium:  return "medium";
        case RiskTier::High:    return "high";
        case RiskTier::Extreme: return "extreme";
    }
    return "unknown";
}

// ─── PsychologyRatios ─────────────────────────────────────────────────────────

double PsychologyRatios::max_component() const noexcept {
    return std::max({buyers, holders, sellers});
}

// ─── AnalysisKey ──────────────────────────────────────────────────────────────

std::string AnalysisKey::to_string() const {
    return fmt::format("analysis:{}:{}:{}",
                       mktpsych::to_string(market), instrument, period);
}

// ─── AnalysisResult ───────────────────────────────────────────────────────────

std::string AnalysisResult::to_string() const {
    const std::time_t t = std::chrono::system_clock::to_time_t(created_at);

    std::string out = fmt::format(
        "{} ({}, {})  price={:.4f}  analysed {:%Y-%m-%dT%H:%M:%SZ}\n",
        instrument, mktpsych::to_string(market), period, current_price,
        fmt::gmtime(t));

    out += fmt::format(
        "  position   return={:+.5f}  percentile={:.3f}  bars={}\n",
        current_return, position_percentile, data_points);

    out += fmt::format(
        "  crowd      buyers={:5.1f}%  holders={:5.1f}%  sellers={:5.1f}%\n",
        ratios.buyers * 100.0, ratios.holders * 100.0, ratios.sellers * 100.0);

    out += fmt::format(
        "  sentiment  {:+.3f}   risk={}   confidence={:.2f}\n",
        sentiment, mktpsych::to_string(risk), confidence);

    out += fmt::format(
        "  returns    mean={:+.5f}  std={:.5f}  skew={:+.3f}  kurt={:+.3f}  peak={:+.5f}\n",
        stats.mean, stats.std_dev, stats.skewness, stats.kurtosis, stats.peak_position);

    out += fmt::format(
        "  quantiles  p5={:+.5f}  p25={:+.5f}  p50={:+.5f}  p75={:+.5f}  p95={:+.5f}\n",
        stats.percentile_5, stats.percentile_25, stats.percentile_50,
        stats.percentile_75, stats.percentile_95);

    out += fmt::format("  {}", interpretation);
    return out;
}

// ─── AnalysisSummary ──────────────────────────────────────────────────────────

AnalysisSummary AnalysisSummary::from(const AnalysisResult& result) {
    return AnalysisSummary{
        .instrument     = result.instrument,
        .current_price  = result.current_price,
        .ratios         = result.ratios,
        .sentiment      = result.sentiment,
        .risk           = result.risk,
        .interpretation = result.interpretation,
        .confidence     = result.confidence,
        .created_at     = result.created_at,
    };
}

}  // namespace mktpsych
