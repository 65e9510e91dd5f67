#pragma once

/// @file include/mktpsych/engine.hpp
/// @brief AnalysisOrchestrator: public entry point of the library.
///
/// # Module: Analysis Orchestrator
///
/// ## Pipeline
///   Fetching     DataCollector::fetch
///   Building     ReturnSeriesBuilder::build
///   Estimating   DistributionEstimator::fit
///   Mapping      PositionMapper::map
///   Scoring      SentimentScorer::score
///   Classifying  RiskClassifier::classify
///   Interpreting InterpretationGenerator::generate
///   Cached       AnalysisCache stores the finished result
///
/// Any stage may throw an `AnalysisError`; the request stops there and nothing
/// is cached. Non-`AnalysisError` exceptions are wrapped in
/// `InternalAnalysisError` naming the stage.
///
/// ## Usage
/// ```cpp
/// auto cache = std::make_shared<AnalysisCache>(config.cache);
/// auto source = std::make_shared<CsvDataCollector>("data");
/// AnalysisOrchestrator engine(source, cache, config);
/// auto result = engine.analyze("AAPL", MarketKind::Stock, "3mo");
/// fmt::print("{}\n", result.to_string());
/// ```
///
/// ## Guarantees
/// - Stateless between requests; all shared state lives in the cache
/// - `analyze` is idempotent within the cache TTL
/// - Safe to call concurrently from any number of threads

#include "mktpsych/cache.hpp"
#include "mktpsych/collector.hpp"
#include "mktpsych/config.hpp"
#include "mktpsych/distribution.hpp"
#include "mktpsych/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mktpsych {

enum class PipelineStage {
    Fetching,
    Building,
    Estimating,
    Mapping,
    Scoring,
    Classifying,
    Interpreting,
    Cached,
};

[[nodiscard]] std::string_view to_string(PipelineStage stage) noexcept;

class AnalysisOrchestrator {
public:
    /// # Arguments
    /// * `collector`: market data source (required)
    /// * `cache`: shared result cache (required)
    /// * `config`: stage parameters; `config.cache` and `config.logging` are
    ///   ignored here. The cache was configured when it was constructed and
    ///   the log level belongs to the process (see `log::set_level`).
    ///
    /// # Throws
    /// `std::invalid_argument` if a pointer is null or `config.validate()`
    /// reports a problem.
    AnalysisOrchestrator(std::shared_ptr<DataCollector> collector,
                         std::shared_ptr<AnalysisCache> cache,
                         AnalysisConfig config = AnalysisConfig{});

    /// Full analysis, served from the cache within the TTL.
    ///
    /// # Throws
    /// An `AnalysisError` subclass; see errors.hpp.
    [[nodiscard]] AnalysisResult
    analyze(const std::string& instrument, MarketKind market, const std::string& period);

    /// Same as `analyze`, reduced to the headline fields.
    [[nodiscard]] AnalysisSummary
    analyze_summary(const std::string& instrument, MarketKind market, const std::string& period);

    /// Run the Building → Interpreting stages on a caller-supplied series.
    /// Does not touch the collector or the cache.
    [[nodiscard]] AnalysisResult
    evaluate(std::span<const PriceBar> series, const AnalysisKey& key) const;

    /// Drop cached results for an instrument and/or market (both empty = all).
    std::size_t invalidate(std::optional<std::string_view> instrument,
                           std::optional<MarketKind> market);

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

    /// Reliability of an analysis in [0.1, 1]:
    ///   0.4·min(1, n/100) + 0.3·max(0.1, 1 − |kurtosis|/10)
    ///                     + 0.3·max(0.1, 1 − min(1, 20σ))
    [[nodiscard]] static double
    confidence(std::size_t n_returns, const DistributionStats& stats) noexcept;

    /// Density curve over mean ± 3σ with oversold / normal / overbought zones
    /// split at mean ± 2σ.
    [[nodiscard]] static VisualizationData
    visualize(const FittedDistribution& dist, double current, std::size_t points);

private:
    /// Fetch + evaluate, run under the cache's single-flight guard.
    [[nodiscard]] AnalysisResult run_pipeline(const AnalysisKey& key) const;

    std::shared_ptr<DataCollector> collector_;
    std::shared_ptr<AnalysisCache> cache_;
    AnalysisConfig                 config_;
};

} // namespace mktpsych
