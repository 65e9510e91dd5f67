/// @file src/core/engine.cpp
/// @brief AnalysisOrchestrator: fetch, estimate, score and cache one analysis.

#include "mktpsych/engine.hpp"
#include "mktpsych/errors.hpp"
#include "mktpsych/interpretation.hpp"
#include "mktpsych/log.hpp"
#include "mktpsych/position.hpp"
#include "mktpsych/returns.hpp"
#include "mktpsych/scoring.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace mktpsych {

std::string_view to_string(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Fetching:     return "fetching";
        case PipelineStage::Building:     return "building";
        case PipelineStage::Estimating:   return "estimating";
        case PipelineStage::Mapping:      return "mapping";
        case PipelineStage::Scoring:      return "scoring";
        case PipelineStage::Classifying:  return "classifying";
        case PipelineStage::Interpreting: return "interpreting";
        case PipelineStage::Cached:       return "cached";
    }
    return "unknown";
}

// ─── Constructor ──────────────────────────────────────────────────────────────

AnalysisOrchestrator::AnalysisOrchestrator(std::shared_ptr<DataCollector> collector,
                                           std::shared_ptr<AnalysisCache> cache,
                                           AnalysisConfig config)
    : collector_(std::move(collector))
    , cache_(std::move(cache))
    , config_(std::move(config))
{
    if (!collector_) {
        throw std::invalid_argument("AnalysisOrchestrator: collector is null");
    }
    if (!cache_) {
        throw std::invalid_argument("AnalysisOrchestrator: cache is null");
    }
    if (auto problem = config_.validate()) {
        throw std::invalid_argument("AnalysisOrchestrator: " + *problem);
    }
}

// ─── Public entry points ──────────────────────────────────────────────────────

AnalysisResult AnalysisOrchestrator::analyze(const std::string& instrument,
                                             MarketKind market,
                                             const std::string& period) {
    const AnalysisKey key{.instrument = instrument, .market = market, .period = period};
    const auto start = std::chrono::steady_clock::now();

    AnalysisResult result = cache_->get_or_compute(key, [this, &key] {
        return run_pipeline(key);
    });

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log::logger()->info("analyze {} -> {} sentiment={:+.3f} ({} ms)",
                        key.to_string(), to_string(result.risk),
                        result.sentiment, elapsed.count());
    return result;
}

AnalysisSummary AnalysisOrchestrator::analyze_summary(const std::string& instrument,
                                                      MarketKind market,
                                                      const std::string& period) {
    return AnalysisSummary::from(analyze(instrument, market, period));
}

std::size_t AnalysisOrchestrator::invalidate(std::optional<std::string_view> instrument,
                                             std::optional<MarketKind> market) {
    return cache_->invalidate_matching(instrument, market);
}

// ─── Pipeline ─────────────────────────────────────────────────────────────────

AnalysisResult AnalysisOrchestrator::run_pipeline(const AnalysisKey& key) const {
    log::logger()->debug("[{}] {}", to_string(PipelineStage::Fetching), key.to_string());

    PriceSeries series;
    try {
        series = collector_->fetch(key.instrument, key.market, key.period);
    } catch (const AnalysisError&) {
        throw;
    } catch (const std::exception& e) {
        throw DataUnavailableError(fmt::format("{}: {}", key.to_string(), e.what()));
    }

    return evaluate(series, key);
}

AnalysisResult AnalysisOrchestrator::evaluate(std::span<const PriceBar> series,
                                              const AnalysisKey& key) const {
    PipelineStage stage = PipelineStage::Building;
    try {
        const ReturnSeries rs = ReturnSeriesBuilder::build(series, config_.min_returns);

        stage = PipelineStage::Estimating;
        const FittedDistribution dist =
            DistributionEstimator::fit(rs.returns, config_.estimator);
        const DistributionStats& stats = dist.stats();

        stage = PipelineStage::Mapping;
        const Position pos = PositionMapper::map(dist, rs.current_return, config_.position);

        stage = PipelineStage::Scoring;
        const double sentiment = SentimentScorer::score(pos.ratios, dist, config_.sentiment);

        stage = PipelineStage::Classifying;
        const RiskTier risk = RiskClassifier::classify(sentiment, pos.ratios, config_.risk);

        stage = PipelineStage::Interpreting;
        std::string text = InterpretationGenerator::generate(InterpretationInput{
            .ratios         = pos.ratios,
            .sentiment      = sentiment,
            .risk           = risk,
            .current_return = rs.current_return,
            .lower_quartile = stats.percentile_25,
            .upper_quartile = stats.percentile_75,
        });

        log::logger()->debug("{} n={} pct={:.3f} b/h/s={:.2f}/{:.2f}/{:.2f}",
                             key.to_string(), rs.returns.size(), pos.percentile,
                             pos.ratios.buyers, pos.ratios.holders, pos.ratios.sellers);

        return AnalysisResult{
            .instrument          = key.instrument,
            .market              = key.market,
            .period              = key.period,
            .current_price       = rs.current_price,
            .current_return      = rs.current_return,
            .position_percentile = pos.percentile,
            .ratios              = pos.ratios,
            .sentiment           = sentiment,
            .risk                = risk,
            .interpretation      = std::move(text),
            .stats               = stats,
            .visualization       = visualize(dist, rs.current_return,
                                             config_.visualization_points),
            .confidence          = confidence(rs.returns.size(), stats),
            .data_points         = series.size(),
            .created_at          = std::chrono::system_clock::now(),
        };
    } catch (const AnalysisError& e) {
        log::logger()->warn("{} failed at {}: {}", key.to_string(), to_string(stage), e.what());
        throw;
    } catch (const std::exception& e) {
        log::logger()->error("{} internal error at {}: {}",
                             key.to_string(), to_string(stage), e.what());
        throw InternalAnalysisError(fmt::format("{}: {}", to_string(stage), e.what()));
    }
}

// ─── Derived outputs ──────────────────────────────────────────────────────────

double AnalysisOrchestrator::confidence(std::size_t n_returns,
                                        const DistributionStats& stats) noexcept {
    const double size_factor =
        std::min(1.0, static_cast<double>(n_returns) / 100.0);
    const double shape_factor =
        std::max(0.1, 1.0 - std::abs(stats.kurtosis) / 10.0);
    const double vol_factor =
        std::max(0.1, 1.0 - std::min(1.0, stats.std_dev * 20.0));

    const double c = 0.4 * size_factor + 0.3 * shape_factor + 0.3 * vol_factor;
    if (!std::isfinite(c)) {
        return 0.1;
    }
    return std::clamp(c, 0.1, 1.0);
}

VisualizationData AnalysisOrchestrator::visualize(const FittedDistribution& dist,
                                                  double current,
                                                  std::size_t points) {
    const double mu    = dist.stats().mean;
    const double sigma = dist.stats().std_dev;
    const double x_min = mu - 3.0 * sigma;
    const double x_max = mu + 3.0 * sigma;

    const Eigen::ArrayXd xs = linspace(x_min, x_max, points);
    const Eigen::ArrayXd ys = dist.kde().evaluate(xs);

    VisualizationData out;
    out.x_values.assign(xs.data(), xs.data() + xs.size());
    out.y_values.assign(ys.data(), ys.data() + ys.size());
    out.current_position = current;
    out.zones = {
        Zone{.name = "oversold",   .start = x_min,              .end = mu - 2.0 * sigma},
        Zone{.name = "normal",     .start = mu - 2.0 * sigma,   .end = mu + 2.0 * sigma},
        Zone{.name = "overbought", .start = mu + 2.0 * sigma,   .end = x_max},
    };
    return out;
}

}  // namespace mktpsych
