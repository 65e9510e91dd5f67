/**
 * @file  bench/bench_kde.cpp
 * @brief Google Benchmark suite for the distribution and pipeline hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Kde_Evaluate          density over a 1000-point grid
 *   BM_Distribution_Fit      filter + bandwidth + percentile table
 *   BM_Percentile_Lookup     one percentile() query on a fitted table
 *   BM_Pipeline_Evaluate     full evaluate() without collector or cache
 *   BM_Cache_Hit             get_or_compute on a warm key
 *
 * Build (CMake):
 *   cmake --build build --target bench_kde
 *   ./build/bench_kde --benchmark_format=json
 *
 * Throughput units: items/second (samples or bars processed).
 */

#include "benchmark/benchmark.h"

#include "mktpsych/cache.hpp"
#include "mktpsych/distribution.hpp"
#include "mktpsych/engine.hpp"
#include "mktpsych/log.hpp"

#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic zero-mean returns with a ~1% spread.
static std::vector<double> make_returns(std::size_t n) {
    std::vector<double> r(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        r[i] = 0.01 * std::sin(0.7 * t) + 0.004 * std::cos(2.3 * t);
    }
    return r;
}

static mktpsych::PriceSeries make_bars(std::size_t n) {
    const auto rets = make_returns(n);
    mktpsych::PriceSeries bars;
    bars.reserve(n + 1);
    double price = 100.0;
    for (std::size_t i = 0; i <= n; ++i) {
        if (i > 0) price *= std::exp(rets[i - 1]);
        bars.push_back(mktpsych::PriceBar{
            .timestamp = static_cast<double>(i),
            .open = price, .high = price, .low = price, .close = price, .volume = 1.0,
        });
    }
    return bars;
}

/// Serves nothing; the benchmarks call evaluate() directly.
class NullCollector final : public mktpsych::DataCollector {
public:
    mktpsych::PriceSeries fetch(const std::string&, mktpsych::MarketKind,
                                const std::string&) override {
        return {};
    }
};

// ── Distribution benchmarks ────────────────────────────────────────────────────

static void BM_Kde_Evaluate(benchmark::State& state) {
    const auto samples = make_returns(static_cast<std::size_t>(state.range(0)));
    const mktpsych::GaussianKde kde(samples, 0.003);
    const auto grid = mktpsych::linspace(-0.1, 0.1, 1000);
    for (auto _ : state) {
        auto ys = kde.evaluate(grid);
        benchmark::DoNotOptimize(ys.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0) * 1000);
}
BENCHMARK(BM_Kde_Evaluate)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_Distribution_Fit(benchmark::State& state) {
    const auto samples = make_returns(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto dist = mktpsych::DistributionEstimator::fit(samples);
        benchmark::DoNotOptimize(dist.stats().bandwidth);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Distribution_Fit)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_Percentile_Lookup(benchmark::State& state) {
    const auto dist = mktpsych::DistributionEstimator::fit(make_returns(252));
    double x = -0.02;
    for (auto _ : state) {
        benchmark::DoNotOptimize(dist.percentile(x));
        x = x > 0.02 ? -0.02 : x + 1e-4;
    }
}
BENCHMARK(BM_Percentile_Lookup);

// ── Pipeline benchmarks ────────────────────────────────────────────────────────

static void BM_Pipeline_Evaluate(benchmark::State& state) {
    mktpsych::log::set_level("off");
    const auto bars = make_bars(static_cast<std::size_t>(state.range(0)));
    mktpsych::AnalysisConfig cfg;
    cfg.logging.level = "off";
    const mktpsych::AnalysisOrchestrator engine(
        std::make_shared<NullCollector>(), std::make_shared<mktpsych::AnalysisCache>(), cfg);
    const mktpsych::AnalysisKey key{
        .instrument = "BENCH", .market = mktpsych::MarketKind::Stock, .period = "1y"};

    for (auto _ : state) {
        auto r = engine.evaluate(bars, key);
        benchmark::DoNotOptimize(r.sentiment);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Pipeline_Evaluate)->Arg(63)->Arg(252)->Arg(1260)->Unit(benchmark::kMicrosecond);

static void BM_Cache_Hit(benchmark::State& state) {
    mktpsych::log::set_level("off");
    mktpsych::AnalysisCache cache;
    const mktpsych::AnalysisKey key{
        .instrument = "BENCH", .market = mktpsych::MarketKind::Crypto, .period = "1mo"};
    cache.put(key, mktpsych::AnalysisResult{});
    for (auto _ : state) {
        auto r = cache.get_or_compute(key, [] { return mktpsych::AnalysisResult{}; });
        benchmark::DoNotOptimize(r.sentiment);
    }
}
BENCHMARK(BM_Cache_Hit);

BENCHMARK_MAIN();
