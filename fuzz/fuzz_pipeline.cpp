/**
 * @file  fuzz_pipeline.cpp
 * @brief libFuzzer target for CSV → evaluate() (end-to-end, no cache)
 *
 * Build:
 *   cmake -DMKTPSYCH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_pipeline
 *
 * Safety invariants verified on every input:
 *   1. Only AnalysisError subclasses escape evaluate().
 *   2. If a result is returned:
 *      a. ratios are non-negative and sum to 1
 *      b. sentiment ∈ [−1, 1]
 *      c. confidence ∈ [0.1, 1]
 *      d. position_percentile ∈ [0, 1]
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "mktpsych/data_loader.hpp"
#include "mktpsych/engine.hpp"
#include "mktpsych/errors.hpp"
#include "mktpsych/log.hpp"

using namespace mktpsych;

namespace {

class NullCollector final : public DataCollector {
public:
    PriceSeries fetch(const std::string&, MarketKind, const std::string&) override {
        return {};
    }
};

const AnalysisOrchestrator& engine() {
    static const AnalysisOrchestrator instance = [] {
        log::set_level("off");
        AnalysisConfig cfg;
        cfg.logging.level = "off";
        return AnalysisOrchestrator(std::make_shared<NullCollector>(),
                                    std::make_shared<AnalysisCache>(), cfg);
    }();
    return instance;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);
    const auto loaded = DataLoader::parse_csv_string(input);

    const AnalysisKey key{.instrument = "FUZZ", .market = MarketKind::Stock, .period = "max"};
    try {
        const auto r = engine().evaluate(loaded.bars, key);

        const double sum = r.ratios.buyers + r.ratios.holders + r.ratios.sellers;
        assert(r.ratios.buyers >= 0.0 && r.ratios.holders >= 0.0 && r.ratios.sellers >= 0.0);
        assert(std::abs(sum - 1.0) < 1e-9);
        assert(r.sentiment >= -1.0 && r.sentiment <= 1.0);
        assert(r.confidence >= 0.1 && r.confidence <= 1.0);
        assert(r.position_percentile >= 0.0 && r.position_percentile <= 1.0);
    } catch (const AnalysisError&) {
        // Expected for short, flat or mis-ordered input.
    }
    return 0;
}
