/// @file src/main.cpp
/// @brief mktpsych CLI entry point.
///
/// Usage:
///   mktpsych --analyze <SYMBOL> [--market stock|crypto] [--period 3mo] [--data-dir data]
///   mktpsych --file <csv_file> [--symbol NAME]
///   mktpsych --help

#include "mktpsych/cache.hpp"
#include "mktpsych/collector.hpp"
#include "mktpsych/config.hpp"
#include "mktpsych/data_loader.hpp"
#include "mktpsych/engine.hpp"
#include "mktpsych/errors.hpp"
#include "mktpsych/log.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  mktpsych --analyze <SYMBOL> [options]   Analyse an instrument from the data directory\n"
        "  mktpsych --file <csv_file> [--symbol S] Analyse a single OHLCV CSV file\n"
        "  mktpsych --help                         Show this help\n"
        "\n"
        "Options:\n"
        "  --market  stock|crypto   (default: stock)\n"
        "  --period  1mo|3mo|6mo|1y|2y|5y|max   (default: 3mo)\n"
        "  --data-dir <dir>         (default: data) files at <dir>/<market>/<SYMBOL>.csv\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,open,high,low,close,volume\n"
        "\n"
        "Environment: MKTPSYCH_LOG_LEVEL, MKTPSYCH_MIN_RETURNS, MKTPSYCH_CACHE_TTL, ...\n"
    );
}

struct CliOptions {
    std::string mode;
    std::string target;
    std::string market    = "stock";
    std::string period    = "3mo";
    std::string data_dir  = "data";
    std::string symbol;
};

/// Parse `argv` into options. Returns nullopt (after printing why) on error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.mode = argv[1];

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires an argument\n", opts.mode);
        return std::nullopt;
    }
    opts.target = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (flag == "--market") {
            opts.market = value;
        } else if (flag == "--period") {
            opts.period = value;
        } else if (flag == "--data-dir") {
            opts.data_dir = value;
        } else if (flag == "--symbol") {
            opts.symbol = value;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }
    return opts;
}

int report_failure(const mktpsych::AnalysisError& e) {
    fmt::print(stderr, "Error [{}]: {}\n",
               mktpsych::to_string(e.kind()), mktpsych::user_message(e.kind()));
    fmt::print(stderr, "  detail: {}\n", e.what());
    return 1;
}

/// `--market` value for either mode; prints the problem and returns nullopt
/// when it is not a known market.
std::optional<mktpsych::MarketKind> resolve_market(const CliOptions& opts) {
    auto market = mktpsych::parse_market_kind(opts.market);
    if (!market) {
        fmt::print(stderr, "Error: unknown market '{}' (expected stock or crypto)\n",
                   opts.market);
    }
    return market;
}

/// Analyse an instrument through the collector + cache path.
int run_analyze(const CliOptions& opts, const mktpsych::AnalysisConfig& config) {
    auto market = resolve_market(opts);
    if (!market) {
        return 1;
    }

    auto collector = std::make_shared<mktpsych::CsvDataCollector>(opts.data_dir);
    auto cache     = std::make_shared<mktpsych::AnalysisCache>(config.cache);
    mktpsych::AnalysisOrchestrator engine(collector, cache, config);

    try {
        const auto result = engine.analyze(opts.target, *market, opts.period);
        fmt::print("{}\n", result.to_string());
    } catch (const mktpsych::AnalysisError& e) {
        return report_failure(e);
    }
    return 0;
}

/// Analyse every bar of a single CSV file, bypassing collector and cache.
int run_file(const CliOptions& opts, const mktpsych::AnalysisConfig& config) {
    auto market = resolve_market(opts);
    if (!market) {
        return 1;
    }

    auto loaded = mktpsych::DataLoader::load_csv(opts.target);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.target);
        return 1;
    }
    if (loaded->bars.empty()) {
        fmt::print(stderr, "Error: no valid bars loaded from '{}'\n", opts.target);
        return 1;
    }

    fmt::print("Loaded {} bars from '{}' ({} rows skipped)\n",
               loaded->bars.size(), opts.target, loaded->skipped_rows);

    const mktpsych::AnalysisKey key{
        .instrument = opts.symbol.empty() ? opts.target : opts.symbol,
        .market     = *market,
        .period     = "file",
    };

    auto collector = std::make_shared<mktpsych::CsvDataCollector>(opts.data_dir);
    auto cache     = std::make_shared<mktpsych::AnalysisCache>(config.cache);
    mktpsych::AnalysisOrchestrator engine(collector, cache, config);

    try {
        const auto result = engine.evaluate(loaded->bars, key);
        fmt::print("{}\n", result.to_string());
    } catch (const mktpsych::AnalysisError& e) {
        return report_failure(e);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--analyze" && mode != "--file") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    const auto config = mktpsych::AnalysisConfig::from_env();
    if (auto problem = config.validate()) {
        fmt::print(stderr, "Error: invalid configuration: {}\n", *problem);
        return 1;
    }
    mktpsych::log::set_level(config.logging.level);

    if (opts->mode == "--analyze") {
        return run_analyze(*opts, config);
    }
    return run_file(*opts, config);
}
