/// @file src/core/collector.cpp
/// @brief CsvDataCollector: file-backed DataCollector.

#include "mktpsych/collector.hpp"
#include "mktpsych/data_loader.hpp"
#include "mktpsych/errors.hpp"
#include "mktpsych/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace mktpsych {

std::optional<std::size_t> period_bars(std::string_view period) noexcept {
    if (period == "1mo") return 21;
    if (period == "3mo") return 63;
    if (period == "6mo") return 126;
    if (period == "1y")  return 252;
    if (period == "2y")  return 504;
    if (period == "5y")  return 1260;
    if (period == "max") return 0;
    return std::nullopt;
}

CsvDataCollector::CsvDataCollector(std::filesystem::path root)
    : root_(std::move(root))
{}

std::filesystem::path
CsvDataCollector::path_for(const std::string& instrument, MarketKind market) const {
    std::string file = instrument;
    std::replace(file.begin(), file.end(), '/', '-');
    return root_ / std::string(to_string(market)) / (file + ".csv");
}

PriceSeries CsvDataCollector::fetch(const std::string& instrument,
                                    MarketKind market,
                                    const std::string& period) {
    const auto window = period_bars(period);
    if (!window) {
        throw DataUnavailableError(fmt::format("unsupported period '{}'", period));
    }

    const auto path = path_for(instrument, market);
    auto loaded = DataLoader::load_csv(path.string());
    if (!loaded) {
        throw DataUnavailableError(fmt::format("cannot open '{}'", path.string()));
    }
    if (loaded->skipped_rows > 0) {
        log::logger()->warn("{}: skipped {} malformed rows", path.string(), loaded->skipped_rows);
    }
    if (loaded->bars.empty()) {
        throw DataUnavailableError(fmt::format("no valid bars in '{}'", path.string()));
    }

    PriceSeries bars = std::move(loaded->bars);
    if (*window > 0 && bars.size() > *window) {
        bars.erase(bars.begin(),
                   bars.end() - static_cast<std::ptrdiff_t>(*window));
    }

    log::logger()->debug("fetched {} bars for {} ({}, {})",
                         bars.size(), instrument, to_string(market), period);
    return bars;
}

}  // namespace mktpsych
