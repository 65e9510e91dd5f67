#pragma once

/// @file include/mktpsych/collector.hpp
/// @brief DataCollector: the market-data capability consumed by the
///        orchestrator, plus a CSV-directory implementation.
///
/// Network clients for equity and exchange APIs implement `DataCollector`
/// outside this library. `CsvDataCollector` serves pre-downloaded files laid
/// out as `<root>/<stock|crypto>/<SYMBOL>.csv`.

#include "mktpsych/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mktpsych {

/// Source of price series.
class DataCollector {
public:
    virtual ~DataCollector() = default;

    /// Fetch bars for one instrument and period, oldest first.
    ///
    /// # Throws
    /// `DataUnavailableError` carrying the upstream cause.
    [[nodiscard]] virtual PriceSeries
    fetch(const std::string& instrument,
          MarketKind market,
          const std::string& period) = 0;
};

/// Number of trailing daily bars for a period code:
/// 1mo 21, 3mo 63, 6mo 126, 1y 252, 2y 504, 5y 1260. "max" → all bars
/// (returned as 0). Unknown codes → `nullopt`.
[[nodiscard]] std::optional<std::size_t> period_bars(std::string_view period) noexcept;

class CsvDataCollector final : public DataCollector {
public:
    explicit CsvDataCollector(std::filesystem::path root);

    [[nodiscard]] PriceSeries
    fetch(const std::string& instrument,
          MarketKind market,
          const std::string& period) override;

    /// File that backs an instrument. '/' in pair symbols maps to '-'.
    [[nodiscard]] std::filesystem::path
    path_for(const std::string& instrument, MarketKind market) const;

private:
    std::filesystem::path root_;
};

} // namespace mktpsych
