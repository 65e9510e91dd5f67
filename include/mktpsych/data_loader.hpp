#pragma once

/// @file include/mktpsych/data_loader.hpp
/// @brief CSV loader for OHLCV price series.
///
/// ## Expected CSV Format
/// ```
/// timestamp,open,high,low,close,volume
/// 1700000000,100.0,105.0,99.0,103.0,1000000
/// 1700086400,103.0,107.0,102.0,106.5,1200000
/// ```
/// The first non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "mktpsych/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace mktpsych {

/// Parsed bars plus the number of rows that were rejected.
struct LoadedSeries {
    PriceSeries bars;
    std::size_t skipped_rows = 0;
};

class DataLoader {
public:
    /// Load bars from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty `bars` if the file has a header but no valid data rows
    [[nodiscard]] static std::optional<LoadedSeries>
    load_csv(const std::string& filepath) noexcept;

    /// Parse bars from CSV text. Same format as `load_csv`.
    [[nodiscard]] static LoadedSeries
    parse_csv_string(const std::string& csv_content) noexcept;

    /// A bar is valid if every field is finite, low ≤ open, close ≤ high,
    /// close > 0 and volume ≥ 0.
    [[nodiscard]] static bool validate_bar(const PriceBar& bar) noexcept;

private:
    /// Parse one data row; `nullopt` if malformed or invalid.
    [[nodiscard]] static std::optional<PriceBar>
    parse_row(const std::string& line) noexcept;
};

} // namespace mktpsych
