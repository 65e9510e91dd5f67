/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for OHLCV price series.
///
/// Rows feed log-return construction, so a bar is kept only if its close is
/// strictly positive and its OHLC range is coherent. Rejected rows are
/// counted, never fatal.

#include "mktpsych/data_loader.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mktpsych {

namespace {

/// Column order of a data row: timestamp,open,high,low,close,volume.
constexpr std::size_t BAR_COLUMNS = 6;

[[nodiscard]] bool is_skippable(std::string_view line) noexcept {
    return line.empty() || line.front() == '#';
}

/// One numeric cell, whitespace-trimmed. Rejects empty cells, trailing
/// characters ("12.5x"), out-of-range values and inf/nan literals.
[[nodiscard]] std::optional<double> parse_cell(const std::string& cell) noexcept {
    constexpr const char* blank = " \t\r\n";
    const auto first = cell.find_first_not_of(blank);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = cell.find_last_not_of(blank);
    const std::string trimmed = cell.substr(first, last - first + 1);

    try {
        std::size_t consumed = 0;
        const double value = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

[[nodiscard]] bool all_finite(const PriceBar& b) noexcept {
    return std::isfinite(b.timestamp) && std::isfinite(b.open) && std::isfinite(b.high)
        && std::isfinite(b.low) && std::isfinite(b.close) && std::isfinite(b.volume);
}

/// low ≤ {open, close} ≤ high.
[[nodiscard]] bool range_is_coherent(const PriceBar& b) noexcept {
    return b.low <= b.high
        && b.low <= b.open  && b.open  <= b.high
        && b.low <= b.close && b.close <= b.high;
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const PriceBar& bar) noexcept {
    return all_finite(bar)
        && range_is_coherent(bar)
        && bar.close > 0.0        // log(close_t / close_{t-1}) must exist
        && bar.volume >= 0.0;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<PriceBar>
DataLoader::parse_row(const std::string& line) noexcept {
    if (is_skippable(line)) {
        return std::nullopt;
    }

    std::array<double, BAR_COLUMNS> cols{};
    std::size_t n = 0;

    std::istringstream row(line);
    std::string cell;
    while (std::getline(row, cell, ',')) {
        if (n == BAR_COLUMNS) {
            return std::nullopt;  // extra column
        }
        const auto value = parse_cell(cell);
        if (!value) {
            return std::nullopt;
        }
        cols[n++] = *value;
    }
    if (n != BAR_COLUMNS) {
        return std::nullopt;
    }

    const PriceBar bar{
        .timestamp = cols[0],
        .open      = cols[1],
        .high      = cols[2],
        .low       = cols[3],
        .close     = cols[4],
        .volume    = cols[5],
    };
    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

LoadedSeries
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadedSeries out;
    std::istringstream stream(csv_content);
    std::string line;
    bool seen_header = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_skippable(line)) {
            continue;
        }
        if (!seen_header) {
            seen_header = true;
            continue;
        }

        if (auto bar = parse_row(line)) {
            out.bars.push_back(*bar);
        } else {
            ++out.skipped_rows;
        }
    }

    return out;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<LoadedSeries>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace mktpsych
