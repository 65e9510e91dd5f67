/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the OHLCV CSV DataLoader.

#include <gtest/gtest.h>
#include "mktpsych/data_loader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace mktpsych;

namespace {

const std::string kHeader = "timestamp,open,high,low,close,volume\n";

PriceBar good_bar() {
    return PriceBar{
        .timestamp = 1.0, .open = 100.0, .high = 105.0,
        .low = 99.0, .close = 103.0, .volume = 1e6,
    };
}

}  // namespace

// ─── validate_bar ────────────────────────────────────────────────────────────

TEST(DataLoaderValidate, AcceptsConsistentBar) {
    EXPECT_TRUE(DataLoader::validate_bar(good_bar()));
}

TEST(DataLoaderValidate, RejectsInconsistentOhlc) {
    auto b = good_bar();
    b.high = 98.0;
    EXPECT_FALSE(DataLoader::validate_bar(b));

    b = good_bar();
    b.close = 106.0;
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

TEST(DataLoaderValidate, RejectsNonPositiveCloseAndNegativeVolume) {
    PriceBar zero{.timestamp = 1, .open = 0, .high = 0, .low = 0, .close = 0, .volume = 1};
    EXPECT_FALSE(DataLoader::validate_bar(zero));

    auto b = good_bar();
    b.volume = -1.0;
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

TEST(DataLoaderValidate, RejectsNonFinite) {
    auto b = good_bar();
    b.open = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(DataLoader::validate_bar(b));
}

// ─── parse_csv_string ────────────────────────────────────────────────────────

TEST(DataLoaderParse, ParsesRowsAfterHeader) {
    const auto out = DataLoader::parse_csv_string(
        kHeader +
        "1700000000,100.0,105.0,99.0,103.0,1000000\n"
        "1700086400,103.0,107.0,102.0,106.5,1200000\n");
    ASSERT_EQ(out.bars.size(), 2u);
    EXPECT_EQ(out.skipped_rows, 0u);
    EXPECT_DOUBLE_EQ(out.bars[1].close, 106.5);
    EXPECT_DOUBLE_EQ(out.bars[0].timestamp, 1700000000.0);
}

TEST(DataLoaderParse, SkipsAndCountsBadRows) {
    const auto out = DataLoader::parse_csv_string(
        kHeader +
        "1,100,105,99,103,1000\n"
        "2,abc,105,99,103,1000\n"      // non-numeric
        "3,100,105,99\n"               // too few fields
        "4,100,105,99,0,1000\n"        // fails OHLC / close check
        "5,100,105,99,104,1000\n");
    EXPECT_EQ(out.bars.size(), 2u);
    EXPECT_EQ(out.skipped_rows, 3u);
}

TEST(DataLoaderParse, RejectsMalformedCells) {
    const auto out = DataLoader::parse_csv_string(
        kHeader +
        "1,100,105,99,103,1000,7\n"    // extra column
        "2,100,105,99,103x,1000\n"     // trailing characters
        "3,100,,99,103,1000\n"         // empty cell
        "4,100,105,99,inf,1000\n"      // non-finite literal
        "5,100,105,99,1e999,1000\n"    // out of range
        "6,0,0,0,0,1000\n"             // coherent range but zero close
        "7,100,105,99,103,1000\n");
    ASSERT_EQ(out.bars.size(), 1u);
    EXPECT_DOUBLE_EQ(out.bars[0].timestamp, 7.0);
    EXPECT_EQ(out.skipped_rows, 6u);
}

TEST(DataLoaderParse, IgnoresCommentsBlankLinesAndCarriageReturns) {
    const auto out = DataLoader::parse_csv_string(
        "# exported by a vendor tool\r\n" + std::string("timestamp,open,high,low,close,volume\r\n") +
        "\r\n"
        "# mid-file comment\n"
        "1, 100 ,105,99,103,1000\r\n");
    ASSERT_EQ(out.bars.size(), 1u);
    EXPECT_EQ(out.skipped_rows, 0u);
    EXPECT_DOUBLE_EQ(out.bars[0].open, 100.0);
}

TEST(DataLoaderParse, HeaderOnlyGivesEmptySeries) {
    const auto out = DataLoader::parse_csv_string(kHeader);
    EXPECT_TRUE(out.bars.empty());
    EXPECT_EQ(out.skipped_rows, 0u);
}

// ─── load_csv ────────────────────────────────────────────────────────────────

TEST(DataLoaderFile, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/path/to/bars.csv").has_value());
}

TEST(DataLoaderFile, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "mktpsych_loader_test.csv";
    {
        std::ofstream f(path);
        f << kHeader << "1,100,105,99,103,1000\n2,103,107,102,106,1000\n";
    }
    const auto out = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->bars.size(), 2u);
}
