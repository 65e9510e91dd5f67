/// @file tests/core/test_types.cpp
/// @brief Unit tests for shared value types and the error taxonomy.

#include <gtest/gtest.h>
#include "mktpsych/types.hpp"
#include "mktpsych/errors.hpp"

#include <set>
#include <string>

using namespace mktpsych;

TEST(MarketKind, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_market_kind("stock"), MarketKind::Stock);
    EXPECT_EQ(parse_market_kind("Crypto"), MarketKind::Crypto);
    EXPECT_EQ(parse_market_kind("STOCK"), MarketKind::Stock);
    EXPECT_FALSE(parse_market_kind("forex").has_value());
}

TEST(MarketKind, RoundTripsThroughName) {
    for (auto k : {MarketKind::Stock, MarketKind::Crypto}) {
        EXPECT_EQ(parse_market_kind(to_string(k)), k);
    }
}

TEST(AnalysisKey, StringForm) {
    const AnalysisKey k{.instrument = "BTC/USDT", .market = MarketKind::Crypto, .period = "1mo"};
    EXPECT_EQ(k.to_string(), "analysis:crypto:BTC/USDT:1mo");
}

TEST(AnalysisKey, OrderingDistinguishesAllComponents) {
    std::set<AnalysisKey> keys{
        {.instrument = "AAPL", .market = MarketKind::Stock,  .period = "1mo"},
        {.instrument = "AAPL", .market = MarketKind::Crypto, .period = "1mo"},
        {.instrument = "AAPL", .market = MarketKind::Stock,  .period = "1y"},
        {.instrument = "MSFT", .market = MarketKind::Stock,  .period = "1mo"},
    };
    EXPECT_EQ(keys.size(), 4u);
}

TEST(PsychologyRatios, MaxComponent) {
    const PsychologyRatios r{.buyers = 0.2, .holders = 0.5, .sellers = 0.3};
    EXPECT_DOUBLE_EQ(r.max_component(), 0.5);
}

TEST(AnalysisResult, ReportMentionsHeadlineFields) {
    AnalysisResult r{};
    r.instrument     = "AAPL";
    r.market         = MarketKind::Stock;
    r.period         = "3mo";
    r.risk           = RiskTier::High;
    r.interpretation = "Risk is high; caution is warranted.";
    const auto text = r.to_string();
    EXPECT_NE(text.find("AAPL"), std::string::npos);
    EXPECT_NE(text.find("risk=high"), std::string::npos);
    EXPECT_NE(text.find("caution"), std::string::npos);
}

TEST(AnalysisSummary, CopiesHeadlineFields) {
    AnalysisResult r{};
    r.instrument = "ETH/USDT";
    r.sentiment  = -0.4;
    r.risk       = RiskTier::Medium;
    r.confidence = 0.7;
    const auto s = AnalysisSummary::from(r);
    EXPECT_EQ(s.instrument, "ETH/USDT");
    EXPECT_DOUBLE_EQ(s.sentiment, -0.4);
    EXPECT_EQ(s.risk, RiskTier::Medium);
    EXPECT_DOUBLE_EQ(s.confidence, 0.7);
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(AnalysisErrors, KindsAndMessages) {
    const InsufficientDataError e(4, 10);
    EXPECT_EQ(e.kind(), ErrorKind::InsufficientData);
    EXPECT_NE(std::string(e.what()).find('4'), std::string::npos);

    EXPECT_EQ(user_message(ErrorKind::DegenerateDistribution),
              "Flat market, analysis not meaningful.");
    EXPECT_EQ(to_string(ErrorKind::Timeout), "timeout");
}

TEST(AnalysisErrors, AllDeriveFromAnalysisError) {
    try {
        throw DegenerateDistributionError("flat");
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateDistribution);
    }
    try {
        throw InternalAnalysisError("estimating: boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "estimating: boom");
    }
}
