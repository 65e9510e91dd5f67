/// @file tests/interpretation/test_interpretation_generator.cpp
/// @brief Unit tests for InterpretationGenerator templates.

#include <gtest/gtest.h>
#include "mktpsych/interpretation.hpp"

#include <string>

using namespace mktpsych;

namespace {

InterpretationInput complete_input() {
    return InterpretationInput{
        .ratios         = PsychologyRatios{.buyers = 0.4, .holders = 0.4, .sellers = 0.2},
        .sentiment      = 0.1,
        .risk           = RiskTier::Low,
        .current_return = 0.0,
        .lower_quartile = -0.01,
        .upper_quartile = 0.01,
    };
}

bool contains(const std::string& hay, std::string_view needle) {
    return hay.find(needle) != std::string::npos;
}

}  // namespace

// ─── Completeness ────────────────────────────────────────────────────────────

TEST(Interpretation, CompleteInputProducesFourSentences) {
    const auto text = InterpretationGenerator::generate(complete_input());
    EXPECT_TRUE(contains(text, InterpretationGenerator::crowd_sentence(
        PsychologyRatios{.buyers = 0.4, .holders = 0.4, .sellers = 0.2})));
    EXPECT_TRUE(contains(text, "Sentiment is broadly balanced."));
    EXPECT_TRUE(contains(text, "Risk is low"));
    EXPECT_TRUE(contains(text, "normal range"));
    EXPECT_NE(text, InterpretationGenerator::INSUFFICIENT_SIGNAL);
}

TEST(Interpretation, AnyMissingFieldGivesFallback) {
    auto in = complete_input();
    in.ratios.reset();
    EXPECT_EQ(InterpretationGenerator::generate(in), InterpretationGenerator::INSUFFICIENT_SIGNAL);

    in = complete_input();
    in.risk.reset();
    EXPECT_EQ(InterpretationGenerator::generate(in), InterpretationGenerator::INSUFFICIENT_SIGNAL);

    in = complete_input();
    in.upper_quartile.reset();
    EXPECT_EQ(InterpretationGenerator::generate(in), InterpretationGenerator::INSUFFICIENT_SIGNAL);
}

TEST(Interpretation, EmptyInputGivesFallback) {
    EXPECT_EQ(InterpretationGenerator::generate(InterpretationInput{}),
              InterpretationGenerator::INSUFFICIENT_SIGNAL);
}

// ─── Individual templates ────────────────────────────────────────────────────

TEST(Interpretation, CrowdSentenceThresholds) {
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::crowd_sentence(
                             {.buyers = 0.7, .holders = 0.2, .sellers = 0.1})),
                         "Buying"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::crowd_sentence(
                             {.buyers = 0.15, .holders = 0.25, .sellers = 0.6})),
                         "Selling"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::crowd_sentence(
                             {.buyers = 0.6, .holders = 0.3, .sellers = 0.1})),
                         "holding"));
}

TEST(Interpretation, SentimentSentenceThresholds) {
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::sentiment_sentence(0.7)), "Greed"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::sentiment_sentence(-0.7)), "Fear"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::sentiment_sentence(0.5)), "balanced"));
}

TEST(Interpretation, EachRiskTierHasDistinctSentence) {
    const auto low     = InterpretationGenerator::risk_sentence(RiskTier::Low);
    const auto medium  = InterpretationGenerator::risk_sentence(RiskTier::Medium);
    const auto high    = InterpretationGenerator::risk_sentence(RiskTier::High);
    const auto extreme = InterpretationGenerator::risk_sentence(RiskTier::Extreme);
    EXPECT_NE(low, medium);
    EXPECT_NE(medium, high);
    EXPECT_NE(high, extreme);
    EXPECT_TRUE(contains(std::string(extreme), "extreme"));
}

TEST(Interpretation, PositionSentenceRelativeToQuartiles) {
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::position_sentence(0.02, -0.01, 0.01)),
                         "top quarter"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::position_sentence(-0.02, -0.01, 0.01)),
                         "bottom quarter"));
    EXPECT_TRUE(contains(std::string(InterpretationGenerator::position_sentence(0.01, -0.01, 0.01)),
                         "normal range"));
}
