/// @file tests/scoring/test_risk_classifier.cpp
/// @brief Unit tests for RiskClassifier tier boundaries.

#include <gtest/gtest.h>
#include "mktpsych/scoring.hpp"

#include <limits>

using namespace mktpsych;

static PsychologyRatios with_max(double m) {
    // `m` is the largest component; the rest is split evenly.
    const double rest = (1.0 - m) / 2.0;
    return PsychologyRatios{.buyers = m, .holders = rest, .sellers = rest};
}

TEST(RiskClassifier, CalmBalancedMarketIsLow) {
    EXPECT_EQ(RiskClassifier::classify(0.1, with_max(0.4)), RiskTier::Low);
    EXPECT_EQ(RiskClassifier::classify(-0.29, with_max(0.59)), RiskTier::Low);
}

TEST(RiskClassifier, LowBoundsAreStrict) {
    EXPECT_EQ(RiskClassifier::classify(0.3, with_max(0.4)), RiskTier::Medium);
    EXPECT_EQ(RiskClassifier::classify(0.1, with_max(0.6)), RiskTier::Medium);
}

TEST(RiskClassifier, Medium) {
    EXPECT_EQ(RiskClassifier::classify(0.5, with_max(0.5)), RiskTier::Medium);
    EXPECT_EQ(RiskClassifier::classify(0.1, with_max(0.74)), RiskTier::Medium);
}

TEST(RiskClassifier, ExtremeRatioWithMildSentimentIsHigh) {
    EXPECT_EQ(RiskClassifier::classify(0.1, with_max(0.8)), RiskTier::High);
    EXPECT_EQ(RiskClassifier::classify(0.1, with_max(0.75)), RiskTier::High);
}

TEST(RiskClassifier, StrongSentimentIsHigh) {
    EXPECT_EQ(RiskClassifier::classify(0.6, with_max(0.4)), RiskTier::High);
    EXPECT_EQ(RiskClassifier::classify(-0.84, with_max(0.4)), RiskTier::High);
}

TEST(RiskClassifier, VeryStrongSentimentIsExtreme) {
    EXPECT_EQ(RiskClassifier::classify(0.85, with_max(0.4)), RiskTier::Extreme);
    EXPECT_EQ(RiskClassifier::classify(-1.0, with_max(0.7)), RiskTier::Extreme);
}

TEST(RiskClassifier, NaNSentimentIsExtreme) {
    EXPECT_EQ(RiskClassifier::classify(std::numeric_limits<double>::quiet_NaN(), with_max(0.4)),
              RiskTier::Extreme);
}

TEST(RiskClassifier, CustomThresholds) {
    const RiskThresholds strict{
        .low_sentiment    = 0.1,
        .low_ratio        = 0.5,
        .medium_sentiment = 0.2,
        .medium_ratio     = 0.6,
        .high_sentiment   = 0.4,
    };
    EXPECT_EQ(RiskClassifier::classify(0.15, with_max(0.4), strict), RiskTier::Medium);
    EXPECT_EQ(RiskClassifier::classify(0.3, with_max(0.4), strict), RiskTier::High);
    EXPECT_EQ(RiskClassifier::classify(0.5, with_max(0.4), strict), RiskTier::Extreme);
}

TEST(RiskTier, IsOrdered) {
    EXPECT_LT(RiskTier::Low, RiskTier::Medium);
    EXPECT_LT(RiskTier::Medium, RiskTier::High);
    EXPECT_LT(RiskTier::High, RiskTier::Extreme);
}
