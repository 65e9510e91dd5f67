/// @file tests/position/test_position_mapper.cpp
/// @brief Unit tests for PositionMapper.
///
/// Test categories:
///   - Band formulas at representative percentiles
///   - Strict band edges at 0.16 and 0.84, approached from both sides
///   - Clamp and renormalize invariants over the whole [0, 1] range
///   - map() against a fitted distribution

#include <gtest/gtest.h>
#include "mktpsych/position.hpp"
#include "mktpsych/distribution.hpp"

#include <cmath>
#include <vector>

using namespace mktpsych;

namespace {

constexpr double kTol = 1e-12;

void expect_valid(const PsychologyRatios& r) {
    EXPECT_GE(r.buyers, 0.0);
    EXPECT_GE(r.holders, 0.0);
    EXPECT_GE(r.sellers, 0.0);
    EXPECT_LE(r.buyers, 1.0);
    EXPECT_LE(r.holders, 1.0);
    EXPECT_LE(r.sellers, 1.0);
    EXPECT_NEAR(r.buyers + r.holders + r.sellers, 1.0, kTol);
}

}  // namespace

// ─── Normal band ─────────────────────────────────────────────────────────────

TEST(PositionBands, MedianIsBalanced) {
    const auto r = PositionMapper::ratios_for_percentile(0.5);
    EXPECT_NEAR(r.buyers, 0.40, kTol);
    EXPECT_NEAR(r.sellers, 0.20, kTol);
    EXPECT_NEAR(r.holders, 0.40, kTol);
}

TEST(PositionBands, LowerEdgeBelongsToNormalBand) {
    // Normal formula gives sellers = −0.004, clamped to 0 and renormalized.
    const auto r = PositionMapper::ratios_for_percentile(0.16);
    EXPECT_NEAR(r.sellers, 0.0, kTol);
    EXPECT_NEAR(r.buyers, 0.604 / 1.004, 1e-9);
    expect_valid(r);
}

TEST(PositionBands, UpperEdgeBelongsToNormalBand) {
    const auto r = PositionMapper::ratios_for_percentile(0.84);
    EXPECT_NEAR(r.buyers, 0.196, 1e-9);
    EXPECT_NEAR(r.sellers, 0.404, 1e-9);
    EXPECT_NEAR(r.holders, 0.400, 1e-9);
}

// ─── Oversold / overbought ───────────────────────────────────────────────────

TEST(PositionBands, JustBelowLowerEdgeIsOversold) {
    const auto inside  = PositionMapper::ratios_for_percentile(0.16);
    const auto outside = PositionMapper::ratios_for_percentile(0.1599);
    EXPECT_NEAR(outside.buyers, 0.70005, 1e-9);
    EXPECT_NEAR(outside.sellers, 0.10, 1e-9);
    EXPECT_GT(outside.buyers, inside.buyers + 0.05);
}

TEST(PositionBands, JustAboveUpperEdgeIsOverbought) {
    const auto inside  = PositionMapper::ratios_for_percentile(0.84);
    const auto outside = PositionMapper::ratios_for_percentile(0.8401);
    EXPECT_NEAR(outside.sellers, 0.60008, 1e-9);
    EXPECT_NEAR(outside.buyers, 0.15, 1e-9);
    EXPECT_GT(outside.sellers, inside.sellers + 0.15);
}

TEST(PositionBands, Extremes) {
    const auto bottom = PositionMapper::ratios_for_percentile(0.0);
    EXPECT_NEAR(bottom.buyers, 0.78, 1e-9);
    EXPECT_NEAR(bottom.sellers, 0.10, 1e-9);
    EXPECT_NEAR(bottom.holders, 0.12, 1e-9);

    const auto top = PositionMapper::ratios_for_percentile(1.0);
    EXPECT_NEAR(top.sellers, 0.728, 1e-9);
    EXPECT_NEAR(top.buyers, 0.15, 1e-9);
    EXPECT_NEAR(top.holders, 0.122, 1e-9);
}

TEST(PositionBands, CustomEdgesMoveTheBands) {
    PositionConfig cfg{.oversold_percentile = 0.05, .overbought_percentile = 0.95};
    // 0.10 is oversold under the defaults but normal here.
    const auto r = PositionMapper::ratios_for_percentile(0.10, cfg);
    EXPECT_NEAR(r.sellers, 0.0, kTol);
    EXPECT_LT(r.buyers, 0.70);
}

// ─── Invariants ──────────────────────────────────────────────────────────────

TEST(PositionInvariants, EveryPercentileGivesValidRatios) {
    for (int i = 0; i <= 1000; ++i) {
        const double p = static_cast<double>(i) / 1000.0;
        const auto r = PositionMapper::ratios_for_percentile(p);
        SCOPED_TRACE(p);
        expect_valid(r);
        EXPECT_LE(r.buyers, 0.9 + kTol);
        EXPECT_LE(r.sellers, 0.9 + kTol);
    }
}

TEST(PositionInvariants, OutOfRangePercentileIsClamped) {
    EXPECT_EQ(PositionMapper::ratios_for_percentile(-0.5),
              PositionMapper::ratios_for_percentile(0.0));
    EXPECT_EQ(PositionMapper::ratios_for_percentile(1.5),
              PositionMapper::ratios_for_percentile(1.0));
}

TEST(PositionInvariants, ClampAndNormalizeCapsThenRescales) {
    const auto r = PositionMapper::clamp_and_normalize(0.95, 0.9, 0.2);
    EXPECT_NEAR(r.buyers, 0.9 / 1.9, 1e-12);
    EXPECT_NEAR(r.sellers, 0.2 / 1.9, 1e-12);
    EXPECT_NEAR(r.holders, 0.8 / 1.9, 1e-12);
    expect_valid(r);
}

TEST(PositionInvariants, NegativeComponentsClampToZero) {
    const auto r = PositionMapper::clamp_and_normalize(0.5, -0.2, 0.5);
    EXPECT_NEAR(r.holders, 0.0, kTol);
    EXPECT_NEAR(r.buyers, 0.5, kTol);
    EXPECT_NEAR(r.sellers, 0.5, kTol);
}

// ─── map() ───────────────────────────────────────────────────────────────────

TEST(PositionMap, CentreOfSymmetricDistribution) {
    std::vector<double> s;
    for (int k = 1; k <= 20; ++k) {
        s.push_back(0.002 * k);
        s.push_back(-0.002 * k);
    }
    const auto dist = DistributionEstimator::fit(s);
    const auto pos  = PositionMapper::map(dist, 0.0);

    EXPECT_NEAR(pos.percentile, 0.5, 1e-3);
    EXPECT_NEAR(pos.ratios.buyers, 0.40, 1e-3);
    EXPECT_NEAR(pos.ratios.sellers, 0.20, 1e-3);
}

TEST(PositionMap, FarRightTailIsOverbought) {
    std::vector<double> s;
    for (int k = 1; k <= 20; ++k) {
        s.push_back(0.002 * k);
        s.push_back(-0.002 * k);
    }
    const auto dist = DistributionEstimator::fit(s);
    const auto pos  = PositionMapper::map(dist, 0.06);

    EXPECT_GT(pos.percentile, 0.84);
    EXPECT_GT(pos.ratios.sellers, pos.ratios.buyers);
}
