/**
 * @file  prop_sentiment_range.cpp
 * @brief Property: sentiment stays in [−1, 1], follows the sign of the ratio
 *        tilt, and risk tiers are consistent with it.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_sentiment_range
 */

#include <rapidcheck.h>
#include <cmath>

#include "mktpsych/position.hpp"
#include "mktpsych/scoring.hpp"

using namespace mktpsych;

int main() {
    // ── Property 1: range and sign ────────────────────────────────────────────
    rc::check(
        "sentiment_range: combine() in [-1, 1] and never opposes the base sign",
        [](double raw_p, double raw_adj) {
            RC_PRE(std::isfinite(raw_p) && std::isfinite(raw_adj));
            const double p   = 0.5 * (std::tanh(raw_p) + 1.0);
            const double adj = 0.15 * (std::tanh(raw_adj) + 1.0);  // [0, 0.3]

            const auto r     = PositionMapper::ratios_for_percentile(p);
            const double base = (r.buyers - r.sellers) * 2.0 - 0.1;
            const double s    = SentimentScorer::combine(r, adj);

            RC_ASSERT(s >= -1.0 && s <= 1.0);
            if (base > 0.0) RC_ASSERT(s >= std::min(base, 1.0) - 1e-12);
            if (base < 0.0) RC_ASSERT(s <= std::max(base, -1.0) + 1e-12);
        }
    );

    // ── Property 2: extreme iff |sentiment| ≥ 0.85 ───────────────────────────
    rc::check(
        "sentiment_range: classify() is extreme exactly when |s| >= high bound",
        [](double raw_s, double raw_p) {
            RC_PRE(std::isfinite(raw_s) && std::isfinite(raw_p));
            const double s = std::tanh(raw_s);
            const auto r   = PositionMapper::ratios_for_percentile(0.5 * (std::tanh(raw_p) + 1.0));
            const auto tier = RiskClassifier::classify(s, r);
            RC_ASSERT((tier == RiskTier::Extreme) == (std::abs(s) >= 0.85));
        }
    );

    // ── Property 3: a low tier implies calm sentiment and a balanced crowd ───
    rc::check(
        "sentiment_range: low risk implies |s| < 0.3 and max ratio < 0.6",
        [](double raw_s, double raw_p) {
            RC_PRE(std::isfinite(raw_s) && std::isfinite(raw_p));
            const double s = std::tanh(raw_s);
            const auto r   = PositionMapper::ratios_for_percentile(0.5 * (std::tanh(raw_p) + 1.0));
            if (RiskClassifier::classify(s, r) == RiskTier::Low) {
                RC_ASSERT(std::abs(s) < 0.3);
                RC_ASSERT(r.max_component() < 0.6);
            }
        }
    );

    return 0;
}
