/// @file src/distribution/distribution_estimator.cpp
/// @brief Outlier filtering, KDE fitting, percentile table and summary
///        statistics.

#include "mktpsych/distribution.hpp"
#include "mktpsych/constants.hpp"
#include "mktpsych/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace mktpsych {

namespace {

[[nodiscard]] double mean_of(std::span<const double> v) noexcept {
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

/// k-th central moment (population normalisation).
[[nodiscard]] double central_moment(std::span<const double> v, double mu, int k) noexcept {
    double acc = 0.0;
    for (double x : v) {
        acc += std::pow(x - mu, k);
    }
    return acc / static_cast<double>(v.size());
}

}  // namespace

// ─── FittedDistribution ───────────────────────────────────────────────────────

FittedDistribution::FittedDistribution(GaussianKde kde,
                                       ReturnSample filtered,
                                       const EstimatorConfig& config)
    : kde_(std::move(kde))
    , filtered_(std::move(filtered))
    , grid_(linspace(config.grid_min, config.grid_max, config.grid_points))
    , cumulative_(Eigen::ArrayXd::Zero(grid_.size()))
    , grid_mass_(0.0)
    , lower_tail_(0.0)
    , stats_{}
{
    // ── Percentile table: cumulative trapezoid integral of the density ───────
    const Eigen::ArrayXd dens = kde_.evaluate(grid_);
    for (Eigen::Index i = 1; i < grid_.size(); ++i) {
        const double dx = grid_[i] - grid_[i - 1];
        cumulative_[i] = cumulative_[i - 1] + 0.5 * (dens[i - 1] + dens[i]) * dx;
    }
    grid_mass_ = grid_.size() > 0 ? cumulative_[grid_.size() - 1] : 0.0;
    lower_tail_ = grid_.size() > 0 ? kde_.cdf(grid_[0]) : 0.0;

    // ── Summary statistics of the filtered sample ─────────────────────────────
    const std::span<const double> s = filtered_;
    const double n  = static_cast<double>(s.size());
    const double mu = mean_of(s);
    const double m2 = central_moment(s, mu, 2);
    const double m3 = central_moment(s, mu, 3);
    const double m4 = central_moment(s, mu, 4);

    Eigen::Index peak_idx = 0;
    if (dens.size() > 0) {
        dens.maxCoeff(&peak_idx);
    }

    stats_.mean          = mu;
    stats_.std_dev       = std::sqrt(m2 * n / (n - 1.0));
    stats_.skewness      = m3 / std::pow(m2, 1.5);
    stats_.kurtosis      = m4 / (m2 * m2) - 3.0;
    stats_.peak_position = grid_.size() > 0 ? grid_[peak_idx] : mu;
    stats_.percentile_5  = DistributionEstimator::quantile(s, 0.05);
    stats_.percentile_25 = DistributionEstimator::quantile(s, 0.25);
    stats_.percentile_50 = DistributionEstimator::quantile(s, 0.50);
    stats_.percentile_75 = DistributionEstimator::quantile(s, 0.75);
    stats_.percentile_95 = DistributionEstimator::quantile(s, 0.95);
    stats_.sample_size   = s.size();
    stats_.bandwidth     = kde_.bandwidth();
}

double FittedDistribution::density(double x) const noexcept {
    return kde_(x);
}

Eigen::ArrayXd
FittedDistribution::density_grid(double lo, double hi, std::size_t points) const {
    return kde_.evaluate(linspace(lo, hi, points));
}

double FittedDistribution::percentile(double x) const noexcept {
    const Eigen::Index n = grid_.size();
    if (n < 2 || std::isnan(x)) {
        return 0.0;
    }

    const double lo = grid_[0];
    const double hi = grid_[n - 1];
    const double xc = std::clamp(x, lo, hi);

    if (grid_mass_ < constants::MIN_GRID_MASS) {
        // Sample lies almost entirely off-grid: the table carries no information.
        return std::clamp(kde_.cdf(xc), 0.0, 1.0);
    }

    const double step = (hi - lo) / static_cast<double>(n - 1);
    const double t    = (xc - lo) / step;
    const auto   i    = std::clamp<Eigen::Index>(static_cast<Eigen::Index>(std::floor(t)),
                                                 0, n - 2);
    const double frac = std::clamp(t - static_cast<double>(i), 0.0, 1.0);
    const double cum  = cumulative_[i] + (cumulative_[i + 1] - cumulative_[i]) * frac;

    return std::clamp(lower_tail_ + cum, 0.0, 1.0);
}

// ─── DistributionEstimator ────────────────────────────────────────────────────

ReturnSample
DistributionEstimator::filter_outliers(std::span<const double> returns, double k) noexcept {
    ReturnSample out;
    if (returns.empty()) {
        return out;
    }

    const double mu    = mean_of(returns);
    const double sigma = std::sqrt(central_moment(returns, mu, 2));
    const double limit = k * sigma;

    out.reserve(returns.size());
    for (double r : returns) {
        if (std::abs(r - mu) <= limit) {
            out.push_back(r);
        }
    }
    return out;
}

double DistributionEstimator::quantile(std::span<const double> sample, double q) noexcept {
    std::vector<double> sorted(sample.begin(), sample.end());
    std::sort(sorted.begin(), sorted.end());

    const double pos  = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    const auto   lo   = static_cast<std::size_t>(std::floor(pos));
    const auto   hi   = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

FittedDistribution
DistributionEstimator::fit(std::span<const double> returns, const EstimatorConfig& config) {
    if (returns.empty()) {
        throw DegenerateDistributionError("empty return sample");
    }
    for (double r : returns) {
        if (!std::isfinite(r)) {
            throw DegenerateDistributionError("return sample contains non-finite values");
        }
    }

    ReturnSample filtered = filter_outliers(returns, config.outlier_sigma);
    if (filtered.size() < 2) {
        throw DegenerateDistributionError(
            fmt::format("{} returns left after outlier filtering", filtered.size()));
    }

    const double mu = mean_of(filtered);
    double sq = 0.0;
    for (double r : filtered) {
        sq += (r - mu) * (r - mu);
    }
    const double variance = sq / static_cast<double>(filtered.size() - 1);
    if (!(variance > constants::MIN_SAMPLE_VARIANCE)) {
        throw DegenerateDistributionError("return sample has zero variance");
    }

    const double bandwidth = config.bandwidth_scale
                           * GaussianKde::scott_factor(filtered.size())
                           * std::sqrt(variance);
    if (!std::isfinite(bandwidth) || bandwidth <= 0.0) {
        throw DegenerateDistributionError(
            fmt::format("cannot fit KDE: bandwidth {} is not usable", bandwidth));
    }

    GaussianKde kde(filtered, bandwidth);
    return FittedDistribution(std::move(kde), std::move(filtered), config);
}

}  // namespace mktpsych
