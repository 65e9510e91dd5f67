#pragma once

/// @file include/mktpsych/distribution.hpp
/// @brief DistributionEstimator: Gaussian KDE over a return sample.
///
/// # Module: Distribution Estimation
///
/// ## Pipeline
///   1. One-pass outlier filter: drop |r − μ| > k·σ, with μ and the population
///      σ taken from the unfiltered sample. Not repeated.
///   2. Gaussian KDE with bandwidth
///        h = bandwidth_scale · n^(−1/5) · s
///      where n^(−1/5) is Scott's factor and s the (n − 1) standard deviation
///      of the filtered sample.
///   3. Density tabulated on a fixed grid; the cumulative trapezoid integral of
///      that table gives percentile(x).
///
/// ## Density
///   f(x) = 1 / (n·h·√(2π)) · Σ_i exp(−½ ((x − x_i) / h)²)
///
/// ## Percentile
///   x is clamped to [grid_min, grid_max]. The result is the kernel mass
///   below grid_min plus the cumulative grid integral, linearly interpolated
///   between grid points. Mass above grid_max is never counted, so a wide
///   sample reaches less than 1 at grid_max. If the sample sits almost
///   entirely outside the grid (mass < MIN_GRID_MASS) the closed form
///   1/n · Σ Φ((x − x_i)/h) is used at the clamped x instead.
///
/// ## Guarantees
/// - density(x) ≥ 0 and finite for finite x
/// - percentile(x) ∈ [0, 1] and non-decreasing in x
/// - A FittedDistribution is immutable; all queries are const and thread-safe

#include "mktpsych/config.hpp"
#include "mktpsych/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <span>

namespace mktpsych {

/// Evenly spaced grid of `points` values over [lo, hi] (inclusive).
[[nodiscard]] Eigen::ArrayXd linspace(double lo, double hi, std::size_t points);

// ─── GaussianKde ──────────────────────────────────────────────────────────────

/// One-dimensional Gaussian kernel density estimate.
class GaussianKde {
public:
    /// Fit over `samples` with kernel standard deviation `bandwidth`.
    /// Precondition (checked by DistributionEstimator): samples non-empty,
    /// bandwidth finite and > 0.
    GaussianKde(std::span<const double> samples, double bandwidth);

    /// Density at a single point.
    [[nodiscard]] double operator()(double x) const noexcept;

    /// Density at every point of `xs`.
    [[nodiscard]] Eigen::ArrayXd evaluate(const Eigen::ArrayXd& xs) const;

    /// Closed-form CDF: mean of Φ((x − x_i) / h).
    [[nodiscard]] double cdf(double x) const noexcept;

    [[nodiscard]] double bandwidth() const noexcept { return bandwidth_; }
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(samples_.size());
    }

    /// Scott's rule factor n^(−1/5) for one dimension.
    [[nodiscard]] static double scott_factor(std::size_t n) noexcept;

private:
    Eigen::ArrayXd samples_;
    double bandwidth_;
    double norm_;  ///< 1 / (n · h · √(2π))
};

// ─── FittedDistribution ───────────────────────────────────────────────────────

/// A KDE plus its percentile table and summary statistics.
/// Created once per analysis request.
class FittedDistribution {
public:
    FittedDistribution(GaussianKde kde,
                       ReturnSample filtered,
                       const EstimatorConfig& config);

    /// KDE density at x (≥ 0).
    [[nodiscard]] double density(double x) const noexcept;

    /// Density at every point of a uniform grid over [lo, hi].
    [[nodiscard]] Eigen::ArrayXd
    density_grid(double lo, double hi, std::size_t points) const;

    /// Fraction of fitted mass at or below x, in [0, 1].
    [[nodiscard]] double percentile(double x) const noexcept;

    /// Summary statistics of the filtered sample.
    [[nodiscard]] const DistributionStats& stats() const noexcept { return stats_; }

    /// Sample after outlier filtering.
    [[nodiscard]] std::span<const double> sample() const noexcept { return filtered_; }

    [[nodiscard]] const GaussianKde& kde() const noexcept { return kde_; }

private:
    GaussianKde       kde_;
    ReturnSample      filtered_;
    Eigen::ArrayXd    grid_;
    Eigen::ArrayXd    cumulative_;  ///< Trapezoid integral of density at grid_
    double            grid_mass_;
    double            lower_tail_;  ///< Kernel mass below grid_min
    DistributionStats stats_;
};

// ─── DistributionEstimator ────────────────────────────────────────────────────

class DistributionEstimator {
public:
    /// Filter outliers and fit the KDE.
    ///
    /// # Throws
    /// `DegenerateDistributionError` if the sample is empty, its filtered
    /// variance is zero, or the bandwidth is not finite and positive.
    [[nodiscard]] static FittedDistribution
    fit(std::span<const double> returns,
        const EstimatorConfig& config = EstimatorConfig{});

    /// One-pass filter: keep |r − mean| ≤ k·σ (population σ of the input).
    [[nodiscard]] static ReturnSample
    filter_outliers(std::span<const double> returns, double k) noexcept;

    /// Linear-interpolation empirical quantile (q in [0, 1]) of a sample.
    /// Precondition: sample non-empty.
    [[nodiscard]] static double
    quantile(std::span<const double> sample, double q) noexcept;
};

} // namespace mktpsych
