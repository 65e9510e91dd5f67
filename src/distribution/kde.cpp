/// @file src/distribution/kde.cpp
/// @brief GaussianKde: one-dimensional Gaussian kernel density estimate.
///
/// Evaluation is vectorised over the sample with Eigen arrays:
///   f(x) = norm · Σ_i exp(−½ z_i²),   z_i = (x − x_i) / h
/// The CDF uses the complementary error function:
///   F(x) = 1/n · Σ_i ½·erfc(−z_i / √2)

#include "mktpsych/distribution.hpp"

#include <cmath>
#include <numbers>

namespace mktpsych {

// ─── linspace ─────────────────────────────────────────────────────────────────

Eigen::ArrayXd linspace(double lo, double hi, std::size_t points) {
    if (points == 0) {
        return Eigen::ArrayXd{};
    }
    if (points == 1) {
        return Eigen::ArrayXd::Constant(1, lo);
    }
    return Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(points), lo, hi);
}

// ─── GaussianKde ──────────────────────────────────────────────────────────────

GaussianKde::GaussianKde(std::span<const double> samples, double bandwidth)
    : samples_(Eigen::Map<const Eigen::ArrayXd>(samples.data(),
                                                static_cast<Eigen::Index>(samples.size())))
    , bandwidth_(bandwidth)
    , norm_(1.0 / (static_cast<double>(samples.size()) * bandwidth
                   * std::sqrt(2.0 * std::numbers::pi)))
{}

double GaussianKde::scott_factor(std::size_t n) noexcept {
    if (n == 0) return 0.0;
    return std::pow(static_cast<double>(n), -0.2);
}

double GaussianKde::operator()(double x) const noexcept {
    const Eigen::ArrayXd z = (samples_ - x) / bandwidth_;
    return norm_ * (-0.5 * z.square()).exp().sum();
}

Eigen::ArrayXd GaussianKde::evaluate(const Eigen::ArrayXd& xs) const {
    Eigen::ArrayXd out(xs.size());
    for (Eigen::Index i = 0; i < xs.size(); ++i) {
        out[i] = (*this)(xs[i]);
    }
    return out;
}

double GaussianKde::cdf(double x) const noexcept {
    if (samples_.size() == 0) return 0.0;
    double acc = 0.0;
    for (Eigen::Index i = 0; i < samples_.size(); ++i) {
        const double z = (x - samples_[i]) / bandwidth_;
        acc += 0.5 * std::erfc(-z / std::numbers::sqrt2);
    }
    return acc / static_cast<double>(samples_.size());
}

}  // namespace mktpsych
