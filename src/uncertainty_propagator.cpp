#include "uncertainty_propagator.hpp"
#include "fit_errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace iv_fit {

namespace {

void
validate_inputs(const std::vector<double> &params,
                const Eigen::MatrixXd &covariance,
                const DerivedQuantity &quantity,
                const PropagationOptions &options) {
    if (covariance.rows() != covariance.cols()) {
        throw DimensionMismatch("Covariance matrix must be square (got " + std::to_string(covariance.rows()) + "x" +
                                std::to_string(covariance.cols()) + ").");
    }
    if (static_cast<std::size_t>(covariance.rows()) != params.size()) {
        throw DimensionMismatch("Covariance dimension (" + std::to_string(covariance.rows()) +
                                ") does not match parameter count (" + std::to_string(params.size()) + ").");
    }
    if (options.num_trials == 0) { throw std::invalid_argument("Monte Carlo propagation needs at least one trial."); }
    if (!quantity) { throw std::invalid_argument("Derived quantity function is empty."); }
    for (Eigen::Index i = 0; i < covariance.rows(); ++i) {
        if (!(covariance(i, i) >= 0.0)) {
            throw std::invalid_argument("Variance of parameter " + std::to_string(i) + " is negative or NaN.");
        }
    }
}

// Symmetric square root of a PSD matrix; small negative eigenvalues from round-off are clamped.
Eigen::MatrixXd
covariance_square_root(const Eigen::MatrixXd &covariance) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
    if (solver.info() != Eigen::Success) {
        throw std::invalid_argument("Eigendecomposition of the covariance matrix failed.");
    }
    Eigen::VectorXd roots = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
    return solver.eigenvectors() * roots.asDiagonal() * solver.eigenvectors().transpose();
}

} // namespace

std::vector<double>
propagate_uncertainty(const std::vector<double> &params,
                      const Eigen::MatrixXd &covariance,
                      const DerivedQuantity &quantity,
                      RandomEngine &rng,
                      const PropagationOptions &options) {
    validate_inputs(params, covariance, quantity, options);

    const std::size_t num_params = params.size();
    std::normal_distribution<double> standard_normal(0.0, 1.0);

    std::vector<double> samples;
    samples.reserve(options.num_trials);
    std::vector<double> draw(num_params);

    if (options.mode == SamplingMode::IndependentDiagonal) {
        std::vector<double> stddevs(num_params);
        for (std::size_t j = 0; j < num_params; ++j) {
            stddevs[j] = std::sqrt(covariance(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(j)));
        }
        for (std::size_t trial = 0; trial < options.num_trials; ++trial) {
            for (std::size_t j = 0; j < num_params; ++j) { draw[j] = params[j] + stddevs[j] * standard_normal(rng); }
            samples.push_back(quantity(draw));
        }
        return samples;
    }

    const Eigen::MatrixXd root = covariance_square_root(covariance);
    Eigen::VectorXd z(static_cast<Eigen::Index>(num_params));
    for (std::size_t trial = 0; trial < options.num_trials; ++trial) {
        for (Eigen::Index j = 0; j < z.size(); ++j) { z(j) = standard_normal(rng); }
        const Eigen::VectorXd offset = root * z;
        for (std::size_t j = 0; j < num_params; ++j) { draw[j] = params[j] + offset(static_cast<Eigen::Index>(j)); }
        samples.push_back(quantity(draw));
    }
    return samples;
}

std::vector<double>
propagate_uncertainty(const FitResult &result,
                      const DerivedQuantity &quantity,
                      RandomEngine &rng,
                      const PropagationOptions &options) {
    return propagate_uncertainty(result.parameters, result.covariance, quantity, rng, options);
}

double
percentile_sorted(const std::vector<double> &sorted_values, double q) {
    if (sorted_values.empty()) { throw InsufficientData("Percentile of an empty sample set is undefined."); }
    if (!(q >= 0.0 && q <= 100.0)) { throw std::invalid_argument("Percentile must lie in [0, 100]."); }

    const double position = q / 100.0 * static_cast<double>(sorted_values.size() - 1);
    const std::size_t lower = static_cast<std::size_t>(std::floor(position));
    const std::size_t upper = std::min(lower + 1, sorted_values.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return sorted_values[lower] + fraction * (sorted_values[upper] - sorted_values[lower]);
}

SampleSummary
summarize_samples(const std::vector<double> &samples) {
    std::vector<double> finite;
    finite.reserve(samples.size());
    std::copy_if(samples.begin(), samples.end(), std::back_inserter(finite), [](double v) { return std::isfinite(v); });
    if (finite.empty()) { throw InsufficientData("Sample set contains no finite values."); }

    SampleSummary summary;
    summary.count = samples.size();
    summary.finite_count = finite.size();

    // Welford accumulation
    double mean = 0.0;
    double m2 = 0.0;
    std::size_t n = 0;
    for (double v : finite) {
        ++n;
        const double delta = v - mean;
        mean += delta / static_cast<double>(n);
        m2 += delta * (v - mean);
    }
    summary.mean = mean;
    summary.stddev = n > 1 ? std::sqrt(m2 / static_cast<double>(n - 1)) : 0.0;

    std::sort(finite.begin(), finite.end());
    summary.min = finite.front();
    summary.max = finite.back();
    summary.median = percentile_sorted(finite, 50.0);
    summary.lower_1sigma = percentile_sorted(finite, 15.865);
    summary.upper_1sigma = percentile_sorted(finite, 84.135);
    return summary;
}

} // namespace iv_fit
