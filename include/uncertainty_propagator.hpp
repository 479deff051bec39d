#ifndef UNCERTAINTY_PROPAGATOR_HPP
#define UNCERTAINTY_PROPAGATOR_HPP

#include "curve_fitter.hpp"
#include "random_source.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <vector>

namespace iv_fit {

/**
 * @brief A quantity computed from a parameter vector (e.g. an emission coefficient).
 *
 * May return a non-finite value for pathological samples; it should only
 * throw for genuine programming errors.
 */
using DerivedQuantity = std::function<double(const std::vector<double> &)>;

enum class SamplingMode {
    // Each parameter is drawn from N(p_i, sqrt(C_ii)); correlations are ignored.
    IndependentDiagonal,
    // Parameters are drawn jointly from N(p, C).
    FullCovariance
};

struct PropagationOptions {
    std::size_t num_trials = 10000;
    SamplingMode mode = SamplingMode::IndependentDiagonal;
};

/**
 * @brief Monte Carlo propagation of fit uncertainty into a derived quantity.
 *
 * Returns exactly options.num_trials values in draw order. Non-finite values
 * returned by the quantity are kept so callers can detect heavy tails;
 * exceptions thrown by the quantity propagate unchanged.
 *
 * The default IndependentDiagonal mode discards the off-diagonal covariance
 * terms. This is a known approximation; use FullCovariance to keep the
 * parameter correlations the fitter estimated.
 *
 * @throws DimensionMismatch If covariance is not square or does not match params.
 * @throws std::invalid_argument If num_trials is zero, the quantity is empty, or a variance is negative.
 */
std::vector<double>
propagate_uncertainty(const std::vector<double> &params,
                      const Eigen::MatrixXd &covariance,
                      const DerivedQuantity &quantity,
                      RandomEngine &rng,
                      const PropagationOptions &options = PropagationOptions());

std::vector<double>
propagate_uncertainty(const FitResult &result,
                      const DerivedQuantity &quantity,
                      RandomEngine &rng,
                      const PropagationOptions &options = PropagationOptions());

/**
 * @brief Summary statistics of a Monte Carlo sample set (finite values only).
 */
struct SampleSummary {
    std::size_t count = 0;        ///< All samples, finite or not.
    std::size_t finite_count = 0; ///< Samples that entered the statistics below.
    double mean = 0.0;
    double stddev = 0.0; ///< Sample standard deviation (n - 1).
    double median = 0.0;
    double lower_1sigma = 0.0; ///< 15.865th percentile.
    double upper_1sigma = 0.0; ///< 84.135th percentile.
    double min = 0.0;
    double max = 0.0;
};

/**
 * @throws InsufficientData If no sample is finite.
 */
SampleSummary
summarize_samples(const std::vector<double> &samples);

/**
 * @brief Linear-interpolated percentile of already sorted values, q in [0, 100].
 */
double
percentile_sorted(const std::vector<double> &sorted_values, double q);

} // namespace iv_fit

#endif // UNCERTAINTY_PROPAGATOR_HPP
