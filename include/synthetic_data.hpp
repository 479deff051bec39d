#ifndef SYNTHETIC_DATA_HPP
#define SYNTHETIC_DATA_HPP

#include "model_functions.hpp"
#include "observation_set.hpp"
#include "random_source.hpp"

#include <cstddef>
#include <vector>

namespace iv_fit {

/**
 * @brief Generative model: y_i = model(x_i, true_params) + noise_sigma * z_i, z_i ~ N(0, 1).
 *
 * Draws exactly one standard normal per point, in order. noise_sigma == 0
 * yields the exact model values.
 *
 * @throws DimensionMismatch If true_params does not match the model arity.
 * @throws DomainError If an x value lies outside the model's domain.
 * @throws std::invalid_argument If noise_sigma is negative or non-finite.
 */
std::vector<double>
generate_synthetic_y(ModelKind model,
                     const std::vector<double> &xs,
                     const std::vector<double> &true_params,
                     double noise_sigma,
                     RandomEngine &rng);

/**
 * @brief Same as generate_synthetic_y, packaged with noise_sigma as every point's uncertainty.
 * @throws std::invalid_argument If noise_sigma is not strictly positive.
 */
ObservationSet
generate_observations(ModelKind model,
                      const std::vector<double> &xs,
                      const std::vector<double> &true_params,
                      double noise_sigma,
                      RandomEngine &rng);

// num_points evenly spaced values from start to stop inclusive.
std::vector<double>
linspace(double start, double stop, std::size_t num_points);

} // namespace iv_fit

#endif // SYNTHETIC_DATA_HPP
