#include "synthetic_data.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace iv_fit {

std::vector<double>
generate_synthetic_y(ModelKind model,
                     const std::vector<double> &xs,
                     const std::vector<double> &true_params,
                     double noise_sigma,
                     RandomEngine &rng) {
    if (!std::isfinite(noise_sigma) || noise_sigma < 0.0) {
        throw std::invalid_argument("Noise standard deviation must be finite and non-negative.");
    }

    std::vector<double> ys = evaluate_model(model, xs, true_params);

    std::normal_distribution<double> standard_normal(0.0, 1.0);
    for (double &y : ys) { y += noise_sigma * standard_normal(rng); }
    return ys;
}

ObservationSet
generate_observations(ModelKind model,
                      const std::vector<double> &xs,
                      const std::vector<double> &true_params,
                      double noise_sigma,
                      RandomEngine &rng) {
    if (!(noise_sigma > 0.0)) {
        throw std::invalid_argument("Observation uncertainty must be strictly positive; use generate_synthetic_y "
                                    "for noise-free data.");
    }
    std::vector<double> ys = generate_synthetic_y(model, xs, true_params, noise_sigma, rng);
    return make_observation_set(xs, std::move(ys), noise_sigma);
}

std::vector<double>
linspace(double start, double stop, std::size_t num_points) {
    std::vector<double> values;
    if (num_points == 0) { return values; }
    values.reserve(num_points);
    if (num_points == 1) {
        values.push_back(start);
        return values;
    }
    const double step = (stop - start) / static_cast<double>(num_points - 1);
    for (std::size_t i = 0; i < num_points; ++i) { values.push_back(start + step * static_cast<double>(i)); }
    values.back() = stop;
    return values;
}

} // namespace iv_fit
