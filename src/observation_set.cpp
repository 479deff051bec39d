#include "observation_set.hpp"
#include "fit_errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace iv_fit {

void
ObservationSet::validate() const {
    if (y.size() != x.size() || sigma.size() != x.size()) {
        throw DimensionMismatch("Observation columns must have equal length (x: " + std::to_string(x.size()) +
                                ", y: " + std::to_string(y.size()) + ", sigma: " + std::to_string(sigma.size()) +
                                ").");
    }
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            throw std::invalid_argument("Observation " + std::to_string(i) + " contains a non-finite value.");
        }
        if (!std::isfinite(sigma[i]) || sigma[i] <= 0.0) {
            throw std::invalid_argument("Uncertainty of observation " + std::to_string(i) +
                                        " must be finite and strictly positive (got " + std::to_string(sigma[i]) +
                                        ").");
        }
    }
}

ObservationSet
make_observation_set(std::vector<double> x, std::vector<double> y, std::vector<double> sigma) {
    ObservationSet data;
    data.x = std::move(x);
    data.y = std::move(y);
    data.sigma = std::move(sigma);
    data.validate();
    return data;
}

ObservationSet
make_observation_set(std::vector<double> x, std::vector<double> y, double sigma) {
    std::vector<double> sigma_column(x.size(), sigma);
    return make_observation_set(std::move(x), std::move(y), std::move(sigma_column));
}

} // namespace iv_fit
