#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include "curve_fitter.hpp"
#include "iv_fit/device_quantities.hpp"
#include "model_functions.hpp"
#include "observation_set.hpp"
#include "synthetic_data.hpp"

#include <cmath>
#include <cstddef>
#include <gtest/gtest.h>
#include <vector>

namespace iv_fit {
namespace test_utils {

// x = [0, 0.001, ..., 0.010]: drive currents of the resistor scenario.
inline std::vector<double>
resistor_currents() {
    return linspace(0.0, 0.010, 11);
}

// Log-spaced currents from 10^lo to 10^hi (A).
inline std::vector<double>
log_spaced_currents(double lo_exponent, double hi_exponent, std::size_t num_points) {
    std::vector<double> currents;
    for (double e : linspace(lo_exponent, hi_exponent, num_points)) { currents.push_back(std::pow(10.0, e)); }
    return currents;
}

// A silicon-like diode used across the diode tests.
inline devices::DiodeParameters
reference_diode() {
    devices::DiodeParameters diode;
    diode.emission_coefficient = 1.8;
    diode.saturation_current = 1e-9;
    diode.series_resistance = 2.0;
    return diode;
}

// True if every fitted parameter lies within k standard errors of the truth.
inline bool
within_k_sigma(const FitResult &fit, const std::vector<double> &truth, double k) {
    const std::vector<double> errors = fit.standard_errors();
    for (std::size_t i = 0; i < truth.size(); ++i) {
        if (std::abs(fit.parameters[i] - truth[i]) > k * errors[i]) { return false; }
    }
    return true;
}

inline void
EXPECT_VECTOR_NEAR(const std::vector<double> &actual, const std::vector<double> &expected, double tolerance) {
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < actual.size(); ++i) {
        EXPECT_NEAR(actual[i], expected[i], tolerance) << "Mismatch at index " << i;
    }
}

inline double
sample_mean(const std::vector<double> &values) {
    double sum = 0.0;
    for (double v : values) { sum += v; }
    return sum / static_cast<double>(values.size());
}

} // namespace test_utils
} // namespace iv_fit

#endif // TEST_UTILS_HPP
