#include "iv_fit/device_quantities.hpp"
#include "fit_errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace iv_fit {
namespace devices {

namespace {

void
require_parameters(const std::vector<double> &params, std::size_t needed, const char *quantity) {
    if (params.size() < needed) {
        throw DimensionMismatch(std::string(quantity) + " needs at least " + std::to_string(needed) +
                                " parameters, got " + std::to_string(params.size()) + ".");
    }
}

} // namespace

double
thermal_voltage(double temperature_kelvin) {
    if (!(temperature_kelvin > 0.0) || !std::isfinite(temperature_kelvin)) {
        throw std::invalid_argument("Temperature must be finite and strictly positive (got " +
                                    std::to_string(temperature_kelvin) + " K).");
    }
    return kBoltzmann * temperature_kelvin / kElementaryCharge;
}

std::vector<double>
diode_linear_log_parameters(const DiodeParameters &diode) {
    if (!(diode.saturation_current > 0.0)) {
        throw std::invalid_argument("Saturation current must be strictly positive.");
    }
    const double slope = diode.emission_coefficient * thermal_voltage(diode.temperature);
    return { slope, -slope * std::log(diode.saturation_current) };
}

std::vector<double>
diode_linear_log_plus_linear_parameters(const DiodeParameters &diode) {
    std::vector<double> params = diode_linear_log_parameters(diode);
    params.push_back(diode.series_resistance);
    return params;
}

double
emission_coefficient(const std::vector<double> &params, double temperature_kelvin) {
    require_parameters(params, 1, "Emission coefficient");
    return params[0] / thermal_voltage(temperature_kelvin);
}

double
saturation_current(const std::vector<double> &params) {
    require_parameters(params, 2, "Saturation current");
    return std::exp(-params[1] / params[0]);
}

double
series_resistance(const std::vector<double> &params) {
    require_parameters(params, 3, "Series resistance");
    return params[2];
}

double
resistance(const std::vector<double> &params) {
    require_parameters(params, 1, "Resistance");
    return params[0];
}

DerivedQuantity
emission_coefficient_quantity(double temperature_kelvin) {
    const double v_t = thermal_voltage(temperature_kelvin);
    return [v_t](const std::vector<double> &params) {
        require_parameters(params, 1, "Emission coefficient");
        return params[0] / v_t;
    };
}

DerivedQuantity
saturation_current_quantity() {
    return [](const std::vector<double> &params) { return saturation_current(params); };
}

DerivedQuantity
series_resistance_quantity() {
    return [](const std::vector<double> &params) { return series_resistance(params); };
}

DerivedQuantity
resistance_quantity() {
    return [](const std::vector<double> &params) { return resistance(params); };
}

DerivedQuantity
parameter_quantity(std::size_t index) {
    return [index](const std::vector<double> &params) {
        require_parameters(params, index + 1, "Parameter selection");
        return params[index];
    };
}

} // namespace devices
} // namespace iv_fit
