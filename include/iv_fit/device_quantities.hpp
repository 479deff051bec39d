#ifndef DEVICE_QUANTITIES_HPP
#define DEVICE_QUANTITIES_HPP

#include "../uncertainty_propagator.hpp" // For DerivedQuantity

#include <cstddef>
#include <vector>

namespace iv_fit {
namespace devices {

constexpr double kBoltzmann = 1.380649e-23;          // J/K
constexpr double kElementaryCharge = 1.602176634e-19; // C
constexpr double kRoomTemperature = 300.0;            // K

/**
 * @brief kT/q in volts.
 * @throws std::invalid_argument If temperature_kelvin is not strictly positive.
 */
double
thermal_voltage(double temperature_kelvin = kRoomTemperature);

/**
 * @brief Physical description of a diode, convertible to fit parameters.
 *
 * The diode law I = I_s * exp(V / (eta * V_T)) solved for the voltage gives
 *   V = eta*V_T * ln(I) - eta*V_T * ln(I_s)  (+ R_s * I with a series resistance),
 * i.e. the LinearLog / LinearLogPlusLinear models with x = I and y = V.
 */
struct DiodeParameters {
    double emission_coefficient = 1.0;
    double saturation_current = 1e-12; // A
    double series_resistance = 0.0;    // Ohm
    double temperature = kRoomTemperature;
};

// [A, B] for ModelKind::LinearLog (series resistance ignored).
std::vector<double>
diode_linear_log_parameters(const DiodeParameters &diode);

// [A, B, R] for ModelKind::LinearLogPlusLinear.
std::vector<double>
diode_linear_log_plus_linear_parameters(const DiodeParameters &diode);

// --- Quantities derived from fitted parameters ---
// All throw DimensionMismatch when the parameter vector is too short. A zero
// slope A is not an error: the result may then be non-finite.

// eta = A / V_T
double
emission_coefficient(const std::vector<double> &params, double temperature_kelvin = kRoomTemperature);

// I_s = exp(-B / A)
double
saturation_current(const std::vector<double> &params);

// R of the LinearLogPlusLinear model.
double
series_resistance(const std::vector<double> &params);

// Slope A of the Linear model read as V = R*I + B.
double
resistance(const std::vector<double> &params);

// --- DerivedQuantity adapters for propagate_uncertainty ---

DerivedQuantity
emission_coefficient_quantity(double temperature_kelvin = kRoomTemperature);

DerivedQuantity
saturation_current_quantity();

DerivedQuantity
series_resistance_quantity();

DerivedQuantity
resistance_quantity();

// Identity on one parameter; mainly useful to check propagation itself.
DerivedQuantity
parameter_quantity(std::size_t index);

} // namespace devices
} // namespace iv_fit

#endif // DEVICE_QUANTITIES_HPP
