#ifndef MODEL_FUNCTIONS_HPP
#define MODEL_FUNCTIONS_HPP

#include "fit_errors.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace iv_fit {

/**
 * @brief The closed set of device laws the library can fit.
 *
 * Parameters are always ordered as listed:
 *   Linear:              y = A*x + B                 [A, B]
 *   LinearLog:           y = A*ln(x) + B             [A, B]
 *   LinearLogPlusLinear: y = A*ln(x) + B + R*x       [A, B, R]
 */
enum class ModelKind { Linear, LinearLog, LinearLogPlusLinear };

/**
 * @brief Static description of a model variant.
 */
struct ModelInfo {
    std::string name;
    std::size_t arity;
    std::vector<std::string> parameter_names;
    bool requires_positive_x;
};

const ModelInfo &
model_info(ModelKind kind);

inline std::size_t
model_arity(ModelKind kind) {
    return model_info(kind).arity;
}

/**
 * @brief Parses "linear", "linear_log" or "linear_log_plus_linear".
 * @throws std::invalid_argument For any other name.
 */
ModelKind
model_kind_from_name(const std::string &name);

// Throws DomainError unless x is finite and, for the log models, strictly positive.
void
check_model_domain(ModelKind kind, double x);

/**
 * @brief Evaluates a model at a single point.
 *
 * Templated on the parameter scalar so the same code path serves plain doubles
 * (data generation, prediction) and ceres::Jet (automatic differentiation
 * inside the fitter). `params` must point to model_arity(kind) values.
 *
 * @throws DomainError If x lies outside the model's domain.
 */
template<typename T>
T
evaluate_model(ModelKind kind, double x, const T *params) {
    check_model_domain(kind, x);
    switch (kind) {
        case ModelKind::Linear:
            return params[0] * x + params[1];
        case ModelKind::LinearLog:
            return params[0] * std::log(x) + params[1];
        case ModelKind::LinearLogPlusLinear:
            return params[0] * std::log(x) + params[1] + params[2] * x;
    }
    throw std::invalid_argument("Unknown model kind.");
}

/**
 * @brief Evaluates a model at a single point.
 * @throws DimensionMismatch If params does not match the model arity.
 * @throws DomainError If x lies outside the model's domain.
 */
double
evaluate_model(ModelKind kind, double x, const std::vector<double> &params);

/**
 * @brief Applies the same parameters to every x value.
 * @throws DimensionMismatch If params does not match the model arity.
 * @throws DomainError If any x lies outside the model's domain.
 */
std::vector<double>
evaluate_model(ModelKind kind, const std::vector<double> &xs, const std::vector<double> &params);

/**
 * @brief Derives a starting point for the fitter from the first and last observation.
 *
 * The slope is taken between the endpoints (in log-x space for the log models)
 * and the intercept is solved algebraically so the line passes through the
 * first point. The linear coefficient of LinearLogPlusLinear starts at zero.
 *
 * @throws DimensionMismatch If xs and ys differ in length.
 * @throws InsufficientData If fewer than two points are given or both endpoints share the same abscissa.
 * @throws DomainError If an endpoint lies outside the model's domain.
 */
std::vector<double>
initial_guess_from_endpoints(ModelKind kind, const std::vector<double> &xs, const std::vector<double> &ys);

} // namespace iv_fit

#endif // MODEL_FUNCTIONS_HPP
