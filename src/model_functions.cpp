#include "model_functions.hpp"

#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace iv_fit {

namespace {

const ModelInfo kLinearInfo{ "linear", 2, { "A", "B" }, false };
const ModelInfo kLinearLogInfo{ "linear_log", 2, { "A", "B" }, true };
const ModelInfo kLinearLogPlusLinearInfo{ "linear_log_plus_linear", 3, { "A", "B", "R" }, true };

void
check_arity(ModelKind kind, const std::vector<double> &params) {
    const ModelInfo &info = model_info(kind);
    if (params.size() != info.arity) {
        throw DimensionMismatch("Model '" + info.name + "' expects " + std::to_string(info.arity) +
                                " parameters, got " + std::to_string(params.size()) + ".");
    }
}

// Abscissa of a point as seen by the model's slope (log space for the log models).
double
transformed_abscissa(ModelKind kind, double x) {
    return model_info(kind).requires_positive_x ? std::log(x) : x;
}

} // namespace

const ModelInfo &
model_info(ModelKind kind) {
    switch (kind) {
        case ModelKind::Linear:
            return kLinearInfo;
        case ModelKind::LinearLog:
            return kLinearLogInfo;
        case ModelKind::LinearLogPlusLinear:
            return kLinearLogPlusLinearInfo;
    }
    throw std::invalid_argument("Unknown model kind.");
}

ModelKind
model_kind_from_name(const std::string &name) {
    for (ModelKind kind : { ModelKind::Linear, ModelKind::LinearLog, ModelKind::LinearLogPlusLinear }) {
        if (model_info(kind).name == name) { return kind; }
    }
    throw std::invalid_argument("Unknown model name '" + name + "'.");
}

void
check_model_domain(ModelKind kind, double x) {
    if (!std::isfinite(x)) {
        throw DomainError("Model '" + model_info(kind).name + "' evaluated at non-finite x.");
    }
    if (model_info(kind).requires_positive_x && x <= 0.0) {
        throw DomainError("Model '" + model_info(kind).name + "' requires x > 0 (got " + std::to_string(x) + ").");
    }
}

double
evaluate_model(ModelKind kind, double x, const std::vector<double> &params) {
    check_arity(kind, params);
    return evaluate_model<double>(kind, x, params.data());
}

std::vector<double>
evaluate_model(ModelKind kind, const std::vector<double> &xs, const std::vector<double> &params) {
    check_arity(kind, params);
    std::vector<double> ys;
    ys.reserve(xs.size());
    for (double x : xs) { ys.push_back(evaluate_model<double>(kind, x, params.data())); }
    return ys;
}

std::vector<double>
initial_guess_from_endpoints(ModelKind kind, const std::vector<double> &xs, const std::vector<double> &ys) {
    if (xs.size() != ys.size()) {
        throw DimensionMismatch("x and y must have equal length (x: " + std::to_string(xs.size()) +
                                ", y: " + std::to_string(ys.size()) + ").");
    }
    if (xs.size() < 2) { throw InsufficientData("At least two points are needed to derive an initial guess."); }

    const double x_first = xs.front();
    const double x_last = xs.back();
    check_model_domain(kind, x_first);
    check_model_domain(kind, x_last);

    const double u_first = transformed_abscissa(kind, x_first);
    const double u_last = transformed_abscissa(kind, x_last);
    if (u_last == u_first) {
        throw InsufficientData("First and last observations share the same abscissa; slope is undefined.");
    }

    const double slope = (ys.back() - ys.front()) / (u_last - u_first);
    const double intercept = ys.front() - slope * u_first;

    std::vector<double> guess = { slope, intercept };
    if (kind == ModelKind::LinearLogPlusLinear) { guess.push_back(0.0); }
    return guess;
}

} // namespace iv_fit
