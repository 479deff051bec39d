// src/curve_fitter.cpp

#include "curve_fitter.hpp"

#include <ceres/ceres.h>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace iv_fit {

// --- FitOptions ---

void
FitOptions::validate() const {
    if (max_iterations <= 0) { throw std::invalid_argument("FitOptions: max_iterations must be positive."); }
    if (!(function_tolerance > 0.0) || !(gradient_tolerance > 0.0) || !(parameter_tolerance > 0.0)) {
        throw std::invalid_argument("FitOptions: solver tolerances must be strictly positive.");
    }
}

// --- FitResult ---

std::vector<double>
standard_errors(const Eigen::MatrixXd &covariance) {
    if (covariance.rows() != covariance.cols()) {
        throw DimensionMismatch("Covariance matrix must be square (got " + std::to_string(covariance.rows()) + "x" +
                                std::to_string(covariance.cols()) + ").");
    }
    std::vector<double> errors(static_cast<std::size_t>(covariance.rows()));
    for (Eigen::Index i = 0; i < covariance.rows(); ++i) {
        const double variance = covariance(i, i);
        if (variance < 0.0) {
            throw std::invalid_argument("Covariance diagonal entry " + std::to_string(i) + " is negative.");
        }
        errors[static_cast<std::size_t>(i)] = std::sqrt(variance);
    }
    return errors;
}

std::vector<double>
FitResult::standard_errors() const {
    return iv_fit::standard_errors(covariance);
}

std::vector<double>
FitResult::predict(const std::vector<double> &xs) const {
    return evaluate_model(model, xs, parameters);
}

namespace {

std::size_t
parameter_index(ModelKind model, const std::string &name) {
    const ModelInfo &info = model_info(model);
    for (std::size_t i = 0; i < info.parameter_names.size(); ++i) {
        if (info.parameter_names[i] == name) { return i; }
    }
    throw std::invalid_argument("Model '" + info.name + "' has no parameter named '" + name + "'.");
}

} // namespace

double
FitResult::parameter(const std::string &name) const {
    return parameters.at(parameter_index(model, name));
}

double
FitResult::standard_error(const std::string &name) const {
    return standard_errors().at(parameter_index(model, name));
}

// --- WeightedResidualFunctor ---

WeightedResidualFunctor::WeightedResidualFunctor(ModelKind model, double x, double y, double sigma)
  : model_(model)
  , x_(x)
  , y_(y)
  , sigma_(sigma) {}

// --- CurveFitProblem Method Implementations ---

CurveFitProblem::CurveFitProblem(ModelKind model, ObservationSet data, FitOptions options)
  : model_(model)
  , data_(std::move(data))
  , options_(options)
  , num_parameters_(model_arity(model)) {
    // --- Validation ---
    options_.validate();
    data_.validate();
    if (data_.size() <= num_parameters_) {
        throw InsufficientData("Model '" + model_info(model_).name + "' has " + std::to_string(num_parameters_) +
                               " parameters but only " + std::to_string(data_.size()) +
                               " observations were supplied; at least one degree of freedom is required.");
    }
    for (double x : data_.x) { check_model_domain(model_, x); }
}

FitResult
CurveFitProblem::solve(const std::vector<double> &initial_guess) const {
    if (initial_guess.size() != num_parameters_) {
        throw DimensionMismatch("Initial guess vector size (" + std::to_string(initial_guess.size()) +
                                ") does not match number of model parameters (" + std::to_string(num_parameters_) +
                                ").");
    }
    for (double value : initial_guess) {
        if (!std::isfinite(value)) { throw std::invalid_argument("Initial guess contains a non-finite value."); }
    }

    std::vector<double> parameter_values = initial_guess;
    ceres::Problem problem;

    // One residual block per observation
    for (std::size_t i = 0; i < data_.size(); ++i) {
        auto *dynamic_cost_function = new ceres::DynamicAutoDiffCostFunction<WeightedResidualFunctor, 4>(
          new WeightedResidualFunctor(model_, data_.x[i], data_.y[i], data_.sigma[i]));
        dynamic_cost_function->AddParameterBlock(static_cast<int>(num_parameters_));
        dynamic_cost_function->SetNumResiduals(1);
        problem.AddResidualBlock(dynamic_cost_function, nullptr, parameter_values.data());
    }

    // Configure Ceres solver options
    ceres::Solver::Options solver_options;
    solver_options.linear_solver_type = ceres::DENSE_QR; // Only 2-3 parameters
    solver_options.max_num_iterations = options_.max_iterations;
    solver_options.function_tolerance = options_.function_tolerance;
    solver_options.gradient_tolerance = options_.gradient_tolerance;
    solver_options.parameter_tolerance = options_.parameter_tolerance;
    solver_options.minimizer_progress_to_stdout = options_.verbose;
    solver_options.logging_type = options_.verbose ? ceres::PER_MINIMIZER_ITERATION : ceres::SILENT;

    if (options_.verbose) {
        std::cout << "[CurveFitProblem] Fitting '" << model_info(model_).name << "' to " << data_.size()
                  << " observations." << std::endl;
    }

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);

    if (options_.verbose) { std::cout << summary.FullReport() << "\n"; }

    if (summary.termination_type != ceres::CONVERGENCE) {
        throw ConvergenceError("Fit of model '" + model_info(model_).name +
                               "' did not converge: " + summary.BriefReport());
    }
    for (double value : parameter_values) {
        if (!std::isfinite(value)) {
            throw ConvergenceError("Fit of model '" + model_info(model_).name +
                                   "' converged to a non-finite parameter vector.");
        }
    }

    FitResult result;
    result.model = model_;
    result.parameters = parameter_values;
    result.covariance = compute_covariance(problem, parameter_values.data());
    result.chi_square = 2.0 * summary.final_cost; // Ceres minimizes 0.5 * sum(r^2)
    result.num_observations = data_.size();
    result.num_iterations = static_cast<int>(summary.iterations.size());
    result.solver_report = summary.BriefReport();

    if (!options_.absolute_sigma) {
        const double dof = static_cast<double>(data_.size() - num_parameters_);
        result.covariance *= result.chi_square / dof;
    }
    return result;
}

Eigen::MatrixXd
CurveFitProblem::compute_covariance(ceres::Problem &problem, const double *parameter_block) const {
    ceres::Covariance::Options covariance_options;
    covariance_options.algorithm_type = ceres::DENSE_SVD;
    ceres::Covariance covariance(covariance_options);

    std::vector<std::pair<const double *, const double *>> covariance_blocks;
    covariance_blocks.emplace_back(parameter_block, parameter_block);

    if (!covariance.Compute(covariance_blocks, &problem)) {
        std::cerr << "[CurveFitProblem] Warning: Jacobian is rank deficient at the minimum." << std::endl;
        throw ConvergenceError("Covariance of model '" + model_info(model_).name +
                               "' could not be estimated; the parameters are not identifiable from this data.");
    }

    // Ceres fills the block in row-major order
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> block(num_parameters_, num_parameters_);
    if (!covariance.GetCovarianceBlock(parameter_block, parameter_block, block.data())) {
        throw ConvergenceError("Covariance block of model '" + model_info(model_).name + "' is unavailable.");
    }
    Eigen::MatrixXd symmetric = 0.5 * (block + block.transpose());
    return symmetric;
}

// --- Convenience entry points ---

FitResult
fit_curve(ModelKind model,
          const std::vector<double> &x,
          const std::vector<double> &y,
          const std::vector<double> &sigma,
          const std::vector<double> &initial_guess,
          const FitOptions &options) {
    ObservationSet data;
    data.x = x;
    data.y = y;
    data.sigma = sigma;
    return CurveFitProblem(model, std::move(data), options).solve(initial_guess);
}

FitResult
fit_curve(ModelKind model,
          const ObservationSet &data,
          const std::vector<double> &initial_guess,
          const FitOptions &options) {
    return CurveFitProblem(model, data, options).solve(initial_guess);
}

FitResult
fit_curve(ModelKind model, const ObservationSet &data, const FitOptions &options) {
    CurveFitProblem problem(model, data, options);
    return problem.solve(initial_guess_from_endpoints(model, data.x, data.y));
}

} // namespace iv_fit
