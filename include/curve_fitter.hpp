#ifndef CURVE_FITTER_HPP
#define CURVE_FITTER_HPP

#include "fit_errors.hpp"
#include "model_functions.hpp"
#include "observation_set.hpp"

#include <Eigen/Dense>
#include <ceres/ceres.h>
#include <cstddef>
#include <exception>
#include <limits>
#include <string>
#include <vector>

namespace iv_fit {

/**
 * @brief Solver settings for a single fit.
 */
struct FitOptions {
    int max_iterations = 200;
    double function_tolerance = 1e-10;
    double gradient_tolerance = 1e-12;
    double parameter_tolerance = 1e-10;

    // true: sigma is an absolute uncertainty and the covariance is (J^T J)^-1.
    // false: sigma only sets relative weights and the covariance is rescaled
    // by the reduced chi-square of the fit.
    bool absolute_sigma = true;

    bool verbose = false; // Print Ceres iteration progress and the full report.

    /**
     * @throws std::invalid_argument If an iteration count or tolerance is not strictly positive.
     */
    void validate() const;
};

/**
 * @brief Best-fit parameters of one model against one observation set.
 *
 * covariance is always parameters.size() x parameters.size().
 */
struct FitResult {
    ModelKind model = ModelKind::Linear;
    std::vector<double> parameters;
    Eigen::MatrixXd covariance;

    double chi_square = std::numeric_limits<double>::quiet_NaN(); // Weighted SSR at the minimum.
    std::size_t num_observations = 0;
    int num_iterations = 0;
    std::string solver_report; // ceres::Solver::Summary::BriefReport()

    std::vector<double> standard_errors() const;

    // Model evaluated with the fitted parameters.
    std::vector<double> predict(const std::vector<double> &xs) const;

    double parameter(const std::string &name) const;
    double standard_error(const std::string &name) const;
};

/**
 * @brief Square roots of the covariance diagonal.
 * @throws DimensionMismatch If the matrix is not square.
 * @throws std::invalid_argument If a diagonal entry is negative.
 */
std::vector<double>
standard_errors(const Eigen::MatrixXd &covariance);

// --- Ceres Cost Functor ---

/**
 * @brief Standardized residual (model(x) - y) / sigma of a single observation.
 */
struct WeightedResidualFunctor {
    const ModelKind model_;
    const double x_;
    const double y_;
    const double sigma_;

    WeightedResidualFunctor(ModelKind model, double x, double y, double sigma);

    template<typename T>
    bool operator()(const T *const *parameters, T *residuals) const;
};

template<typename T>
bool
WeightedResidualFunctor::operator()(const T *const *parameters, T *residuals) const {
    try {
        residuals[0] = (evaluate_model<T>(model_, x_, parameters[0]) - T(y_)) / sigma_;
    } catch (const std::exception &) {
        // Ceres cannot propagate exceptions; report a failed evaluation instead.
        return false;
    }
    return true;
}

// --- Curve Fit Problem Class ---

/*
 * @brief Weighted nonlinear least-squares fit of a model to observations.
 *
 * The constructor validates the data against the model once; solve() can then
 * be called repeatedly with different starting points. Each call builds its
 * own ceres::Problem, so a CurveFitProblem holds no mutable state.
 *
 * The residual Jacobian comes from automatic differentiation, and the
 * covariance is the Gauss-Newton estimate (J^T J)^-1 of the sigma-scaled
 * residuals, computed with ceres::Covariance.
 */
class CurveFitProblem {
  public:
    /**
     * @throws DimensionMismatch If x, y and sigma differ in length.
     * @throws InsufficientData If there are not more observations than model parameters.
     * @throws DomainError If an x value lies outside the model's domain.
     * @throws std::invalid_argument On non-positive sigma, non-finite data or invalid options.
     */
    CurveFitProblem(ModelKind model, ObservationSet data, FitOptions options = FitOptions());

    /**
     * @brief Runs the optimizer from the given starting point.
     * @throws DimensionMismatch If the guess length does not match the model arity.
     * @throws ConvergenceError If the optimizer does not converge or the covariance is singular.
     */
    FitResult solve(const std::vector<double> &initial_guess) const;

    ModelKind get_model() const { return model_; }
    const ObservationSet &get_data() const { return data_; }
    const FitOptions &get_options() const { return options_; }
    std::size_t get_num_parameters() const { return num_parameters_; }

  private:
    ModelKind model_;
    ObservationSet data_;
    FitOptions options_;
    std::size_t num_parameters_;

    Eigen::MatrixXd compute_covariance(ceres::Problem &problem, const double *parameter_block) const;
};

// --- Convenience entry points ---

FitResult
fit_curve(ModelKind model,
          const std::vector<double> &x,
          const std::vector<double> &y,
          const std::vector<double> &sigma,
          const std::vector<double> &initial_guess,
          const FitOptions &options = FitOptions());

FitResult
fit_curve(ModelKind model,
          const ObservationSet &data,
          const std::vector<double> &initial_guess,
          const FitOptions &options = FitOptions());

// Starts from initial_guess_from_endpoints(model, data.x, data.y).
FitResult
fit_curve(ModelKind model, const ObservationSet &data, const FitOptions &options = FitOptions());

} // namespace iv_fit

#endif // CURVE_FITTER_HPP
