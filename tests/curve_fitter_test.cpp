#include "curve_fitter.hpp"
#include "fit_errors.hpp"
#include "synthetic_data.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace iv_fit;
using namespace iv_fit::test_utils;

namespace {

// Closed-form weighted linear regression, used as the reference for the linear law.
void
weighted_line(const ObservationSet &data, double &slope, double &intercept, double &var_slope, double &var_intercept) {
    double s = 0.0, sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        const double w = 1.0 / (data.sigma[i] * data.sigma[i]);
        s += w;
        sx += w * data.x[i];
        sy += w * data.y[i];
        sxx += w * data.x[i] * data.x[i];
        sxy += w * data.x[i] * data.y[i];
    }
    const double delta = s * sxx - sx * sx;
    slope = (s * sxy - sx * sy) / delta;
    intercept = (sxx * sy - sx * sxy) / delta;
    var_slope = s / delta;
    var_intercept = sxx / delta;
}

} // namespace

TEST(CurveFitterTest, LinearFitMatchesClosedFormRegression) {
    RandomEngine rng = make_engine(11);
    ObservationSet data = generate_observations(ModelKind::Linear, resistor_currents(), { 1000.0, 0.0 }, 0.005, rng);

    const std::vector<double> guess = { 1000.0, 0.0 };
    FitResult fit = fit_curve(ModelKind::Linear, data, guess);

    double slope, intercept, var_slope, var_intercept;
    weighted_line(data, slope, intercept, var_slope, var_intercept);

    ASSERT_EQ(fit.parameters.size(), 2u);
    EXPECT_NEAR(fit.parameters[0], slope, 1e-6 * std::abs(slope));
    EXPECT_NEAR(fit.parameters[1], intercept, 1e-6);
    EXPECT_NEAR(fit.covariance(0, 0), var_slope, 1e-6 * var_slope);
    EXPECT_NEAR(fit.covariance(1, 1), var_intercept, 1e-6 * var_intercept);
    EXPECT_EQ(fit.num_observations, 11u);
}

TEST(CurveFitterTest, CovarianceHasParameterDimensionAndIsSymmetric) {
    RandomEngine rng = make_engine(12);
    const std::vector<double> truth = devices::diode_linear_log_plus_linear_parameters(reference_diode());
    ObservationSet data =
      generate_observations(ModelKind::LinearLogPlusLinear, log_spaced_currents(-6.0, -2.0, 25), truth, 0.002, rng);

    FitResult fit = fit_curve(ModelKind::LinearLogPlusLinear, data, truth);

    ASSERT_EQ(fit.covariance.rows(), 3);
    ASSERT_EQ(fit.covariance.cols(), 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_GT(fit.covariance(i, i), 0.0);
        for (int j = 0; j < 3; ++j) { EXPECT_DOUBLE_EQ(fit.covariance(i, j), fit.covariance(j, i)); }
    }
    std::vector<double> errors = fit.standard_errors();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_DOUBLE_EQ(errors[2], std::sqrt(fit.covariance(2, 2)));
    EXPECT_DOUBLE_EQ(fit.standard_error("R"), errors[2]);
    EXPECT_DOUBLE_EQ(fit.parameter("A"), fit.parameters[0]);
    EXPECT_THROW(fit.parameter("eta"), std::invalid_argument);
}

TEST(CurveFitterTest, NoiseFreeDiodeDataIsRecoveredExactly) {
    RandomEngine rng = make_engine(13);
    const std::vector<double> truth = devices::diode_linear_log_parameters(reference_diode());
    const std::vector<double> xs = log_spaced_currents(-7.0, -3.0, 15);
    std::vector<double> ys = generate_synthetic_y(ModelKind::LinearLog, xs, truth, 0.0, rng);
    ObservationSet data = make_observation_set(xs, ys, 0.001);

    // Start well away from the truth
    const std::vector<double> guess = { 0.1, 0.5 };
    FitResult fit = fit_curve(ModelKind::LinearLog, data, guess);

    EXPECT_VECTOR_NEAR(fit.parameters, truth, 1e-7);
    EXPECT_NEAR(fit.chi_square, 0.0, 1e-8);
}

TEST(CurveFitterTest, EndpointGuessOverloadConverges) {
    RandomEngine rng = make_engine(14);
    const std::vector<double> truth = devices::diode_linear_log_plus_linear_parameters(reference_diode());
    ObservationSet data =
      generate_observations(ModelKind::LinearLogPlusLinear, log_spaced_currents(-6.0, -2.0, 30), truth, 0.002, rng);

    FitResult fit = fit_curve(ModelKind::LinearLogPlusLinear, data);
    EXPECT_TRUE(within_k_sigma(fit, truth, 5.0));
    EXPECT_FALSE(fit.solver_report.empty());
    EXPECT_GT(fit.num_iterations, 0);
}

TEST(CurveFitterTest, RelativeSigmaScalesCovarianceByReducedChiSquare) {
    RandomEngine rng = make_engine(15);
    ObservationSet data = generate_observations(ModelKind::Linear, resistor_currents(), { 1000.0, 0.0 }, 0.005, rng);
    const std::vector<double> guess = { 1000.0, 0.0 };

    FitOptions absolute;
    FitOptions relative;
    relative.absolute_sigma = false;

    FitResult fit_abs = fit_curve(ModelKind::Linear, data, guess, absolute);
    FitResult fit_rel = fit_curve(ModelKind::Linear, data, guess, relative);

    const double reduced = fit_abs.chi_square / 9.0;
    EXPECT_NEAR(fit_rel.covariance(0, 0), fit_abs.covariance(0, 0) * reduced, 1e-9 * fit_abs.covariance(0, 0));
    EXPECT_NEAR(fit_rel.parameters[0], fit_abs.parameters[0], 1e-8);
}

TEST(CurveFitterTest, LengthDisagreementIsDimensionMismatch) {
    const std::vector<double> x = { 0.0, 0.001, 0.002, 0.003 };
    const std::vector<double> y = { 0.0, 1.0, 2.0 };
    const std::vector<double> y4 = { 0.0, 1.0, 2.0, 3.0 };
    const std::vector<double> sigma = { 0.005, 0.005, 0.005, 0.005 };
    const std::vector<double> sigma3 = { 0.005, 0.005, 0.005 };
    const std::vector<double> guess = { 1000.0, 0.0 };
    const std::vector<double> long_guess = { 1000.0, 0.0, 1.0 };

    EXPECT_THROW(fit_curve(ModelKind::Linear, x, y, sigma, guess), DimensionMismatch);
    EXPECT_THROW(fit_curve(ModelKind::Linear, x, y4, sigma3, guess), DimensionMismatch);
    EXPECT_THROW(fit_curve(ModelKind::Linear, x, y4, sigma, long_guess), DimensionMismatch);
}

TEST(CurveFitterTest, TooFewObservationsIsInsufficientData) {
    const std::vector<double> x = { 1e-4, 1e-3, 1e-2 };
    const std::vector<double> y = { 0.5, 0.6, 0.7 };
    const std::vector<double> sigma = { 0.01, 0.01, 0.01 };

    // 3 points, 3 parameters: no degrees of freedom
    const std::vector<double> guess3 = { 0.05, 0.9, 0.0 };
    EXPECT_THROW(fit_curve(ModelKind::LinearLogPlusLinear, x, y, sigma, guess3), InsufficientData);

    const std::vector<double> x2 = { 1e-4, 1e-3 };
    const std::vector<double> y2 = { 0.5, 0.6 };
    const std::vector<double> s2 = { 0.01, 0.01 };
    const std::vector<double> guess2 = { 0.05, 0.9 };
    EXPECT_THROW(fit_curve(ModelKind::LinearLog, x2, y2, s2, guess2), InsufficientData);
}

TEST(CurveFitterTest, LogModelRejectsNonPositiveCurrents) {
    const std::vector<double> x = { 0.0, 1e-4, 1e-3, 1e-2 };
    const std::vector<double> y = { 0.4, 0.5, 0.6, 0.7 };
    const std::vector<double> sigma = { 0.01, 0.01, 0.01, 0.01 };
    const std::vector<double> guess = { 0.05, 0.9 };
    EXPECT_THROW(fit_curve(ModelKind::LinearLog, x, y, sigma, guess), DomainError);
}

TEST(CurveFitterTest, RejectsNonPositiveSigma) {
    const std::vector<double> x = { 0.0, 1.0, 2.0 };
    const std::vector<double> y = { 0.0, 1.0, 2.0 };
    const std::vector<double> sigma = { 0.1, 0.0, 0.1 };
    const std::vector<double> guess = { 1.0, 0.0 };
    EXPECT_THROW(fit_curve(ModelKind::Linear, x, y, sigma, guess), std::invalid_argument);
}

TEST(CurveFitterTest, IterationCapRaisesConvergenceError) {
    RandomEngine rng = make_engine(16);
    const std::vector<double> truth = devices::diode_linear_log_plus_linear_parameters(reference_diode());
    ObservationSet data =
      generate_observations(ModelKind::LinearLogPlusLinear, log_spaced_currents(-6.0, -2.0, 25), truth, 0.002, rng);

    FitOptions options;
    options.max_iterations = 1;
    const std::vector<double> far_guess = { 5.0, -40.0, 500.0 };
    EXPECT_THROW(fit_curve(ModelKind::LinearLogPlusLinear, data, far_guess, options), ConvergenceError);
}

TEST(CurveFitterTest, UnidentifiableParametersRaiseConvergenceError) {
    // All observations at one x: slope and intercept cannot be separated
    const std::vector<double> x = { 1e-3, 1e-3, 1e-3, 1e-3 };
    const std::vector<double> y = { 0.60, 0.61, 0.59, 0.60 };
    const std::vector<double> sigma = { 0.01, 0.01, 0.01, 0.01 };
    const std::vector<double> guess = { 0.05, 0.9 };
    EXPECT_THROW(fit_curve(ModelKind::LinearLog, x, y, sigma, guess), ConvergenceError);
}

TEST(CurveFitterTest, InvalidOptionsAreRejected) {
    FitOptions options;
    options.max_iterations = 0;
    EXPECT_THROW(options.validate(), std::invalid_argument);

    FitOptions bad_tolerance;
    bad_tolerance.function_tolerance = 0.0;
    EXPECT_THROW(bad_tolerance.validate(), std::invalid_argument);
}

TEST(CurveFitterTest, ProblemCanBeSolvedFromSeveralStartingPoints) {
    RandomEngine rng = make_engine(17);
    const std::vector<double> truth = devices::diode_linear_log_parameters(reference_diode());
    ObservationSet data = generate_observations(ModelKind::LinearLog, log_spaced_currents(-6.0, -2.0, 20), truth, 0.002, rng);

    CurveFitProblem problem(ModelKind::LinearLog, data);
    EXPECT_EQ(problem.get_num_parameters(), 2u);

    FitResult from_truth = problem.solve(truth);
    const std::vector<double> far_guess = { 0.5, -2.0 };
    FitResult from_far = problem.solve(far_guess);

    EXPECT_VECTOR_NEAR(from_far.parameters, from_truth.parameters, 1e-6);
}
