#ifndef GOODNESS_OF_FIT_HPP
#define GOODNESS_OF_FIT_HPP

#include "curve_fitter.hpp"
#include "observation_set.hpp"

#include <cstddef>
#include <vector>

namespace iv_fit {

/**
 * @brief Chi-square summary of a fit.
 *
 * A reduced chi-square near 1.0 means the residual scatter is consistent with
 * the stated uncertainties. The value is reported, never used as a gate.
 */
struct GoodnessOfFit {
    double chi_square = 0.0;
    std::size_t degrees_of_freedom = 0;
    double reduced_chi_square = 0.0;
    double p_value = 0.0; ///< P(chi2 >= observed) for the given degrees of freedom.
};

/**
 * @brief Standardized residuals (y_i - yhat_i) / sigma_i.
 * @throws DimensionMismatch If the three sequences differ in length.
 * @throws std::invalid_argument If a sigma is not strictly positive.
 */
std::vector<double>
standardized_residuals(const std::vector<double> &observed,
                       const std::vector<double> &predicted,
                       const std::vector<double> &sigma);

// Sum of squared standardized residuals.
double
chi_square(const std::vector<double> &observed,
           const std::vector<double> &predicted,
           const std::vector<double> &sigma);

/**
 * @brief chi_square / (N - P).
 * @throws InsufficientData If N <= num_params.
 * @throws DimensionMismatch If the three sequences differ in length.
 */
double
reduced_chi_square(const std::vector<double> &observed,
                   const std::vector<double> &predicted,
                   const std::vector<double> &sigma,
                   std::size_t num_params);

/**
 * @brief Upper-tail probability of the chi-squared distribution.
 * @throws InsufficientData If degrees_of_freedom is zero.
 * @throws std::invalid_argument If chi2 is negative or non-finite.
 */
double
chi_square_p_value(double chi2, std::size_t degrees_of_freedom);

/**
 * @brief Evaluates a fit against the observations it was fitted to.
 */
GoodnessOfFit
evaluate_goodness_of_fit(const FitResult &result, const ObservationSet &data);

} // namespace iv_fit

#endif // GOODNESS_OF_FIT_HPP
