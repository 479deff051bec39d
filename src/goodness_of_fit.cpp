#include "goodness_of_fit.hpp"
#include "fit_errors.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace iv_fit {

std::vector<double>
standardized_residuals(const std::vector<double> &observed,
                       const std::vector<double> &predicted,
                       const std::vector<double> &sigma) {
    if (predicted.size() != observed.size() || sigma.size() != observed.size()) {
        throw DimensionMismatch("Observed (" + std::to_string(observed.size()) + "), predicted (" +
                                std::to_string(predicted.size()) + ") and sigma (" + std::to_string(sigma.size()) +
                                ") must have equal length.");
    }
    std::vector<double> residuals(observed.size());
    for (std::size_t i = 0; i < observed.size(); ++i) {
        if (!(sigma[i] > 0.0)) {
            throw std::invalid_argument("Uncertainty at index " + std::to_string(i) + " must be strictly positive.");
        }
        residuals[i] = (observed[i] - predicted[i]) / sigma[i];
    }
    return residuals;
}

double
chi_square(const std::vector<double> &observed,
           const std::vector<double> &predicted,
           const std::vector<double> &sigma) {
    double sum = 0.0;
    for (double r : standardized_residuals(observed, predicted, sigma)) { sum += r * r; }
    return sum;
}

double
reduced_chi_square(const std::vector<double> &observed,
                   const std::vector<double> &predicted,
                   const std::vector<double> &sigma,
                   std::size_t num_params) {
    const double chi2 = chi_square(observed, predicted, sigma);
    if (observed.size() <= num_params) {
        throw InsufficientData("Reduced chi-square needs more observations (" + std::to_string(observed.size()) +
                               ") than parameters (" + std::to_string(num_params) + ").");
    }
    return chi2 / static_cast<double>(observed.size() - num_params);
}

double
chi_square_p_value(double chi2, std::size_t degrees_of_freedom) {
    if (degrees_of_freedom == 0) { throw InsufficientData("Chi-square p-value needs at least one degree of freedom."); }
    if (!std::isfinite(chi2) || chi2 < 0.0) {
        throw std::invalid_argument("Chi-square statistic must be finite and non-negative.");
    }
    boost::math::chi_squared_distribution<double> distribution(static_cast<double>(degrees_of_freedom));
    return boost::math::cdf(boost::math::complement(distribution, chi2));
}

GoodnessOfFit
evaluate_goodness_of_fit(const FitResult &result, const ObservationSet &data) {
    data.validate();
    const std::vector<double> predicted = result.predict(data.x);

    GoodnessOfFit gof;
    gof.chi_square = chi_square(data.y, predicted, data.sigma);
    gof.reduced_chi_square = reduced_chi_square(data.y, predicted, data.sigma, result.parameters.size());
    gof.degrees_of_freedom = data.size() - result.parameters.size();
    gof.p_value = chi_square_p_value(gof.chi_square, gof.degrees_of_freedom);
    return gof;
}

} // namespace iv_fit
