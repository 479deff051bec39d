#include "curve_fitter.hpp"
#include "goodness_of_fit.hpp"
#include "iv_fit/device_quantities.hpp"
#include "synthetic_data.hpp"
#include "uncertainty_propagator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void
print_summary(const std::string &label, const iv_fit::SampleSummary &summary) {
    std::cout << "  " << label << ": mean " << summary.mean << ", std " << summary.stddev << ", median "
              << summary.median << " [" << summary.lower_1sigma << ", " << summary.upper_1sigma << "]";
    if (summary.finite_count != summary.count) {
        std::cout << " (" << summary.count - summary.finite_count << " non-finite samples)";
    }
    std::cout << '\n';
}

// Text histogram of the finite samples.
void
print_histogram(const std::vector<double> &samples, const iv_fit::SampleSummary &summary, int num_bins = 20) {
    std::vector<int> counts(static_cast<std::size_t>(num_bins), 0);
    const double width = (summary.max - summary.min) / num_bins;
    if (!(width > 0.0)) { return; }
    for (double v : samples) {
        if (!std::isfinite(v)) { continue; }
        int bin = static_cast<int>((v - summary.min) / width);
        bin = std::min(bin, num_bins - 1);
        counts[static_cast<std::size_t>(bin)]++;
    }
    const int peak = *std::max_element(counts.begin(), counts.end());
    for (int b = 0; b < num_bins; ++b) {
        const int bar = peak > 0 ? 50 * counts[static_cast<std::size_t>(b)] / peak : 0;
        std::cout << "    " << std::setw(12) << summary.min + (b + 0.5) * width << " | " << std::string(bar, '#')
                  << '\n';
    }
}

} // namespace

int
main(int argc, char **argv) {
    std::cout << "--- Diode Fit Example ---" << '\n';

    std::uint64_t seed = 7;
    if (argc > 1) { seed = std::strtoull(argv[1], nullptr, 10); }
    iv_fit::RandomEngine rng = iv_fit::make_engine(seed);

    // --- 1. Define the Device ---
    iv_fit::devices::DiodeParameters diode;
    diode.emission_coefficient = 1.8;
    diode.saturation_current = 1e-9;
    diode.series_resistance = 2.0;

    const std::vector<double> true_params = iv_fit::devices::diode_linear_log_plus_linear_parameters(diode);
    const double sigma_v = 0.002;

    // Log-spaced currents from 1 uA to 10 mA
    std::vector<double> current;
    for (double exponent : iv_fit::linspace(-6.0, -2.0, 25)) { current.push_back(std::pow(10.0, exponent)); }

    std::cout << "Generating data with eta=" << diode.emission_coefficient << ", I_s=" << diode.saturation_current
              << " A, R_s=" << diode.series_resistance << " Ohm (seed " << seed << ")" << '\n';

    try {
        iv_fit::ObservationSet data = iv_fit::generate_observations(
          iv_fit::ModelKind::LinearLogPlusLinear, current, true_params, sigma_v, rng);

        // --- 2. Fit both diode models ---
        for (iv_fit::ModelKind kind : { iv_fit::ModelKind::LinearLog, iv_fit::ModelKind::LinearLogPlusLinear }) {
            const iv_fit::ModelInfo &info = iv_fit::model_info(kind);
            std::cout << "\nModel '" << info.name << "'" << '\n';

            iv_fit::FitResult fit = iv_fit::fit_curve(kind, data);
            const std::vector<double> errors = fit.standard_errors();
            for (std::size_t i = 0; i < fit.parameters.size(); ++i) {
                std::cout << "  " << info.parameter_names[i] << " = " << fit.parameters[i] << " +/- " << errors[i]
                          << '\n';
            }

            iv_fit::GoodnessOfFit gof = iv_fit::evaluate_goodness_of_fit(fit, data);
            std::cout << "  reduced chi2 = " << gof.reduced_chi_square << " (p = " << gof.p_value << ")" << '\n';

            // --- 3. Monte Carlo propagation ---
            std::vector<double> eta_samples =
              iv_fit::propagate_uncertainty(fit, iv_fit::devices::emission_coefficient_quantity(diode.temperature), rng);
            iv_fit::SampleSummary eta_summary = iv_fit::summarize_samples(eta_samples);
            print_summary("eta", eta_summary);
            print_histogram(eta_samples, eta_summary);

            std::vector<double> is_samples =
              iv_fit::propagate_uncertainty(fit, iv_fit::devices::saturation_current_quantity(), rng);
            print_summary("I_s", iv_fit::summarize_samples(is_samples));

            if (kind == iv_fit::ModelKind::LinearLogPlusLinear) {
                iv_fit::PropagationOptions correlated;
                correlated.mode = iv_fit::SamplingMode::FullCovariance;
                std::vector<double> is_correlated = iv_fit::propagate_uncertainty(
                  fit, iv_fit::devices::saturation_current_quantity(), rng, correlated);
                print_summary("I_s (correlated)", iv_fit::summarize_samples(is_correlated));
            }
        }

    } catch (const std::exception &e) {
        std::cerr << "Error fitting diode data: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
