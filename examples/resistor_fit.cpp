#include "iv_fit.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int
main(int argc, char **argv) {
    std::cout << "--- Resistor Fit Example ---" << '\n';

    std::uint64_t seed = 42;
    if (argc > 1) { seed = std::strtoull(argv[1], nullptr, 10); }
    iv_fit::RandomEngine rng = iv_fit::make_engine(seed);

    // --- 1. Generate Synthetic Data: V = R*I + B ---
    const std::vector<double> true_params = { 1000.0, 0.0 }; // 1 kOhm, no offset
    const double sigma_v = 0.005;
    const std::vector<double> current = iv_fit::linspace(0.0, 0.010, 11);

    std::cout << "Generating data with R=" << true_params[0] << " Ohm, B=" << true_params[1]
              << " V, sigma=" << sigma_v << " V (seed " << seed << ")" << '\n';

    try {
        iv_fit::ObservationSet data =
          iv_fit::generate_observations(iv_fit::ModelKind::Linear, current, true_params, sigma_v, rng);

        std::cout << "I [A]\tV [V]" << '\n';
        for (std::size_t i = 0; i < data.size(); ++i) { std::cout << data.x[i] << "\t" << data.y[i] << '\n'; }
        std::cout << '\n';

        // --- 2. Fit ---
        const std::vector<double> initial_guess = { 1000.0, 0.0 };
        iv_fit::FitResult fit = iv_fit::fit_curve(iv_fit::ModelKind::Linear, data, initial_guess);
        const std::vector<double> errors = fit.standard_errors();

        std::cout << "Fit: " << fit.solver_report << '\n';
        std::cout << "  R = " << fit.parameters[0] << " +/- " << errors[0] << " Ohm" << '\n';
        std::cout << "  B = " << fit.parameters[1] << " +/- " << errors[1] << " V" << '\n';

        // --- 3. Goodness of Fit ---
        iv_fit::GoodnessOfFit gof = iv_fit::evaluate_goodness_of_fit(fit, data);
        std::cout << "  chi2/dof = " << gof.chi_square << "/" << gof.degrees_of_freedom << " = "
                  << gof.reduced_chi_square << " (p = " << gof.p_value << ")" << '\n';

        // --- 4. Propagate into the conductance 1/R ---
        iv_fit::DerivedQuantity conductance = [](const std::vector<double> &p) { return 1.0 / p[0]; };
        std::vector<double> samples = iv_fit::propagate_uncertainty(fit, conductance, rng);
        iv_fit::SampleSummary summary = iv_fit::summarize_samples(samples);
        std::cout << "  G = " << summary.mean << " +/- " << summary.stddev << " S (" << summary.count
                  << " Monte Carlo trials)" << '\n';

    } catch (const std::exception &e) {
        std::cerr << "Error fitting resistor data: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
