#ifndef OBSERVATION_SET_HPP
#define OBSERVATION_SET_HPP

#include <cstddef>
#include <vector>

namespace iv_fit {

/**
 * @brief Structure to hold measured (x, y, sigma) triples.
 *
 * Columns are stored separately so they can be handed to the fitter and the
 * goodness-of-fit helpers without copying. x[i], y[i] and sigma[i] describe
 * the i-th observation.
 */
struct ObservationSet {
    std::vector<double> x;     ///< Independent variable (e.g. diode current).
    std::vector<double> y;     ///< Dependent variable (e.g. diode voltage).
    std::vector<double> sigma; ///< Absolute one-sigma uncertainty of each y.

    std::size_t size() const { return x.size(); }
    bool empty() const { return x.empty(); }

    /**
     * @brief Checks column lengths and uncertainties.
     * @throws DimensionMismatch If the columns differ in length.
     * @throws std::invalid_argument If any value is non-finite or any sigma is not strictly positive.
     */
    void validate() const;
};

/**
 * @brief Builds a validated observation set from three columns.
 */
ObservationSet
make_observation_set(std::vector<double> x, std::vector<double> y, std::vector<double> sigma);

/**
 * @brief Builds a validated observation set where every point shares the same uncertainty.
 */
ObservationSet
make_observation_set(std::vector<double> x, std::vector<double> y, double sigma);

} // namespace iv_fit

#endif // OBSERVATION_SET_HPP
