#ifndef FIT_ERRORS_HPP
#define FIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace iv_fit {

/**
 * @brief Thrown when input sequences disagree in length, or a parameter vector
 * does not match the arity of its model.
 */
class DimensionMismatch : public std::invalid_argument {
  public:
    explicit DimensionMismatch(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Thrown when there are not more observations than fitted parameters
 * (no degrees of freedom left).
 */
class InsufficientData : public std::invalid_argument {
  public:
    explicit InsufficientData(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Thrown when the optimizer does not reach a stable minimum within its
 * iteration budget, or when no covariance can be computed at the minimum.
 */
class ConvergenceError : public std::runtime_error {
  public:
    explicit ConvergenceError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * @brief Thrown when a model is evaluated outside its valid input domain
 * (e.g. the logarithm of a non-positive value).
 */
class DomainError : public std::domain_error {
  public:
    explicit DomainError(const std::string &what)
      : std::domain_error(what) {}
};

} // namespace iv_fit

#endif // FIT_ERRORS_HPP
