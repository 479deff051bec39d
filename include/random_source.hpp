#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>

namespace iv_fit {

/**
 * @brief Engine used by every randomized component.
 *
 * Components never own an engine; callers construct one with an explicit seed
 * and pass it by reference, so results are reproducible and independent
 * invocations can run on separate engines.
 */
using RandomEngine = std::mt19937_64;

inline RandomEngine
make_engine(std::uint64_t seed) {
    return RandomEngine(seed);
}

} // namespace iv_fit

#endif // RANDOM_SOURCE_HPP
