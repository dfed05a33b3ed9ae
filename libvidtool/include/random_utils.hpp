#ifndef VIDTOOL_RANDOM_UTILS_HPP
#define VIDTOOL_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to name temporary outputs.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a short random hexadecimal suffix (8 characters).
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // VIDTOOL_RANDOM_UTILS_HPP
