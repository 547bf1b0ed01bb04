/**
 * @file random_utils.hpp
 * @brief Thread-local random helpers used for task ids and temp names.
 */

#ifndef CRUSHER_RANDOM_UTILS_HPP
#define CRUSHER_RANDOM_UTILS_HPP

#include <cstdint>
#include <string>

/**
 * @brief Simple, thread-local random number utilities.
 *
 * The underlying generator (std::mt19937_64) is seeded from
 * std::random_device once per thread.
 */
namespace crusher::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    std::uint64_t next_u64();

    /**
     * @brief Generates a random suffix of 16 lowercase hex digits.
     *
     * Appended to generated ids and temporary file names to make them unique.
     */
    std::string random_suffix();

} // namespace crusher::RandomUtils

#endif // CRUSHER_RANDOM_UTILS_HPP
