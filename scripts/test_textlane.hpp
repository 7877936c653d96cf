/**
 *  @brief  Helper structures and functions for C++ unit- and stress-tests.
 *  @file   test_textlane.hpp
 *
 *  @section Environment Variables
 *
 *  The test infrastructure supports the following environment variables for reproducible
 *  stress testing and fuzzing:
 *
 *  - `TL_TESTS_SEED` : Seed for the random number generator. If not set, a random seed is
 *    generated using `std::random_device`. The actual seed used is always
 *    printed at startup for reproducibility.
 *  - `TL_TESTS_MULTIPLIER` : Multiplier for stress-test iteration counts. Defaults to 1.0.
 *    Use 0.1 for quick smoke tests, or 10 for thorough CI fuzzing.
 *
 *  @section Example Usage
 *
 *  @code{.sh}
 *  TL_TESTS_SEED=42 ./build_release/textlane_test_cpp17
 *  TL_TESTS_SEED=12345 TL_TESTS_MULTIPLIER=5 ./build_release/textlane_test_shared
 *  @endcode
 */
#pragma once
#include <algorithm> // `std::generate`, `std::copy`
#include <cstdio>    // `std::printf`
#include <cstdlib>   // `std::getenv`, `std::strtoul`
#include <random>    // `std::random_device`, `std::mt19937`
#include <string>    // `std::string`

#include "textlane/textlane.h"

namespace textlane {
namespace scripts {

/**
 *  @brief  Returns the seed used for the global random number generator.
 *
 *  If `TL_TESTS_SEED` is set, returns its value. Otherwise, generates a random seed
 *  using `std::random_device`. The seed is cached after the first call.
 */
inline std::mt19937::result_type global_random_seed() noexcept {
    static std::mt19937::result_type seed = []() {
        char const *seed_env = std::getenv("TL_TESTS_SEED");
        if (seed_env && seed_env[0] != '\0') {
            auto parsed = static_cast<std::mt19937::result_type>(std::strtoul(seed_env, nullptr, 10));
            std::printf("TL_TESTS_SEED=%u (from environment)\n", static_cast<unsigned>(parsed));
            return parsed;
        }
        std::random_device seed_source;
        auto generated = static_cast<std::mt19937::result_type>(seed_source());
        std::printf("TL_TESTS_SEED=%u (randomly generated)\n", static_cast<unsigned>(generated));
        return generated;
    }();
    return seed;
}

/**
 *  @brief  Returns a reference to the global random number generator,
 *          seeded once with `global_random_seed()`.
 */
inline std::mt19937 &global_random_generator() noexcept {
    static std::mt19937 generator(global_random_seed());
    return generator;
}

/**
 *  @brief  Returns the multiplier for stress-test iteration counts.
 *          Reads from the `TL_TESTS_MULTIPLIER` environment variable. Defaults to 1.0.
 */
inline double get_iterations_multiplier() noexcept {
    static double multiplier = []() {
        char const *env = std::getenv("TL_TESTS_MULTIPLIER");
        if (env && env[0] != '\0') {
            double parsed = std::strtod(env, nullptr);
            if (parsed > 0.0) {
                std::printf("TL_TESTS_MULTIPLIER=%.2f (from environment)\n", parsed);
                return parsed;
            }
        }
        return 1.0;
    }();
    return multiplier;
}

/**
 *  @brief  Scales a baseline iteration count by the global multiplier.
 *  @return The scaled iteration count, guaranteed to be at least 1.
 */
inline std::size_t scale_iterations(std::size_t baseline) noexcept {
    double scaled = baseline * get_iterations_multiplier();
    return scaled < 1.0 ? 1 : static_cast<std::size_t>(scaled);
}

/**
 *  @brief  A uniform distribution of bytes in an inclusive range.
 *
 *  We can't use `std::uniform_int_distribution<char>` because `char` overload is not supported by some platforms.
 */
struct uniform_u8_distribution_t {
    std::uniform_int_distribution<std::uint32_t> distribution;

    inline uniform_u8_distribution_t(std::uint8_t from = 0, std::uint8_t to = 255)
        : distribution(static_cast<std::uint32_t>(from), static_cast<std::uint32_t>(to)) {}

    template <typename generator_type_>
    std::uint8_t operator()(generator_type_ &&generator) noexcept {
        return static_cast<std::uint8_t>(distribution(generator));
    }
};

/** @brief Produces a string of @p length arbitrary bytes, including NULs and invalid UTF-8. */
inline std::string random_bytes(std::size_t length) noexcept(false) {
    uniform_u8_distribution_t distribution;
    std::string result(length, '\0');
    std::generate(result.begin(), result.end(),
                  [&]() -> char { return static_cast<char>(distribution(global_random_generator())); });
    return result;
}

inline std::string repeat(std::string const &pattern, std::size_t count) noexcept(false) {
    std::string result(pattern.size() * count, '\0');
    for (std::size_t i = 0; i < count; ++i) std::copy(pattern.begin(), pattern.end(), result.begin() + i * pattern.size());
    return result;
}

/**
 *  @brief  Prints the backends compiled into this binary and the ones supported by the CPU.
 */
inline void print_test_environment() noexcept {
    std::printf("- Uses Westmere: %s \n", TL_USE_WESTMERE ? "yes" : "no");
    std::printf("- Uses Haswell: %s \n", TL_USE_HASWELL ? "yes" : "no");
    std::printf("- Uses NEON: %s \n", TL_USE_NEON ? "yes" : "no");
    std::printf("- Dynamic dispatch: %s \n", tl_dynamic_dispatch() ? "yes" : "no");
    std::printf("- CPU capabilities: %s \n", tl_capabilities_to_string(tl_capabilities()));
    std::printf("- Dispatched backend: %s \n", tl_capabilities_to_string(tl_dispatch_table_capability()));
    global_random_seed();
    get_iterations_multiplier();
}

} // namespace scripts
} // namespace textlane
