/**
 * @file qr_options.hpp
 * @brief Tunable parameters of the sparse QR wrapper and of the self-test
 */

#ifndef SPQRBIND_MODELS_QR_OPTIONS_HPP
#define SPQRBIND_MODELS_QR_OPTIONS_HPP

#include <cstdint>
#include <string>

#include "models/enums.hpp"

/**
 * @brief Sentinel understood by SuiteSparseQR as "use the default tolerance"
 *
 * Same value as SPQR_DEFAULT_TOL.
 */
constexpr double kDefaultTolerance = -2.0;

/**
 * @struct QROptions
 * @brief Parameters forwarded to SuiteSparseQR_C_QR
 */
struct QROptions {
    OrderingMethod ordering = OrderingMethod::Default;   ///< Column ordering
    double tolerance = kDefaultTolerance;               ///< Rank detection tolerance
    std::int64_t econ = -1;                             ///< Rows of R kept; negative means A's row count
    bool verbose = false;                               ///< Print the input triplet and time the call
    int print_level = 3;                                ///< cholmod_common::print
    PermutationOwnership permutation_ownership = PermutationOwnership::Retained;
};

/**
 * @struct SelfTestSettings
 * @brief Random matrix used by the self-test executable
 */
struct SelfTestSettings {
    int rows = 10;
    int cols = 10;
    double density = 0.1;
    unsigned int seed = 42;
    bool write_log = false;
    std::string log_directory = "log";
};

#endif // SPQRBIND_MODELS_QR_OPTIONS_HPP
