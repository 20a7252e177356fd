/**
 * @file enums.hpp
 * @brief Defines enumerations used throughout the library
 */

#ifndef SPQRBIND_MODELS_ENUMS_HPP
#define SPQRBIND_MODELS_ENUMS_HPP

/**
 * @enum OrderingMethod
 * @brief Fill-reducing column ordering requested from SuiteSparseQR
 *
 * The values match the SPQR_ORDERING_* constants of SuiteSparseQR.h.
 */
enum class OrderingMethod {
    /**
     * @brief Keep the input column order (no permutation)
     */
    Fixed = 0,

    /**
     * @brief Only singleton removal, otherwise natural order
     */
    Natural = 1,

    /**
     * @brief COLAMD ordering
     */
    COLAMD = 2,

    /**
     * @brief User-supplied ordering (not exposed by this wrapper)
     */
    Given = 3,

    /**
     * @brief CHOLMOD's choice between AMD and METIS
     */
    CHOLMOD = 4,

    /**
     * @brief AMD ordering on A'A
     */
    AMD = 5,

    /**
     * @brief METIS ordering on A'A
     */
    METIS = 6,

    /**
     * @brief SuiteSparseQR default (COLAMD for most matrices)
     */
    Default = 7,

    /**
     * @brief Try COLAMD, AMD and METIS, keep the best
     */
    Best = 8,

    /**
     * @brief Try COLAMD and AMD, keep the best
     */
    BestAMD = 9
};

/**
 * @enum PermutationOwnership
 * @brief What happens to the permutation buffer SuiteSparseQR returns
 */
enum class PermutationOwnership {
    /**
     * @brief The buffer is copied and left to the native library
     */
    Retained,

    /**
     * @brief The buffer is copied and then freed with cholmod_l_free
     */
    Released
};

#endif // SPQRBIND_MODELS_ENUMS_HPP
