#ifndef SPQRBIND_SPARSE_QR_FACTORIZATION_HPP
#define SPQRBIND_SPARSE_QR_FACTORIZATION_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "linear_algebra/cholmod_context.hpp"
#include "linear_algebra/coo_matrix.hpp"
#include "models/enums.hpp"
#include "models/qr_options.hpp"

namespace LinearAlgebra {

    // ============================================================================
    // ERRORS
    // ============================================================================

    /**
     * @brief The coordinate matrix handed to CHOLMOD is malformed
     *
     * Raised when the coordinate arrays disagree in length, or when
     * cholmod_l_check_triplet rejects the populated triplet (index out of
     * range, nnz larger than the allocation).
     */
    class StructuralValidationError : public std::runtime_error {
        public:
            explicit StructuralValidationError(const std::string& what)
                : std::runtime_error(what) {}
    };

    /**
     * @brief A CHOLMOD or SuiteSparseQR entry point signalled failure
     *
     * Carries the cholmod_common status recorded at the time of failure
     * (CHOLMOD_OUT_OF_MEMORY for allocation failures).
     */
    class NativeFailureError : public std::runtime_error {
        public:
            NativeFailureError(const std::string& what, int status)
                : std::runtime_error(what + " (" + CholmodContext::status_name(status) + ")")
                , status_(status) {}

            int status() const { return status_; }

        private:
            int status_;
    };

    // ============================================================================
    // RESULT
    // ============================================================================

    /**
     * @brief Output of one sparse QR factorization
     *
     * Q*R = A*P where P is the n x n permutation matrix with P(E[k], k) = 1,
     * or P = I when E is absent.
     */
    struct QRFactors {
        COOMatrix Q;                      ///< Orthogonal factor, m x econ
        COOMatrix R;                      ///< Upper trapezoidal factor, econ x n
        std::optional<IndexVector> E;     ///< Column permutation, absent for identity
        std::int64_t rank = 0;            ///< Estimated numerical rank of A
    };

    /**
     * @brief Sparse QR factorization through SuiteSparseQR
     *
     * Converts coordinate matrices to CHOLMOD's compressed sparse column
     * form, calls SuiteSparseQR_C_QR and converts Q and R back. The
     * numerical work (ordering, Householder QR, rank detection) is done
     * by SuiteSparseQR.
     *
     * Every intermediate CHOLMOD handle is owned by a CholmodSparsePtr or
     * CholmodTripletPtr and is freed exactly once on every exit path.
     */
    class SparseQRFactorization {

        public:
            // ============================================================================
            // CONSTRUCTORS AND DESTRUCTOR
            // ============================================================================

            explicit SparseQRFactorization(CholmodContext& context, QROptions options = QROptions());
            ~SparseQRFactorization() = default;

            // The context is borrowed, copying would only duplicate the reference
            SparseQRFactorization(const SparseQRFactorization&) = delete;
            SparseQRFactorization& operator=(const SparseQRFactorization&) = delete;

            // ============================================================================
            // MAIN INTERFACE
            // ============================================================================

            /**
             * @brief Factorize A*P = Q*R
             *
             * Algorithm:
             * 1. Convert A to CHOLMOD sparse form (to_cholmod_sparse)
             * 2. SuiteSparseQR_C_QR(ordering, tolerance, econ, A, &Q, &R, &E)
             * 3. Convert Q and R back to coordinate form
             * 4. Copy the n entries of E, or report it absent when SPQR returns null
             *
             * No requirement on A being square, full rank or symmetric.
             *
             * @param A Real coordinate matrix, m x n
             * @return Q, R, E and the rank estimate
             * @throws StructuralValidationError if A is malformed
             * @throws NativeFailureError if SuiteSparseQR fails
             */
            QRFactors factorize(const COOMatrix& A) const;

            /// Convenience overload for Eigen input
            QRFactors factorize(const Eigen::SparseMatrix<double>& A) const;

            // ============================================================================
            // FORMAT CONVERSION
            // ============================================================================

            /**
             * @brief Coordinate matrix to CHOLMOD compressed sparse column
             *
             * The entries are written verbatim into a cholmod_triplet, which
             * is validated with cholmod_l_check_triplet and converted with
             * cholmod_l_triplet_to_sparse (duplicates are summed there). The
             * triplet is freed before returning, also on failure.
             *
             * @throws StructuralValidationError if the triplet is rejected
             * @throws NativeFailureError if an allocation fails
             */
            CholmodSparsePtr to_cholmod_sparse(const COOMatrix& A) const;

            /**
             * @brief CHOLMOD compressed sparse column to coordinate matrix
             *
             * The handle stays owned by the caller.
             *
             * @throws NativeFailureError if the intermediate triplet cannot be allocated
             */
            COOMatrix from_cholmod_sparse(const cholmod_sparse* A) const;

            // ============================================================================
            // HELPERS
            // ============================================================================

            /**
             * @brief Permutation matrix P with P(E[k], k) = 1
             *
             * E is expected to be a bijection on [0, n). It is not checked;
             * a non-bijective E gives a matrix that is not a permutation.
             */
            static COOMatrix permutation_matrix_from_vector(const IndexVector& E);

            const QROptions& options() const { return options_; }
            void set_options(const QROptions& options);

        private:
            CholmodContext& context_;
            QROptions options_;
    };

}

#endif
