#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef SPQRBIND_ERRORS_HPP
#define SPQRBIND_ERRORS_HPP

#include <cmath>
#include <optional>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "linear_algebra/coo_matrix.hpp"

namespace utils {
    class errors {

        public:
            // ============================================================================
            // FACTORIZATION ERRORS
            // ============================================================================

            /**
             * @brief Sum of absolute residuals Σ|Q·R − A·P(E)|
             *
             * P(E) is the permutation matrix with P(E[k], k) = 1, or the identity
             * when E is absent.
             *
             * @param Q Orthogonal factor
             * @param R Upper trapezoidal factor
             * @param A Factorized matrix
             * @param E Column permutation, absent for identity
             * @return Sum of absolute entries of Q·R − A·P
             */
            static double compute_reconstruction_residual(
                const LinearAlgebra::COOMatrix& Q,
                const LinearAlgebra::COOMatrix& R,
                const LinearAlgebra::COOMatrix& A,
                const std::optional<LinearAlgebra::IndexVector>& E
            );

            /**
             * @brief Relative Frobenius residual ‖Q·R − A·P‖ / ‖A‖
             *
             * Falls back to the absolute residual when ‖A‖ vanishes.
             */
            static double compute_relative_residual(
                const LinearAlgebra::COOMatrix& Q,
                const LinearAlgebra::COOMatrix& R,
                const LinearAlgebra::COOMatrix& A,
                const std::optional<LinearAlgebra::IndexVector>& E
            );

            /**
             * @brief Orthogonality defect ‖QᵀQ − I‖ (Frobenius)
             */
            static double compute_orthogonality_error(const LinearAlgebra::COOMatrix& Q);

            // ============================================================================
            // HELPER METHODS
            // ============================================================================

            /**
             * @brief Check E is a bijection on [0, n)
             */
            static bool is_permutation(const LinearAlgebra::IndexVector& E, std::int64_t n);

            /**
             * @brief A·P(E) as an Eigen sparse matrix
             */
            static Eigen::SparseMatrix<double> permute_columns(
                const LinearAlgebra::COOMatrix& A,
                const std::optional<LinearAlgebra::IndexVector>& E
            );

        private:
            static Eigen::SparseMatrix<double> reconstruction_difference(
                const LinearAlgebra::COOMatrix& Q,
                const LinearAlgebra::COOMatrix& R,
                const LinearAlgebra::COOMatrix& A,
                const std::optional<LinearAlgebra::IndexVector>& E
            );
    };
}

#endif
