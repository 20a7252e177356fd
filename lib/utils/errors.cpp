#include "utils/errors.hpp"

#include <stdexcept>
#include <vector>

#include "linear_algebra/sparse_qr_factorization.hpp"

namespace utils {
    // ============================================================================
    // FACTORIZATION ERRORS
    // ============================================================================

    double errors::compute_reconstruction_residual(
        const LinearAlgebra::COOMatrix& Q,
        const LinearAlgebra::COOMatrix& R,
        const LinearAlgebra::COOMatrix& A,
        const std::optional<LinearAlgebra::IndexVector>& E
    ){
        Eigen::SparseMatrix<double> difference = reconstruction_difference(Q, R, A, E);
        return difference.cwiseAbs().sum();
    }

    double errors::compute_relative_residual(
        const LinearAlgebra::COOMatrix& Q,
        const LinearAlgebra::COOMatrix& R,
        const LinearAlgebra::COOMatrix& A,
        const std::optional<LinearAlgebra::IndexVector>& E
    ){
        double numerator = reconstruction_difference(Q, R, A, E).norm();
        double denominator = A.to_eigen().norm();

        if (denominator > 1e-300) {
            return numerator / denominator;
        }
        return numerator;
    }

    double errors::compute_orthogonality_error(const LinearAlgebra::COOMatrix& Q){
        Eigen::SparseMatrix<double> Q_sparse = Q.to_eigen();
        Eigen::SparseMatrix<double> QtQ = Q_sparse.transpose() * Q_sparse;

        Eigen::SparseMatrix<double> eye(QtQ.rows(), QtQ.cols());
        eye.setIdentity();

        return Eigen::SparseMatrix<double>(QtQ - eye).norm();
    }

    // ============================================================================
    // HELPER METHODS
    // ============================================================================

    bool errors::is_permutation(const LinearAlgebra::IndexVector& E, std::int64_t n){
        if (E.size() != n) {
            return false;
        }

        std::vector<bool> seen(static_cast<std::size_t>(n), false);
        for (Eigen::Index k = 0; k < E.size(); ++k) {
            std::int64_t j = E(k);
            if (j < 0 || j >= n || seen[static_cast<std::size_t>(j)]) {
                return false;
            }
            seen[static_cast<std::size_t>(j)] = true;
        }
        return true;
    }

    Eigen::SparseMatrix<double> errors::permute_columns(
        const LinearAlgebra::COOMatrix& A,
        const std::optional<LinearAlgebra::IndexVector>& E
    ){
        Eigen::SparseMatrix<double> A_sparse = A.to_eigen();
        if (!E) {
            return A_sparse;
        }

        if (E->size() != A.n_cols) {
            throw std::invalid_argument("Permutation length does not match the number of columns");
        }

        Eigen::SparseMatrix<double> P =
            LinearAlgebra::SparseQRFactorization::permutation_matrix_from_vector(*E).to_eigen();
        return Eigen::SparseMatrix<double>(A_sparse * P);
    }

    Eigen::SparseMatrix<double> errors::reconstruction_difference(
        const LinearAlgebra::COOMatrix& Q,
        const LinearAlgebra::COOMatrix& R,
        const LinearAlgebra::COOMatrix& A,
        const std::optional<LinearAlgebra::IndexVector>& E
    ){
        if (Q.n_cols != R.n_rows || Q.n_rows != A.n_rows || R.n_cols != A.n_cols) {
            throw std::invalid_argument("Factor shapes are incompatible with the factorized matrix");
        }

        Eigen::SparseMatrix<double> QR = Q.to_eigen() * R.to_eigen();
        Eigen::SparseMatrix<double> AP = permute_columns(A, E);
        return Eigen::SparseMatrix<double>(QR - AP);
    }
}
