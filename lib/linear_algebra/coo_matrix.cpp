#include "linear_algebra/coo_matrix.hpp"

#include <string>
#include <utility>

namespace LinearAlgebra {

    COOMatrix::COOMatrix(std::int64_t rows, std::int64_t cols)
        : n_rows(rows)
        , n_cols(cols) {}

    COOMatrix::COOMatrix(std::int64_t rows, std::int64_t cols,
                         IndexVector rows_idx, IndexVector cols_idx, Eigen::VectorXd vals)
        : n_rows(rows)
        , n_cols(cols)
        , row_indices(std::move(rows_idx))
        , col_indices(std::move(cols_idx))
        , values(std::move(vals)) {}

    COOMatrix::COOMatrix(const Eigen::SparseMatrix<double>& eigen_sparse)
        : n_rows(eigen_sparse.rows())
        , n_cols(eigen_sparse.cols()) {

        const Eigen::Index nnz = eigen_sparse.nonZeros();
        row_indices.resize(nnz);
        col_indices.resize(nnz);
        values.resize(nnz);

        Eigen::Index k = 0;
        for (int col = 0; col < eigen_sparse.outerSize(); ++col) {
            for (Eigen::SparseMatrix<double>::InnerIterator it(eigen_sparse, col); it; ++it) {
                row_indices(k) = it.row();
                col_indices(k) = it.col();
                values(k) = it.value();
                ++k;
            }
        }
    }

    bool COOMatrix::has_consistent_arrays() const {
        if (n_rows < 0 || n_cols < 0) {
            return false;
        }
        return row_indices.size() == values.size() && col_indices.size() == values.size();
    }

    Eigen::SparseMatrix<double> COOMatrix::to_eigen() const {
        if (!has_consistent_arrays()) {
            throw std::invalid_argument("Coordinate arrays have inconsistent lengths");
        }

        std::vector<Eigen::Triplet<double>> triplets;
        triplets.reserve(static_cast<std::size_t>(nnz()));

        for (Eigen::Index k = 0; k < values.size(); ++k) {
            if (row_indices(k) < 0 || row_indices(k) >= n_rows ||
                col_indices(k) < 0 || col_indices(k) >= n_cols) {
                throw std::out_of_range("Coordinate entry " + std::to_string(k) + " lies outside the matrix");
            }
            triplets.emplace_back(static_cast<int>(row_indices(k)),
                                  static_cast<int>(col_indices(k)),
                                  values(k));
        }

        Eigen::SparseMatrix<double> result(n_rows, n_cols);
        result.setFromTriplets(triplets.begin(), triplets.end());
        result.makeCompressed();
        return result;
    }

    Eigen::MatrixXd COOMatrix::to_dense() const {
        return Eigen::MatrixXd(to_eigen());
    }

    COOMatrix COOMatrix::identity(std::int64_t k) {
        COOMatrix eye(k, k);
        eye.row_indices = IndexVector::LinSpaced(k, 0, k - 1);
        eye.col_indices = eye.row_indices;
        eye.values = Eigen::VectorXd::Ones(k);
        return eye;
    }

}
