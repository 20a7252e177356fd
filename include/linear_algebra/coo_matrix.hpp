#ifndef SPQRBIND_COO_MATRIX_HPP
#define SPQRBIND_COO_MATRIX_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace LinearAlgebra {

    /// 64-bit index array, the width of SuiteSparse_long on the long-index build
    using IndexVector = Eigen::Matrix<std::int64_t, Eigen::Dynamic, 1>;

    /**
     * @brief Coordinate (triplet) sparse matrix
     *
     * The matrix is stored as three parallel arrays:
     * - row_indices: Row index of each entry
     * - col_indices: Column index of each entry
     * - values: Value of each entry
     *
     * Duplicate (row, col) pairs are kept as they are. They are summed
     * only when the matrix is compressed (to_eigen() or the CHOLMOD
     * triplet to sparse conversion).
     */
    struct COOMatrix {
        std::int64_t n_rows;             ///< Number of rows
        std::int64_t n_cols;             ///< Number of columns
        IndexVector row_indices;         ///< Row index of each entry
        IndexVector col_indices;         ///< Column index of each entry
        Eigen::VectorXd values;          ///< Value of each entry

        COOMatrix() : n_rows(0), n_cols(0) {}
        COOMatrix(std::int64_t rows, std::int64_t cols);
        COOMatrix(std::int64_t rows, std::int64_t cols,
                  IndexVector rows_idx, IndexVector cols_idx, Eigen::VectorXd vals);

        /**
         * @brief Build the coordinate form of an Eigen sparse matrix
         *
         * Every stored entry becomes one triplet, explicit zeros included.
         *
         * @param eigen_sparse The Eigen sparse matrix to convert
         */
        explicit COOMatrix(const Eigen::SparseMatrix<double>& eigen_sparse);

        /// Number of stored entries
        std::int64_t nnz() const { return values.size(); }

        /**
         * @brief Check the arrays agree with each other and with the shape
         *
         * Only lengths and the shape sign are checked here. Index ranges
         * are left to cholmod_l_check_triplet.
         *
         * @return true if the three arrays have the same length and the shape is non-negative
         */
        bool has_consistent_arrays() const;

        /**
         * @brief Compressed Eigen copy, duplicate entries summed
         *
         * @throws std::out_of_range if an index lies outside the shape
         */
        Eigen::SparseMatrix<double> to_eigen() const;

        /// Dense copy, intended for small matrices in tests and output
        Eigen::MatrixXd to_dense() const;

        /// k x k identity in coordinate form
        static COOMatrix identity(std::int64_t k);
    };

}

#endif
