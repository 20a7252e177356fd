#ifndef SPQRBIND_MATRIX_HELPER_HPP
#define SPQRBIND_MATRIX_HELPER_HPP


#include <random>
#include <cmath>
#include <string>
#include <iostream>
#include <iomanip>
#include <algorithm>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "linear_algebra/coo_matrix.hpp"

namespace utils {
    class MatrixHelper {
        public:

            // ============================================================================
            // GENERATORS
            // ============================================================================

            /**
             * @brief Random sparse matrix with uniformly distributed values in [0, 1)
             *
             * round(density * rows * cols) distinct positions are drawn without
             * replacement, so the result never has duplicate entries.
             *
             * @param rows Number of rows
             * @param cols Number of columns
             * @param density Fraction of stored entries, in [0, 1]
             * @param seed Seed of the generator
             * @return Coordinate matrix with entries sorted by column then row
             * @throws std::invalid_argument if density is outside [0, 1] or a dimension is negative
             */
            static LinearAlgebra::COOMatrix random_sparse(int rows, int cols, double density, unsigned int seed);

            /**
             * @brief Random sparse matrix with a nonzero diagonal added
             *
             * Keeps the random pattern of random_sparse and adds `shift` to each
             * diagonal position, which makes the matrix full rank for moderate density.
             */
            static LinearAlgebra::COOMatrix random_sparse_full_rank(int rows, int cols, double density,
                                                                    unsigned int seed, double shift = 1.0);

            // ============================================================================
            // HELPERS
            // ============================================================================

            /**
             * @brief Display matrix in formatted terminal output
             * @param matrix The matrix to display
             * @param name Optional name/label for the matrix
             * @param precision Number of decimal places to show
             * @param max_rows Maximum number of rows to display (0 = all)
             * @param max_cols Maximum number of columns to display (0 = all)
             */
            static void display_matrix(
                const Eigen::MatrixXd& matrix,
                const std::string& name = "",
                int precision = 6,
                int max_rows = 0,
                int max_cols = 0
            );

            /**
             * @brief Display the stored entries of a coordinate matrix, one per line
             */
            static void display_entries(const LinearAlgebra::COOMatrix& matrix, const std::string& name = "");
    };
}

#endif
