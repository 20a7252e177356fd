#include "utils/matrix_helper.hpp"

#include <cstdint>
#include <set>
#include <stdexcept>

namespace utils {

    // ============================================================================
    // GENERATORS
    // ============================================================================

    LinearAlgebra::COOMatrix MatrixHelper::random_sparse(int rows, int cols, double density, unsigned int seed) {
        if (rows < 0 || cols < 0) {
            throw std::invalid_argument("Matrix dimensions must be non-negative");
        }
        if (density < 0.0 || density > 1.0) {
            throw std::invalid_argument("Density must lie in [0, 1]");
        }

        const std::int64_t total = static_cast<std::int64_t>(rows) * cols;
        const std::int64_t k = static_cast<std::int64_t>(std::llround(density * static_cast<double>(total)));

        std::mt19937 gen(seed);
        std::uniform_real_distribution<double> value_dist(0.0, 1.0);

        // Floyd's sampling of k distinct linear positions (column major)
        std::set<std::int64_t> positions;
        for (std::int64_t j = total - k; j < total; ++j) {
            std::uniform_int_distribution<std::int64_t> pick(0, j);
            std::int64_t t = pick(gen);
            if (!positions.insert(t).second) {
                positions.insert(j);
            }
        }

        LinearAlgebra::COOMatrix result(rows, cols);
        result.row_indices.resize(k);
        result.col_indices.resize(k);
        result.values.resize(k);

        Eigen::Index idx = 0;
        for (std::int64_t position : positions) {
            result.row_indices(idx) = position % rows;
            result.col_indices(idx) = position / rows;
            result.values(idx) = value_dist(gen);
            ++idx;
        }

        return result;
    }

    LinearAlgebra::COOMatrix MatrixHelper::random_sparse_full_rank(int rows, int cols, double density,
                                                                   unsigned int seed, double shift) {
        LinearAlgebra::COOMatrix pattern = random_sparse(rows, cols, density, seed);

        const Eigen::Index n_diag = std::min(rows, cols);
        const Eigen::Index nnz = pattern.nnz();

        // Duplicates on the diagonal are fine, CHOLMOD sums them
        pattern.row_indices.conservativeResize(nnz + n_diag);
        pattern.col_indices.conservativeResize(nnz + n_diag);
        pattern.values.conservativeResize(nnz + n_diag);

        for (Eigen::Index i = 0; i < n_diag; ++i) {
            pattern.row_indices(nnz + i) = i;
            pattern.col_indices(nnz + i) = i;
            pattern.values(nnz + i) = shift;
        }

        return pattern;
    }

    // ============================================================================
    // HELPERS
    // ============================================================================

    void MatrixHelper::display_matrix(
        const Eigen::MatrixXd& matrix,
        const std::string& name,
        int precision,
        int max_rows,
        int max_cols
    ) {
        if (!name.empty()) {
            std::cout << "\n=== " << name << " ===" << std::endl;
        }

        int rows = static_cast<int>(matrix.rows());
        int cols = static_cast<int>(matrix.cols());

        // Set display limits
        int display_rows = (max_rows > 0) ? std::min(max_rows, rows) : rows;
        int display_cols = (max_cols > 0) ? std::min(max_cols, cols) : cols;

        std::ios_base::fmtflags old_flags = std::cout.flags();
        std::streamsize old_precision = std::cout.precision();
        std::cout << std::fixed << std::setprecision(precision);

        std::cout << "Dimensions: " << rows << " x " << cols;
        if (max_rows > 0 && rows > max_rows) std::cout << " (showing " << max_rows << " rows)";
        if (max_cols > 0 && cols > max_cols) std::cout << " (showing " << max_cols << " cols)";
        std::cout << std::endl;

        for (int i = 0; i < display_rows; ++i) {
            for (int j = 0; j < display_cols; ++j) {
                std::cout << std::setw(precision + 5) << matrix(i, j) << " ";
            }
            if (display_cols < cols) std::cout << "...";
            std::cout << std::endl;
        }
        if (display_rows < rows) std::cout << "..." << std::endl;

        std::cout.flags(old_flags);
        std::cout.precision(old_precision);
    }

    void MatrixHelper::display_entries(const LinearAlgebra::COOMatrix& matrix, const std::string& name) {
        if (!name.empty()) {
            std::cout << "\n=== " << name << " ===" << std::endl;
        }
        std::cout << "Dimensions: " << matrix.n_rows << " x " << matrix.n_cols
                  << ", stored entries: " << matrix.nnz() << std::endl;

        for (Eigen::Index k = 0; k < matrix.nnz(); ++k) {
            std::cout << "  (" << matrix.row_indices(k) << ", " << matrix.col_indices(k) << ")  "
                      << matrix.values(k) << std::endl;
        }
    }
}
