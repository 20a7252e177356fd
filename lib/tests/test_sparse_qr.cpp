#include "tests/test_sparse_qr.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <vector>

using LinearAlgebra::CholmodContext;
using LinearAlgebra::CholmodSparsePtr;
using LinearAlgebra::COOMatrix;
using LinearAlgebra::IndexVector;
using LinearAlgebra::QRFactors;
using LinearAlgebra::SparseQRFactorization;

namespace TestSparseQR {

    using Entry = std::tuple<std::int64_t, std::int64_t, double>;

    // Entries sorted by (row, col, value) so two coordinate matrices compare as multisets
    std::vector<Entry> sorted_entries(const COOMatrix& A) {
        std::vector<Entry> entries;
        entries.reserve(static_cast<std::size_t>(A.nnz()));
        for (Eigen::Index k = 0; k < A.nnz(); ++k) {
            entries.emplace_back(A.row_indices(k), A.col_indices(k), A.values(k));
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    // Brings CHOLMOD's persistent workspace up to size before allocation counts are compared
    void warm_up(const SparseQRFactorization& qr, int size = 8) {
        COOMatrix A = utils::MatrixHelper::random_sparse_full_rank(size, size, 0.3, 1234);
        QRFactors factors = qr.factorize(A);
        assert(factors.rank == size);
    }

    void check_factorization(const COOMatrix& A, const QRFactors& f, double tolerance) {
        assert(f.Q.n_rows == A.n_rows);
        assert(f.Q.n_cols == f.R.n_rows);
        assert(f.R.n_cols == A.n_cols);
        assert(f.rank >= 0);
        assert(f.rank <= std::min(A.n_rows, A.n_cols));

        if (f.E) {
            assert(utils::errors::is_permutation(*f.E, A.n_cols));
        }

        double residual = utils::errors::compute_reconstruction_residual(f.Q, f.R, A, f.E);
        assert(residual < tolerance);
    }

    // ============================================================================
    // CONTEXT LIFECYCLE
    // ============================================================================

    void test_context_lifecycle() {
        std::cout << "Testing CHOLMOD context lifecycle..." << std::endl;

        CholmodContext context;
        assert(context.is_started());
        assert(context.common() != nullptr);

        // init() on a running context is a no-op
        cholmod_common* before = context.common();
        context.init();
        assert(context.is_started());
        assert(context.common() == before);

        context.deinit();
        assert(!context.is_started());
        context.deinit();
        assert(!context.is_started());

        bool threw = false;
        try {
            context.common();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        SparseQRFactorization qr(context);
        threw = false;
        try {
            qr.factorize(COOMatrix::identity(3));
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        // A finalized context can be started again
        context.init();
        assert(context.is_started());
        QRFactors factors = qr.factorize(COOMatrix::identity(3));
        assert(factors.rank == 3);

        std::cout << "  ✓ passed" << std::endl;
    }

    // ============================================================================
    // FORMAT CONVERSION
    // ============================================================================

    void test_round_trip_conversion() {
        std::cout << "Testing coordinate -> CHOLMOD -> coordinate round trip..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        COOMatrix A = utils::MatrixHelper::random_sparse(7, 5, 0.4, 11);
        assert(A.nnz() > 0);

        {
            CholmodSparsePtr warm = qr.to_cholmod_sparse(A);
            COOMatrix unused = qr.from_cholmod_sparse(warm.get());
        }
        const std::int64_t baseline = context.malloc_count();

        COOMatrix B;
        {
            CholmodSparsePtr native = qr.to_cholmod_sparse(A);
            assert(native != nullptr);
            assert(native->nrow == 7);
            assert(native->ncol == 5);
            assert(native->xtype == CHOLMOD_REAL);

            B = qr.from_cholmod_sparse(native.get());

            // The caller still owns the handle
            assert(native->nrow == 7);
        }

        assert(context.malloc_count() <= baseline);

        assert(B.n_rows == A.n_rows);
        assert(B.n_cols == A.n_cols);
        assert(B.nnz() == A.nnz());
        assert(sorted_entries(A) == sorted_entries(B));

        std::cout << "  ✓ passed (" << A.nnz() << " entries reproduced exactly)" << std::endl;
    }

    void test_duplicate_entries_summed() {
        std::cout << "Testing duplicate entries are summed by CHOLMOD..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        IndexVector rows(3), cols(3);
        Eigen::VectorXd vals(3);
        rows << 0, 0, 2;
        cols << 0, 0, 1;
        vals << 1.5, 2.5, 4.0;
        COOMatrix A(3, 3, rows, cols, vals);

        CholmodSparsePtr native = qr.to_cholmod_sparse(A);
        COOMatrix B = qr.from_cholmod_sparse(native.get());

        assert(B.nnz() == 2);
        Eigen::MatrixXd dense = B.to_dense();
        assert(dense(0, 0) == 4.0);
        assert(dense(2, 1) == 4.0);
        assert(dense.cwiseAbs().sum() == 8.0);

        std::cout << "  ✓ passed" << std::endl;
    }

    void test_structural_validation_failure() {
        std::cout << "Testing malformed coordinate input is rejected without leaks..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);
        warm_up(qr);

        const std::int64_t baseline = context.malloc_count();

        // Row index outside a 3 x 3 shape
        IndexVector rows(2), cols(2);
        Eigen::VectorXd vals(2);
        rows << 0, 5;
        cols << 0, 1;
        vals << 1.0, 2.0;
        COOMatrix out_of_range(3, 3, rows, cols, vals);

        bool threw = false;
        try {
            CholmodSparsePtr native = qr.to_cholmod_sparse(out_of_range);
        } catch (const LinearAlgebra::StructuralValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(context.malloc_count() <= baseline);

        threw = false;
        try {
            qr.factorize(out_of_range);
        } catch (const LinearAlgebra::StructuralValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(context.malloc_count() <= baseline);

        // Arrays of different lengths never reach CHOLMOD
        COOMatrix mismatched(3, 3, rows, cols, Eigen::VectorXd::Ones(3));
        threw = false;
        try {
            qr.factorize(mismatched);
        } catch (const LinearAlgebra::StructuralValidationError&) {
            threw = true;
        }
        assert(threw);
        assert(context.malloc_count() <= baseline);

        // The context is still usable afterwards
        QRFactors factors = qr.factorize(COOMatrix::identity(4));
        assert(factors.rank == 4);

        std::cout << "  ✓ passed" << std::endl;
    }

    // ============================================================================
    // FACTORIZATION
    // ============================================================================

    void test_reconstruction_identity() {
        std::cout << "Testing Q*R = A*P on random sparse matrices..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        struct Case { int rows; int cols; double density; unsigned int seed; };
        std::vector<Case> cases = {
            {10, 10, 0.1, 1},   // the classic demo matrix, usually rank deficient
            {12, 12, 0.3, 2},
            {20, 8, 0.3, 3},    // tall
            {8, 20, 0.3, 4},    // wide
            {30, 30, 0.05, 5},
            {40, 25, 0.2, 6}
        };

        std::cout << std::left << std::setw(10) << "Shape"
                  << std::setw(8) << "nnz"
                  << std::setw(8) << "rank"
                  << std::setw(14) << "residual" << std::endl;

        for (const Case& c : cases) {
            COOMatrix A = utils::MatrixHelper::random_sparse(c.rows, c.cols, c.density, c.seed);
            QRFactors f = qr.factorize(A);

            // econ defaults to the row count, Q is square
            assert(f.Q.n_cols == A.n_rows);
            assert(f.R.n_rows == A.n_rows);
            check_factorization(A, f, 1e-9);

            double orthogonality = utils::errors::compute_orthogonality_error(f.Q);
            assert(orthogonality < 1e-10);

            std::cout << std::left
                      << std::setw(10) << (std::to_string(c.rows) + "x" + std::to_string(c.cols))
                      << std::setw(8) << A.nnz()
                      << std::setw(8) << f.rank
                      << std::setw(14) << std::scientific << std::setprecision(2)
                      << utils::errors::compute_reconstruction_residual(f.Q, f.R, A, f.E)
                      << std::defaultfloat << std::endl;
        }

        std::cout << "  ✓ passed" << std::endl;
    }

    void test_identity_matrix() {
        std::cout << "Testing factorization of the identity..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        const int k = 6;
        COOMatrix eye = COOMatrix::identity(k);
        QRFactors f = qr.factorize(eye);

        assert(f.rank == k);
        check_factorization(eye, f, 1e-12);

        // Q and R are identities up to sign (and up to the column permutation, if any)
        Eigen::MatrixXd Q_abs = f.Q.to_dense().cwiseAbs();
        Eigen::MatrixXd R_abs = f.R.to_dense().cwiseAbs();
        assert(Q_abs.rows() == k && Q_abs.cols() == k);
        assert(R_abs.rows() == k && R_abs.cols() == k);
        assert((Q_abs.rowwise().sum() - Eigen::VectorXd::Ones(k)).norm() < 1e-12);
        assert((Q_abs.colwise().sum() - Eigen::RowVectorXd::Ones(k)).norm() < 1e-12);
        assert((R_abs.rowwise().sum() - Eigen::VectorXd::Ones(k)).norm() < 1e-12);
        assert((R_abs.colwise().sum() - Eigen::RowVectorXd::Ones(k)).norm() < 1e-12);

        bool identity_order = !f.E || *f.E == IndexVector::LinSpaced(k, 0, k - 1);
        if (identity_order) {
            assert((Q_abs - Eigen::MatrixXd::Identity(k, k)).norm() < 1e-12);
            assert((R_abs - Eigen::MatrixXd::Identity(k, k)).norm() < 1e-12);
        }

        std::cout << "  ✓ passed" << std::endl;
    }

    void test_empty_matrix() {
        std::cout << "Testing factorization of a matrix without entries..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        COOMatrix A(5, 4);
        assert(A.nnz() == 0);

        QRFactors f = qr.factorize(A);

        assert(f.rank == 0);
        assert(f.Q.n_rows == 5);
        assert(f.R.n_cols == 4);
        assert(f.Q.n_cols == f.R.n_rows);
        assert(f.R.values.cwiseAbs().sum() == 0.0);
        if (f.E) {
            assert(utils::errors::is_permutation(*f.E, 4));
        }
        assert(utils::errors::compute_reconstruction_residual(f.Q, f.R, A, f.E) == 0.0);

        std::cout << "  ✓ passed" << std::endl;
    }

    void test_rank_deficient_matrix() {
        std::cout << "Testing rank estimate of a rank deficient matrix..." << std::endl;

        CholmodContext context;
        SparseQRFactorization qr(context);

        // Column 3 is twice column 0
        Eigen::MatrixXd dense(6, 4);
        dense << 1, 0, 2, 2,
                 2, 1, 0, 4,
                 0, 4, 1, 0,
                 3, 0, 0, 6,
                 0, 2, 0, 0,
                 1, 0, 5, 2;
        Eigen::SparseMatrix<double> sparse = dense.sparseView();
        COOMatrix A(sparse);

        QRFactors f = qr.factorize(A);

        assert(f.rank == 3);
        check_factorization(A, f, 1e-9);

        std::cout << "  ✓ passed (rank " << f.rank << ")" << std::endl;
    }

    void test_ordering_and_econ_options() {
        std::cout << "Testing ordering methods and the econ setting..." << std::endl;

        CholmodContext context;
        COOMatrix A = utils::MatrixHelper::random_sparse(15, 12, 0.25, 21);

        for (OrderingMethod ordering : {OrderingMethod::Fixed, OrderingMethod::Natural,
                                        OrderingMethod::COLAMD, OrderingMethod::AMD,
                                        OrderingMethod::Default}) {
            QROptions options;
            options.ordering = ordering;
            SparseQRFactorization qr(context, options);

            QRFactors f = qr.factorize(A);
            check_factorization(A, f, 1e-9);
        }

        // econ = 0 keeps only rank rows of R
        COOMatrix tall = utils::MatrixHelper::random_sparse_full_rank(10, 6, 0.3, 22, 10.0);
        QROptions econ_options;
        econ_options.econ = 0;
        SparseQRFactorization econ_qr(context, econ_options);

        QRFactors f = econ_qr.factorize(tall);
        assert(f.rank == 6);
        assert(f.Q.n_rows == 10);
        assert(f.Q.n_cols == 6);
        assert(f.R.n_rows == 6);
        assert(f.R.n_cols == 6);
        check_factorization(tall, f, 1e-9);

        // Eigen input goes through the same path
        QRFactors from_eigen = econ_qr.factorize(tall.to_eigen());
        assert(from_eigen.rank == 6);

        std::cout << "  ✓ passed" << std::endl;
    }

    void test_permutation_matrix_from_vector() {
        std::cout << "Testing permutation matrix construction..." << std::endl;

        IndexVector E(4);
        E << 2, 0, 3, 1;

        COOMatrix P = SparseQRFactorization::permutation_matrix_from_vector(E);
        assert(P.n_rows == 4 && P.n_cols == 4);
        assert(P.nnz() == 4);

        Eigen::MatrixXd dense = P.to_dense();
        for (int k = 0; k < 4; ++k) {
            assert(dense(E(k), k) == 1.0);
        }
        assert((dense.rowwise().sum() - Eigen::VectorXd::Ones(4)).norm() == 0.0);
        assert((dense.colwise().sum() - Eigen::RowVectorXd::Ones(4)).norm() == 0.0);

        // A*P moves column E[k] of the identity to position k
        Eigen::MatrixXd moved = Eigen::MatrixXd::Identity(4, 4) * dense;
        assert(moved(2, 0) == 1.0 && moved(0, 1) == 1.0);

        COOMatrix empty = SparseQRFactorization::permutation_matrix_from_vector(IndexVector(0));
        assert(empty.n_rows == 0 && empty.n_cols == 0 && empty.nnz() == 0);

        std::cout << "  ✓ passed" << std::endl;
    }

    // ============================================================================
    // RESOURCES
    // ============================================================================

    void test_repeated_factorization_no_leak(int num_calls) {
        std::cout << "Testing " << num_calls << " sequential factorizations for native leaks..." << std::endl;

        CholmodContext context;

        // Released: every native block is returned
        {
            QROptions options;
            options.permutation_ownership = PermutationOwnership::Released;
            SparseQRFactorization qr(context, options);
            warm_up(qr);

            const std::int64_t baseline = context.malloc_count();
            for (int i = 0; i < num_calls; ++i) {
                int rows = 1 + (i % 8);
                int cols = 1 + ((i * 7) % 8);
                COOMatrix A = utils::MatrixHelper::random_sparse(rows, cols, 0.3, static_cast<unsigned int>(i));
                QRFactors f = qr.factorize(A);
                if (i % 100 == 0) {
                    check_factorization(A, f, 1e-9);
                }
            }
            assert(context.malloc_count() <= baseline);
            std::cout << "  released permutations: " << context.malloc_count() - baseline
                      << " blocks outstanding" << std::endl;
        }

        // Retained: only the permutation buffers stay with CHOLMOD
        {
            SparseQRFactorization qr(context);
            warm_up(qr);

            const std::int64_t baseline = context.malloc_count();
            std::int64_t retained = 0;
            const int retained_calls = num_calls / 5;
            for (int i = 0; i < retained_calls; ++i) {
                COOMatrix A = utils::MatrixHelper::random_sparse(6, 6, 0.3, static_cast<unsigned int>(7000 + i));
                QRFactors f = qr.factorize(A);
                if (f.E) {
                    ++retained;
                }
            }
            assert(context.malloc_count() - baseline <= retained);
            std::cout << "  retained permutations: " << retained << " of " << retained_calls << " calls" << std::endl;
        }

        std::cout << "  ✓ passed" << std::endl;
    }

    void run_all() {
        test_context_lifecycle();
        test_round_trip_conversion();
        test_duplicate_entries_summed();
        test_structural_validation_failure();
        test_reconstruction_identity();
        test_identity_matrix();
        test_empty_matrix();
        test_rank_deficient_matrix();
        test_ordering_and_econ_options();
        test_permutation_matrix_from_vector();
        test_repeated_factorization_no_leak(1000);
    }
}
