#include "linear_algebra/sparse_qr_factorization.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <SuiteSparseQR_C.h>

#include "utils/scope_timer.hpp"

static_assert(sizeof(SuiteSparse_long) == sizeof(std::int64_t),
              "SuiteSparse must be built with 64-bit SuiteSparse_long");

namespace LinearAlgebra {
    // ============================================================================
    // CONSTRUCTORS
    // ============================================================================

    SparseQRFactorization::SparseQRFactorization(CholmodContext& context, QROptions options)
        : context_(context)
        , options_(options) {
        context_.set_print_level(options_.print_level);
    }

    void SparseQRFactorization::set_options(const QROptions& options) {
        options_ = options;
        context_.set_print_level(options_.print_level);
    }

    // ============================================================================
    // MAIN INTERFACE
    // ============================================================================

    QRFactors SparseQRFactorization::factorize(const COOMatrix& A) const {
        cholmod_common* cc = context_.common();
        context_.reset_status();

        CholmodSparsePtr A_native = to_cholmod_sparse(A);

        const SuiteSparse_long econ = options_.econ < 0
            ? static_cast<SuiteSparse_long>(A.n_rows)
            : static_cast<SuiteSparse_long>(options_.econ);

        cholmod_sparse* Q_raw = nullptr;
        cholmod_sparse* R_raw = nullptr;
        SuiteSparse_long* E_raw = nullptr;
        SuiteSparse_long rank = -1;

        {
            utils::ScopeTimer timer("SuiteSparseQR_C_QR", options_.verbose);
            rank = SuiteSparseQR_C_QR(
                static_cast<int>(options_.ordering),
                options_.tolerance,
                econ,
                A_native.get(),
                &Q_raw,
                &R_raw,
                &E_raw,
                cc);
        }

        CholmodSparsePtr Q_native(Q_raw, CholmodSparseDeleter{cc});
        CholmodSparsePtr R_native(R_raw, CholmodSparseDeleter{cc});

        if (rank < 0 || !Q_native || !R_native) {
            throw NativeFailureError("SuiteSparseQR_C_QR failed", cc->status);
        }

        QRFactors result;
        result.rank = static_cast<std::int64_t>(rank);

        // A null E means SPQR kept the columns in their input order
        if (E_raw != nullptr) {
            const std::int64_t n = A.n_cols;
            IndexVector E(n);
            std::copy(E_raw, E_raw + n, E.data());
            result.E = std::move(E);

            // E comes from cholmod_l_malloc; it is only freed when the caller opts in
            if (options_.permutation_ownership == PermutationOwnership::Released) {
                cholmod_l_free(static_cast<size_t>(n), sizeof(SuiteSparse_long), E_raw, cc);
            }
        }

        result.Q = from_cholmod_sparse(Q_native.get());
        result.R = from_cholmod_sparse(R_native.get());

        if (options_.verbose) {
            std::cout << "Sparse QR: " << A.n_rows << " x " << A.n_cols
                      << ", nnz(A) = " << A.nnz()
                      << ", nnz(Q) = " << result.Q.nnz()
                      << ", nnz(R) = " << result.R.nnz()
                      << ", rank = " << result.rank
                      << (result.E ? "" : ", no permutation") << std::endl;
        }

        return result;
    }

    QRFactors SparseQRFactorization::factorize(const Eigen::SparseMatrix<double>& A) const {
        return factorize(COOMatrix(A));
    }

    // ============================================================================
    // FORMAT CONVERSION
    // ============================================================================

    CholmodSparsePtr SparseQRFactorization::to_cholmod_sparse(const COOMatrix& A) const {
        if (!A.has_consistent_arrays()) {
            throw StructuralValidationError(
                "Coordinate matrix " + std::to_string(A.n_rows) + " x " + std::to_string(A.n_cols) +
                " has " + std::to_string(A.row_indices.size()) + " row indices, " +
                std::to_string(A.col_indices.size()) + " column indices and " +
                std::to_string(A.values.size()) + " values");
        }

        cholmod_common* cc = context_.common();
        const size_t nnz = static_cast<size_t>(A.nnz());

        // stype 0: all entries are stored, no symmetry assumed
        CholmodTripletPtr triplet(
            cholmod_l_allocate_triplet(static_cast<size_t>(A.n_rows), static_cast<size_t>(A.n_cols),
                                       nnz, 0, CHOLMOD_REAL, cc),
            CholmodTripletDeleter{cc});

        if (!triplet) {
            throw NativeFailureError("cholmod_l_allocate_triplet failed", cc->status);
        }

        SuiteSparse_long* Ti = static_cast<SuiteSparse_long*>(triplet->i);
        SuiteSparse_long* Tj = static_cast<SuiteSparse_long*>(triplet->j);
        double* Tx = static_cast<double*>(triplet->x);

        std::copy(A.row_indices.data(), A.row_indices.data() + nnz, Ti);
        std::copy(A.col_indices.data(), A.col_indices.data() + nnz, Tj);
        std::copy(A.values.data(), A.values.data() + nnz, Tx);

        // nzmax is only the capacity
        triplet->nnz = nnz;

        if (options_.verbose) {
            cholmod_l_print_triplet(triplet.get(), "A", cc);
        }

        if (cholmod_l_check_triplet(triplet.get(), cc) != 1) {
            throw StructuralValidationError("cholmod_l_check_triplet rejected the input matrix");
        }

        CholmodSparsePtr sparse(
            cholmod_l_triplet_to_sparse(triplet.get(), nnz, cc),
            CholmodSparseDeleter{cc});

        if (!sparse) {
            throw NativeFailureError("cholmod_l_triplet_to_sparse failed", cc->status);
        }

        return sparse;
    }

    COOMatrix SparseQRFactorization::from_cholmod_sparse(const cholmod_sparse* A) const {
        cholmod_common* cc = context_.common();

        if (A == nullptr) {
            throw NativeFailureError("Null cholmod_sparse handle", CHOLMOD_INVALID);
        }

        CholmodTripletPtr triplet(
            cholmod_l_sparse_to_triplet(const_cast<cholmod_sparse*>(A), cc),
            CholmodTripletDeleter{cc});

        if (!triplet) {
            throw NativeFailureError("cholmod_l_sparse_to_triplet failed", cc->status);
        }

        const Eigen::Index nnz = static_cast<Eigen::Index>(triplet->nnz);

        COOMatrix result(static_cast<std::int64_t>(triplet->nrow), static_cast<std::int64_t>(triplet->ncol));
        result.row_indices.resize(nnz);
        result.col_indices.resize(nnz);
        result.values.resize(nnz);

        const SuiteSparse_long* Ti = static_cast<const SuiteSparse_long*>(triplet->i);
        const SuiteSparse_long* Tj = static_cast<const SuiteSparse_long*>(triplet->j);
        const double* Tx = static_cast<const double*>(triplet->x);

        std::copy(Ti, Ti + nnz, result.row_indices.data());
        std::copy(Tj, Tj + nnz, result.col_indices.data());
        std::copy(Tx, Tx + nnz, result.values.data());

        return result;
    }

    // ============================================================================
    // HELPERS
    // ============================================================================

    COOMatrix SparseQRFactorization::permutation_matrix_from_vector(const IndexVector& E) {
        const std::int64_t n = E.size();

        COOMatrix P(n, n);
        P.row_indices = E;
        P.col_indices = IndexVector::LinSpaced(n, 0, n - 1);
        P.values = Eigen::VectorXd::Ones(n);

        return P;
    }

}
