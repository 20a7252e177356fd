#include "spqrbind_python.hpp"

#include <memory>
#include <sstream>
#include <utility>

using LinearAlgebra::CholmodContext;
using LinearAlgebra::COOMatrix;
using LinearAlgebra::IndexVector;
using LinearAlgebra::QRFactors;
using LinearAlgebra::SparseQRFactorization;

namespace {
    // The one CHOLMOD context of the interpreter, started at import
    std::unique_ptr<CholmodContext> module_context;

    CholmodContext& context() {
        if (!module_context) {
            module_context = std::make_unique<CholmodContext>();
        }
        return *module_context;
    }

    py::tuple run_qr(const COOMatrix& A, OrderingMethod ordering, double tolerance,
                     std::int64_t econ, bool release_permutation, bool verbose) {
        QROptions options;
        options.ordering = ordering;
        options.tolerance = tolerance;
        options.econ = econ;
        options.verbose = verbose;
        options.permutation_ownership = release_permutation
            ? PermutationOwnership::Released
            : PermutationOwnership::Retained;

        SparseQRFactorization qr(context(), options);
        QRFactors factors = qr.factorize(A);

        py::object E = py::none();
        if (factors.E) {
            E = py::cast(std::move(*factors.E));
        }

        return py::make_tuple(std::move(factors.Q), std::move(factors.R), E, factors.rank);
    }
}

void init_sparse_qr(py::module_ &m) {
    context();

    py::register_exception<LinearAlgebra::StructuralValidationError>(m, "StructuralValidationError", PyExc_ValueError);
    py::register_exception<LinearAlgebra::NativeFailureError>(m, "NativeFailureError", PyExc_RuntimeError);

    py::class_<COOMatrix>(m, "COOMatrix")
        .def(py::init<>())
        .def(py::init([](std::pair<std::int64_t, std::int64_t> shape,
                         IndexVector row, IndexVector col, Eigen::VectorXd data) {
                 return COOMatrix(shape.first, shape.second, std::move(row), std::move(col), std::move(data));
             }),
             py::arg("shape"),
             py::arg("row"),
             py::arg("col"),
             py::arg("data"))
        .def(py::init<const Eigen::SparseMatrix<double>&>(),
             py::arg("matrix"),
             "Coordinate copy of a scipy.sparse matrix")
        .def_property_readonly("shape", [](const COOMatrix& A) {
            return py::make_tuple(A.n_rows, A.n_cols);
        })
        .def_property_readonly("nnz", &COOMatrix::nnz)
        .def_readwrite("row", &COOMatrix::row_indices)
        .def_readwrite("col", &COOMatrix::col_indices)
        .def_readwrite("data", &COOMatrix::values)
        .def("to_sparse", &COOMatrix::to_eigen, "Compressed scipy.sparse copy, duplicates summed")
        .def("toarray", &COOMatrix::to_dense, "Dense numpy copy")
        .def("__repr__", [](const COOMatrix& A) {
            std::ostringstream out;
            out << "<COOMatrix " << A.n_rows << "x" << A.n_cols << " with " << A.nnz() << " stored entries>";
            return out.str();
        });

    m.def("qr",
          [](const COOMatrix& A, OrderingMethod ordering, double tolerance,
             std::int64_t econ, bool release_permutation, bool verbose) {
              return run_qr(A, ordering, tolerance, econ, release_permutation, verbose);
          },
          py::arg("A"),
          py::arg("ordering") = OrderingMethod::Default,
          py::arg("tolerance") = kDefaultTolerance,
          py::arg("econ") = -1,
          py::arg("release_permutation") = false,
          py::arg("verbose") = false,
          "Sparse QR of A. Returns (Q, R, E, rank) with Q*R = A*permutation_from_E(E); E is None for no permutation.");

    m.def("qr",
          [](const Eigen::SparseMatrix<double>& A, OrderingMethod ordering, double tolerance,
             std::int64_t econ, bool release_permutation, bool verbose) {
              return run_qr(COOMatrix(A), ordering, tolerance, econ, release_permutation, verbose);
          },
          py::arg("A"),
          py::arg("ordering") = OrderingMethod::Default,
          py::arg("tolerance") = kDefaultTolerance,
          py::arg("econ") = -1,
          py::arg("release_permutation") = false,
          py::arg("verbose") = false,
          "Sparse QR of a scipy.sparse matrix.");

    m.def("permutation_from_E", &SparseQRFactorization::permutation_matrix_from_vector,
          py::arg("E"),
          "n x n permutation matrix P with P[E[k], k] = 1");

    m.def("init", []() { context().init(); },
          "Start the CHOLMOD context (no-op if running)");

    m.def("deinit", []() { context().deinit(); },
          "Finish the CHOLMOD context; call init() before factorizing again");

    m.def("malloc_count", []() { return context().malloc_count(); },
          "Blocks currently allocated by CHOLMOD");

    // Finish CHOLMOD when the module is unloaded
    m.add_object("_cleanup", py::capsule([]() { module_context.reset(); }));
}
