/**
 * @file spqrbind_python.hpp
 * @brief Header file for Python bindings of the SpQRBind library
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef SPQRBIND_PYTHON_HPP
#define SPQRBIND_PYTHON_HPP

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "linear_algebra/cholmod_context.hpp"
#include "linear_algebra/coo_matrix.hpp"
#include "linear_algebra/sparse_qr_factorization.hpp"
#include "models/enums.hpp"
#include "models/qr_options.hpp"

namespace py = pybind11;

// Function declarations for module components
void init_enums(py::module_ &m);
void init_sparse_qr(py::module_ &m);

#endif // SPQRBIND_PYTHON_HPP
