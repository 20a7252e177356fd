#include "spqrbind_python.hpp"
#include <iostream>

PYBIND11_MODULE(spqrbind_py, m) {
    m.doc() = "Python bindings for SuiteSparseQR sparse QR factorization";

    try {
        init_enums(m);
    } catch (const std::exception& e) {
        std::cerr << "Error initializing enums: " << e.what() << std::endl;
        throw;
    }

    try {
        init_sparse_qr(m);
    } catch (const std::exception& e) {
        std::cerr << "Error initializing sparse QR bindings: " << e.what() << std::endl;
        throw;
    }
}
