#include "linear_algebra/cholmod_context.hpp"

#include <iostream>

namespace LinearAlgebra {
    // ============================================================================
    // CONSTRUCTORS AND DESTRUCTOR
    // ============================================================================

    CholmodContext::CholmodContext()
        : common_()
        , started_(false)
        , print_level_(3) {
        init();
    }

    CholmodContext::~CholmodContext() {
        deinit();
    }

    // ============================================================================
    // LIFECYCLE
    // ============================================================================

    void CholmodContext::init() {
        if (started_) {
            return;
        }

        if (!cholmod_l_start(&common_)) {
            throw std::runtime_error("cholmod_l_start failed");
        }

        common_.error_handler = CholmodContext::handle_error;
        common_.print = print_level_;
        started_ = true;
    }

    void CholmodContext::deinit() {
        if (!started_) {
            return;
        }

        cholmod_l_finish(&common_);
        started_ = false;
    }

    // ============================================================================
    // ACCESS
    // ============================================================================

    cholmod_common* CholmodContext::common() {
        if (!started_) {
            throw std::logic_error("CHOLMOD context used after deinit()");
        }
        return &common_;
    }

    int CholmodContext::status() const {
        return common_.status;
    }

    void CholmodContext::reset_status() {
        common_.status = CHOLMOD_OK;
    }

    std::int64_t CholmodContext::malloc_count() const {
        return static_cast<std::int64_t>(common_.malloc_count);
    }

    std::int64_t CholmodContext::memory_inuse() const {
        return static_cast<std::int64_t>(common_.memory_inuse);
    }

    void CholmodContext::set_print_level(int level) {
        print_level_ = level;
        if (started_) {
            common_.print = level;
        }
    }

    std::string CholmodContext::status_name(int status) {
        switch (status) {
            case CHOLMOD_OK:            return "CHOLMOD_OK";
            case CHOLMOD_NOT_INSTALLED: return "CHOLMOD_NOT_INSTALLED";
            case CHOLMOD_OUT_OF_MEMORY: return "CHOLMOD_OUT_OF_MEMORY";
            case CHOLMOD_TOO_LARGE:     return "CHOLMOD_TOO_LARGE";
            case CHOLMOD_INVALID:       return "CHOLMOD_INVALID";
            case CHOLMOD_GPU_PROBLEM:   return "CHOLMOD_GPU_PROBLEM";
            case CHOLMOD_NOT_POSDEF:    return "CHOLMOD_NOT_POSDEF";
            case CHOLMOD_DSMALL:        return "CHOLMOD_DSMALL";
            default:                    return "CHOLMOD status " + std::to_string(status);
        }
    }

    void CholmodContext::handle_error(int status, const char* file, int line, const char* message) {
        const char* kind = status < 0 ? "error" : "warning";
        std::cerr << "CHOLMOD " << kind << " (" << status_name(status) << ") "
                  << (file ? file : "?") << ":" << line << ": "
                  << (message ? message : "") << std::endl;
    }

    // ============================================================================
    // OWNING HANDLES
    // ============================================================================

    void CholmodSparseDeleter::operator()(cholmod_sparse* matrix) const {
        if (matrix != nullptr) {
            cholmod_l_free_sparse(&matrix, common);
        }
    }

    void CholmodTripletDeleter::operator()(cholmod_triplet* matrix) const {
        if (matrix != nullptr) {
            cholmod_l_free_triplet(&matrix, common);
        }
    }

}
