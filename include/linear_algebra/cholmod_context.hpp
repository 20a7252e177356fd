#ifndef SPQRBIND_CHOLMOD_CONTEXT_HPP
#define SPQRBIND_CHOLMOD_CONTEXT_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <cholmod.h>

namespace LinearAlgebra {

    /**
     * @brief Owner of the CHOLMOD common block (long-index API)
     *
     * Every CHOLMOD and SuiteSparseQR call needs the common block as an
     * implicit argument. One context is created per process (the Python
     * module creates it at import) and passed by reference to whatever
     * converts or factorizes.
     *
     * Lifecycle:
     * - construction calls init(), which runs cholmod_l_start
     * - deinit() runs cholmod_l_finish
     * - both are idempotent; init() after deinit() starts a fresh block
     *
     * The context is not thread safe. Callers sharing it between threads
     * must serialize every operation themselves.
     */
    class CholmodContext {

        public:
            // ============================================================================
            // CONSTRUCTORS AND DESTRUCTOR
            // ============================================================================

            CholmodContext();
            ~CholmodContext();

            // CHOLMOD objects remember the address of their common block
            CholmodContext(const CholmodContext&) = delete;
            CholmodContext& operator=(const CholmodContext&) = delete;
            CholmodContext(CholmodContext&&) = delete;
            CholmodContext& operator=(CholmodContext&&) = delete;

            // ============================================================================
            // LIFECYCLE
            // ============================================================================

            /**
             * @brief Start CHOLMOD if it is not running
             *
             * Installs the error handler and the configured print level.
             */
            void init();

            /**
             * @brief Finish CHOLMOD if it is running
             *
             * Any handle still allocated from this context must be freed
             * before calling this.
             */
            void deinit();

            bool is_started() const { return started_; }

            // ============================================================================
            // ACCESS
            // ============================================================================

            /**
             * @brief The common block for native calls
             *
             * @throws std::logic_error if the context has been finalized
             */
            cholmod_common* common();

            /// CHOLMOD status of the last call (CHOLMOD_OK, warnings > 0, errors < 0)
            int status() const;

            /// Clear a status left over from a previous failed call
            void reset_status();

            /// Number of blocks currently allocated through this context
            std::int64_t malloc_count() const;

            /// Bytes currently allocated through this context
            std::int64_t memory_inuse() const;

            /**
             * @brief Set the verbosity of cholmod_l_print_* (0 silent to 5 everything)
             */
            void set_print_level(int level);

            /// Readable name of a CHOLMOD status code
            static std::string status_name(int status);

        private:
            static void handle_error(int status, const char* file, int line, const char* message);

            cholmod_common common_;
            bool started_;
            int print_level_;
    };

    // ============================================================================
    // OWNING HANDLES
    // ============================================================================

    /// Frees a cholmod_sparse through the context it was allocated from
    struct CholmodSparseDeleter {
        cholmod_common* common = nullptr;
        void operator()(cholmod_sparse* matrix) const;
    };

    /// Frees a cholmod_triplet through the context it was allocated from
    struct CholmodTripletDeleter {
        cholmod_common* common = nullptr;
        void operator()(cholmod_triplet* matrix) const;
    };

    using CholmodSparsePtr = std::unique_ptr<cholmod_sparse, CholmodSparseDeleter>;
    using CholmodTripletPtr = std::unique_ptr<cholmod_triplet, CholmodTripletDeleter>;

}

#endif
