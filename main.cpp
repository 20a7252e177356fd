#include <iostream>
#include <iomanip>
#include <string>

#include <nlohmann/json.hpp>

#include "linear_algebra/cholmod_context.hpp"
#include "linear_algebra/sparse_qr_factorization.hpp"
#include "utils/datasource.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/matrix_helper.hpp"
#include "utils/scope_timer.hpp"

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

// Usage: spqrbind_selftest [config.json]
int main(int argc, char** argv) {
    try {
        utils::datasource config;
        if (argc > 1) {
            config.readJson(argv[1]);
        }
        const SelfTestSettings& settings = config.self_test;

        LinearAlgebra::CholmodContext context;
        LinearAlgebra::SparseQRFactorization qr(context, config.options);

        LinearAlgebra::COOMatrix A = utils::MatrixHelper::random_sparse(
            settings.rows, settings.cols, settings.density, settings.seed);

        print_separator("Sparse QR self-test");
        std::cout << "A: " << A.n_rows << " x " << A.n_cols << ", nnz = " << A.nnz()
                  << ", seed = " << settings.seed << std::endl;

        double elapsed_ms = 0.0;
        LinearAlgebra::QRFactors factors;
        {
            utils::ScopeTimer timer("factorize", config.options.verbose, &elapsed_ms);
            factors = qr.factorize(A);
        }

        double residual = utils::errors::compute_reconstruction_residual(factors.Q, factors.R, A, factors.E);

        std::cout << "rank = " << factors.rank
                  << ", permutation " << (factors.E ? "computed" : "absent") << std::endl;
        std::cout << std::scientific << std::setprecision(6) << residual << std::endl;

        if (config.options.verbose && A.n_rows <= 12 && A.n_cols <= 12) {
            utils::MatrixHelper::display_matrix(factors.Q.to_dense(), "Q", 4);
            utils::MatrixHelper::display_matrix(factors.R.to_dense(), "R", 4);
        }

        if (settings.write_log) {
            nlohmann::json record;
            record["rows"] = A.n_rows;
            record["cols"] = A.n_cols;
            record["nnz"] = A.nnz();
            record["seed"] = settings.seed;
            record["rank"] = factors.rank;
            record["residual"] = residual;
            record["elapsed_ms"] = elapsed_ms;
            record["options"] = utils::datasource::optionsToJson(config.options);
            utils::logging::buildLogFile(record, settings.log_directory);
        }

        context.deinit();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Self-test failed: " << e.what() << std::endl;
        return 1;
    }
}
