/**
 * @file test_utils.hpp
 * @brief Tests of configuration, logging and matrix helpers
 */

#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <iostream>
#include <cassert>
#include <cmath>

#include "utils/datasource.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/matrix_helper.hpp"
#include "utils/scope_timer.hpp"

namespace TestUtils {
    void test_datasource_parsing();
    void test_datasource_rejects_invalid_input();
    void test_logging_writes_json();
    void test_random_sparse_generator();
    void test_error_metrics();
    void test_coo_matrix_conversions();
    void test_scope_timer();

    void run_all();
}

#endif
