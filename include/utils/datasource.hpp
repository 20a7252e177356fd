/**
 * @file datasource.hpp
 * @brief Reads wrapper and self-test settings from JSON configuration files
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef SPQRBIND_DATASOURCE_HPP
#define SPQRBIND_DATASOURCE_HPP

#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "models/enums.hpp"
#include "models/qr_options.hpp"

namespace utils {
    /**
     * @class datasource
     * @brief JSON configuration input
     *
     * Layout of a configuration file (every key optional):
     * {
     *   "factorization": { "ordering": "default", "tolerance": -2.0, "econ": -1,
     *                      "verbose": false, "print_level": 3, "release_permutation": false },
     *   "self_test": { "rows": 10, "cols": 10, "density": 0.1, "seed": 42,
     *                  "write_log": false, "log_directory": "log" }
     * }
     */
    class datasource{
        public:
            /**
             * @brief Factorization options
             */
            QROptions options;

            /**
             * @brief Settings of the self-test executable
             */
            SelfTestSettings self_test;

            datasource() = default;

            /**
             * @brief Constructor
             *
             * @param filepath Path to the JSON configuration file
             */
            explicit datasource(const std::string& filepath){
                readJson(filepath);
            }

            /**
             * @brief Read a configuration file
             *
             * @param filepath Path to the JSON file
             * @throws std::runtime_error if the file cannot be opened or parsed
             * @throws std::invalid_argument if a value is invalid
             */
            void readJson(const std::string& filepath);

            /**
             * @brief Apply an already parsed configuration
             */
            void applyJson(const nlohmann::json& j);

            /**
             * @brief Parse the "factorization" section
             */
            static QROptions parseOptions(const nlohmann::json& section, QROptions defaults = QROptions());

            /**
             * @brief Parse the "self_test" section
             */
            static SelfTestSettings parseSelfTest(const nlohmann::json& section, SelfTestSettings defaults = SelfTestSettings());

            /**
             * @brief Ordering method from its configuration name ("colamd", "metis", ...)
             *
             * @throws std::invalid_argument for an unknown name
             */
            static OrderingMethod orderingFromString(const std::string& name);

            /**
             * @brief Configuration name of an ordering method
             */
            static std::string orderingToString(OrderingMethod ordering);

            /**
             * @brief Options as JSON, the inverse of parseOptions
             */
            static nlohmann::json optionsToJson(const QROptions& options);
    };
}

#endif
