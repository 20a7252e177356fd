#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef SPQRBIND_LOGGING_HPP
#define SPQRBIND_LOGGING_HPP

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace utils {
    class logging{
    public:
        // generate a date string with the current date
        static std::string generateDateString();

        // generate timestamp (seconds since epoch)
        static std::string generateTimestamp();

        /**
         * @brief Write a run record as log_<timestamp>.json
         *
         * "date" and "timestamp" are added to the record. The directory is
         * created if needed.
         *
         * @param dataMap Key/value pairs of the run
         * @param directory Directory receiving the log file
         * @return Path of the written file
         * @throws std::runtime_error if the file cannot be written
         */
        static std::string buildLogFile(const nlohmann::json& dataMap, const std::string& directory = "log");
    };
}

#endif
