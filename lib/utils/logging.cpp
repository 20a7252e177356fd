#include "utils/logging.hpp"

#include <filesystem>
#include <stdexcept>

std::string utils::logging::generateDateString(){
    auto now = std::chrono::system_clock::now();
    std::time_t currentTime = std::chrono::system_clock::to_time_t(now);
    std::tm* localTime = std::localtime(&currentTime);

    std::ostringstream dateStream;
    dateStream << std::put_time(localTime, "%Y-%m-%d %H:%M:%S");
    return dateStream.str();
}

std::string utils::logging::generateTimestamp(){
    auto now = std::chrono::system_clock::now();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::string utils::logging::buildLogFile(const nlohmann::json& dataMap, const std::string& directory){
    std::string timestamp = generateTimestamp();

    nlohmann::json j = dataMap;
    j["date"] = generateDateString();
    j["timestamp"] = timestamp;

    std::filesystem::create_directories(directory);
    std::filesystem::path filename = std::filesystem::path(directory) / ("log_" + timestamp + ".json");

    std::ofstream o(filename);
    if (!o) {
        throw std::runtime_error("Cannot open log file " + filename.string());
    }
    o << std::setw(4) << j << std::endl;

    std::cout << "Data written to: " << filename.string() << std::endl;
    return filename.string();
}
