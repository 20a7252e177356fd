#include "utils/datasource.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace {
    const std::array<std::pair<const char*, OrderingMethod>, 10> kOrderingNames = {{
        {"fixed", OrderingMethod::Fixed},
        {"natural", OrderingMethod::Natural},
        {"colamd", OrderingMethod::COLAMD},
        {"given", OrderingMethod::Given},
        {"cholmod", OrderingMethod::CHOLMOD},
        {"amd", OrderingMethod::AMD},
        {"metis", OrderingMethod::METIS},
        {"default", OrderingMethod::Default},
        {"best", OrderingMethod::Best},
        {"bestamd", OrderingMethod::BestAMD}
    }};
}

void utils::datasource::readJson(const std::string& filepath){
    using json = nlohmann::json;

    std::ifstream input_file(filepath);
    if (!input_file) {
        throw std::runtime_error("Cannot open configuration file " + filepath);
    }

    json j;
    try {
        input_file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + filepath + ": " + e.what());
    }

    applyJson(j);
}

void utils::datasource::applyJson(const nlohmann::json& j){
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    if (j.contains("factorization")) {
        options = parseOptions(j["factorization"], options);
    }
    if (j.contains("self_test")) {
        self_test = parseSelfTest(j["self_test"], self_test);
    }
}

QROptions utils::datasource::parseOptions(const nlohmann::json& section, QROptions defaults){
    QROptions result = defaults;

    try {
        if (section.contains("ordering")) {
            result.ordering = orderingFromString(section["ordering"].get<std::string>());
        }
        if (section.contains("tolerance")) {
            result.tolerance = section["tolerance"].get<double>();
        }
        if (section.contains("econ")) {
            result.econ = section["econ"].get<std::int64_t>();
        }
        if (section.contains("verbose")) {
            result.verbose = section["verbose"].get<bool>();
        }
        if (section.contains("print_level")) {
            result.print_level = section["print_level"].get<int>();
        }
        if (section.contains("release_permutation")) {
            result.permutation_ownership = section["release_permutation"].get<bool>()
                ? PermutationOwnership::Released
                : PermutationOwnership::Retained;
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid factorization setting: ") + e.what());
    }

    if (result.print_level < 0 || result.print_level > 5) {
        throw std::invalid_argument("print_level must lie in [0, 5]");
    }

    return result;
}

SelfTestSettings utils::datasource::parseSelfTest(const nlohmann::json& section, SelfTestSettings defaults){
    SelfTestSettings result = defaults;

    try {
        if (section.contains("rows")) result.rows = section["rows"].get<int>();
        if (section.contains("cols")) result.cols = section["cols"].get<int>();
        if (section.contains("density")) result.density = section["density"].get<double>();
        if (section.contains("seed")) result.seed = section["seed"].get<unsigned int>();
        if (section.contains("write_log")) result.write_log = section["write_log"].get<bool>();
        if (section.contains("log_directory")) result.log_directory = section["log_directory"].get<std::string>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid self_test setting: ") + e.what());
    }

    if (result.rows < 0 || result.cols < 0) {
        throw std::invalid_argument("self_test dimensions must be non-negative");
    }
    if (result.density < 0.0 || result.density > 1.0) {
        throw std::invalid_argument("self_test density must lie in [0, 1]");
    }

    return result;
}

OrderingMethod utils::datasource::orderingFromString(const std::string& name){
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : kOrderingNames) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    throw std::invalid_argument("Unknown ordering method: " + name);
}

std::string utils::datasource::orderingToString(OrderingMethod ordering){
    for (const auto& entry : kOrderingNames) {
        if (entry.second == ordering) {
            return entry.first;
        }
    }
    return "default";
}

nlohmann::json utils::datasource::optionsToJson(const QROptions& options){
    nlohmann::json j;
    j["ordering"] = orderingToString(options.ordering);
    j["tolerance"] = options.tolerance;
    j["econ"] = options.econ;
    j["verbose"] = options.verbose;
    j["print_level"] = options.print_level;
    j["release_permutation"] = options.permutation_ownership == PermutationOwnership::Released;
    return j;
}
