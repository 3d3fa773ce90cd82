#ifndef FURNACELINE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define FURNACELINE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace furnaceline::json {

// Indentation used for human-readable output
constexpr int PRETTY_INDENT = 2;

// Pretty-print any json flavour (ordered or not)
template <typename BasicJsonType>
std::string to_pretty_string(const BasicJsonType& j) {
    return j.dump(PRETTY_INDENT);
}

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    return j;
}

}  // namespace furnaceline::json

#endif // FURNACELINE_SERIALIZATION_JSON_SERIALIZATION_HPP
