// QSDE - JSON Utilities
// JSON file helpers shared by the command line driver and tests

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace qsde::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str, std::string* error = nullptr);
    static std::optional<json> parseFile(const std::filesystem::path& path, std::string* error = nullptr);

    // Serialization
    static std::string prettyPrint(const json& j, int indent = 2);
    static bool writeFile(const std::filesystem::path& path, const json& j, int indent = 2);
};

} // namespace qsde::utils
