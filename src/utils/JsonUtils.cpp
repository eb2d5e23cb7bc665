/**
 * JsonUtils.cpp
 *
 * JSON parsing and serialization helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>
#include <system_error>

namespace qsde::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str, std::string* error) {
    try { return json::parse(str); }
    catch (const json::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path, std::string* error) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            if (error) *error = "cannot open " + path.string();
            return std::nullopt;
        }
        return json::parse(file);
    } catch (const json::exception& e) {
        if (error) *error = path.string() + ": " + e.what();
        return std::nullopt;
    }
}

// -- Serialization --

std::string JsonUtils::prettyPrint(const json& j, int indent) { return j.dump(indent); }

bool JsonUtils::writeFile(const std::filesystem::path& path, const json& j, int indent) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << j.dump(indent);
    return static_cast<bool>(file);
}

} // namespace qsde::utils
