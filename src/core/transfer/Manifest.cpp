#include "Manifest.hpp"
#include "../../utils/JsonUtils.hpp"

#include <stdexcept>
#include <string>

namespace qsde::core::transfer {

Manifest Manifest::fromJson(const json& document) {
    Manifest manifest;

    const json* entries = &document;
    if (document.is_object()) {
        if (!document.contains("tasks")) {
            throw std::invalid_argument("manifest object needs a \"tasks\" array");
        }
        entries = &document.at("tasks");

        if (document.contains("maxConcurrency")) {
            const json& value = document.at("maxConcurrency");
            const int64_t limit = value.is_number_integer() ? value.get<int64_t>() : 0;
            if (limit < 1) {
                throw std::invalid_argument("manifest maxConcurrency must be at least 1");
            }
            manifest.maxConcurrency = static_cast<size_t>(limit);
        }
    }

    if (!entries->is_array()) {
        throw std::invalid_argument("manifest tasks must be an array");
    }

    manifest.tasks.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
        try {
            manifest.tasks.push_back((*entries)[i].get<DownloadTask>());
        } catch (const json::exception& e) {
            throw std::invalid_argument("manifest task " + std::to_string(i) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("manifest task " + std::to_string(i) + ": " + e.what());
        }
    }
    return manifest;
}

Manifest Manifest::load(const std::filesystem::path& path) {
    std::string error;
    auto document = utils::JsonUtils::parseFile(path, &error);
    if (!document) {
        throw std::runtime_error(error);
    }
    return fromJson(*document);
}

} // namespace qsde::core::transfer
