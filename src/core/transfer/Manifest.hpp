#pragma once

/**
 * Manifest.hpp
 *
 * Batch description read from JSON: either a bare array of tasks or an
 * object {"tasks": [...], "maxConcurrency": N}.
 */

#include "DownloadTask.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace qsde::core::transfer {

struct Manifest {
    std::vector<DownloadTask> tasks;
    std::optional<size_t> maxConcurrency;

    /**
     * @throws std::invalid_argument when the document has the wrong shape
     */
    static Manifest fromJson(const json& document);

    /**
     * @throws std::runtime_error when the file cannot be read or parsed
     * @throws std::invalid_argument when the document has the wrong shape
     */
    static Manifest load(const std::filesystem::path& path);
};

} // namespace qsde::core::transfer
