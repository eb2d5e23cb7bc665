#pragma once

#include <filesystem>
#include <random>
#include <string>
#include <string_view>

namespace qsde::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    // Marker shared by every staged file name; never a valid final name
    static constexpr std::string_view kStagedMarker = ".qsde-";
    static constexpr std::string_view kStagedSuffix = ".tmp";

    /**
     * Replace characters that are invalid in file names on common
     * platforms. Only the last path component is touched.
     */
    static fs::path sanitizeFilename(const fs::path& path) {
        std::string name = path.filename().string();
        for (char& c : name) {
            switch (c) {
                case '<': case '>': case ':': case '"':
                case '/': case '\\': case '|': case '?': case '*':
                    c = '_';
                    break;
                default:
                    break;
            }
        }
        return path.parent_path() / name;
    }

    /**
     * Temporary sibling of a destination: "<name>.qsde-<token>.tmp" in the
     * same directory, so the final rename stays on one volume.
     */
    static fs::path stagedPathFor(const fs::path& destination) {
        std::string name = destination.filename().string();
        name += kStagedMarker;
        name += randomToken();
        name += kStagedSuffix;
        return destination.parent_path() / name;
    }

    static bool isStagedPath(const fs::path& path) {
        const std::string name = path.filename().string();
        return name.find(kStagedMarker) != std::string::npos &&
               name.size() >= kStagedSuffix.size() &&
               name.compare(name.size() - kStagedSuffix.size(), kStagedSuffix.size(),
                            kStagedSuffix) == 0;
    }

private:
    static std::string randomToken() {
        static constexpr char kHex[] = "0123456789abcdef";
        thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_int_distribution<int> digit(0, 15);

        std::string token(12, '0');
        for (char& c : token) {
            c = kHex[digit(engine)];
        }
        return token;
    }
};

} // namespace qsde::utils
