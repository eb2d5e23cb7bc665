#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace qsde::core {

using json = nlohmann::json;

/**
 * Configuration store
 *
 * Holds engine, network, retry and logging settings as one JSON document:
 * - Type-safe getters with defaults
 * - Dot-notation keys ("retry.maxAttempts")
 * - JSON persistence and merging of partial documents
 *
 * Each host owns its own instance; the engine only sees the typed settings
 * built from it (see EngineConfig::fromConfig).
 */
class Config {
public:
    Config() {
        setDefaults();
    }

    Config(const Config& other) : m_config(other.getAll()), m_configPath(other.m_configPath) {}

    Config& operator=(const Config& other) {
        if (this != &other) {
            json copy = other.getAll();
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(copy);
            m_configPath = other.m_configPath;
        }
        return *this;
    }

    /**
     * Load configuration from file and merge it over the current values
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") const {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return static_cast<bool>(file);

        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Reset every key to its default value
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"engine", {
                {"maxConcurrency", 16},
                {"workerThreads", 32},
                {"chunkSize", 65536},
                {"createDirectories", true}
            }},
            {"network", {
                {"timeoutSeconds", 30},
                {"connectTimeoutSeconds", 10},
                {"userAgent", "QSDE/1.0.0 (High Performance)"},
                {"proxy", ""},
                {"verifySsl", true}
            }},
            {"retry", {
                {"maxAttempts", 3},
                {"maxIntegrityAttempts", 2},
                {"initialDelayMs", 1000},
                {"multiplier", 2.0},
                {"jitterRatio", 0.25},
                {"maxDelayMs", 30000}
            }},
            {"progress", {
                {"queueCapacity", 64}
            }},
            {"cancel", {
                {"gracePeriodMs", 5000}
            }},
            {"log", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "engine.chunkSize")
     * @param defaultValue Default value if key not found or of the wrong type
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "network.userAgent")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Get entire configuration as JSON
     * @return JSON configuration object
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    /**
     * Merge configuration values
     * @param other JSON object to merge
     */
    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

private:
    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace qsde::core
