#pragma once

/**
 * EngineConfig.hpp
 *
 * Typed engine settings and the partial updates accepted at runtime.
 */

#include "NetworkSource.hpp"
#include "RetryPolicy.hpp"
#include "../Config.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace qsde::core::transfer {

/**
 * Settings of one Engine instance
 */
struct EngineConfig {
    // Admission limit used when a batch does not name one
    size_t maxConcurrency{16};

    // Upper bound on pool threads per batch
    size_t workerThreads{32};

    // Bytes buffered before each write to the staged file
    size_t chunkSize{65536};

    // Create missing parent directories of destinations before starting
    bool createDirectories{true};

    NetworkConfig network;
    RetrySettings retry;

    // Undelivered progress events kept per channel
    size_t progressQueueCapacity{64};

    // How long CancelAll waits for workers to acknowledge
    std::chrono::milliseconds cancelGracePeriod{5000};

    /**
     * Build typed settings from a configuration store
     * @param config Store holding the engine, network, retry, progress and
     *        cancel sections
     */
    static EngineConfig fromConfig(const Config& config);
};

/**
 * Partial network settings; unset fields keep their value
 */
struct NetworkConfigUpdate {
    std::optional<std::string> proxy;
    std::optional<std::string> userAgent;
    std::optional<std::chrono::seconds> timeout;
};

/**
 * Partial runtime settings; unset fields keep their value
 */
struct RuntimeConfigUpdate {
    std::optional<size_t> maxConcurrency;
    std::optional<size_t> chunkSizeBytes;
};

} // namespace qsde::core::transfer
