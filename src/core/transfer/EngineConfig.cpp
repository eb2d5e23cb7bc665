#include "EngineConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace qsde::core::transfer {

namespace {

// Sizes are read signed so a negative value clamps instead of wrapping
size_t readSize(const Config& config, const std::string& key, size_t fallback) {
    const int64_t value = config.get<int64_t>(key, static_cast<int64_t>(fallback));
    return value < 1 ? 1 : static_cast<size_t>(value);
}

} // namespace

EngineConfig EngineConfig::fromConfig(const Config& config) {
    EngineConfig result;

    result.maxConcurrency = readSize(config, "engine.maxConcurrency", result.maxConcurrency);
    result.workerThreads = readSize(config, "engine.workerThreads", result.workerThreads);
    result.chunkSize = readSize(config, "engine.chunkSize", result.chunkSize);
    result.createDirectories = config.get<bool>("engine.createDirectories", result.createDirectories);

    result.network.proxy = config.get<std::string>("network.proxy", result.network.proxy);
    result.network.userAgent = config.get<std::string>("network.userAgent", result.network.userAgent);
    result.network.timeout = std::chrono::seconds(
        config.get<int64_t>("network.timeoutSeconds", result.network.timeout.count()));
    result.network.connectTimeout = std::chrono::seconds(
        config.get<int64_t>("network.connectTimeoutSeconds", result.network.connectTimeout.count()));
    result.network.verifySsl = config.get<bool>("network.verifySsl", result.network.verifySsl);

    result.retry.maxAttempts = config.get<int>("retry.maxAttempts", result.retry.maxAttempts);
    result.retry.maxIntegrityAttempts = config.get<int>("retry.maxIntegrityAttempts", result.retry.maxIntegrityAttempts);
    result.retry.initialDelay = std::chrono::milliseconds(
        config.get<int64_t>("retry.initialDelayMs", result.retry.initialDelay.count()));
    result.retry.multiplier = config.get<double>("retry.multiplier", result.retry.multiplier);
    result.retry.jitterRatio = config.get<double>("retry.jitterRatio", result.retry.jitterRatio);
    result.retry.maxDelay = std::chrono::milliseconds(
        config.get<int64_t>("retry.maxDelayMs", result.retry.maxDelay.count()));

    result.progressQueueCapacity = readSize(config, "progress.queueCapacity", result.progressQueueCapacity);
    result.cancelGracePeriod = std::chrono::milliseconds(std::max<int64_t>(
        0, config.get<int64_t>("cancel.gracePeriodMs", result.cancelGracePeriod.count())));

    return result;
}

} // namespace qsde::core::transfer
