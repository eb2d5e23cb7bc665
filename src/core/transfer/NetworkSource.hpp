#pragma once

/**
 * NetworkSource.hpp
 *
 * Abstract network client used by transfer workers. Concrete transports
 * (HttpSource, test doubles) stream a resource into a FetchSink.
 */

#include "CancellationController.hpp"
#include "DownloadTask.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace qsde::core::transfer {

/**
 * Settings applied to network operations started after they are set
 */
struct NetworkConfig {
    std::string proxy;
    std::string userAgent{"QSDE/1.0.0 (High Performance)"};

    // Longest tolerated stall while reading
    std::chrono::seconds timeout{30};
    std::chrono::seconds connectTimeout{10};
    bool verifySsl{true};
};

struct FetchRequest {
    std::string url;
    NetworkConfig network;
};

/**
 * Receiver of one response body
 */
struct FetchSink {
    // Called once before the first byte; 0 when the length is unknown
    std::function<void(uint64_t contentLength)> onStart;

    // Called for every received block; returning false aborts the transfer
    std::function<bool(std::string_view bytes)> onData;
};

/**
 * Result of one fetch attempt
 */
struct FetchResult {
    enum class Status {
        Completed,  // whole body delivered to the sink
        Failed,     // transport or remote failure, see errorClass
        Aborted     // the sink or the cancellation token stopped it
    };

    Status status{Status::Completed};
    ErrorClass errorClass{ErrorClass::Transient};
    int statusCode{0};
    std::string message;

    static FetchResult completed(int statusCode = 200) {
        return FetchResult{Status::Completed, ErrorClass::Transient, statusCode, {}};
    }
    static FetchResult failed(ErrorClass errorClass, int statusCode, std::string message) {
        return FetchResult{Status::Failed, errorClass, statusCode, std::move(message)};
    }
    static FetchResult aborted() {
        return FetchResult{Status::Aborted, ErrorClass::Transient, 0, "aborted"};
    }
};

/**
 * Map an HTTP status code to a failure class.
 * 408, 429 and 5xx are worth retrying; every other 4xx is permanent.
 */
inline ErrorClass classifyHttpStatus(int statusCode) {
    if (statusCode == 408 || statusCode == 429 || statusCode >= 500 || statusCode <= 0) {
        return ErrorClass::Transient;
    }
    return ErrorClass::PermanentRemote;
}

inline bool isSuccessStatus(int statusCode) {
    return statusCode >= 200 && statusCode < 300;
}

/**
 * NetworkSource - pull one resource into a sink
 *
 * Implementations must be safe to call from several workers at once and
 * must return promptly once the token fires.
 */
class NetworkSource {
public:
    virtual ~NetworkSource() = default;

    virtual FetchResult fetch(const FetchRequest& request,
                              FetchSink& sink,
                              const CancellationToken& token) = 0;
};

} // namespace qsde::core::transfer
