#pragma once

/**
 * DownloadTask.hpp
 *
 * Transfer data model: the task description, its lifecycle states,
 * failure classification and the values reported back to callers.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsde::core::transfer {

using json = nlohmann::json;

//=============================================================================
// Task description
//=============================================================================

/**
 * Supported digest algorithms
 */
enum class DigestAlgorithm {
    MD5,
    SHA1,
    SHA256,
    SHA512
};

NLOHMANN_JSON_SERIALIZE_ENUM(DigestAlgorithm, {
    {DigestAlgorithm::MD5, "md5"},
    {DigestAlgorithm::SHA1, "sha1"},
    {DigestAlgorithm::SHA256, "sha256"},
    {DigestAlgorithm::SHA512, "sha512"},
})

/**
 * DownloadTask - one source-to-destination transfer unit
 *
 * Copied by the engine on submission and never modified afterwards.
 */
struct DownloadTask {
    // Source URL
    std::string url;

    // Final destination path
    std::string destination;

    // Expected digest as hex (empty = no verification)
    std::string expectedDigest;

    DigestAlgorithm digestAlgorithm{DigestAlgorithm::SHA256};

    // Write chunk size in bytes (0 = engine runtime setting)
    size_t chunkSize{0};

    DownloadTask() = default;

    DownloadTask(std::string url_, std::string destination_)
        : url(std::move(url_)), destination(std::move(destination_)) {}

    DownloadTask(std::string url_, std::string destination_, std::string digest_,
                 DigestAlgorithm algorithm_ = DigestAlgorithm::SHA256)
        : url(std::move(url_))
        , destination(std::move(destination_))
        , expectedDigest(std::move(digest_))
        , digestAlgorithm(algorithm_) {}

    bool hasExpectedDigest() const { return !expectedDigest.empty(); }
};

inline void to_json(json& j, const DownloadTask& task) {
    j = json{{"url", task.url}, {"destination", task.destination}};
    if (task.hasExpectedDigest()) {
        j["digest"] = task.expectedDigest;
        j["algorithm"] = task.digestAlgorithm;
    }
    if (task.chunkSize > 0) {
        j["chunkSize"] = task.chunkSize;
    }
}

inline void from_json(const json& j, DownloadTask& task) {
    j.at("url").get_to(task.url);
    j.at("destination").get_to(task.destination);
    task.expectedDigest = j.value("digest", std::string{});
    task.digestAlgorithm = DigestAlgorithm::SHA256;
    if (j.contains("algorithm")) {
        const auto name = j.at("algorithm").get<std::string>();
        task.digestAlgorithm = j.at("algorithm").get<DigestAlgorithm>();
        // Unknown names map to the first enumerator
        if (json(task.digestAlgorithm).get<std::string>() != name) {
            throw std::invalid_argument("unsupported digest algorithm: " + name);
        }
    }
    task.chunkSize = j.value("chunkSize", size_t{0});
}

//=============================================================================
// Lifecycle and failures
//=============================================================================

/**
 * Task lifecycle. Transitions only move forward; the last three are terminal.
 */
enum class TransferState {
    Pending,
    Active,
    Verifying,
    Publishing,
    Succeeded,
    Failed,
    Cancelled
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferState, {
    {TransferState::Pending, "pending"},
    {TransferState::Active, "active"},
    {TransferState::Verifying, "verifying"},
    {TransferState::Publishing, "publishing"},
    {TransferState::Succeeded, "succeeded"},
    {TransferState::Failed, "failed"},
    {TransferState::Cancelled, "cancelled"},
})

inline bool isTerminal(TransferState state) {
    return state == TransferState::Succeeded ||
           state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

const char* toString(TransferState state);

/**
 * Failure classification used for retry decisions and reporting
 */
enum class ErrorClass {
    Transient,          // timeouts, resets, 5xx
    PermanentRemote,    // 4xx, not found
    LocalResource,      // disk full, permission denied, rename failure
    IntegrityMismatch   // digest differs from the expected one
};

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorClass, {
    {ErrorClass::Transient, "transient"},
    {ErrorClass::PermanentRemote, "permanent_remote"},
    {ErrorClass::LocalResource, "local_resource"},
    {ErrorClass::IntegrityMismatch, "integrity_mismatch"},
})

const char* toString(ErrorClass errorClass);

/**
 * Classified transfer failure
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorClass errorClass, const std::string& message)
        : std::runtime_error(message), m_class(errorClass) {}

    ErrorClass errorClass() const { return m_class; }

private:
    ErrorClass m_class;
};

/**
 * Raised at a suspension point that observed cancellation
 */
class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("transfer cancelled") {}
};

//=============================================================================
// Reported values
//=============================================================================

/**
 * Terminal result of one task
 */
struct TaskOutcome {
    size_t index{0};
    std::string url;
    std::string destination;
    TransferState state{TransferState::Pending};
    std::optional<ErrorClass> error;
    std::string message;
    int attempts{0};
    uint64_t bytesTransferred{0};
    std::chrono::milliseconds totalBackoff{0};
};

inline void to_json(json& j, const TaskOutcome& outcome) {
    j = json{
        {"index", outcome.index},
        {"url", outcome.url},
        {"destination", outcome.destination},
        {"state", outcome.state},
        {"attempts", outcome.attempts},
        {"bytes", outcome.bytesTransferred},
        {"backoffMs", outcome.totalBackoff.count()}
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
        j["message"] = outcome.message;
    }
}

/**
 * Aggregate result of a batch
 */
struct BatchSummary {
    size_t submitted{0};
    size_t succeeded{0};
    size_t failed{0};
    size_t cancelled{0};

    // At least one task failed on local storage (disk full, permissions)
    bool localResourceFailure{false};

    // One entry per submitted task, in submission order
    std::vector<TaskOutcome> outcomes;

    bool allSucceeded() const { return succeeded == submitted; }
};

inline void to_json(json& j, const BatchSummary& summary) {
    j = json{
        {"submitted", summary.submitted},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"cancelled", summary.cancelled},
        {"localResourceFailure", summary.localResourceFailure},
        {"outcomes", summary.outcomes}
    };
}

/**
 * Point-in-time view of batch progress
 */
struct ProgressSnapshot {
    uint64_t bytesTransferred{0};
    uint64_t bytesExpected{0};
    size_t tasksFinished{0};
    size_t tasksTotal{0};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ProgressSnapshot, bytesTransferred, bytesExpected,
                                   tasksFinished, tasksTotal)
};

/**
 * Per-file byte progress
 */
struct ByteProgress {
    size_t taskIndex{0};
    std::string fileName;
    uint64_t delta{0};
    uint64_t fileBytes{0};
    uint64_t fileTotal{0};    // 0 when the length is unknown
};

} // namespace qsde::core::transfer
