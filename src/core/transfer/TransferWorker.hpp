#pragma once

/**
 * TransferWorker.hpp
 *
 * Per-task state machine: admission, network read into a staged file,
 * digest verification, atomic publish, retries and cancellation.
 */

#include "CancellationController.hpp"
#include "ConcurrencyLimiter.hpp"
#include "DownloadTask.hpp"
#include "IntegrityVerifier.hpp"
#include "NetworkSource.hpp"
#include "RetryPolicy.hpp"
#include "StagedWriter.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace qsde::core::transfer {

/**
 * Phase data. Each alternative carries only what its phase needs; the
 * staged file and the digest move from phase to phase.
 */
namespace phase {

struct Pending {};

struct Active {
    StagedWriter staged;
    IntegrityVerifier verifier;
};

struct Verifying {
    StagedWriter staged;
    IntegrityVerifier verifier;
};

struct Publishing {
    StagedWriter staged;
    std::string digest;
};

struct Succeeded {
    std::string digest;
};

struct Failed {
    ErrorClass error;
    std::string message;
};

struct Cancelled {};

} // namespace phase

using TaskPhase = std::variant<
    phase::Pending,
    phase::Active,
    phase::Verifying,
    phase::Publishing,
    phase::Succeeded,
    phase::Failed,
    phase::Cancelled
>;

TransferState stateOf(const TaskPhase& phase);

/**
 * Whether the state machine allows moving from one state to another.
 * Active may be re-entered from Active or Verifying when a retry restarts
 * the fetch.
 */
bool canTransition(TransferState from, TransferState to);

/**
 * Callbacks into the owner of the worker. Invoked on the worker thread.
 */
struct WorkerHooks {
    std::function<void(size_t index, TransferState state)> onState;

    // Signed deltas; negative when a failed attempt's bytes are discarded
    std::function<void(size_t index, int64_t bytesDelta, int64_t expectedDelta)> onProgress;
};

/**
 * Collaborators of a worker
 */
struct WorkerEnvironment {
    NetworkSource& source;
    const RetryPolicy& policy;
    ConcurrencyLimiter& limiter;

    // Current network settings; read at the start of every attempt
    std::function<NetworkConfig()> network;

    // Current write chunk size; read before every chunk
    std::function<size_t()> chunkSize;

    WorkerHooks hooks;
};

/**
 * TransferWorker - drives one DownloadTask to a terminal state
 *
 * run() never throws for per-task problems: every failure ends in a
 * Failed or Cancelled outcome and leaves no staged file behind.
 */
class TransferWorker {
public:
    TransferWorker(size_t index,
                   DownloadTask task,
                   WorkerEnvironment environment,
                   CancellationToken token);

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    /**
     * Wait for admission, then transfer until a terminal state
     * @return Terminal outcome
     */
    TaskOutcome run();

    TransferState state() const { return stateOf(m_phase); }
    const RetryContext& retryContext() const { return m_retry; }
    const DownloadTask& task() const { return m_task; }

private:
    void runAttempt();
    size_t currentChunkSize() const;
    void writeChunk(phase::Active& active, std::string& buffer);
    void handleFailure(const TransferError& error);

    void transitionTo(TaskPhase next);
    void discardStaged() noexcept;
    void reportProgress(int64_t bytesDelta, int64_t expectedDelta);

    TaskOutcome makeOutcome() const;

private:
    static constexpr size_t kDefaultChunkSize = 65536;

    size_t m_index;
    DownloadTask m_task;
    WorkerEnvironment m_env;
    CancellationToken m_token;

    TaskPhase m_phase;
    RetryContext m_retry;

    // Bytes and announced length of the attempt in progress
    uint64_t m_attemptBytes{0};
    uint64_t m_attemptExpected{0};
    uint64_t m_finalBytes{0};

    // Raised inside a network callback, rethrown after fetch() returns
    std::exception_ptr m_sinkError;
};

} // namespace qsde::core::transfer
