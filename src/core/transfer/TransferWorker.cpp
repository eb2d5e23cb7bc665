/**
 * TransferWorker.cpp
 *
 * State machine of a single transfer.
 */

#include "TransferWorker.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace qsde::core::transfer {

TransferState stateOf(const TaskPhase& phase) {
    return static_cast<TransferState>(phase.index());
}

bool canTransition(TransferState from, TransferState to) {
    if (isTerminal(from)) {
        return false;
    }
    if (to == TransferState::Cancelled || to == TransferState::Failed) {
        return true;
    }
    switch (from) {
        case TransferState::Pending:
            return to == TransferState::Active;
        case TransferState::Active:
            return to == TransferState::Active || to == TransferState::Verifying;
        case TransferState::Verifying:
            return to == TransferState::Active || to == TransferState::Publishing;
        case TransferState::Publishing:
            return to == TransferState::Succeeded;
        default:
            return false;
    }
}

TransferWorker::TransferWorker(size_t index,
                               DownloadTask task,
                               WorkerEnvironment environment,
                               CancellationToken token)
    : m_index(index)
    , m_task(std::move(task))
    , m_env(std::move(environment))
    , m_token(std::move(token)) {}

TaskOutcome TransferWorker::run() {
    m_retry.reset();

    try {
        ConcurrencyLimiter::Slot slot = m_env.limiter.acquireSlot(m_token);

        while (!isTerminal(state())) {
            m_token.throwIfCancelled();
            ++m_retry.attempt;

            try {
                runAttempt();
            } catch (const TransferError& error) {
                handleFailure(error);
            }
        }
    } catch (const CancelledError&) {
        discardStaged();
        transitionTo(phase::Cancelled{});
        Logger::instance().debug("Task {} cancelled after {} attempt(s)", m_index, m_retry.attempt);
    }

    return makeOutcome();
}

void TransferWorker::runAttempt() {
    Logger::instance().debug("Task {} attempt {}: {} -> {}",
                             m_index, m_retry.attempt, m_task.url, m_task.destination);

    m_sinkError = nullptr;
    transitionTo(phase::Active{
        StagedWriter::open(m_task.destination),
        IntegrityVerifier(m_task.digestAlgorithm, m_task.expectedDigest)
    });
    auto& active = std::get<phase::Active>(m_phase);

    std::string buffer;

    FetchSink sink;
    sink.onStart = [this](uint64_t contentLength) {
        reportProgress(0, static_cast<int64_t>(contentLength) - static_cast<int64_t>(m_attemptExpected));
        m_attemptExpected = contentLength;
    };
    sink.onData = [&](std::string_view data) -> bool {
        if (m_token.isCancelled()) {
            return false;
        }
        try {
            while (!data.empty()) {
                const size_t chunk = std::max<size_t>(1, currentChunkSize());
                if (buffer.size() < chunk) {
                    const size_t take = std::min(chunk - buffer.size(), data.size());
                    buffer.append(data.data(), take);
                    data.remove_prefix(take);
                }
                if (buffer.size() >= chunk) {
                    writeChunk(active, buffer);
                }
            }
            return true;
        } catch (const std::exception&) {
            m_sinkError = std::current_exception();
            return false;
        }
    };

    FetchRequest request{m_task.url, m_env.network ? m_env.network() : NetworkConfig{}};
    FetchResult result = m_env.source.fetch(request, sink, m_token);

    if (m_sinkError) {
        std::rethrow_exception(m_sinkError);
    }
    m_token.throwIfCancelled();

    switch (result.status) {
        case FetchResult::Status::Aborted:
            throw TransferError(ErrorClass::Transient, "transfer aborted by the transport");
        case FetchResult::Status::Failed:
            throw TransferError(result.errorClass, result.message);
        case FetchResult::Status::Completed:
            break;
    }

    if (!buffer.empty()) {
        writeChunk(active, buffer);
    }

    transitionTo(phase::Verifying{std::move(active.staged), std::move(active.verifier)});
    auto& verifying = std::get<phase::Verifying>(m_phase);

    if (!verifying.verifier.verify()) {
        throw TransferError(ErrorClass::IntegrityMismatch,
                            "digest mismatch: expected " + verifying.verifier.expected() +
                            ", got " + verifying.verifier.finalize());
    }

    m_token.throwIfCancelled();

    std::string digest = verifying.verifier.finalize();
    transitionTo(phase::Publishing{std::move(verifying.staged), digest});
    auto& publishing = std::get<phase::Publishing>(m_phase);

    publishing.staged.publish();
    m_finalBytes = publishing.staged.bytesWritten();

    transitionTo(phase::Succeeded{std::move(digest)});
    Logger::instance().debug("Task {} published {} ({} bytes)", m_index, m_task.destination, m_finalBytes);
}

size_t TransferWorker::currentChunkSize() const {
    if (m_task.chunkSize > 0) {
        return m_task.chunkSize;
    }
    return m_env.chunkSize ? m_env.chunkSize() : kDefaultChunkSize;
}

void TransferWorker::writeChunk(phase::Active& active, std::string& buffer) {
    m_token.throwIfCancelled();

    active.staged.write(buffer);
    active.verifier.update(buffer);

    m_attemptBytes += buffer.size();
    reportProgress(static_cast<int64_t>(buffer.size()), 0);
    buffer.clear();
}

void TransferWorker::handleFailure(const TransferError& error) {
    const ErrorClass errorClass = error.errorClass();
    const TransferState failedIn = state();

    discardStaged();

    m_retry.lastError = errorClass;
    if (errorClass == ErrorClass::IntegrityMismatch) {
        ++m_retry.integrityFailures;
        Logger::instance().warn("Digest mismatch for {}: {}", m_task.destination, error.what());
    }

    // Cancellation wins over any retry
    m_token.throwIfCancelled();

    const auto& settings = m_env.policy.settings();
    RetryDecision decision = m_retry.attempt >= settings.maxAttempts
        ? RetryDecision::giveUp()
        : m_env.policy.decide(errorClass,
                              errorClass == ErrorClass::IntegrityMismatch ? m_retry.integrityFailures
                                                                          : m_retry.attempt);

    if (!decision.shouldRetry()) {
        transitionTo(phase::Failed{errorClass, error.what()});
        Logger::instance().error("Failed to download {} after {} attempt(s) [{} in {}]: {}",
                                 m_task.url, m_retry.attempt, toString(errorClass),
                                 toString(failedIn), error.what());
        return;
    }

    // Never shorter than the previous wait
    const auto delay = std::max(*decision.delay, m_retry.lastDelay);
    m_retry.lastDelay = delay;
    m_retry.totalBackoff += delay;

    Logger::instance().warn("Retry {}/{} for {} in {}ms ({}): {}",
                            m_retry.attempt, settings.maxAttempts, m_task.url,
                            delay.count(), toString(errorClass), error.what());

    if (m_token.waitFor(delay)) {
        throw CancelledError();
    }
}

void TransferWorker::transitionTo(TaskPhase next) {
    const TransferState from = state();
    const TransferState to = stateOf(next);
    if (!canTransition(from, to)) {
        throw std::logic_error(std::string("illegal transfer transition ") +
                               toString(from) + " -> " + toString(to));
    }

    m_phase = std::move(next);
    if (m_env.hooks.onState) {
        m_env.hooks.onState(m_index, to);
    }
}

void TransferWorker::discardStaged() noexcept {
    std::visit([](auto& current) {
        using Phase = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<Phase, phase::Active> ||
                      std::is_same_v<Phase, phase::Verifying> ||
                      std::is_same_v<Phase, phase::Publishing>) {
            current.staged.abort();
        }
    }, m_phase);

    if (m_attemptBytes > 0 || m_attemptExpected > 0) {
        reportProgress(-static_cast<int64_t>(m_attemptBytes), -static_cast<int64_t>(m_attemptExpected));
    }
    m_attemptBytes = 0;
    m_attemptExpected = 0;
}

void TransferWorker::reportProgress(int64_t bytesDelta, int64_t expectedDelta) {
    if (m_env.hooks.onProgress && (bytesDelta != 0 || expectedDelta != 0)) {
        m_env.hooks.onProgress(m_index, bytesDelta, expectedDelta);
    }
}

TaskOutcome TransferWorker::makeOutcome() const {
    TaskOutcome outcome;
    outcome.index = m_index;
    outcome.url = m_task.url;
    outcome.destination = m_task.destination;
    outcome.state = state();
    outcome.attempts = m_retry.attempt;
    outcome.totalBackoff = m_retry.totalBackoff;

    if (const auto* failed = std::get_if<phase::Failed>(&m_phase)) {
        outcome.error = failed->error;
        outcome.message = failed->message;
        outcome.bytesTransferred = 0;
    } else if (outcome.state == TransferState::Succeeded) {
        outcome.bytesTransferred = m_finalBytes;
    } else if (outcome.state == TransferState::Cancelled) {
        outcome.message = "cancelled";
    }
    return outcome;
}

} // namespace qsde::core::transfer
