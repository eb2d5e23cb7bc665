#pragma once

/**
 * CancellationController.hpp
 *
 * Cancellation signal shared by every worker of a batch, per-task derived
 * signals, and tracking of in-flight workers so a canceller can wait for
 * the unwind to finish.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace qsde::core::transfer {

namespace detail {
class CancellationState;
}

/**
 * Keeps a cancellation callback registered for its lifetime.
 * Destruction waits for a concurrently running callback to return.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

private:
    std::shared_ptr<detail::CancellationState> m_state;
    uint64_t m_id{0};
};

/**
 * Read side of a cancellation signal. Cheap to copy.
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    /**
     * Throw CancelledError if the signal has fired
     */
    void throwIfCancelled() const;

    /**
     * Sleep for a duration, waking early on cancellation
     * @return true if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * Run a callback when the signal fires (immediately if it already has).
     * The callback runs on the cancelling thread and must not block.
     */
    [[nodiscard]] CancellationRegistration onCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

/**
 * Write side of a cancellation signal
 */
class CancellationSource {
public:
    CancellationSource();

    /**
     * Source that also fires whenever the parent fires
     */
    explicit CancellationSource(const CancellationToken& parent);

    /**
     * Fire the signal. One-way and idempotent.
     * @return true if this call fired it
     */
    bool cancel();

    bool isCancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<detail::CancellationState> m_state;
    std::shared_ptr<CancellationRegistration> m_parentLink;
};

/**
 * CancellationController - batch-wide cancellation
 *
 * Owns the root signal of a batch, derives per-task sources from it and
 * counts workers that have not finished unwinding.
 */
class CancellationController {
public:
    /**
     * Marks one worker as in flight until destroyed
     */
    class UnwindGuard {
    public:
        explicit UnwindGuard(CancellationController& controller);
        ~UnwindGuard();

        UnwindGuard(const UnwindGuard&) = delete;
        UnwindGuard& operator=(const UnwindGuard&) = delete;

    private:
        CancellationController& m_controller;
    };

    CancellationController() = default;

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    /**
     * Fire the batch-wide signal
     * @return true if this call fired it
     */
    bool cancelAll();

    bool isCancelled() const { return m_root.isCancelled(); }

    CancellationToken token() const { return m_root.token(); }

    /**
     * Create a task-level source that fires with the batch signal and can
     * also be fired on its own
     */
    CancellationSource deriveTaskSource() const;

    /**
     * Wait until no worker is in flight
     * @param grace Upper bound on the wait
     * @return true if every worker acknowledged in time
     */
    bool waitForUnwind(std::chrono::milliseconds grace);

    size_t inFlight() const;

private:
    void enter();
    void leave();

    CancellationSource m_root;

    mutable std::mutex m_mutex;
    std::condition_variable m_idle;
    size_t m_inFlight{0};
};

} // namespace qsde::core::transfer
