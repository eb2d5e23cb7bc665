/**
 * CancellationController.cpp
 */

#include "CancellationController.hpp"
#include "DownloadTask.hpp"
#include "../Logger.hpp"

#include <map>
#include <thread>
#include <utility>
#include <vector>

namespace qsde::core::transfer {

namespace detail {

class CancellationState {
public:
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    bool cancel() {
        std::map<uint64_t, std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_cancelled.load(std::memory_order_relaxed)) {
                return false;
            }
            m_cancelled.store(true, std::memory_order_release);
            callbacks.swap(m_callbacks);
            m_invoking = true;
            m_invokingThread = std::this_thread::get_id();
        }
        m_condition.notify_all();

        for (auto& [id, callback] : callbacks) {
            try {
                callback();
            } catch (const std::exception& e) {
                Logger::instance().error("Cancellation callback {} threw: {}", id, e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_invoking = false;
        }
        m_condition.notify_all();
        return true;
    }

    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, duration, [this] { return isCancelled(); });
    }

    // Returns 0 when the callback already ran synchronously
    uint64_t add(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!isCancelled()) {
                uint64_t id = ++m_nextId;
                m_callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove(uint64_t id) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_callbacks.erase(id) > 0) {
            return;
        }
        // Already taken by cancel(); make sure it is not still running
        if (m_invokingThread != std::this_thread::get_id()) {
            m_condition.wait(lock, [this] { return !m_invoking; });
        }
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::map<uint64_t, std::function<void()>> m_callbacks;
    uint64_t m_nextId{0};
    bool m_invoking{false};
    std::thread::id m_invokingThread;
};

} // namespace detail

// -- CancellationRegistration --

CancellationRegistration::CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
    : m_state(std::move(state)), m_id(id) {}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : m_state(std::move(other.m_state)), m_id(std::exchange(other.m_id, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        m_state = std::move(other.m_state);
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (m_state && m_id != 0) {
        m_state->remove(m_id);
    }
    m_state.reset();
    m_id = 0;
}

// -- CancellationToken --

bool CancellationToken::isCancelled() const {
    return m_state && m_state->isCancelled();
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw CancelledError();
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!m_state) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    return m_state->waitFor(duration);
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!m_state) {
        return {};
    }
    uint64_t id = m_state->add(std::move(callback));
    if (id == 0) {
        return {};
    }
    return CancellationRegistration(m_state, id);
}

// -- CancellationSource --

CancellationSource::CancellationSource()
    : m_state(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : CancellationSource() {
    std::weak_ptr<detail::CancellationState> weak = m_state;
    m_parentLink = std::make_shared<CancellationRegistration>(parent.onCancel([weak] {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    }));
}

bool CancellationSource::cancel() {
    return m_state->cancel();
}

bool CancellationSource::isCancelled() const {
    return m_state->isCancelled();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(m_state);
}

// -- CancellationController --

CancellationController::UnwindGuard::UnwindGuard(CancellationController& controller)
    : m_controller(controller) {
    m_controller.enter();
}

CancellationController::UnwindGuard::~UnwindGuard() {
    m_controller.leave();
}

bool CancellationController::cancelAll() {
    return m_root.cancel();
}

CancellationSource CancellationController::deriveTaskSource() const {
    return CancellationSource(m_root.token());
}

bool CancellationController::waitForUnwind(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, grace, [this] { return m_inFlight == 0; });
}

size_t CancellationController::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

void CancellationController::enter() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_inFlight;
}

void CancellationController::leave() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_inFlight;
    }
    m_idle.notify_all();
}

} // namespace qsde::core::transfer
