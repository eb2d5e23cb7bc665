#include "ConcurrencyLimiter.hpp"
#include "DownloadTask.hpp"

#include <algorithm>

namespace qsde::core::transfer {

ConcurrencyLimiter::ConcurrencyLimiter(size_t capacity)
    : m_capacity(std::max<size_t>(1, capacity)) {}

void ConcurrencyLimiter::acquire(const CancellationToken& token) {
    // Registered before locking: the callback itself takes m_mutex
    CancellationRegistration wake = token.onCancel([this] {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_condition.notify_all();
    });

    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        const uint64_t ticket = m_nextTicket++;
        m_waiters.push_back(ticket);

        m_condition.wait(lock, [&] {
            return token.isCancelled() || admissible(ticket);
        });

        if (token.isCancelled()) {
            m_waiters.erase(std::find(m_waiters.begin(), m_waiters.end(), ticket));
            cancelled = true;
        } else {
            m_waiters.pop_front();
            ++m_active;
            m_peakActive = std::max(m_peakActive, m_active);
        }
    }
    // Queue head changed either way
    m_condition.notify_all();

    wake.reset();
    if (cancelled) {
        throw CancelledError();
    }
}

ConcurrencyLimiter::Slot ConcurrencyLimiter::acquireSlot(const CancellationToken& token) {
    acquire(token);
    return Slot(this);
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active > 0) {
            --m_active;
        }
    }
    m_condition.notify_all();
}

void ConcurrencyLimiter::setCapacity(size_t capacity) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_capacity = std::max<size_t>(1, capacity);
    }
    m_condition.notify_all();
}

size_t ConcurrencyLimiter::capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

size_t ConcurrencyLimiter::active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

size_t ConcurrencyLimiter::waiting() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiters.size();
}

size_t ConcurrencyLimiter::peakActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peakActive;
}

bool ConcurrencyLimiter::admissible(uint64_t ticket) const {
    return m_active < m_capacity && !m_waiters.empty() && m_waiters.front() == ticket;
}

} // namespace qsde::core::transfer
