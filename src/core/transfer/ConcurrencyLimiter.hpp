#pragma once

/**
 * ConcurrencyLimiter.hpp
 *
 * Bounded FIFO admission gate for transfer workers.
 */

#include "CancellationController.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace qsde::core::transfer {

/**
 * ConcurrencyLimiter - at most `capacity` holders at a time
 *
 * Waiters are admitted strictly in arrival order. Raising the capacity
 * admits waiters at once; lowering it only delays new admissions until
 * enough holders have released.
 */
class ConcurrencyLimiter {
public:
    /**
     * RAII holder of one admission slot
     */
    class Slot {
    public:
        Slot() = default;
        explicit Slot(ConcurrencyLimiter* limiter) : m_limiter(limiter) {}
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : m_limiter(other.m_limiter) { other.m_limiter = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                release();
                m_limiter = other.m_limiter;
                other.m_limiter = nullptr;
            }
            return *this;
        }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release() {
            if (m_limiter) {
                m_limiter->release();
                m_limiter = nullptr;
            }
        }

        bool held() const { return m_limiter != nullptr; }

    private:
        ConcurrencyLimiter* m_limiter{nullptr};
    };

    explicit ConcurrencyLimiter(size_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * Block until a slot is granted
     * @param token Cancellation signal observed while waiting
     * @throws CancelledError if the token fires first; no slot is held then
     */
    void acquire(const CancellationToken& token);

    /**
     * acquire() wrapped in a Slot that releases on destruction
     */
    Slot acquireSlot(const CancellationToken& token);

    /**
     * Return a slot and wake the next waiter
     */
    void release();

    /**
     * Change the number of slots (minimum 1)
     */
    void setCapacity(size_t capacity);

    size_t capacity() const;
    size_t active() const;
    size_t waiting() const;

    // Highest number of simultaneous holders seen so far
    size_t peakActive() const;

private:
    bool admissible(uint64_t ticket) const;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<uint64_t> m_waiters;
    uint64_t m_nextTicket{0};
    size_t m_capacity;
    size_t m_active{0};
    size_t m_peakActive{0};
};

} // namespace qsde::core::transfer
