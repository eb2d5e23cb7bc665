#pragma once

/**
 * EventBus.hpp
 *
 * Typed publish/subscribe channel with bounded, non-blocking delivery.
 * Publishers never wait on subscribers: events are queued and handed to
 * subscribers on a dedicated dispatch thread. When the queue is full the
 * oldest pending event is dropped.
 */

#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace qsde::core {

/**
 * Event subscription handle
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - bounded event channel for one event type
 *
 * Features:
 * - Multiple subscribers
 * - publish() never blocks on a subscriber
 * - Drop-oldest overflow with a drop counter
 * - Pending events are delivered before the bus is destroyed
 */
template<typename Event>
class EventBus {
public:
    using Callback = std::function<void(const Event&)>;

    /**
     * Constructor
     * @param capacity Maximum number of undelivered events kept
     */
    explicit EventBus(size_t capacity = 64)
        : m_capacity(std::max<size_t>(1, capacity)) {
        m_dispatcher = std::thread([this] { dispatchLoop(); });
    }

    ~EventBus() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_condition.notify_all();
        if (m_dispatcher.joinable()) {
            m_dispatcher.join();
        }
    }

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to events
     * @param callback Invoked on the dispatch thread for each event
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto subscription = std::make_shared<Subscription>(m_nextId++);
        m_subscribers.push_back({std::move(callback), subscription});
        return subscription;
    }

    /**
     * Unsubscribe
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                [&subscription](const SubscriberEntry& entry) {
                    return entry.subscription == subscription;
                }),
            m_subscribers.end()
        );
    }

    /**
     * Queue an event for delivery
     * @param event Event payload
     */
    void publish(Event event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_subscribers.empty()) {
                return;
            }
            if (m_queue.size() >= m_capacity) {
                m_queue.pop_front();
                ++m_dropped;
            }
            m_queue.push_back(std::move(event));
        }
        m_condition.notify_all();
    }

    /**
     * Wait until every queued event has been handed to the subscribers
     * @param timeout Upper bound on the wait
     * @return true if the queue drained in time
     */
    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idleCondition.wait_for(lock, timeout, [this] {
            return m_queue.empty() && !m_delivering;
        });
    }

    size_t droppedCount() const { return m_dropped.load(); }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

private:
    struct SubscriberEntry {
        Callback callback;
        SubscriptionPtr subscription;
    };

    void dispatchLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true) {
            m_condition.wait(lock, [this] { return m_stop || !m_queue.empty(); });

            if (m_queue.empty()) {
                if (m_stop) return;
                continue;
            }

            Event event = std::move(m_queue.front());
            m_queue.pop_front();
            std::vector<SubscriberEntry> targets = m_subscribers;
            m_delivering = true;

            lock.unlock();
            for (const auto& entry : targets) {
                if (!entry.subscription->isActive()) continue;
                try {
                    entry.callback(event);
                } catch (const std::exception& e) {
                    Logger::instance().warn("Event subscriber {} threw: {}",
                                            entry.subscription->getId(), e.what());
                }
            }
            lock.lock();

            m_delivering = false;
            if (m_queue.empty()) {
                m_idleCondition.notify_all();
            }
        }
    }

private:
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    std::deque<Event> m_queue;
    std::vector<SubscriberEntry> m_subscribers;
    bool m_delivering{false};
    bool m_stop{false};

    std::atomic<uint64_t> m_nextId{0};
    std::atomic<size_t> m_dropped{0};

    std::thread m_dispatcher;
};

} // namespace qsde::core
