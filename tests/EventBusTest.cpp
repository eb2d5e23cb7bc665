#include <gtest/gtest.h>

#include "core/EventBus.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using qsde::core::EventBus;
using namespace std::chrono_literals;

TEST(EventBusTest, DeliversInPublishOrder) {
    EventBus<int> bus(16);
    std::mutex mutex;
    std::vector<int> received;

    auto subscription = bus.subscribe([&](const int& value) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(value);
    });

    for (int i = 0; i < 10; ++i) bus.publish(i);
    ASSERT_TRUE(bus.waitIdle(2s));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(bus.droppedCount(), 0u);
}

TEST(EventBusTest, EveryEventReachesEverySubscriber) {
    EventBus<int> bus;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    auto a = bus.subscribe([&](const int& v) { first += v; });
    auto b = bus.subscribe([&](const int& v) { second += v; });
    EXPECT_EQ(bus.subscriberCount(), 2u);

    bus.publish(3);
    bus.publish(4);
    ASSERT_TRUE(bus.waitIdle(2s));

    EXPECT_EQ(first.load(), 7);
    EXPECT_EQ(second.load(), 7);
}

TEST(EventBusTest, FullQueueDropsOldestWithoutBlockingPublisher) {
    EventBus<int> bus(2);
    std::promise<void> release;
    auto gate = release.get_future().share();

    std::mutex mutex;
    std::vector<int> received;
    auto subscription = bus.subscribe([&](const int& value) {
        gate.wait();
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(value);
    });

    bus.publish(0);
    // Event 0 is in the subscriber; give the dispatcher time to take it
    std::this_thread::sleep_for(50ms);

    const auto started = std::chrono::steady_clock::now();
    for (int i = 1; i <= 5; ++i) bus.publish(i);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);

    release.set_value();
    ASSERT_TRUE(bus.waitIdle(2s));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received, (std::vector<int>{0, 4, 5}));
    EXPECT_EQ(bus.droppedCount(), 3u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus<int> bus;
    std::atomic<int> calls{0};

    auto subscription = bus.subscribe([&](const int&) { ++calls; });
    bus.publish(1);
    ASSERT_TRUE(bus.waitIdle(2s));

    bus.unsubscribe(subscription);
    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(bus.subscriberCount(), 0u);

    bus.publish(2);
    ASSERT_TRUE(bus.waitIdle(2s));
    EXPECT_EQ(calls.load(), 1);

    bus.unsubscribe(nullptr);
}

TEST(EventBusTest, UnsubscribeOnlyRemovesOwnHandle) {
    EventBus<int> first;
    EventBus<int> second;
    std::atomic<int> calls{0};

    // Both buses hand out the same first id
    auto a = first.subscribe([&](const int&) {});
    auto b = second.subscribe([&](const int&) { ++calls; });

    second.unsubscribe(a);
    EXPECT_EQ(second.subscriberCount(), 1u);
    EXPECT_EQ(first.subscriberCount(), 1u);

    first.unsubscribe(a);
    second.publish(1);
    ASSERT_TRUE(second.waitIdle(2s));
    EXPECT_EQ(calls.load(), 1);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    EventBus<int> bus;
    std::atomic<int> calls{0};

    auto faulty = bus.subscribe([](const int&) { throw std::runtime_error("subscriber failure"); });
    auto healthy = bus.subscribe([&](const int&) { ++calls; });

    bus.publish(1);
    bus.publish(2);
    ASSERT_TRUE(bus.waitIdle(2s));
    EXPECT_EQ(calls.load(), 2);
}

TEST(EventBusTest, PublishWithoutSubscribersIsDiscarded) {
    EventBus<int> bus(1);
    bus.publish(1);
    bus.publish(2);
    EXPECT_TRUE(bus.waitIdle(100ms));
    EXPECT_EQ(bus.droppedCount(), 0u);
}

TEST(EventBusTest, PendingEventsDeliveredBeforeDestruction) {
    std::atomic<int> calls{0};
    {
        EventBus<int> bus(16);
        auto subscription = bus.subscribe([&](const int&) {
            std::this_thread::sleep_for(2ms);
            ++calls;
        });
        for (int i = 0; i < 8; ++i) bus.publish(i);
    }
    EXPECT_EQ(calls.load(), 8);
}
