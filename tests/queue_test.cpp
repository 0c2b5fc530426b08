// tests/queue_test.cpp
// Notification queue: ordering, replay priority, drain and shutdown.

#include <gtest/gtest.h>
#include "apns/queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace apns {
namespace {

Notification make(uint32_t id) {
    Notification n;
    n.identifier = id;
    n.token = {0x01};
    n.payload = {'{', '}'};
    return n;
}

std::vector<Notification> make_range(uint32_t first, uint32_t last) {
    std::vector<Notification> out;
    for (uint32_t id = first; id <= last; id++) out.push_back(make(id));
    return out;
}

std::vector<uint32_t> dequeue_ids(NotificationQueue& queue, size_t count) {
    std::atomic<bool> cancel{false};
    std::vector<uint32_t> ids;
    for (size_t i = 0; i < count; i++) {
        auto n = queue.dequeue(cancel);
        if (!n) break;
        ids.push_back(n->identifier);
        queue.task_done();
    }
    return ids;
}

TEST(QueueTest, FifoOrder) {
    NotificationQueue queue;
    for (uint32_t id = 1; id <= 3; id++) queue.enqueue(make(id));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(dequeue_ids(queue, 3), (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_TRUE(queue.empty());
}

TEST(QueueTest, EnqueueFrontJumpsAheadInOrder) {
    NotificationQueue queue;
    queue.enqueue(make(100));
    queue.enqueue(make(101));
    queue.enqueue_front(make_range(6, 10));

    EXPECT_EQ(dequeue_ids(queue, 7), (std::vector<uint32_t>{6, 7, 8, 9, 10, 100, 101}));
}

TEST(QueueTest, EnqueueFrontEmptyIsNoop) {
    NotificationQueue queue;
    queue.enqueue_front({});
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.unfinished(), 0u);
}

TEST(QueueTest, DequeueBlocksUntilEnqueue) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    std::atomic<uint32_t> got{0};

    std::thread consumer([&] {
        auto n = queue.dequeue(cancel);
        if (n) got = n->identifier;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(got.load(), 0u);
    queue.enqueue(make(42));
    consumer.join();
    EXPECT_EQ(got.load(), 42u);
}

TEST(QueueTest, ShutdownReleasesConsumers) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    std::atomic<int> released{0};

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; i++) {
        consumers.emplace_back([&] {
            if (!queue.dequeue(cancel)) released++;
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    for (auto& t : consumers) t.join();

    EXPECT_EQ(released.load(), 3);
    EXPECT_TRUE(queue.is_shutdown());
    EXPECT_FALSE(queue.dequeue(cancel).has_value());
}

TEST(QueueTest, CancelFlagReleasesOneConsumer) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    std::atomic<bool> released{false};

    std::thread consumer([&] {
        released = !queue.dequeue(cancel).has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    cancel = true;
    queue.wake_all();
    consumer.join();

    EXPECT_TRUE(released.load());
    EXPECT_FALSE(queue.is_shutdown());
}

TEST(QueueTest, WaitForItemDoesNotConsume) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    queue.enqueue(make(1));

    EXPECT_TRUE(queue.wait_for_item(cancel));
    EXPECT_EQ(queue.size(), 1u);
}

TEST(QueueTest, DrainWaitsForTaskDone) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    for (uint32_t id = 1; id <= 5; id++) queue.enqueue(make(id));

    std::atomic<int> processed{0};
    std::thread consumer([&] {
        for (int i = 0; i < 5; i++) {
            auto n = queue.dequeue(cancel);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            processed++;
            queue.task_done();
        }
    });

    queue.drain();
    EXPECT_EQ(processed.load(), 5);
    consumer.join();
}

TEST(QueueTest, DrainWaitsForDequeuedButUnfinished) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    queue.enqueue(make(1));

    auto n = queue.dequeue(cancel);
    ASSERT_TRUE(n.has_value());
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.drain_for(std::chrono::milliseconds(20)));

    queue.task_done();
    EXPECT_TRUE(queue.drain_for(std::chrono::milliseconds(20)));
}

TEST(QueueTest, DrainCoversReplay) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    queue.enqueue(make(1));
    queue.enqueue(make(2));

    // Both written, then the connection fails and 2 comes back for replay.
    dequeue_ids(queue, 2);
    queue.enqueue_front({make(2)});

    EXPECT_FALSE(queue.drain_for(std::chrono::milliseconds(20)));
    EXPECT_EQ(dequeue_ids(queue, 1), (std::vector<uint32_t>{2}));
    EXPECT_TRUE(queue.drain_for(std::chrono::milliseconds(20)));
}

TEST(QueueTest, DrainOnEmptyQueueReturns) {
    NotificationQueue queue;
    queue.drain();
    EXPECT_TRUE(queue.drain_for(std::chrono::milliseconds(0)));
}

TEST(QueueTest, TakePending) {
    NotificationQueue queue;
    for (uint32_t id = 1; id <= 4; id++) queue.enqueue(make(id));
    dequeue_ids(queue, 1);

    auto pending = queue.take_pending();
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(pending[0].identifier, 2u);
    EXPECT_EQ(pending[2].identifier, 4u);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.unfinished(), 0u);
}

TEST(QueueTest, ConcurrentProducersAndConsumers) {
    NotificationQueue queue;
    std::atomic<bool> cancel{false};
    constexpr uint32_t PER_PRODUCER = 500;

    std::atomic<uint32_t> consumed{0};
    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; i++) {
        consumers.emplace_back([&] {
            while (auto n = queue.dequeue(cancel)) {
                consumed++;
                queue.task_done();
            }
        });
    }

    std::vector<std::thread> producers;
    for (uint32_t p = 0; p < 4; p++) {
        producers.emplace_back([&, p] {
            for (uint32_t i = 0; i < PER_PRODUCER; i++) queue.enqueue(make(p * PER_PRODUCER + i));
        });
    }
    for (auto& t : producers) t.join();

    queue.drain();
    EXPECT_EQ(consumed.load(), 4 * PER_PRODUCER);

    queue.shutdown();
    for (auto& t : consumers) t.join();
}

} // namespace
} // namespace apns
