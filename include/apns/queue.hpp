// include/apns/queue.hpp
// Notification queue shared by the façade (producer) and connection
// workers (consumers).

#pragma once

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace apns {

// Unbounded FIFO of pending notifications.
//
// Consumers call dequeue() and later task_done() once the notification has
// been written to a connection; drain() waits for both the queue to empty
// and every dequeued item to be marked done. Replayed notifications go back
// in with enqueue_front() so they are sent before fresh work.
//
// All methods are thread-safe.
class NotificationQueue {
public:
    NotificationQueue() = default;

    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    // Append to the back. Never blocks beyond the internal lock.
    void enqueue(Notification notification);

    // Insert `notifications` ahead of everything queued, keeping their order.
    void enqueue_front(std::vector<Notification> notifications);

    // Block until an item is available, the queue is shut down, or `cancel`
    // becomes true (after a wake_all()). Returns nullopt in the latter cases.
    std::optional<Notification> dequeue(const std::atomic<bool>& cancel);

    // Block until the queue is non-empty. Returns false on shutdown/cancel.
    bool wait_for_item(const std::atomic<bool>& cancel);

    // Mark one dequeued item as fully processed.
    void task_done();

    // Block until the queue is empty and all dequeued items are done.
    void drain();

    // Bounded drain(). Returns true if the queue drained in time.
    bool drain_for(std::chrono::milliseconds timeout);

    // Make every current and future dequeue() return nullopt.
    void shutdown();

    // Re-evaluate blocked consumers (after a cancel flag was raised).
    void wake_all();

    // Remove and return everything still queued.
    std::vector<Notification> take_pending();

    bool is_shutdown() const;
    bool empty() const;
    size_t size() const;
    size_t unfinished() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable items_cv_;
    std::condition_variable done_cv_;
    std::deque<Notification> items_;
    size_t unfinished_ = 0;
    bool shutdown_ = false;
};

} // namespace apns
