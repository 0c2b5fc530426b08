// src/queue.cpp
// Notification queue implementation.

#include "apns/queue.hpp"

namespace apns {

void NotificationQueue::enqueue(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(notification));
        unfinished_++;
    }
    items_cv_.notify_one();
}

void NotificationQueue::enqueue_front(std::vector<Notification> notifications) {
    if (notifications.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        unfinished_ += notifications.size();
        for (auto it = notifications.rbegin(); it != notifications.rend(); ++it) {
            items_.push_front(std::move(*it));
        }
    }
    items_cv_.notify_all();
}

std::optional<Notification> NotificationQueue::dequeue(const std::atomic<bool>& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    items_cv_.wait(lock, [&] {
        return !items_.empty() || shutdown_ || cancel.load();
    });
    if (shutdown_ || cancel.load()) {
        return std::nullopt;
    }
    Notification n = std::move(items_.front());
    items_.pop_front();
    return n;
}

bool NotificationQueue::wait_for_item(const std::atomic<bool>& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    items_cv_.wait(lock, [&] {
        return !items_.empty() || shutdown_ || cancel.load();
    });
    return !shutdown_ && !cancel.load();
}

void NotificationQueue::task_done() {
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unfinished_ > 0) unfinished_--;
        idle = unfinished_ == 0;
    }
    if (idle) {
        done_cv_.notify_all();
    }
}

void NotificationQueue::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return unfinished_ == 0; });
}

bool NotificationQueue::drain_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return unfinished_ == 0; });
}

void NotificationQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    items_cv_.notify_all();
}

void NotificationQueue::wake_all() {
    // Taking the lock orders the notify after any in-progress predicate check.
    { std::lock_guard<std::mutex> lock(mutex_); }
    items_cv_.notify_all();
}

std::vector<Notification> NotificationQueue::take_pending() {
    std::vector<Notification> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(items_.size());
        for (auto& n : items_) {
            out.push_back(std::move(n));
        }
        unfinished_ = unfinished_ >= items_.size() ? unfinished_ - items_.size() : 0;
        items_.clear();
    }
    done_cv_.notify_all();
    return out;
}

bool NotificationQueue::is_shutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

bool NotificationQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

size_t NotificationQueue::unfinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unfinished_;
}

} // namespace apns
