// src/replay_window.cpp
// Replay window implementation.

#include "replay_window.hpp"

#include <algorithm>

namespace apns {

ReplayWindow::ReplayWindow(size_t capacity, std::chrono::milliseconds grace)
    : capacity_(std::max<size_t>(capacity, 1)), grace_(grace) {}

bool ReplayWindow::push(Notification&& notification, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() >= capacity_) {
        return false;
    }
    uint64_t seq = next_seq_++;
    // A reused identifier points at its newest occurrence.
    index_[notification.identifier] = seq;
    entries_.push_back(Entry{seq, std::move(notification), now});
    high_water_ = std::max(high_water_, entries_.size());
    return true;
}

size_t ReplayWindow::trim_expired(Clock::time_point now, size_t keep_newest) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    while (entries_.size() > keep_newest && entries_.front().sent_at + grace_ <= now) {
        pop_front_locked();
        removed++;
    }
    return removed;
}

std::optional<ReplayWindow::Clock::time_point> ReplayWindow::oldest_expiry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) return std::nullopt;
    return entries_.front().sent_at + grace_;
}

ReplayWindow::Resolution ReplayWindow::resolve_failure(uint32_t identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    Resolution result;

    auto index = find_locked(identifier);
    if (!index) {
        result.replay = take_from_locked(0);
        return result;
    }

    result.found = true;
    result.failed = std::move(entries_[*index].notification);
    result.replay = take_from_locked(*index + 1);
    return result;
}

std::vector<Notification> ReplayWindow::take_after(uint32_t identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = find_locked(identifier);
    return take_from_locked(index ? *index + 1 : 0);
}

std::vector<Notification> ReplayWindow::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_from_locked(0);
}

void ReplayWindow::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

bool ReplayWindow::contains(uint32_t identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(identifier).has_value();
}

size_t ReplayWindow::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ReplayWindow::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

bool ReplayWindow::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size() >= capacity_;
}

size_t ReplayWindow::high_water() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_;
}

std::optional<size_t> ReplayWindow::find_locked(uint32_t identifier) const {
    auto it = index_.find(identifier);
    if (it == index_.end() || entries_.empty()) return std::nullopt;

    uint64_t base = entries_.front().seq;
    if (it->second < base) return std::nullopt;
    size_t index = static_cast<size_t>(it->second - base);
    if (index >= entries_.size()) return std::nullopt;
    return index;
}

// Collect entries [index, end) and clear the window.
std::vector<Notification> ReplayWindow::take_from_locked(size_t index) {
    std::vector<Notification> out;
    if (index < entries_.size()) {
        out.reserve(entries_.size() - index);
        for (size_t i = index; i < entries_.size(); i++) {
            out.push_back(std::move(entries_[i].notification));
        }
    }
    entries_.clear();
    index_.clear();
    return out;
}

void ReplayWindow::pop_front_locked() {
    const Entry& front = entries_.front();
    auto it = index_.find(front.notification.identifier);
    if (it != index_.end() && it->second == front.seq) {
        index_.erase(it);
    }
    entries_.pop_front();
}

} // namespace apns
