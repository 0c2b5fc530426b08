// src/replay_window.hpp
// Bounded, identifier-indexed record of notifications in flight on one
// connection.

#pragma once

#include "apns/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace apns {

// Holds exactly the notifications written on the current connection whose
// outcome is still unknown. Order is insertion order, never identifier
// order, so replay stays correct across 32-bit identifier wraparound.
//
// An entry that has been on the wire for `grace` without an error frame is
// presumed delivered and trimmed from the front. The window never grows
// past `capacity`; push() refuses instead.
//
// Thread-safe.
class ReplayWindow {
public:
    using Clock = std::chrono::steady_clock;

    // Outcome of an error frame naming `identifier`.
    struct Resolution {
        bool found = false;
        std::optional<Notification> failed;   // the rejected notification
        std::vector<Notification> replay;     // to resend, oldest first
    };

    ReplayWindow(size_t capacity, std::chrono::milliseconds grace);

    ReplayWindow(const ReplayWindow&) = delete;
    ReplayWindow& operator=(const ReplayWindow&) = delete;

    // Record a notification as written at `now`. Returns false, leaving
    // `notification` untouched, if the window is full.
    bool push(Notification&& notification, Clock::time_point now = Clock::now());

    // Drop entries whose grace period has elapsed, never touching the
    // newest `keep_newest` entries. Returns the count removed.
    size_t trim_expired(Clock::time_point now = Clock::now(), size_t keep_newest = 0);

    // When the oldest entry will be presumed delivered, if any.
    std::optional<Clock::time_point> oldest_expiry() const;

    // Resolve a rejection of `identifier` and clear the window. Entries after
    // it are returned for replay; if it is not present the whole window is.
    Resolution resolve_failure(uint32_t identifier);

    // Take every entry after `identifier` (the last one the server accepted)
    // and clear the window. If it is not present the whole window is taken.
    std::vector<Notification> take_after(uint32_t identifier);

    // Take every entry, oldest first, and clear the window.
    std::vector<Notification> take_all();

    void clear();

    bool contains(uint32_t identifier) const;
    size_t size() const;
    bool empty() const;
    bool full() const;
    size_t capacity() const noexcept { return capacity_; }
    std::chrono::milliseconds grace() const noexcept { return grace_; }

    // Largest size ever observed.
    size_t high_water() const;

private:
    struct Entry {
        uint64_t seq = 0;
        Notification notification;
        Clock::time_point sent_at;
    };

    // Index of `identifier` in entries_, if present. Caller holds mutex_.
    std::optional<size_t> find_locked(uint32_t identifier) const;
    std::vector<Notification> take_from_locked(size_t index);
    void pop_front_locked();

    const size_t capacity_;
    const std::chrono::milliseconds grace_;

    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
    std::unordered_map<uint32_t, uint64_t> index_;
    uint64_t next_seq_ = 0;
    size_t high_water_ = 0;
};

} // namespace apns
