// src/connection.cpp
// Connection state machine implementation.

#include "connection.hpp"

#include "codec.hpp"
#include "logging.hpp"

#include <algorithm>

namespace apns {

const char* to_string(Connection::State state) noexcept {
    switch (state) {
        case Connection::State::Disconnected: return "disconnected";
        case Connection::State::Connecting:   return "connecting";
        case Connection::State::Ready:        return "ready";
        case Connection::State::Draining:     return "draining";
    }
    return "unknown";
}

Connection::Connection(std::unique_ptr<Transport> transport, NotificationQueue& queue,
                       Options options, ErrorHandler on_error)
    : transport_(std::move(transport)),
      queue_(queue),
      on_error_(std::move(on_error)),
      window_(options.replay_capacity, options.grace) {}

Connection::~Connection() {
    transport_->close();
    stop_writer();
}

void Connection::connect() {
    state_.store(State::Connecting);
    try {
        transport_->connect();
    } catch (const ApnsError&) {
        state_.store(State::Disconnected);
        throw;
    }
    if (aborted_.load()) {
        transport_->close();
        state_.store(State::Disconnected);
        throw ApnsError::network("connection aborted");
    }
    state_.store(State::Ready);
}

Connection::Outcome Connection::run() {
    writer_ = std::thread(&Connection::write_loop, this);

    // The server never sends anything but a single error frame before it
    // closes, so read until six bytes arrive or the stream ends.
    uint8_t frame[codec::ERROR_FRAME_LENGTH];
    size_t got = 0;
    while (got < sizeof(frame)) {
        size_t n = transport_->read_some(frame + got, sizeof(frame) - got);
        if (n == 0) break;
        got += n;
    }

    // Close before joining: a writer stuck in write_all only returns once
    // the transport is gone.
    state_.store(State::Draining);
    transport_->close();
    stop_writer();

    Outcome outcome = resolve(frame, got);
    outcome.written = written_.load();
    outcome.unsettled = unsettled_.load();

    state_.store(State::Disconnected);
    return outcome;
}

void Connection::abort() {
    aborted_.store(true);
    transport_->close();
}

bool Connection::wait_settled(std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        if (cancel_.load() || state_.load() != State::Ready) {
            return false;
        }
        window_.trim_expired();
        auto expiry = window_.oldest_expiry();
        if (!expiry) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::unique_lock<std::mutex> lock(room_mutex_);
        room_cv_.wait_until(lock, std::min(*expiry, deadline),
                            [this] { return cancel_.load(); });
    }
}

void Connection::stop_writer() {
    {
        std::lock_guard<std::mutex> lock(room_mutex_);
        cancel_.store(true);
    }
    room_cv_.notify_all();
    queue_.wake_all();
    if (writer_.joinable()) {
        writer_.join();
    }
}

bool Connection::wait_for_room() {
    for (;;) {
        window_.trim_expired();
        if (!window_.full()) {
            return true;
        }
        auto expiry = window_.oldest_expiry();
        APNS_LOG_DEBUG("replay window full ({} entries), pausing writes", window_.size());
        std::unique_lock<std::mutex> lock(room_mutex_);
        if (cancel_.load()) {
            return false;
        }
        if (expiry) {
            room_cv_.wait_until(lock, *expiry, [this] { return cancel_.load(); });
        }
        if (cancel_.load()) {
            return false;
        }
    }
}

void Connection::write_loop() {
    std::vector<uint8_t> buf;
    buf.reserve(512);

    while (!cancel_.load()) {
        if (!wait_for_room()) break;

        auto next = queue_.dequeue(cancel_);
        if (!next) break;

        buf.clear();
        try {
            codec::encode_notification_into(buf, *next);
        } catch (const ApnsError& e) {
            APNS_LOG_ERROR("dropping notification {}: {}", next->identifier, e.what());
            if (on_error_) on_error_(e);
            queue_.task_done();
            continue;
        }

        uint32_t identifier = next->identifier;
        // Recorded before the write so a failure racing the write still
        // finds it in the window. Only this thread pushes, and
        // wait_for_room() left space.
        window_.push(std::move(*next));

        if (!transport_->write_all(buf.data(), buf.size())) {
            APNS_LOG_DEBUG("write failed for notification {}", identifier);
            unsettled_.fetch_add(1);
            transport_->close();
            break;
        }
        written_.fetch_add(1);
        queue_.task_done();
        APNS_LOG_TRACE("sent notification {} ({} bytes)", identifier, buf.size());
    }
}

Connection::Outcome Connection::resolve(const uint8_t* frame, size_t len) {
    Outcome outcome;

    // Entries past their grace period are presumed delivered even if the
    // connection sat idle since. A write that failed never reached the
    // wire, so the newest `unsettled` entries always stay.
    size_t presumed = window_.trim_expired(ReplayWindow::Clock::now(), unsettled_.load());
    if (presumed != 0) {
        APNS_LOG_DEBUG("{} notifications presumed delivered before close", presumed);
    }

    if (len == 0) {
        outcome.replay = window_.take_all();
        APNS_LOG_DEBUG("connection closed without error frame, replaying {}",
                       outcome.replay.size());
        return outcome;
    }

    codec::ErrorFrame error;
    try {
        error = codec::decode_error(frame, len);
    } catch (const ApnsError& e) {
        APNS_LOG_WARN("{}", e.what());
        outcome.diagnostic = e;
        outcome.replay = window_.take_all();
        return outcome;
    }
    outcome.error_frame = true;

    if (error.status == STATUS_SHUTDOWN) {
        outcome.replay = window_.take_after(error.identifier);
        APNS_LOG_INFO("gateway shutting down after notification {}, replaying {}",
                      error.identifier, outcome.replay.size());
        return outcome;
    }

    auto resolution = window_.resolve_failure(error.identifier);
    outcome.replay = std::move(resolution.replay);

    if (!resolution.found) {
        APNS_LOG_WARN("error status {} names unknown notification {}, replaying {}",
                      error.status, error.identifier, outcome.replay.size());
        outcome.diagnostic = ApnsError::protocol(error.status, error.identifier);
        return outcome;
    }

    DeliveryError failure;
    failure.error = classify_status(error.status);
    failure.status = error.status;
    failure.identifier = error.identifier;
    failure.notification = std::move(resolution.failed);
    APNS_LOG_INFO("notification {} rejected: {}, replaying {}",
                  error.identifier, failure.description(), outcome.replay.size());
    outcome.failure = std::move(failure);
    return outcome;
}

} // namespace apns
