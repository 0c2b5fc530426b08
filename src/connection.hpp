// src/connection.hpp
// One gateway connection: concurrent send/read duties and replay resolution.

#pragma once

#include "replay_window.hpp"
#include "apns/error.hpp"
#include "apns/queue.hpp"
#include "apns/transport.hpp"
#include "apns/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace apns {

// Drives a single transport through
// Disconnected -> Connecting -> Ready -> Draining -> Disconnected.
//
// While Ready, a writer thread pulls notifications from the shared queue,
// records them in the replay window and writes them; the thread that called
// run() blocks reading the error channel. Whichever side sees the connection
// end first closes the transport so the other side observes it at once.
//
// A Connection is single-use: once run() returns it stays Disconnected.
class Connection {
public:
    enum class State {
        Disconnected,
        Connecting,
        Ready,
        Draining,
    };

    struct Options {
        size_t replay_capacity = 10000;
        std::chrono::milliseconds grace{5000};
    };

    // What one connection incarnation leaves behind.
    struct Outcome {
        // Notifications to resend, oldest first, ahead of fresh work.
        std::vector<Notification> replay;
        // Permanent failure named by an error frame.
        std::optional<DeliveryError> failure;
        // Connection-level condition for the diagnostic path.
        std::optional<ApnsError> diagnostic;
        // Dequeued notifications whose task_done() is still owed because
        // their write did not complete. Settle after requeueing `replay`.
        size_t unsettled = 0;
        // Notifications fully written on this connection.
        size_t written = 0;
        // True if the server sent a readable error frame.
        bool error_frame = false;
    };

    using ErrorHandler = std::function<void(const ApnsError&)>;

    Connection(std::unique_ptr<Transport> transport, NotificationQueue& queue,
               Options options, ErrorHandler on_error = nullptr);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Open the transport. Throws ApnsError (Network/Tls) and returns to
    // Disconnected on failure.
    void connect();

    // Run both duties until the connection ends, then resolve the window.
    // Must follow a successful connect().
    Outcome run();

    // End the connection from any thread. Everything in flight is replayed.
    void abort();

    // Block until every written notification has been presumed delivered,
    // or `deadline` passes. Returns true if the window is empty.
    bool wait_settled(std::chrono::steady_clock::time_point deadline);

    State state() const noexcept { return state_.load(); }
    size_t window_size() const { return window_.size(); }
    size_t window_high_water() const { return window_.high_water(); }

private:
    void write_loop();
    void stop_writer();
    // Block while the window is full. Returns false if cancelled.
    bool wait_for_room();
    Outcome resolve(const uint8_t* frame, size_t len);

    std::unique_ptr<Transport> transport_;
    NotificationQueue& queue_;
    ErrorHandler on_error_;
    ReplayWindow window_;

    std::atomic<State> state_{State::Disconnected};
    std::atomic<bool> cancel_{false};
    std::atomic<bool> aborted_{false};
    std::thread writer_;

    // Writer parks here while the window is full.
    std::mutex room_mutex_;
    std::condition_variable room_cv_;

    std::atomic<size_t> written_{0};
    std::atomic<size_t> unsettled_{0};
};

const char* to_string(Connection::State state) noexcept;

} // namespace apns
