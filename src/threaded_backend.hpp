// src/threaded_backend.hpp
// Thread-per-connection backend with reconnect backoff.

#pragma once

#include "connection.hpp"
#include "apns/backend.hpp"
#include "apns/config.hpp"
#include "apns/queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace apns {

class ThreadedBackend : public Backend {
public:
    ThreadedBackend(ApnsConfig config, NotificationQueue& queue, TransportFactory transports);
    ~ThreadedBackend() override;

    ThreadedBackend(const ThreadedBackend&) = delete;
    ThreadedBackend& operator=(const ThreadedBackend&) = delete;

    void start() override;
    std::vector<Notification> stop(std::chrono::milliseconds timeout) override;
    void notify_error(const DeliveryError& error) override;

    // Largest replay window observed on any connection.
    size_t window_high_water() const noexcept { return high_water_.load(); }
    // Connections that completed their handshake.
    uint64_t sessions() const noexcept { return sessions_.load(); }
    // Notifications requeued for replay.
    uint64_t replayed() const noexcept { return replayed_.load(); }

    // Delay before reconnect attempt `attempt` (1-based).
    static std::chrono::milliseconds backoff_delay(uint32_t attempt,
                                                   std::chrono::milliseconds initial,
                                                   std::chrono::milliseconds cap);

private:
    // One connection slot and the thread that keeps it alive.
    struct Worker {
        size_t index = 0;
        std::thread thread;
        std::mutex mutex;
        std::shared_ptr<Connection> current;
    };

    void run(Worker& worker);
    void finish_session(Connection::Outcome& outcome, const Connection& connection);
    // Sleep for `delay` unless stop() begins. Returns false if stopping.
    bool pause(std::chrono::milliseconds delay);
    // Wait until the queue is drained and every window has settled.
    bool settle(std::chrono::steady_clock::time_point deadline);
    void report(const ApnsError& error);

    ApnsConfig config_;
    NotificationQueue& queue_;
    TransportFactory transports_;
    std::vector<std::unique_ptr<Worker>> workers_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> stopping_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    std::atomic<size_t> high_water_{0};
    std::atomic<uint64_t> sessions_{0};
    std::atomic<uint64_t> replayed_{0};
};

} // namespace apns
