// src/threaded_backend.cpp
// Thread-per-connection backend implementation.

#include "threaded_backend.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace apns {

namespace {

// Poll interval while stop() waits for sessions to hand back their replay.
constexpr std::chrono::milliseconds SETTLE_POLL{10};

} // namespace

std::unique_ptr<Backend> make_threaded_backend(const ApnsConfig& config,
                                               NotificationQueue& queue,
                                               TransportFactory transports) {
    return std::make_unique<ThreadedBackend>(config, queue, std::move(transports));
}

ThreadedBackend::ThreadedBackend(ApnsConfig config, NotificationQueue& queue,
                                 TransportFactory transports)
    : config_(std::move(config)), queue_(queue), transports_(std::move(transports)) {
    if (!transports_) {
        throw ApnsError::configuration("backend requires a transport factory");
    }
}

ThreadedBackend::~ThreadedBackend() {
    if (started_.load() && !stopped_.load()) {
        auto abandoned = stop(std::chrono::milliseconds(0));
        if (!abandoned.empty()) {
            APNS_LOG_WARN("backend destroyed with {} unsent notifications", abandoned.size());
        }
    }
}

void ThreadedBackend::start() {
    if (started_.exchange(true)) return;

    workers_.reserve(config_.connections());
    for (size_t i = 0; i < config_.connections(); i++) {
        auto worker = std::make_unique<Worker>();
        worker->index = i;
        workers_.push_back(std::move(worker));
    }
    for (auto& worker : workers_) {
        Worker& w = *worker;
        w.thread = std::thread([this, &w] { run(w); });
    }
    APNS_LOG_INFO("started {} connection worker(s) for {}",
                  workers_.size(), config_.gateway_endpoint().to_string());
}

std::vector<Notification> ThreadedBackend::stop(std::chrono::milliseconds timeout) {
    if (!started_.load() || stopped_.exchange(true)) {
        return {};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool clean = settle(deadline);

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_.store(true);
    }
    stop_cv_.notify_all();
    queue_.wake_all();

    for (auto& worker : workers_) {
        std::lock_guard<std::mutex> lock(worker->mutex);
        if (worker->current) {
            worker->current->abort();
        }
    }
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    queue_.shutdown();
    auto abandoned = queue_.take_pending();
    if (clean) {
        APNS_LOG_INFO("backend stopped cleanly");
    } else {
        APNS_LOG_WARN("backend stopped after {} ms with {} notifications unsent",
                      timeout.count(), abandoned.size());
    }
    return abandoned;
}

void ThreadedBackend::notify_error(const DeliveryError& error) {
    APNS_LOG_WARN("{} (notification {})", error.to_string(), error.identifier);
    const auto& handler = config_.on_delivery_error();
    if (!handler) return;
    try {
        handler(error);
    } catch (const std::exception& e) {
        APNS_LOG_ERROR("delivery error handler threw: {}", e.what());
    }
}

void ThreadedBackend::report(const ApnsError& error) {
    const auto& handler = config_.on_error();
    if (!handler) return;
    try {
        handler(error);
    } catch (const std::exception& e) {
        APNS_LOG_ERROR("error handler threw: {}", e.what());
    }
}

std::chrono::milliseconds ThreadedBackend::backoff_delay(uint32_t attempt,
                                                         std::chrono::milliseconds initial,
                                                         std::chrono::milliseconds cap) {
    if (attempt == 0 || initial.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    // Exponential backoff: initial * 1.5^(attempt-1), 20% jitter, capped
    double base = static_cast<double>(initial.count()) *
                  std::pow(1.5, static_cast<double>(attempt - 1));

    std::random_device rd;
    double jitter = base * 0.2 * (static_cast<double>(rd()) / static_cast<double>(rd.max()));
    double delay = std::min(base + jitter, static_cast<double>(cap.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool ThreadedBackend::pause(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
}

void ThreadedBackend::run(Worker& worker) {
    const Endpoint& endpoint = config_.gateway_endpoint();
    Connection::Options options;
    options.replay_capacity = config_.replay_capacity();
    options.grace = config_.grace_period();

    uint32_t connect_failures = 0;
    uint32_t idle_sessions = 0;

    while (!stopping_.load()) {
        // Connect lazily, only once there is something to send.
        if (!queue_.wait_for_item(stopping_)) break;

        std::shared_ptr<Connection> connection;
        try {
            auto transport = transports_(endpoint);
            if (!transport) {
                throw ApnsError::network("transport factory returned no transport");
            }
            connection = std::make_shared<Connection>(
                std::move(transport), queue_, options,
                [this](const ApnsError& e) { report(e); });
            {
                std::lock_guard<std::mutex> lock(worker.mutex);
                worker.current = connection;
            }
            if (stopping_.load()) {
                connection->abort();
            }
            connection->connect();
        } catch (const ApnsError& e) {
            {
                std::lock_guard<std::mutex> lock(worker.mutex);
                worker.current.reset();
            }
            if (stopping_.load()) break;
            connect_failures++;
            APNS_LOG_WARN("worker {}: connect to {} failed (attempt {}): {}",
                          worker.index, endpoint.to_string(), connect_failures, e.what());
            if (connect_failures == config_.connect_failure_threshold()) {
                report(ApnsError(e.kind(),
                    "gateway " + endpoint.to_string() + " unreachable after " +
                    std::to_string(connect_failures) + " attempts: " + e.message()));
            }
            if (!pause(backoff_delay(connect_failures, config_.reconnect_delay(),
                                     config_.max_reconnect_delay()))) {
                break;
            }
            continue;
        }

        connect_failures = 0;
        sessions_.fetch_add(1);
        APNS_LOG_DEBUG("worker {}: connected to {}", worker.index, endpoint.to_string());

        auto outcome = connection->run();
        finish_session(outcome, *connection);
        {
            std::lock_guard<std::mutex> lock(worker.mutex);
            worker.current.reset();
        }

        // A server that accepts the handshake and then drops every write
        // would otherwise be hammered in a tight loop.
        if (outcome.written == 0 && !outcome.error_frame) {
            idle_sessions++;
            if (!pause(backoff_delay(idle_sessions, config_.reconnect_delay(),
                                     config_.max_reconnect_delay()))) {
                break;
            }
        } else {
            idle_sessions = 0;
        }
    }
    APNS_LOG_DEBUG("worker {}: exiting", worker.index);
}

void ThreadedBackend::finish_session(Connection::Outcome& outcome,
                                     const Connection& connection) {
    size_t seen = connection.window_high_water();
    size_t prev = high_water_.load();
    while (prev < seen && !high_water_.compare_exchange_weak(prev, seen)) {
    }

    // Requeue before settling so drain() never observes a gap.
    if (!outcome.replay.empty()) {
        replayed_.fetch_add(outcome.replay.size());
        queue_.enqueue_front(std::move(outcome.replay));
    }
    for (size_t i = 0; i < outcome.unsettled; i++) {
        queue_.task_done();
    }

    if (outcome.failure) {
        notify_error(*outcome.failure);
    }
    if (outcome.diagnostic) {
        report(*outcome.diagnostic);
    }
}

bool ThreadedBackend::settle(std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!queue_.drain_for(remaining)) return false;

        bool settled = true;
        for (auto& worker : workers_) {
            std::shared_ptr<Connection> connection;
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                connection = worker->current;
            }
            if (connection && !connection->wait_settled(deadline)) {
                settled = false;
            }
        }
        if (settled && queue_.unfinished() == 0) return true;

        std::this_thread::sleep_for(SETTLE_POLL);
    }
}

} // namespace apns
