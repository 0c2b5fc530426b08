// include/apns/backend.hpp
// Concurrency backend interface: supplies connections that pump the queue.

#pragma once

#include "config.hpp"
#include "queue.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace apns {

// A concurrency model for the protocol engine.
//
// A backend keeps the configured number of gateway connections fed from the
// shared NotificationQueue, requeues replayed notifications ahead of fresh
// work, retries transient failures and hands permanent failures to the
// caller through notify_error().
class Backend {
public:
    virtual ~Backend() = default;

    // Bring up the connection workers. Called once.
    virtual void start() = 0;

    // Drain the queue, wait for in-flight notifications to settle and close
    // every connection. Anything that could not be sent before `timeout`
    // expires is returned, oldest first. Idempotent; later calls return an
    // empty list.
    virtual std::vector<Notification> stop(std::chrono::milliseconds timeout) = 0;

    // Deliver a permanent failure to the caller's handler. Invoked exactly
    // once per rejected notification, on a backend thread.
    virtual void notify_error(const DeliveryError& error) = 0;
};

// Builds a backend for `config` over `queue`, opening gateway connections
// through `transports`.
using BackendFactory = std::function<std::unique_ptr<Backend>(
    const ApnsConfig& config, NotificationQueue& queue, TransportFactory transports)>;

// The default backend: one worker thread per configured connection.
std::unique_ptr<Backend> make_threaded_backend(const ApnsConfig& config,
                                               NotificationQueue& queue,
                                               TransportFactory transports);

} // namespace apns
