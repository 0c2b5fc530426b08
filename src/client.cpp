// src/client.cpp
// APNs client implementation.

#include "apns/client.hpp"
#include "apns/queue.hpp"
#include "feedback.hpp"
#include "logging.hpp"
#include "transport.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace apns {

struct ApnsClient::Inner {
    ApnsConfig config;
    NotificationQueue queue;
    TransportFactory transports;
    std::unique_ptr<Backend> backend;

    std::atomic<uint32_t> next_identifier{1};
    std::atomic<bool> closed{false};
    // Held shared by send() so close() cannot strand a notification in the
    // queue after the backend has collected what is left.
    std::shared_mutex close_mutex;

    explicit Inner(ApnsConfig cfg) : config(std::move(cfg)) {}
};

std::unique_ptr<ApnsClient> ApnsClient::create(ApnsConfig config) {
    return create(std::move(config), &make_threaded_backend);
}

std::unique_ptr<ApnsClient> ApnsClient::create(ApnsConfig config, BackendFactory backend) {
    if (!backend) {
        throw ApnsError::configuration("backend factory is required");
    }
    return std::unique_ptr<ApnsClient>(new ApnsClient(std::move(config), std::move(backend)));
}

ApnsClient::ApnsClient(ApnsConfig config, BackendFactory backend)
    : inner_(std::make_unique<Inner>(std::move(config))) {
    logging::initialize(inner_->config.log_level());

    if (inner_->config.transport_factory()) {
        inner_->transports = inner_->config.transport_factory();
    } else {
        auto context = TlsContext::create(inner_->config.cert_path(),
                                          inner_->config.key_path(),
                                          inner_->config.ca_path(),
                                          inner_->config.verify_peer());
        inner_->transports = make_tls_transport_factory(std::move(context),
                                                        inner_->config.network_timeout());
    }

    inner_->backend = backend(inner_->config, inner_->queue, inner_->transports);
    if (!inner_->backend) {
        throw ApnsError::configuration("backend factory returned no backend");
    }
    inner_->backend->start();

    APNS_LOG_INFO("client ready ({} environment, gateway {})",
                  inner_->config.environment() == Environment::Production ? "production" : "sandbox",
                  inner_->config.gateway_endpoint().to_string());
}

ApnsClient::~ApnsClient() {
    if (inner_ && !inner_->closed.load()) {
        auto abandoned = close();
        if (!abandoned.empty()) {
            APNS_LOG_WARN("client destroyed with {} unsent notifications", abandoned.size());
        }
    }
}

ApnsClient::ApnsClient(ApnsClient&&) noexcept = default;
ApnsClient& ApnsClient::operator=(ApnsClient&&) noexcept = default;

uint32_t ApnsClient::send(const Message& message) {
    std::shared_lock<std::shared_mutex> lock(inner_->close_mutex);
    if (inner_->closed.load()) {
        throw ApnsError::closed();
    }
    auto count = static_cast<uint32_t>(message.size());
    uint32_t first = inner_->next_identifier.fetch_add(count);
    for (auto& notification : message.notifications(first)) {
        APNS_LOG_TRACE("queueing notification {} for {}",
                       notification.identifier, notification.token_hex());
        inner_->queue.enqueue(std::move(notification));
    }
    return first;
}

uint32_t ApnsClient::send_aps(const std::vector<std::string>& tokens, const Aps& aps,
                              Priority priority) {
    return send(Message(tokens, aps, std::nullopt, priority));
}

void ApnsClient::flush() {
    if (inner_->closed.load()) return;
    inner_->queue.drain();
}

bool ApnsClient::flush_for(std::chrono::milliseconds timeout) {
    if (inner_->closed.load()) return inner_->queue.unfinished() == 0;
    return inner_->queue.drain_for(timeout);
}

std::vector<Notification> ApnsClient::close() {
    return close(inner_->config.close_timeout());
}

std::vector<Notification> ApnsClient::close(std::chrono::milliseconds timeout) {
    {
        // Waits out sends already in progress; later ones see `closed`.
        std::unique_lock<std::shared_mutex> lock(inner_->close_mutex);
        if (inner_->closed.exchange(true)) {
            return {};
        }
    }
    return inner_->backend->stop(timeout);
}

size_t ApnsClient::fetch_feedback(const FeedbackCallback& callback) {
    auto transport = inner_->transports(inner_->config.feedback_endpoint());
    if (!transport) {
        throw ApnsError::network("transport factory returned no transport");
    }
    FeedbackReader reader(std::move(transport), inner_->config.on_error());
    return reader.run(callback);
}

size_t ApnsClient::pending() const {
    return inner_->queue.size();
}

const ApnsConfig& ApnsClient::config() const noexcept {
    return inner_->config;
}

} // namespace apns
