// include/apns/client.hpp
// APNs client — queueing façade over the protocol engine.

#pragma once

#include "aps.hpp"
#include "backend.hpp"
#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace apns {

// The APNs client.
//
// Created via ApnsClient::create(config). Ready to use immediately: the
// backend starts its connection workers at construction and connects
// lazily once the first notification is queued. The caller owns the client;
// there is no global instance.
//
// Example:
//   auto client = ApnsClient::create(ApnsConfig::sandbox("cert.pem", "key.pem"));
//   client->send_aps({"1ba97ad1..."}, Aps().alert("Hello").badge(1));
//   client->flush();
//   auto unsent = client->close();
class ApnsClient {
public:
    using FeedbackCallback = std::function<void(const Feedback&)>;

    // Create a client backed by the default threaded backend.
    // Throws ApnsError on invalid configuration or unreadable credentials.
    static std::unique_ptr<ApnsClient> create(ApnsConfig config);

    // Create a client with a caller-chosen backend.
    static std::unique_ptr<ApnsClient> create(ApnsConfig config, BackendFactory backend);

    ~ApnsClient();

    ApnsClient(const ApnsClient&) = delete;
    ApnsClient& operator=(const ApnsClient&) = delete;
    ApnsClient(ApnsClient&&) noexcept;
    ApnsClient& operator=(ApnsClient&&) noexcept;

    // --- Sending ---

    // Queue one notification per token of `message`. Never blocks on the
    // network. Returns the identifier assigned to the first token; the rest
    // follow consecutively. Throws ApnsError (Closed) after close().
    uint32_t send(const Message& message);

    // Convenience for a standard "aps" payload. Throws ApnsError
    // (Validation) on bad tokens or an oversize payload.
    uint32_t send_aps(const std::vector<std::string>& tokens, const Aps& aps,
                      Priority priority = Priority::Immediate);

    // --- Lifecycle ---

    // Block until every notification queued so far has been written to a
    // gateway connection (replays included).
    void flush();

    // Bounded flush(). Returns true if everything was written in time.
    bool flush_for(std::chrono::milliseconds timeout);

    // Stop the backend, waiting up to close_timeout for queued notifications
    // to be sent and settled. Returns whatever could not be sent.
    std::vector<Notification> close();
    std::vector<Notification> close(std::chrono::milliseconds timeout);

    // --- Feedback ---

    // Connect to the feedback service and deliver every record on the
    // calling thread. Returns the number of records. Throws ApnsError
    // (Network/Tls) if the service cannot be reached.
    size_t fetch_feedback(const FeedbackCallback& callback);

    // Notifications queued but not yet handed to a connection.
    size_t pending() const;

    const ApnsConfig& config() const noexcept;

private:
    ApnsClient(ApnsConfig config, BackendFactory backend);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace apns
