// include/apns/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "error.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace apns {

class ApnsConfigBuilder;

// Configuration for an ApnsClient.
//
// Callbacks are invoked from library worker threads, never from the thread
// that called send(). They must be thread-safe and should return quickly;
// a slow callback stalls the connection that raised it.
class ApnsConfig {
public:
    // Connection-level diagnostics and fatal conditions (repeated connect
    // failures, malformed frames, errors naming an unknown identifier).
    using ErrorCallback = std::function<void(const ApnsError&)>;

    // Permanent per-notification failures. Called exactly once per rejected
    // notification; never for conditions that are retried.
    using DeliveryErrorCallback = std::function<void(const DeliveryError&)>;

    static ApnsConfigBuilder builder(const std::string& cert_path, const std::string& key_path);

    static ApnsConfig production(const std::string& cert_path, const std::string& key_path);
    static ApnsConfig sandbox(const std::string& cert_path, const std::string& key_path);

    Environment environment() const noexcept { return environment_; }
    const std::string& cert_path() const noexcept { return cert_path_; }
    const std::string& key_path() const noexcept { return key_path_; }
    const std::string& ca_path() const noexcept { return ca_path_; }
    bool verify_peer() const noexcept { return verify_peer_; }
    const Endpoint& gateway_endpoint() const noexcept { return gateway_endpoint_; }
    const Endpoint& feedback_endpoint() const noexcept { return feedback_endpoint_; }
    size_t connections() const noexcept { return connections_; }
    std::chrono::milliseconds grace_period() const noexcept { return grace_period_; }
    size_t replay_capacity() const noexcept { return replay_capacity_; }
    std::chrono::milliseconds reconnect_delay() const noexcept { return reconnect_delay_; }
    std::chrono::milliseconds max_reconnect_delay() const noexcept { return max_reconnect_delay_; }
    uint32_t connect_failure_threshold() const noexcept { return connect_failure_threshold_; }
    std::chrono::milliseconds close_timeout() const noexcept { return close_timeout_; }
    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }
    LogLevel log_level() const noexcept { return log_level_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }
    const DeliveryErrorCallback& on_delivery_error() const noexcept { return on_delivery_error_; }
    const TransportFactory& transport_factory() const noexcept { return transport_factory_; }

private:
    friend class ApnsConfigBuilder;

    Environment environment_ = Environment::Production;
    std::string cert_path_;
    std::string key_path_;
    std::string ca_path_;
    bool verify_peer_ = true;
    Endpoint gateway_endpoint_;
    Endpoint feedback_endpoint_;
    size_t connections_ = 1;
    std::chrono::milliseconds grace_period_{5000};
    size_t replay_capacity_ = 10000;
    std::chrono::milliseconds reconnect_delay_{1000};
    std::chrono::milliseconds max_reconnect_delay_{30000};
    uint32_t connect_failure_threshold_ = 5;
    std::chrono::milliseconds close_timeout_{10000};
    std::chrono::milliseconds network_timeout_{30000};
    LogLevel log_level_ = LogLevel::Warn;
    ErrorCallback on_error_;
    DeliveryErrorCallback on_delivery_error_;
    TransportFactory transport_factory_;
};

// Fluent builder for ApnsConfig.
class ApnsConfigBuilder {
public:
    ApnsConfigBuilder(const std::string& cert_path, const std::string& key_path);

    // Selects the default gateway and feedback hosts.
    ApnsConfigBuilder& environment(Environment environment);
    // Override the gateway ("host:port"), e.g. for a local test server.
    ApnsConfigBuilder& gateway_endpoint(std::string endpoint);
    ApnsConfigBuilder& feedback_endpoint(std::string endpoint);
    // PEM bundle of trust anchors; empty uses the system store.
    ApnsConfigBuilder& ca_path(std::string path);
    ApnsConfigBuilder& verify_peer(bool verify);
    // Number of simultaneous gateway connections. With more than one,
    // notifications are spread across connections and no global send order
    // is guaranteed; replayed notifications still go before fresh ones.
    ApnsConfigBuilder& connections(size_t count);
    // How long a written notification must go without an error frame before
    // it is presumed delivered.
    ApnsConfigBuilder& grace_period(std::chrono::milliseconds grace);
    // Upper bound on notifications awaiting their grace period per connection.
    ApnsConfigBuilder& replay_capacity(size_t capacity);
    ApnsConfigBuilder& reconnect_delay(std::chrono::milliseconds delay);
    ApnsConfigBuilder& max_reconnect_delay(std::chrono::milliseconds delay);
    // Consecutive connect failures before on_error hears about it; 0 never.
    ApnsConfigBuilder& connect_failure_threshold(uint32_t failures);
    ApnsConfigBuilder& close_timeout(std::chrono::milliseconds timeout);
    ApnsConfigBuilder& network_timeout(std::chrono::milliseconds timeout);
    ApnsConfigBuilder& log_level(LogLevel level);
    ApnsConfigBuilder& on_error(ApnsConfig::ErrorCallback callback);
    ApnsConfigBuilder& on_delivery_error(ApnsConfig::DeliveryErrorCallback callback);
    // Replace the TLS transport (tests, proxies). Credentials are not loaded
    // when a factory is supplied.
    ApnsConfigBuilder& transport_factory(TransportFactory factory);

    // Build the config. Throws ApnsError on invalid settings.
    ApnsConfig build() const;

private:
    ApnsConfig config_;
    std::string gateway_override_;
    std::string feedback_override_;
};

} // namespace apns
