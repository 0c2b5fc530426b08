// src/config.cpp
// Configuration builder and presets.

#include "apns/config.hpp"

namespace apns {

namespace {

constexpr uint16_t GATEWAY_PORT = 2195;
constexpr uint16_t FEEDBACK_PORT = 2196;

Endpoint default_gateway(Environment environment) {
    Endpoint e;
    e.host = environment == Environment::Production
        ? "gateway.push.apple.com"
        : "gateway.sandbox.push.apple.com";
    e.port = GATEWAY_PORT;
    return e;
}

Endpoint default_feedback(Environment environment) {
    Endpoint e;
    e.host = environment == Environment::Production
        ? "feedback.push.apple.com"
        : "feedback.sandbox.push.apple.com";
    e.port = FEEDBACK_PORT;
    return e;
}

} // namespace

// --- ApnsConfig presets ---

ApnsConfigBuilder ApnsConfig::builder(const std::string& cert_path, const std::string& key_path) {
    return ApnsConfigBuilder(cert_path, key_path);
}

ApnsConfig ApnsConfig::production(const std::string& cert_path, const std::string& key_path) {
    return ApnsConfig::builder(cert_path, key_path).build();
}

ApnsConfig ApnsConfig::sandbox(const std::string& cert_path, const std::string& key_path) {
    return ApnsConfig::builder(cert_path, key_path)
        .environment(Environment::Sandbox)
        .log_level(LogLevel::Info)
        .build();
}

// --- ApnsConfigBuilder ---

ApnsConfigBuilder::ApnsConfigBuilder(const std::string& cert_path, const std::string& key_path) {
    config_.cert_path_ = cert_path;
    config_.key_path_ = key_path;
}

ApnsConfigBuilder& ApnsConfigBuilder::environment(Environment environment) {
    config_.environment_ = environment;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::gateway_endpoint(std::string endpoint) {
    gateway_override_ = std::move(endpoint);
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::feedback_endpoint(std::string endpoint) {
    feedback_override_ = std::move(endpoint);
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::ca_path(std::string path) {
    config_.ca_path_ = std::move(path);
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::verify_peer(bool verify) {
    config_.verify_peer_ = verify;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::connections(size_t count) {
    config_.connections_ = count;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::grace_period(std::chrono::milliseconds grace) {
    config_.grace_period_ = grace;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::replay_capacity(size_t capacity) {
    config_.replay_capacity_ = capacity;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::reconnect_delay(std::chrono::milliseconds delay) {
    config_.reconnect_delay_ = delay;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::max_reconnect_delay(std::chrono::milliseconds delay) {
    config_.max_reconnect_delay_ = delay;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::connect_failure_threshold(uint32_t failures) {
    config_.connect_failure_threshold_ = failures;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::close_timeout(std::chrono::milliseconds timeout) {
    config_.close_timeout_ = timeout;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::log_level(LogLevel level) {
    config_.log_level_ = level;
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::on_error(ApnsConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::on_delivery_error(ApnsConfig::DeliveryErrorCallback callback) {
    config_.on_delivery_error_ = std::move(callback);
    return *this;
}

ApnsConfigBuilder& ApnsConfigBuilder::transport_factory(TransportFactory factory) {
    config_.transport_factory_ = std::move(factory);
    return *this;
}

ApnsConfig ApnsConfigBuilder::build() const {
    if (!config_.transport_factory_) {
        if (config_.cert_path_.empty()) {
            throw ApnsError::configuration("certificate path is required");
        }
        if (config_.key_path_.empty()) {
            throw ApnsError::configuration("key path is required");
        }
    }
    if (config_.connections_ == 0) {
        throw ApnsError::configuration("connections must be at least 1");
    }
    if (config_.replay_capacity_ == 0) {
        throw ApnsError::configuration("replay capacity must be at least 1");
    }
    if (config_.grace_period_.count() <= 0) {
        throw ApnsError::configuration("grace period must be positive");
    }
    if (config_.reconnect_delay_.count() < 0 ||
        config_.max_reconnect_delay_ < config_.reconnect_delay_) {
        throw ApnsError::configuration("reconnect delays must satisfy 0 <= delay <= max delay");
    }

    ApnsConfig result = config_;
    result.gateway_endpoint_ = gateway_override_.empty()
        ? default_gateway(config_.environment_)
        : Endpoint::parse(gateway_override_);
    result.feedback_endpoint_ = feedback_override_.empty()
        ? default_feedback(config_.environment_)
        : Endpoint::parse(feedback_override_);
    return result;
}

} // namespace apns
