// include/apns/error.hpp
// Library error type — single exception class with a kind enum.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace apns {

enum class ErrorKind {
    Configuration,   // Invalid config or credentials at construction
    Validation,      // Bad message input, rejected before enqueue
    Encode,          // Notification exceeds protocol limits
    MalformedFrame,  // Truncated or unrecognized inbound frame
    Network,         // TCP connect/read/write failure (retried)
    Tls,             // Handshake or TLS-level failure (retried)
    Protocol,        // Error frame that names no known notification
    Closed,          // Client already closed
    Io               // System I/O error
};

class ApnsError : public std::exception {
public:
    ApnsError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    ApnsError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("validation error: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    static ApnsError configuration(std::string msg) {
        return ApnsError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static ApnsError validation(std::string field, std::string reason) {
        return ApnsError(ErrorKind::Validation, field, reason);
    }

    static ApnsError encode(std::string msg) {
        return ApnsError(ErrorKind::Encode, "encode error: " + msg);
    }

    static ApnsError malformed_frame(std::string msg) {
        return ApnsError(ErrorKind::MalformedFrame, "malformed frame: " + msg);
    }

    static ApnsError network(std::string msg) {
        return ApnsError(ErrorKind::Network, "network error: " + msg);
    }

    static ApnsError tls(std::string msg) {
        return ApnsError(ErrorKind::Tls, "tls error: " + msg);
    }

    static ApnsError protocol(uint8_t status, uint32_t identifier) {
        return ApnsError(ErrorKind::Protocol,
            "protocol error: status " + std::to_string(status) +
            " for unknown identifier " + std::to_string(identifier));
    }

    static ApnsError closed() {
        return ApnsError(ErrorKind::Closed, "client is closed");
    }

    static ApnsError io(std::string msg) {
        return ApnsError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
};

} // namespace apns
