// include/apns/types.hpp
// Core value types: notifications, protocol errors, feedback tuples.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apns {

// APNs environment; selects the default gateway and feedback hosts.
enum class Environment : uint8_t {
    Production = 0,
    Sandbox    = 1,
};

// Delivery priority (item 5 of the notification frame).
enum class Priority : uint8_t {
    ConservePower = 5,
    Immediate     = 10,
};

// Library log verbosity.
enum class LogLevel : uint8_t {
    Off   = 0,
    Error = 1,
    Warn  = 2,
    Info  = 3,
    Debug = 4,
    Trace = 5,
};

// Protocol status codes reported in error frames (command 8).
//
// Every status byte maps to exactly one value; bytes outside the table map
// to Unknown so that new server codes never break decoding.
enum class ProtocolError : uint8_t {
    Processing         = 1,
    MissingToken       = 2,
    MissingTopic       = 3,
    MissingPayload     = 4,
    InvalidTokenSize   = 5,
    InvalidTopicSize   = 6,
    InvalidPayloadSize = 7,
    InvalidToken       = 8,
    Unknown            = 255,
};

// Map a raw status byte to its ProtocolError.
ProtocolError classify_status(uint8_t status) noexcept;

// Human-readable description, e.g. "Invalid token".
const char* describe(ProtocolError error) noexcept;

// Status 10: the server is shutting the connection down. The accompanying
// identifier is the last notification it processed successfully.
static constexpr uint8_t STATUS_SHUTDOWN = 10;

// A single token-targeted notification ready for the wire.
struct Notification {
    uint32_t identifier = 0;
    std::vector<uint8_t> token;
    std::vector<uint8_t> payload;
    uint32_t expiration = 0;  // epoch seconds; 0 = do not store
    Priority priority = Priority::Immediate;
    std::chrono::system_clock::time_point enqueued_at{};

    // Lowercase hex rendering of the token.
    std::string token_hex() const;
};

// A permanent failure reported by the gateway for one notification.
struct DeliveryError {
    ProtocolError error = ProtocolError::Unknown;
    uint8_t status = 0;
    uint32_t identifier = 0;
    std::optional<Notification> notification;

    const char* description() const noexcept { return describe(error); }

    // "APNs error 8: Invalid token"
    std::string to_string() const;
};

// A record from the feedback service: the device behind `token` stopped
// accepting notifications at `when`.
struct Feedback {
    std::vector<uint8_t> token;
    std::chrono::system_clock::time_point when{};

    std::string token_hex() const;
};

} // namespace apns
