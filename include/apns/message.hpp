// include/apns/message.hpp
// User-facing message: one payload addressed to one or more devices.

#pragma once

#include "aps.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apns {

// A payload addressed to a list of hex-encoded device tokens. Expands to
// one Notification per token, all sharing payload, expiration and priority.
//
// The constructor validates everything the gateway would reject for size
// or shape and throws ApnsError (Validation) instead.
class Message {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    Message(const std::vector<std::string>& tokens, std::string payload,
            std::optional<TimePoint> expiration = std::nullopt,
            Priority priority = Priority::Immediate);

    Message(const std::vector<std::string>& tokens, const Aps& aps,
            std::optional<TimePoint> expiration = std::nullopt,
            Priority priority = Priority::Immediate);

    // Build the notifications, numbering them from `first_identifier`
    // (wrapping at 2^32).
    std::vector<Notification> notifications(uint32_t first_identifier) const;

    size_t size() const noexcept { return tokens_.size(); }
    const std::vector<std::vector<uint8_t>>& tokens() const noexcept { return tokens_; }
    const std::string& payload() const noexcept { return payload_; }
    // Epoch seconds; 0 means deliver now or never.
    uint32_t expiration() const noexcept { return expiration_; }
    Priority priority() const noexcept { return priority_; }

private:
    std::vector<std::vector<uint8_t>> tokens_;
    std::string payload_;
    uint32_t expiration_ = 0;
    Priority priority_ = Priority::Immediate;
};

} // namespace apns
