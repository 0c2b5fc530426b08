// src/message.cpp
// Message validation and expansion into notifications.

#include "apns/message.hpp"
#include "apns/error.hpp"
#include "validation.hpp"

#include <limits>

namespace apns {

namespace {

uint32_t encode_expiration(const std::optional<Message::TimePoint>& expiration) {
    if (!expiration) return 0;
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        expiration->time_since_epoch()).count();
    if (seconds <= 0) {
        throw ApnsError::validation("expiration", "must be after the epoch");
    }
    if (seconds > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ApnsError::validation("expiration", "must fit in 32-bit epoch seconds");
    }
    return static_cast<uint32_t>(seconds);
}

} // namespace

Message::Message(const std::vector<std::string>& tokens, std::string payload,
                 std::optional<TimePoint> expiration, Priority priority)
    : payload_(std::move(payload)), expiration_(encode_expiration(expiration)),
      priority_(priority) {
    if (tokens.empty()) {
        throw ApnsError::validation("tokens", "must not be empty");
    }
    if (!validation::check_payload(payload_)) {
        throw ApnsError::validation("payload",
            "must be 1.." + std::to_string(validation::MAX_PAYLOAD_LENGTH) +
            " bytes, got " + std::to_string(payload_.size()));
    }
    if (!validation::check_priority(priority_)) {
        throw ApnsError::validation("priority", "must be 5 or 10");
    }
    tokens_.reserve(tokens.size());
    for (const auto& hex : tokens) {
        tokens_.push_back(validation::decode_hex_token(hex));
    }
}

Message::Message(const std::vector<std::string>& tokens, const Aps& aps,
                 std::optional<TimePoint> expiration, Priority priority)
    : Message(tokens, aps.to_json(), expiration, priority) {}

std::vector<Notification> Message::notifications(uint32_t first_identifier) const {
    auto now = std::chrono::system_clock::now();
    std::vector<uint8_t> payload(payload_.begin(), payload_.end());

    std::vector<Notification> out;
    out.reserve(tokens_.size());
    uint32_t identifier = first_identifier;
    for (const auto& token : tokens_) {
        Notification n;
        n.identifier = identifier++;
        n.token = token;
        n.payload = payload;
        n.expiration = expiration_;
        n.priority = priority_;
        n.enqueued_at = now;
        out.push_back(std::move(n));
    }
    return out;
}

} // namespace apns
