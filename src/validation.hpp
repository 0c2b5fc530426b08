// src/validation.hpp
// Internal input validation and hex helpers.

#pragma once

#include "apns/error.hpp"
#include "apns/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace apns {
namespace validation {

static constexpr size_t MAX_TOKEN_LENGTH = 255;
static constexpr size_t MAX_PAYLOAD_LENGTH = 2048;

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decode a hex-encoded device token. Throws ApnsError on odd length,
// non-hex characters or a decoded size outside 1..255 bytes.
inline std::vector<uint8_t> decode_hex_token(const std::string& hex) {
    if (hex.empty()) {
        throw ApnsError::validation("token", "is required");
    }
    if (hex.size() % 2 != 0) {
        throw ApnsError::validation("token", "must have an even number of hex digits");
    }
    if (hex.size() / 2 > MAX_TOKEN_LENGTH) {
        throw ApnsError::validation("token", "must be at most 255 bytes");
    }

    std::vector<uint8_t> bytes(hex.size() / 2);
    for (size_t i = 0; i < bytes.size(); i++) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw ApnsError::validation("token",
                std::string("contains non-hex character '") + hex[hi < 0 ? i*2 : i*2+1] + "'");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return bytes;
}

inline std::string encode_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline bool check_token(const std::vector<uint8_t>& token) {
    return !token.empty() && token.size() <= MAX_TOKEN_LENGTH;
}

// Payload must be present and at most 2KB once serialized.
inline bool check_payload(const std::string& payload) {
    return !payload.empty() && payload.size() <= MAX_PAYLOAD_LENGTH;
}

inline bool check_priority(Priority priority) {
    return priority == Priority::Immediate || priority == Priority::ConservePower;
}

} // namespace validation
} // namespace apns
