// src/codec.hpp
// Binary frame codec for the APNs gateway and feedback protocols.
// Pure encode/decode, no I/O. All multi-byte fields are big-endian.

#pragma once

#include "apns/error.hpp"
#include "apns/types.hpp"
#include "validation.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace apns {
namespace codec {

static constexpr uint8_t COMMAND_NOTIFICATION = 2;
static constexpr uint8_t COMMAND_ERROR = 8;

static constexpr uint8_t ITEM_TOKEN = 1;
static constexpr uint8_t ITEM_PAYLOAD = 2;
static constexpr uint8_t ITEM_IDENTIFIER = 3;
static constexpr uint8_t ITEM_EXPIRATION = 4;
static constexpr uint8_t ITEM_PRIORITY = 5;

static constexpr size_t FRAME_HEADER_LENGTH = 5;    // command(1) + length(4)
static constexpr size_t ITEM_HEADER_LENGTH = 3;     // id(1) + length(2)
static constexpr size_t ERROR_FRAME_LENGTH = 6;     // command(1) + status(1) + identifier(4)
static constexpr size_t FEEDBACK_HEADER_LENGTH = 6; // time(4) + token length(2)

// Largest item section a valid notification can produce.
static constexpr size_t MAX_FRAME_LENGTH =
    5 * ITEM_HEADER_LENGTH + validation::MAX_TOKEN_LENGTH +
    validation::MAX_PAYLOAD_LENGTH + 4 + 4 + 1;

// --- Helpers ---

inline void write_u16(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void write_u32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 24));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void patch_u32(std::vector<uint8_t>& buf, size_t pos, uint32_t value) {
    buf[pos]     = static_cast<uint8_t>(value >> 24);
    buf[pos + 1] = static_cast<uint8_t>(value >> 16);
    buf[pos + 2] = static_cast<uint8_t>(value >> 8);
    buf[pos + 3] = static_cast<uint8_t>(value);
}

// Write [id][u16 length][data].
inline void write_item(std::vector<uint8_t>& buf, uint8_t item_id,
                       const uint8_t* data, size_t len) {
    buf.push_back(item_id);
    write_u16(buf, static_cast<uint16_t>(len));
    if (data && len > 0) buf.insert(buf.end(), data, data + len);
}

// --- Notification frames (command 2) ---

// Append the item-framed encoding of `n` to buf.
// Throws ApnsError (Encode) when a field exceeds protocol limits; buf is
// left untouched in that case.
inline void encode_notification_into(std::vector<uint8_t>& buf, const Notification& n) {
    if (!validation::check_token(n.token)) {
        throw ApnsError::encode("token must be 1-255 bytes, got " +
                                std::to_string(n.token.size()));
    }
    if (n.payload.empty()) {
        throw ApnsError::encode("payload is empty");
    }
    if (n.payload.size() > validation::MAX_PAYLOAD_LENGTH) {
        throw ApnsError::encode("payload must be at most 2048 bytes, got " +
                                std::to_string(n.payload.size()));
    }

    size_t items_len = 5 * ITEM_HEADER_LENGTH + n.token.size() + n.payload.size() + 4 + 4 + 1;
    if (items_len > MAX_FRAME_LENGTH) {
        throw ApnsError::encode("frame exceeds " + std::to_string(MAX_FRAME_LENGTH) + " bytes");
    }

    buf.reserve(buf.size() + FRAME_HEADER_LENGTH + items_len);
    buf.push_back(COMMAND_NOTIFICATION);
    size_t length_pos = buf.size();
    write_u32(buf, 0);
    size_t items_start = buf.size();

    write_item(buf, ITEM_TOKEN, n.token.data(), n.token.size());
    write_item(buf, ITEM_PAYLOAD, n.payload.data(), n.payload.size());

    buf.push_back(ITEM_IDENTIFIER);
    write_u16(buf, 4);
    write_u32(buf, n.identifier);

    buf.push_back(ITEM_EXPIRATION);
    write_u16(buf, 4);
    write_u32(buf, n.expiration);

    buf.push_back(ITEM_PRIORITY);
    write_u16(buf, 1);
    buf.push_back(static_cast<uint8_t>(n.priority));

    patch_u32(buf, length_pos, static_cast<uint32_t>(buf.size() - items_start));
}

inline std::vector<uint8_t> encode_notification(const Notification& n) {
    std::vector<uint8_t> buf;
    encode_notification_into(buf, n);
    return buf;
}

// Parse one notification frame from the head of data. Returns the number of
// bytes consumed, or 0 if data does not yet hold a complete frame.
// Throws ApnsError (MalformedFrame) on a bad command or item layout.
inline size_t decode_notification(const uint8_t* data, size_t len, Notification& out) {
    if (len < FRAME_HEADER_LENGTH) return 0;
    if (data[0] != COMMAND_NOTIFICATION) {
        throw ApnsError::malformed_frame("unexpected command " + std::to_string(data[0]));
    }
    uint32_t items_len = read_u32(data + 1);
    if (len < FRAME_HEADER_LENGTH + items_len) return 0;

    Notification n;
    const uint8_t* p = data + FRAME_HEADER_LENGTH;
    const uint8_t* end = p + items_len;
    while (p < end) {
        if (static_cast<size_t>(end - p) < ITEM_HEADER_LENGTH) {
            throw ApnsError::malformed_frame("truncated item header");
        }
        uint8_t item_id = p[0];
        uint16_t item_len = read_u16(p + 1);
        p += ITEM_HEADER_LENGTH;
        if (static_cast<size_t>(end - p) < item_len) {
            throw ApnsError::malformed_frame("truncated item " + std::to_string(item_id));
        }
        switch (item_id) {
            case ITEM_TOKEN:
                n.token.assign(p, p + item_len);
                break;
            case ITEM_PAYLOAD:
                n.payload.assign(p, p + item_len);
                break;
            case ITEM_IDENTIFIER:
                if (item_len != 4) throw ApnsError::malformed_frame("identifier must be 4 bytes");
                n.identifier = read_u32(p);
                break;
            case ITEM_EXPIRATION:
                if (item_len != 4) throw ApnsError::malformed_frame("expiration must be 4 bytes");
                n.expiration = read_u32(p);
                break;
            case ITEM_PRIORITY:
                if (item_len != 1) throw ApnsError::malformed_frame("priority must be 1 byte");
                n.priority = static_cast<Priority>(p[0]);
                break;
            default:
                throw ApnsError::malformed_frame("unknown item id " + std::to_string(item_id));
        }
        p += item_len;
    }

    out = std::move(n);
    return FRAME_HEADER_LENGTH + items_len;
}

// --- Error frames (command 8) ---

struct ErrorFrame {
    uint8_t status = 0;
    uint32_t identifier = 0;
};

inline ErrorFrame decode_error(const uint8_t* data, size_t len) {
    if (len < ERROR_FRAME_LENGTH) {
        throw ApnsError::malformed_frame("error frame needs 6 bytes, got " + std::to_string(len));
    }
    if (data[0] != COMMAND_ERROR) {
        throw ApnsError::malformed_frame("expected command 8, got " + std::to_string(data[0]));
    }
    ErrorFrame frame;
    frame.status = data[1];
    frame.identifier = read_u32(data + 2);
    return frame;
}

inline std::vector<uint8_t> encode_error(uint8_t status, uint32_t identifier) {
    std::vector<uint8_t> buf;
    buf.reserve(ERROR_FRAME_LENGTH);
    buf.push_back(COMMAND_ERROR);
    buf.push_back(status);
    write_u32(buf, identifier);
    return buf;
}

// --- Feedback stream ---

// Incremental decoder for the feedback stream. Bytes are fed as they arrive
// from the socket; next() yields each complete tuple in stream order.
class FeedbackDecoder {
public:
    void feed(const uint8_t* data, size_t len) {
        if (pos_ > 0 && pos_ >= buf_.size() / 2) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
            pos_ = 0;
        }
        buf_.insert(buf_.end(), data, data + len);
    }

    std::optional<Feedback> next() {
        size_t avail = buf_.size() - pos_;
        if (avail < FEEDBACK_HEADER_LENGTH) return std::nullopt;

        const uint8_t* p = buf_.data() + pos_;
        uint32_t timestamp = read_u32(p);
        uint16_t token_len = read_u16(p + 4);
        if (avail < FEEDBACK_HEADER_LENGTH + token_len) return std::nullopt;

        Feedback fb;
        fb.token.assign(p + FEEDBACK_HEADER_LENGTH, p + FEEDBACK_HEADER_LENGTH + token_len);
        fb.when = std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
        pos_ += FEEDBACK_HEADER_LENGTH + token_len;
        return fb;
    }

    // Bytes buffered that do not yet form a complete record.
    size_t remainder() const noexcept { return buf_.size() - pos_; }

private:
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

// Decode a complete feedback stream. Throws ApnsError (MalformedFrame) if
// the input ends inside a record.
inline std::vector<Feedback> decode_feedback(const uint8_t* data, size_t len) {
    FeedbackDecoder decoder;
    decoder.feed(data, len);

    std::vector<Feedback> out;
    while (auto fb = decoder.next()) {
        out.push_back(std::move(*fb));
    }
    if (decoder.remainder() != 0) {
        throw ApnsError::malformed_frame("feedback stream ends with " +
                                         std::to_string(decoder.remainder()) +
                                         " trailing bytes");
    }
    return out;
}

inline void encode_feedback_into(std::vector<uint8_t>& buf, uint32_t timestamp,
                                 const std::vector<uint8_t>& token) {
    write_u32(buf, timestamp);
    write_u16(buf, static_cast<uint16_t>(token.size()));
    buf.insert(buf.end(), token.begin(), token.end());
}

} // namespace codec
} // namespace apns
