// src/types.cpp
// Status byte taxonomy and value-type helpers.

#include "apns/types.hpp"
#include "validation.hpp"

namespace apns {

ProtocolError classify_status(uint8_t status) noexcept {
    switch (status) {
        case 1: return ProtocolError::Processing;
        case 2: return ProtocolError::MissingToken;
        case 3: return ProtocolError::MissingTopic;
        case 4: return ProtocolError::MissingPayload;
        case 5: return ProtocolError::InvalidTokenSize;
        case 6: return ProtocolError::InvalidTopicSize;
        case 7: return ProtocolError::InvalidPayloadSize;
        case 8: return ProtocolError::InvalidToken;
        default: return ProtocolError::Unknown;
    }
}

const char* describe(ProtocolError error) noexcept {
    switch (error) {
        case ProtocolError::Processing:         return "Processing error";
        case ProtocolError::MissingToken:       return "Missing device token";
        case ProtocolError::MissingTopic:       return "Missing topic";
        case ProtocolError::MissingPayload:     return "Missing payload";
        case ProtocolError::InvalidTokenSize:   return "Invalid token size";
        case ProtocolError::InvalidTopicSize:   return "Invalid topic size";
        case ProtocolError::InvalidPayloadSize: return "Invalid payload size";
        case ProtocolError::InvalidToken:       return "Invalid token";
        case ProtocolError::Unknown:            break;
    }
    return "Unknown";
}

std::string Notification::token_hex() const {
    return validation::encode_hex(token.data(), token.size());
}

std::string Feedback::token_hex() const {
    return validation::encode_hex(token.data(), token.size());
}

std::string DeliveryError::to_string() const {
    return "APNs error " + std::to_string(status) + ": " + description();
}

} // namespace apns
