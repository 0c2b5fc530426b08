// src/feedback.cpp
// Feedback reader implementation.

#include "feedback.hpp"

#include "codec.hpp"
#include "logging.hpp"

namespace apns {

namespace {

constexpr size_t READ_CHUNK = 4096;

} // namespace

FeedbackReader::FeedbackReader(std::unique_ptr<Transport> transport, ErrorHandler on_error)
    : transport_(std::move(transport)), on_error_(std::move(on_error)) {}

FeedbackReader::~FeedbackReader() {
    transport_->close();
}

size_t FeedbackReader::run(const Callback& callback) {
    transport_->connect();

    codec::FeedbackDecoder decoder;
    uint8_t chunk[READ_CHUNK];
    size_t delivered = 0;

    for (;;) {
        size_t n = transport_->read_some(chunk, sizeof(chunk));
        if (n == 0) break;
        decoder.feed(chunk, n);
        while (auto feedback = decoder.next()) {
            callback(*feedback);
            delivered++;
        }
    }
    transport_->close();

    if (decoder.remainder() != 0) {
        auto error = ApnsError::malformed_frame(
            "feedback stream ended with " + std::to_string(decoder.remainder()) +
            " trailing bytes");
        APNS_LOG_WARN("{}", error.what());
        if (on_error_) on_error_(error);
    }

    APNS_LOG_DEBUG("feedback: {} record(s) received", delivered);
    return delivered;
}

} // namespace apns
