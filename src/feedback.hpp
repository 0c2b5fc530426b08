// src/feedback.hpp
// One-shot reader for the feedback service.

#pragma once

#include "apns/error.hpp"
#include "apns/transport.hpp"
#include "apns/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>

namespace apns {

// Connects, streams every (timestamp, token) record until the server closes
// the connection, then closes its side. Single use.
class FeedbackReader {
public:
    using Callback = std::function<void(const Feedback&)>;
    using ErrorHandler = std::function<void(const ApnsError&)>;

    explicit FeedbackReader(std::unique_ptr<Transport> transport, ErrorHandler on_error = nullptr);
    ~FeedbackReader();

    FeedbackReader(const FeedbackReader&) = delete;
    FeedbackReader& operator=(const FeedbackReader&) = delete;

    // Invoke `callback` once per record, in stream order, on the calling
    // thread. Returns the number of records delivered. An empty feed is not
    // an error. Throws ApnsError (Network/Tls) if the connection fails;
    // exceptions thrown by `callback` propagate after the connection closes.
    size_t run(const Callback& callback);

private:
    std::unique_ptr<Transport> transport_;
    ErrorHandler on_error_;
};

} // namespace apns
