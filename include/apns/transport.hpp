// include/apns/transport.hpp
// Byte-stream transport seam between the protocol engine and the network.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace apns {

// A host:port pair.
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    // Parse "host:port". Throws ApnsError (Configuration) on bad input.
    static Endpoint parse(const std::string& endpoint);

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

// One connection to a gateway or feedback server.
//
// A transport is used by at most one reader thread and one writer thread at
// the same time; close() may be called from any thread and unblocks both.
// Once closed, a transport is never reopened; a new one is created per
// connection attempt.
class Transport {
public:
    virtual ~Transport() = default;

    // Open the connection and complete the TLS handshake.
    // Throws ApnsError (Network or Tls).
    virtual void connect() = 0;

    // Write the whole buffer. Returns false on failure or after close().
    virtual bool write_all(const uint8_t* data, size_t len) = 0;

    // Block until at least one byte is available and read up to `cap` bytes.
    // Returns 0 on orderly close, failure, or after close().
    virtual size_t read_some(uint8_t* buf, size_t cap) = 0;

    // Close the connection. Idempotent.
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const Endpoint&)>;

} // namespace apns
