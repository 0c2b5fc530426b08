// src/transport.hpp
// TLS transport over a POSIX TCP socket (OpenSSL).

#pragma once

#include "apns/error.hpp"
#include "apns/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/ssl.h>

namespace apns {

// Client credentials and trust anchors, loaded once and shared read-only by
// every connection.
class TlsContext {
public:
    // Load the PEM certificate and key. An empty `ca_path` uses the system
    // trust store. Throws ApnsError (Configuration) if anything fails to load.
    static std::shared_ptr<TlsContext> create(const std::string& cert_path,
                                              const std::string& key_path,
                                              const std::string& ca_path,
                                              bool verify_peer);

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* native() const noexcept { return ctx_; }
    bool verify_peer() const noexcept { return verify_peer_; }

private:
    TlsContext(SSL_CTX* ctx, bool verify_peer) : ctx_(ctx), verify_peer_(verify_peer) {}

    SSL_CTX* ctx_;
    bool verify_peer_;
};

class TlsTransport : public Transport {
public:
    TlsTransport(Endpoint endpoint, std::shared_ptr<TlsContext> context,
                 std::chrono::milliseconds timeout);
    ~TlsTransport() override;

    TlsTransport(const TlsTransport&) = delete;
    TlsTransport& operator=(const TlsTransport&) = delete;

    void connect() override;
    bool write_all(const uint8_t* data, size_t len) override;
    size_t read_some(uint8_t* buf, size_t cap) override;
    void close() override;

    const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    int connect_tcp();
    void configure_socket(int fd);
    void handshake();

    // Wait for the socket to become readable/writable. Returns false on
    // timeout, error or close.
    bool wait_ready(short events, int timeout_ms);

    Endpoint endpoint_;
    std::shared_ptr<TlsContext> context_;
    std::chrono::milliseconds timeout_;

    std::mutex ssl_mutex_;
    SSL* ssl_ = nullptr;
    std::atomic<int> socket_fd_{-1};
    std::atomic<bool> closed_{false};
};

// Factory producing TlsTransports bound to one shared context.
TransportFactory make_tls_transport_factory(std::shared_ptr<TlsContext> context,
                                            std::chrono::milliseconds timeout);

} // namespace apns
