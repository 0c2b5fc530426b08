// src/transport.cpp
// TLS transport over a non-blocking TCP socket.
//
// OpenSSL does not allow SSL_read and SSL_write to run concurrently on one
// SSL object, so every SSL_* call is made under ssl_mutex_ and all waiting
// happens in poll() outside the lock. A reader parked on an idle socket
// therefore never holds up the writer.

#include "transport.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstring>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace apns {

namespace {

// Poll slice used while blocked so a concurrent close() is noticed promptly.
constexpr int POLL_SLICE_MS = 250;

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

} // namespace

// --- Endpoint ---

Endpoint Endpoint::parse(const std::string& endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw ApnsError::configuration("endpoint must be host:port, got: " + endpoint);
    }
    int port_int = 0;
    try {
        size_t consumed = 0;
        port_int = std::stoi(endpoint.substr(colon + 1), &consumed);
        if (consumed != endpoint.size() - colon - 1) {
            throw ApnsError::configuration("endpoint port is not a valid number: " + endpoint);
        }
    } catch (const std::logic_error&) {
        throw ApnsError::configuration("endpoint port is not a valid number: " + endpoint);
    }
    if (port_int <= 0 || port_int > 65535) {
        throw ApnsError::configuration("endpoint port must be 1-65535, got: " + std::to_string(port_int));
    }

    Endpoint result;
    result.host = endpoint.substr(0, colon);
    result.port = static_cast<uint16_t>(port_int);
    return result;
}

// --- TlsContext ---

std::shared_ptr<TlsContext> TlsContext::create(const std::string& cert_path,
                                               const std::string& key_path,
                                               const std::string& ca_path,
                                               bool verify_peer) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        throw ApnsError::configuration("SSL_CTX_new() failed: " + ssl_error_string());
    }
    std::shared_ptr<TlsContext> context(new TlsContext(ctx, verify_peer));

    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (SSL_CTX_use_certificate_chain_file(ctx, cert_path.c_str()) != 1) {
        throw ApnsError::configuration("cannot load certificate " + cert_path + ": " + ssl_error_string());
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
        throw ApnsError::configuration("cannot load private key " + key_path + ": " + ssl_error_string());
    }
    if (SSL_CTX_check_private_key(ctx) != 1) {
        throw ApnsError::configuration("private key does not match certificate: " + ssl_error_string());
    }

    if (verify_peer) {
        int ok = ca_path.empty()
            ? SSL_CTX_set_default_verify_paths(ctx)
            : SSL_CTX_load_verify_locations(ctx, ca_path.c_str(), nullptr);
        if (ok != 1) {
            throw ApnsError::configuration("cannot load trust anchors: " + ssl_error_string());
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }

    return context;
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

// --- TlsTransport ---

TlsTransport::TlsTransport(Endpoint endpoint, std::shared_ptr<TlsContext> context,
                           std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), context_(std::move(context)), timeout_(timeout) {}

TlsTransport::~TlsTransport() {
    close();
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    int fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

void TlsTransport::connect() {
    int fd = connect_tcp();
    configure_socket(fd);
    socket_fd_.store(fd);
    if (closed_.load()) {
        throw ApnsError::network("connection to " + endpoint_.to_string() + " closed while connecting");
    }
    handshake();
    APNS_LOG_DEBUG("connected to {}", endpoint_.to_string());
}

int TlsTransport::connect_tcp() {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(endpoint_.port);
    int err = ::getaddrinfo(endpoint_.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw ApnsError::network("DNS resolution failed for " + endpoint_.host);
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            ::close(fd);
            continue;
        }

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (ret != 0) {
            if (errno != EINPROGRESS) {
                ::close(fd);
                continue;
            }

            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int poll_ret = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
            if (poll_ret <= 0) {
                ::close(fd);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
                ::close(fd);
                continue;
            }
        }

        // The socket stays non-blocking; SSL I/O is driven by poll().
        ::freeaddrinfo(res);
        return fd;
    }

    ::freeaddrinfo(res);
    throw ApnsError::network("connect failed to " + endpoint_.to_string());
}

void TlsTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TlsTransport::handshake() {
    std::unique_lock<std::mutex> lock(ssl_mutex_);
    ssl_ = SSL_new(context_->native());
    if (!ssl_) {
        throw ApnsError::tls("SSL_new() failed: " + ssl_error_string());
    }
    if (SSL_set_fd(ssl_, socket_fd_.load()) != 1) {
        throw ApnsError::tls("SSL_set_fd() failed: " + ssl_error_string());
    }
    SSL_set_tlsext_host_name(ssl_, endpoint_.host.c_str());
    if (context_->verify_peer() && SSL_set1_host(ssl_, endpoint_.host.c_str()) != 1) {
        throw ApnsError::tls("SSL_set1_host() failed: " + ssl_error_string());
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (true) {
        int ret = SSL_connect(ssl_);
        if (ret == 1) {
            return;
        }

        int err = SSL_get_error(ssl_, ret);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
        } else {
            throw ApnsError::tls("handshake with " + endpoint_.to_string() +
                                 " failed: " + ssl_error_string());
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw ApnsError::tls("handshake with " + endpoint_.to_string() + " timed out");
        }
        lock.unlock();
        bool ready = wait_ready(events, static_cast<int>(remaining.count()));
        lock.lock();
        if (!ready) {
            throw ApnsError::tls("handshake with " + endpoint_.to_string() + " interrupted");
        }
    }
}

bool TlsTransport::wait_ready(short events, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!closed_.load()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }

        struct pollfd pfd{};
        pfd.fd = socket_fd_.load();
        pfd.events = events;
        int ret = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (ret > 0) {
            // POLLHUP/POLLERR are reported as ready so the SSL call observes them.
            return !closed_.load();
        }
        if (ret < 0 && errno != EINTR) {
            return false;
        }
    }
    return false;
}

bool TlsTransport::write_all(const uint8_t* data, size_t len) {
    size_t sent = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    while (sent < len) {
        if (closed_.load()) return false;

        short wait_events = 0;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            if (!ssl_) return false;
            int n = SSL_write(ssl_, data + sent, static_cast<int>(len - sent));
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_WRITE) {
                wait_events = POLLOUT;
            } else if (err == SSL_ERROR_WANT_READ) {
                wait_events = POLLIN;
            } else {
                APNS_LOG_INFO("write to {} failed: {}", endpoint_.to_string(), ssl_error_string());
                return false;
            }
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || !wait_ready(wait_events, static_cast<int>(remaining.count()))) {
            APNS_LOG_INFO("write to {} timed out or was interrupted", endpoint_.to_string());
            return false;
        }
    }
    return true;
}

size_t TlsTransport::read_some(uint8_t* buf, size_t cap) {
    while (!closed_.load()) {
        short wait_events = 0;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            if (!ssl_) return 0;
            int n = SSL_read(ssl_, buf, static_cast<int>(cap));
            if (n > 0) {
                return static_cast<size_t>(n);
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ) {
                wait_events = POLLIN;
            } else if (err == SSL_ERROR_WANT_WRITE) {
                wait_events = POLLOUT;
            } else if (err == SSL_ERROR_ZERO_RETURN) {
                APNS_LOG_DEBUG("{} closed the connection", endpoint_.to_string());
                return 0;
            } else {
                APNS_LOG_INFO("read from {} failed: {}", endpoint_.to_string(), ssl_error_string());
                return 0;
            }
        }

        // Reads wait indefinitely; only close() or the peer ends them.
        if (!wait_ready(wait_events, POLL_SLICE_MS) && closed_.load()) {
            return 0;
        }
    }
    return 0;
}

void TlsTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    int fd = socket_fd_.load();
    if (fd >= 0) {
        // Wakes any thread parked in poll(); the descriptor is released in
        // the destructor once no thread can be using it.
        ::shutdown(fd, SHUT_RDWR);
    }
}

TransportFactory make_tls_transport_factory(std::shared_ptr<TlsContext> context,
                                            std::chrono::milliseconds timeout) {
    return [context, timeout](const Endpoint& endpoint) -> std::unique_ptr<Transport> {
        return std::make_unique<TlsTransport>(endpoint, context, timeout);
    };
}

} // namespace apns
