// src/websocket.hpp
// WebSocket client transport over POSIX TCP with optional OpenSSL TLS.

#pragma once

#include "frame.hpp"
#include "transport.hpp"
#include "ran/config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/ssl.h>

namespace ran {

struct WsUrl {
    bool secure = false;
    std::string host;
    uint16_t port = 0;
    std::string target = "/";   // Path plus query string
};

// Parse ws:// or wss:// URLs. Throws RanError (Configuration).
WsUrl parse_ws_url(const std::string& url);

// Percent-encode a query parameter value.
std::string url_encode(const std::string& value);

// One SSL_CTX shared by every connection of a factory, with a per-host
// client session cache so reconnects and sibling streams resume TLS sessions.
class TlsContext {
public:
    explicit TlsContext(bool verify_peer);
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* native() const noexcept { return ctx_; }
    bool verify_peer() const noexcept { return verify_peer_; }

    // Apply a cached session for `host` to `ssl`, if one exists.
    void resume(SSL* ssl, const std::string& host);

private:
    static int on_new_session(SSL* ssl, SSL_SESSION* session);
    void store(const std::string& host, SSL_SESSION* session);

    SSL_CTX* ctx_ = nullptr;
    bool verify_peer_;
    mutable std::mutex mutex_;
    std::map<std::string, SSL_SESSION*> sessions_;
};

class WebSocketTransport : public Transport {
public:
    WebSocketTransport(WsUrl url, std::string access_token,
                       std::chrono::milliseconds network_timeout,
                       std::shared_ptr<TlsContext> tls);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void connect() override;
    ReadStatus read_message(std::string& out, std::chrono::milliseconds timeout) override;
    void send_text(const std::string& text) override;
    void shutdown() noexcept override;

private:
    using Clock = std::chrono::steady_clock;

    void open_socket(Clock::time_point deadline);
    void configure_socket(int fd);
    void tls_handshake(Clock::time_point deadline);
    void http_upgrade(Clock::time_point deadline);

    // Wait for readiness; returns false on timeout.
    bool wait_fd(short events, Clock::time_point deadline);

    // Caller holds io_mutex_. Reads what is available into rx_.
    // Returns false when nothing could be read without blocking.
    bool fill_rx();
    // Caller holds io_mutex_.
    void write_all(const char* data, size_t len, Clock::time_point deadline);

    void send_frame(ws::Opcode opcode, const char* payload, size_t len);

    // Extract the next complete message from rx_, answering control frames.
    bool next_message(std::string& out, ReadStatus& status);

    bool shutdown_requested() const noexcept { return shutdown_.load(std::memory_order_acquire); }

    WsUrl url_;
    std::string access_token_;
    std::chrono::milliseconds network_timeout_;
    std::shared_ptr<TlsContext> tls_;

    std::mutex state_mutex_;     // Guards fd_ against concurrent shutdown()
    int fd_ = -1;
    SSL* ssl_ = nullptr;
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> open_{false};

    std::mutex io_mutex_;        // Serializes SSL_read / SSL_write / send
    std::string rx_;
    size_t rx_pos_ = 0;
    bool peer_eof_ = false;
    bool close_sent_ = false;

    // Reader-thread state.
    std::string fragments_;
    bool in_fragment_ = false;
};

class WebSocketTransportFactory : public TransportFactory {
public:
    explicit WebSocketTransportFactory(const RanConfig& config);

    std::unique_ptr<Transport> create(StreamKind kind) override;

private:
    WsUrl upstream_;
    WsUrl downstream_;
    std::string access_token_;
    std::chrono::milliseconds network_timeout_;
    std::shared_ptr<TlsContext> tls_;
};

} // namespace ran
