// src/websocket.cpp
// WebSocket client transport: non-blocking TCP, OpenSSL TLS, RFC 6455 framing.

#include "websocket.hpp"
#include "ran/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <openssl/err.h>

// POSIX sockets
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ran {

namespace {

constexpr size_t READ_CHUNK = 16 * 1024;
constexpr size_t MAX_RX_PER_FILL = 1024 * 1024;
constexpr size_t MAX_RESPONSE_HEAD = 16 * 1024;

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return std::strerror(errno);
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

// --- URL helpers ---

WsUrl parse_ws_url(const std::string& url) {
    WsUrl out;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw RanError::configuration("url has no scheme: " + url);
    }
    std::string scheme = lower(url.substr(0, scheme_end));
    if (scheme == "wss") {
        out.secure = true;
    } else if (scheme != "ws") {
        throw RanError::configuration("url scheme must be ws or wss: " + url);
    }

    std::string rest = url.substr(scheme_end + 3);
    size_t authority_end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, authority_end);
    if (authority_end != std::string::npos) {
        out.target = rest.substr(authority_end);
        if (out.target[0] == '?') out.target = "/" + out.target;
    }

    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw RanError::configuration("url has an unterminated IPv6 literal: " + url);
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw RanError::configuration("url has a malformed authority: " + url);
            }
            port_str = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    if (out.host.empty()) {
        throw RanError::configuration("url has no host: " + url);
    }

    if (port_str.empty()) {
        out.port = out.secure ? 443 : 80;
    } else {
        int port_int = 0;
        try {
            port_int = std::stoi(port_str);
        } catch (const std::exception&) {
            throw RanError::configuration("url port is not a valid number: " + url);
        }
        if (port_int <= 0 || port_int > 65535) {
            throw RanError::configuration("url port must be 1-65535, got: " + std::to_string(port_int));
        }
        out.port = static_cast<uint16_t>(port_int);
    }
    return out;
}

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// --- TlsContext ---

TlsContext::TlsContext(bool verify_peer) : verify_peer_(verify_peer) {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        throw RanError::io("SSL_CTX_new failed: " + ssl_error_string());
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

    if (verify_peer_) {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            std::string err = ssl_error_string();
            SSL_CTX_free(ctx_);
            throw RanError::io("cannot load default CA paths: " + err);
        }
    } else {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    }

    // Sessions are kept per host by this object, not by OpenSSL's internal store.
    SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);
    SSL_CTX_set_app_data(ctx_, this);
    SSL_CTX_sess_set_new_cb(ctx_, &TlsContext::on_new_session);
}

TlsContext::~TlsContext() {
    for (auto& kv : sessions_) {
        SSL_SESSION_free(kv.second);
    }
    SSL_CTX_free(ctx_);
}

int TlsContext::on_new_session(SSL* ssl, SSL_SESSION* session) {
    auto* self = static_cast<TlsContext*>(SSL_CTX_get_app_data(SSL_get_SSL_CTX(ssl)));
    auto* host = static_cast<const char*>(SSL_get_app_data(ssl));
    if (self == nullptr || host == nullptr) return 0;
    self->store(host, session);
    return 1;  // We own the reference now
}

void TlsContext::store(const std::string& host, SSL_SESSION* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(host);
    if (it != sessions_.end()) {
        SSL_SESSION_free(it->second);
        it->second = session;
    } else {
        sessions_.emplace(host, session);
    }
}

void TlsContext::resume(SSL* ssl, const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(host);
    if (it != sessions_.end()) {
        SSL_set_session(ssl, it->second);
    }
}

// --- WebSocketTransport ---

WebSocketTransport::WebSocketTransport(WsUrl url, std::string access_token,
                                       std::chrono::milliseconds network_timeout,
                                       std::shared_ptr<TlsContext> tls)
    : url_(std::move(url)), access_token_(std::move(access_token)),
      network_timeout_(network_timeout), tls_(std::move(tls)) {
    if (url_.secure && !tls_) {
        throw RanError::configuration("wss:// url requires a TLS context");
    }
}

WebSocketTransport::~WebSocketTransport() {
    shutdown();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void WebSocketTransport::connect() {
    auto deadline = Clock::now() + network_timeout_;

    logger()->debug("connecting to {}:{}{}", url_.host, url_.port, url_.secure ? " (tls)" : "");
    open_socket(deadline);
    if (url_.secure) {
        tls_handshake(deadline);
    }
    http_upgrade(deadline);
    open_.store(true, std::memory_order_release);
}

void WebSocketTransport::open_socket(Clock::time_point deadline) {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(url_.port);
    int err = ::getaddrinfo(url_.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw RanError::transport("DNS resolution failed for " + url_.host);
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

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (shutdown_requested()) {
                ::close(fd);
                ::freeaddrinfo(res);
                throw RanError::closed("connection closed during connect");
            }
            fd_ = fd;
        }

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        bool connected = ret == 0;
        if (!connected && errno == EINPROGRESS && wait_fd(POLLOUT, deadline)) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            connected = so_error == 0;
        }

        if (connected && !shutdown_requested()) {
            ::freeaddrinfo(res);
            configure_socket(fd);
            return;
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        ::close(fd);
        fd_ = -1;
    }

    ::freeaddrinfo(res);
    if (shutdown_requested()) {
        throw RanError::closed("connection closed during connect");
    }
    throw RanError::transport("connect failed to " + url_.host + ":" + port_str);
}

void WebSocketTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void WebSocketTransport::tls_handshake(Clock::time_point deadline) {
    ssl_ = SSL_new(tls_->native());
    if (!ssl_) {
        throw RanError::io("SSL_new failed: " + ssl_error_string());
    }
    if (SSL_set_fd(ssl_, fd_) != 1) {
        throw RanError::io("SSL_set_fd failed: " + ssl_error_string());
    }
    SSL_set_tlsext_host_name(ssl_, url_.host.c_str());
    if (tls_->verify_peer()) {
        SSL_set1_host(ssl_, url_.host.c_str());
    }
    SSL_set_app_data(ssl_, const_cast<char*>(url_.host.c_str()));
    tls_->resume(ssl_, url_.host);

    while (true) {
        ERR_clear_error();
        int ret = SSL_connect(ssl_);
        if (ret == 1) break;

        int err = SSL_get_error(ssl_, ret);
        bool ready;
        if (err == SSL_ERROR_WANT_READ) {
            ready = wait_fd(POLLIN, deadline);
        } else if (err == SSL_ERROR_WANT_WRITE) {
            ready = wait_fd(POLLOUT, deadline);
        } else {
            throw RanError::transport("TLS handshake failed with " + url_.host + ": " + ssl_error_string());
        }
        if (shutdown_requested()) {
            throw RanError::closed("connection closed during connect");
        }
        if (!ready) {
            throw RanError::transport("TLS handshake timed out with " + url_.host);
        }
    }

    logger()->debug("TLS established with {} ({})", url_.host,
                    SSL_session_reused(ssl_) == 1 ? "resumed session" : "full handshake");
}

void WebSocketTransport::http_upgrade(Clock::time_point deadline) {
    std::string key = ws::make_client_key();

    std::string target = url_.target;
    target += (target.find('?') == std::string::npos) ? '?' : '&';
    target += "access_token=" + url_encode(access_token_);

    std::string host_header = url_.host.find(':') != std::string::npos ? "[" + url_.host + "]" : url_.host;
    if (url_.port != (url_.secure ? 443 : 80)) {
        host_header += ":" + std::to_string(url_.port);
    }

    std::string request;
    request.reserve(512);
    request += "GET " + target + " HTTP/1.1\r\n";
    request += "Host: " + host_header + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + key + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    request += "Authorization: Bearer " + access_token_ + "\r\n";
    request += "User-Agent: ran-routing-cpp\r\n";
    request += "\r\n";

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        write_all(request.data(), request.size(), deadline);
    }

    // Response head; bytes after it already belong to the frame stream.
    std::string head;
    while (true) {
        size_t end = rx_.find("\r\n\r\n");
        if (end != std::string::npos) {
            head = rx_.substr(0, end);
            rx_.erase(0, end + 4);
            break;
        }
        if (rx_.size() > MAX_RESPONSE_HEAD) {
            throw RanError::transport("websocket upgrade response is too large");
        }
        if (peer_eof_) {
            throw RanError::transport("connection closed during websocket upgrade");
        }
        bool got;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            got = fill_rx();
        }
        if (got || peer_eof_) continue;
        bool ready = wait_fd(POLLIN, deadline);
        if (shutdown_requested()) {
            throw RanError::closed("connection closed during connect");
        }
        if (!ready) {
            throw RanError::transport("websocket upgrade timed out");
        }
    }

    size_t line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);
    int status = 0;
    size_t sp = status_line.find(' ');
    if (sp != std::string::npos && status_line.size() >= sp + 4) {
        for (size_t i = sp + 1; i < sp + 4; i++) {
            char c = status_line[i];
            if (c < '0' || c > '9') { status = 0; break; }
            status = status * 10 + (c - '0');
        }
    }
    if (status == 401) {
        throw RanError::transport("unauthorized: access token rejected");
    }
    if (status != 101) {
        throw RanError::transport("websocket upgrade failed: " + status_line);
    }

    std::string accept;
    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        std::string line = head.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos && lower(trim(line.substr(0, colon))) == "sec-websocket-accept") {
            accept = trim(line.substr(colon + 1));
        }
        if (next == std::string::npos) break;
        pos = next + 2;
    }
    if (accept != ws::accept_key(key)) {
        throw RanError::transport("websocket upgrade returned an invalid Sec-WebSocket-Accept");
    }
}

bool WebSocketTransport::wait_fd(short events, Clock::time_point deadline) {
    while (true) {
        auto now = Clock::now();
        int64_t remaining = 0;
        if (deadline > now) {
            remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            remaining = std::min<int64_t>(remaining, 60 * 60 * 1000);
        }

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret > 0) return true;
        if (ret == 0) {
            if (Clock::now() >= deadline) return false;
            continue;
        }
        if (errno == EINTR) continue;
        throw RanError::io(std::string("poll failed: ") + std::strerror(errno));
    }
}

bool WebSocketTransport::fill_rx() {
    char buf[READ_CHUNK];
    bool any = false;
    size_t appended = 0;

    while (appended < MAX_RX_PER_FILL) {
        if (ssl_) {
            ERR_clear_error();
            int n = SSL_read(ssl_, buf, static_cast<int>(sizeof(buf)));
            if (n > 0) {
                rx_.append(buf, static_cast<size_t>(n));
                appended += static_cast<size_t>(n);
                any = true;
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) return any;
            if (err == SSL_ERROR_ZERO_RETURN || shutdown_requested()) {
                peer_eof_ = true;
                return any;
            }
            throw RanError::transport("TLS read failed: " + ssl_error_string());
        }

        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            rx_.append(buf, static_cast<size_t>(n));
            appended += static_cast<size_t>(n);
            any = true;
            continue;
        }
        if (n == 0) {
            peer_eof_ = true;
            return any;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) return any;
        if (errno == EINTR) continue;
        if (shutdown_requested()) {
            peer_eof_ = true;
            return any;
        }
        throw RanError::transport(std::string("read failed: ") + std::strerror(errno));
    }
    return any;
}

void WebSocketTransport::write_all(const char* data, size_t len, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < len) {
        if (ssl_) {
            ERR_clear_error();
            int n = SSL_write(ssl_, data + sent, static_cast<int>(len - sent));
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            short events;
            if (err == SSL_ERROR_WANT_WRITE) {
                events = POLLOUT;
            } else if (err == SSL_ERROR_WANT_READ) {
                events = POLLIN;
            } else {
                throw RanError::transport("TLS write failed: " + ssl_error_string());
            }
            if (!wait_fd(events, deadline)) {
                throw RanError::transport("write timed out");
            }
            continue;
        }

        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_fd(POLLOUT, deadline)) {
                throw RanError::transport("write timed out");
            }
            continue;
        }
        throw RanError::transport(std::string("write failed: ") + std::strerror(errno));
    }
}

void WebSocketTransport::send_frame(ws::Opcode opcode, const char* payload, size_t len) {
    uint8_t mask[4];
    ws::random_bytes(mask, sizeof(mask));

    std::string frame;
    frame.reserve(len + 14);
    ws::append_frame(frame, opcode, payload, len, mask);

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (close_sent_) {
        if (opcode == ws::Opcode::Close) return;
        throw RanError::transport("websocket is closing");
    }
    write_all(frame.data(), frame.size(), Clock::now() + network_timeout_);
    if (opcode == ws::Opcode::Close) close_sent_ = true;
}

void WebSocketTransport::send_text(const std::string& text) {
    if (!open_.load(std::memory_order_acquire)) {
        throw RanError::transport("websocket is not open");
    }
    if (shutdown_requested()) {
        throw RanError::transport("websocket is shut down");
    }
    send_frame(ws::Opcode::Text, text.data(), text.size());
}

bool WebSocketTransport::next_message(std::string& out, ReadStatus& status) {
    while (true) {
        size_t avail = rx_.size() - rx_pos_;
        const auto* data = reinterpret_cast<const uint8_t*>(rx_.data()) + rx_pos_;

        ws::FrameHeader header;
        if (!ws::parse_frame_header(data, avail, header)) return false;
        if (avail < header.header_len + header.payload_len) return false;

        std::string payload(rx_, rx_pos_ + header.header_len, static_cast<size_t>(header.payload_len));
        rx_pos_ += header.header_len + static_cast<size_t>(header.payload_len);
        if (rx_pos_ == rx_.size()) {
            rx_.clear();
            rx_pos_ = 0;
        } else if (rx_pos_ > READ_CHUNK * 4) {
            rx_.erase(0, rx_pos_);
            rx_pos_ = 0;
        }
        if (header.masked && !payload.empty()) {
            ws::apply_mask(reinterpret_cast<uint8_t*>(&payload[0]), payload.size(), header.mask_key);
        }

        switch (header.opcode) {
            case ws::Opcode::Ping:
                send_frame(ws::Opcode::Pong, payload.data(), payload.size());
                continue;
            case ws::Opcode::Pong:
                continue;
            case ws::Opcode::Close: {
                uint16_t code = payload.size() >= 2
                    ? static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]))
                    : 1005;
                logger()->debug("close frame from {} with code {}", url_.host, code);
                try {
                    send_frame(ws::Opcode::Close, payload.data(), std::min<size_t>(payload.size(), 2));
                } catch (const RanError& e) {
                    logger()->debug("close reply to {} failed: {}", url_.host, e.what());
                }
                status = ReadStatus::Closed;
                return true;
            }
            case ws::Opcode::Text:
            case ws::Opcode::Binary:
                if (in_fragment_) {
                    throw RanError::transport("websocket data frame inside a fragmented message");
                }
                if (header.fin) {
                    out = std::move(payload);
                    status = ReadStatus::Message;
                    return true;
                }
                fragments_ = std::move(payload);
                in_fragment_ = true;
                continue;
            case ws::Opcode::Continuation:
                if (!in_fragment_) {
                    throw RanError::transport("unexpected websocket continuation frame");
                }
                if (fragments_.size() + payload.size() > ws::MAX_MESSAGE_SIZE) {
                    throw RanError::transport("websocket message exceeds size limit");
                }
                fragments_ += payload;
                if (header.fin) {
                    out = std::move(fragments_);
                    fragments_.clear();
                    in_fragment_ = false;
                    status = ReadStatus::Message;
                    return true;
                }
                continue;
        }
    }
}

ReadStatus WebSocketTransport::read_message(std::string& out, std::chrono::milliseconds timeout) {
    if (!open_.load(std::memory_order_acquire)) {
        throw RanError::transport("websocket is not open");
    }
    auto deadline = Clock::now() + timeout;

    while (true) {
        if (shutdown_requested()) return ReadStatus::Closed;

        ReadStatus status = ReadStatus::Idle;
        if (next_message(out, status)) return status;
        if (peer_eof_) {
            throw RanError::transport("connection closed by peer without close frame");
        }

        bool got;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            got = fill_rx();
        }
        if (got || peer_eof_) continue;
        if (!wait_fd(POLLIN, deadline)) return ReadStatus::Idle;
    }
}

void WebSocketTransport::shutdown() noexcept {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return;

    // Best-effort close frame, only if no write is in flight.
    if (open_.load(std::memory_order_acquire)) {
        std::unique_lock<std::mutex> io(io_mutex_, std::try_to_lock);
        if (io.owns_lock() && !close_sent_) {
            uint8_t mask[4] = {};
            if (RAND_bytes(mask, sizeof(mask)) != 1) std::memset(mask, 0, sizeof(mask));
            const char body[2] = {static_cast<char>(0x03), static_cast<char>(0xE8)};  // 1000
            std::string frame;
            ws::append_frame(frame, ws::Opcode::Close, body, sizeof(body), mask);
            if (ssl_) {
                ERR_clear_error();
                SSL_write(ssl_, frame.data(), static_cast<int>(frame.size()));
                ERR_clear_error();
            } else {
                ssize_t n = ::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
                (void)n;
            }
            close_sent_ = true;
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

// --- WebSocketTransportFactory ---

WebSocketTransportFactory::WebSocketTransportFactory(const RanConfig& config)
    : upstream_(parse_ws_url(config.upstream_url())),
      downstream_(parse_ws_url(config.downstream_url())),
      access_token_(config.access_token()),
      network_timeout_(config.network_timeout()) {
    if (upstream_.secure || downstream_.secure) {
        tls_ = std::make_shared<TlsContext>(config.verify_tls());
    }
}

std::unique_ptr<Transport> WebSocketTransportFactory::create(StreamKind kind) {
    const WsUrl& url = kind == StreamKind::Upstream ? upstream_ : downstream_;
    return std::make_unique<WebSocketTransport>(url, access_token_, network_timeout_, tls_);
}

} // namespace ran
