// src/transport.hpp
// Duplex message transport — one session per stream connection.

#pragma once

#include "ran/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ran {

enum class ReadStatus : uint8_t {
    Message,   // One complete text message was read
    Idle,      // Nothing arrived within the poll timeout
    Closed,    // Orderly close: close frame received or shutdown() called
};

class Transport {
public:
    virtual ~Transport() = default;

    // Open the session (TCP, TLS, upgrade). Throws RanError (Transport).
    virtual void connect() = 0;

    // Wait up to `timeout` for one message. Called from a single reader thread.
    // Throws RanError (Transport) on abrupt disconnect.
    virtual ReadStatus read_message(std::string& out, std::chrono::milliseconds timeout) = 0;

    // Write one text message. Thread-safe; writes are serialized.
    // Throws RanError (Transport) if the session is not usable.
    virtual void send_text(const std::string& text) = 0;

    // Thread-safe and idempotent. Interrupts connect() and read_message().
    virtual void shutdown() noexcept = 0;
};

// Shared by every connection of one manager: one TLS context, one session
// cache and the bearer credential.
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::unique_ptr<Transport> create(StreamKind kind) = 0;
};

} // namespace ran
