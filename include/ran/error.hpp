// include/ran/error.hpp
// Single error class with a kind enum — all failures surface as RanError.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ran {

enum class ErrorKind {
    Configuration,         // Invalid config at construction
    Validation,            // Bad argument at the API boundary (never sent)
    Transport,             // Handshake failure or abrupt disconnect
    Decode,                // Malformed or unknown frame (fatal to the connection)
    Closed,                // Connection or manager already closed
    Timeout,               // Caller deadline elapsed
    UnknownTransaction,    // Ack/reject/receive for an id that is not outstanding
    DuplicateTransaction,  // Send with an id that is already outstanding
    ReconnectExhausted,    // Reconnect supervisor gave up
    Io                     // System I/O error
};

const char* to_string(ErrorKind kind) noexcept;

class RanError : public std::exception {
public:
    RanError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    RanError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("validation error: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    // True for conditions after which the connection cannot be used again.
    bool is_terminal() const noexcept {
        return kind_ == ErrorKind::Decode || kind_ == ErrorKind::ReconnectExhausted ||
               kind_ == ErrorKind::Transport || kind_ == ErrorKind::Io;
    }

    static RanError configuration(std::string msg) {
        return RanError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static RanError validation(std::string field, std::string reason) {
        return RanError(ErrorKind::Validation, field, reason);
    }

    static RanError transport(std::string msg) {
        return RanError(ErrorKind::Transport, "transport error: " + msg);
    }

    static RanError decode(std::string msg) {
        return RanError(ErrorKind::Decode, "decode error: " + msg);
    }

    static RanError closed(std::string reason = "connection closed") {
        return RanError(ErrorKind::Closed, std::move(reason));
    }

    static RanError timeout(std::string msg) {
        return RanError(ErrorKind::Timeout, "timed out: " + msg);
    }

    static RanError unknown_transaction(uint64_t transaction_id) {
        return RanError(ErrorKind::UnknownTransaction,
                        "unknown transaction " + std::to_string(transaction_id));
    }

    static RanError duplicate_transaction(uint64_t transaction_id) {
        return RanError(ErrorKind::DuplicateTransaction,
                        "transaction " + std::to_string(transaction_id) + " is already outstanding");
    }

    static RanError reconnect_exhausted(uint32_t attempts, const std::string& last_error) {
        return RanError(ErrorKind::ReconnectExhausted,
                        "reconnect gave up after " + std::to_string(attempts) +
                        " attempts: " + last_error);
    }

    static RanError io(std::string msg) {
        return RanError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
};

} // namespace ran
