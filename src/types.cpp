// src/types.cpp
// Enum names as they appear on the wire and in log lines.

#include "ran/error.hpp"
#include "ran/types.hpp"

namespace ran {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration:        return "Configuration";
        case ErrorKind::Validation:           return "Validation";
        case ErrorKind::Transport:            return "Transport";
        case ErrorKind::Decode:               return "Decode";
        case ErrorKind::Closed:               return "Closed";
        case ErrorKind::Timeout:              return "Timeout";
        case ErrorKind::UnknownTransaction:   return "UnknownTransaction";
        case ErrorKind::DuplicateTransaction: return "DuplicateTransaction";
        case ErrorKind::ReconnectExhausted:   return "ReconnectExhausted";
        case ErrorKind::Io:                   return "Io";
    }
    return "Unknown";
}

const char* to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Upstream:         return "Upstream";
        case MessageKind::UpstreamAck:      return "UpstreamAck";
        case MessageKind::UpstreamReject:   return "UpstreamReject";
        case MessageKind::Downstream:       return "Downstream";
        case MessageKind::DownstreamAck:    return "DownstreamAck";
        case MessageKind::DownstreamResult: return "DownstreamResult";
    }
    return "Unknown";
}

const char* to_string(UpstreamRejectResultCode code) noexcept {
    switch (code) {
        case UpstreamRejectResultCode::MICFailed: return "MICFailed";
        case UpstreamRejectResultCode::Other:     return "Other";
    }
    return "Other";
}

const char* to_string(DownstreamResultCode code) noexcept {
    switch (code) {
        case DownstreamResultCode::Success:         return "Success";
        case DownstreamResultCode::WindowNotFound:  return "WindowNotFound";
        case DownstreamResultCode::GatewayNotFound: return "GatewayNotFound";
        case DownstreamResultCode::TooLate:         return "TooLate";
        case DownstreamResultCode::NoAck:           return "NoAck";
        case DownstreamResultCode::GatewayError:    return "GatewayError";
    }
    return "GatewayError";
}

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Closing:      return "Closing";
        case ConnectionState::Closed:       return "Closed";
    }
    return "Unknown";
}

const char* to_string(StreamKind kind) noexcept {
    return kind == StreamKind::Upstream ? "upstream" : "downstream";
}

std::optional<UpstreamRejectResultCode> parse_upstream_reject_code(const std::string& s) {
    if (s == "MICFailed") return UpstreamRejectResultCode::MICFailed;
    if (s == "Other")     return UpstreamRejectResultCode::Other;
    return std::nullopt;
}

std::optional<DownstreamResultCode> parse_downstream_result_code(const std::string& s) {
    if (s == "Success")         return DownstreamResultCode::Success;
    if (s == "WindowNotFound")  return DownstreamResultCode::WindowNotFound;
    if (s == "GatewayNotFound") return DownstreamResultCode::GatewayNotFound;
    if (s == "TooLate")         return DownstreamResultCode::TooLate;
    if (s == "NoAck")           return DownstreamResultCode::NoAck;
    if (s == "GatewayError")    return DownstreamResultCode::GatewayError;
    return std::nullopt;
}

} // namespace ran
