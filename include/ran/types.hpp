// include/ran/types.hpp
// Protocol enums and constants shared by the upstream and downstream streams.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ran {

// Default protocol version stamped on every outbound message.
constexpr uint32_t PROTOCOL_VERSION = 1;

// Upper bound on the MIC challenge list the network may offer.
constexpr size_t MAX_MIC_CHALLENGE = 4096;

// Class B: maximum number of ping-slot candidates in a Tmms window.
constexpr size_t MAX_TMMS_SLOTS = 8;

// Class C: default and maximum distance of a deadline from issue time.
constexpr uint64_t MAX_DEADLINE_SECONDS = 512;

// Wire message discriminator. Order matches the Message variant alternatives.
enum class MessageKind : uint8_t {
    Upstream         = 0,
    UpstreamAck      = 1,
    UpstreamReject   = 2,
    Downstream       = 3,
    DownstreamAck    = 4,
    DownstreamResult = 5,
};

enum class UpstreamRejectResultCode : uint8_t {
    MICFailed = 0,
    Other     = 1,
};

enum class DownstreamResultCode : uint8_t {
    Success         = 0,
    WindowNotFound  = 1,
    GatewayNotFound = 2,
    TooLate         = 3,
    NoAck           = 4,
    GatewayError    = 5,
};

// Stream connection lifecycle.
enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting   = 1,
    Connected    = 2,
    Closing      = 3,
    Closed       = 4,
};

// Which stream endpoint a connection talks to.
enum class StreamKind : uint8_t {
    Upstream   = 0,
    Downstream = 1,
};

const char* to_string(MessageKind kind) noexcept;
const char* to_string(UpstreamRejectResultCode code) noexcept;
const char* to_string(DownstreamResultCode code) noexcept;
const char* to_string(ConnectionState state) noexcept;
const char* to_string(StreamKind kind) noexcept;

std::optional<UpstreamRejectResultCode> parse_upstream_reject_code(const std::string& s);
std::optional<DownstreamResultCode> parse_downstream_result_code(const std::string& s);

} // namespace ran
