// include/ran/messages.hpp
// Wire message values — immutable transit records for both streams.

#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ran {

// --- Radio ---

struct LoRaModulation {
    uint32_t spreading = 0;   // 0..12
    uint64_t bandwidth = 0;   // Hz
};

struct FSKModulation {
    uint64_t frequency_deviation = 0;
    uint64_t bit_rate = 0;
};

struct FHSSModulation {
    uint64_t ocw = 0;         // Operating channel width
    std::string coding_rate;
};

// Exactly one modulation per radio.
using Modulation = std::variant<LoRaModulation, FSKModulation, FHSSModulation>;

struct Radio {
    uint64_t frequency = 0;   // Hz
    Modulation modulation;

    static Radio lora(uint64_t frequency, uint32_t spreading, uint64_t bandwidth) {
        return Radio{frequency, LoRaModulation{spreading, bandwidth}};
    }
};

struct UpstreamRadio {
    uint64_t frequency = 0;
    Modulation modulation;
    double rssi = 0.0;
    double snr = 0.0;
};

struct Gps {
    double lat = 0.0;
    double lng = 0.0;
    std::optional<double> alt;
};

// --- Upstream ---

struct UpstreamMessage {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    std::optional<bool> outdated;
    std::vector<uint64_t> dev_euis;         // Non-empty; several when a DevAddr is shared
    UpstreamRadio radio;
    std::vector<uint8_t> phy_payload_no_mic;
    std::vector<uint32_t> mic_challenge;    // Non-empty candidate MICs
    std::optional<Gps> gps;

    bool has_dev_eui(uint64_t dev_eui) const noexcept;
    bool offers_mic(uint32_t mic) const noexcept;
};

struct UpstreamAck {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    uint64_t dev_eui = 0;
    uint32_t mic = 0;
};

struct UpstreamReject {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    UpstreamRejectResultCode result_code = UpstreamRejectResultCode::Other;
    std::optional<std::string> result_message;
};

// --- Downstream ---

struct Delay {
    uint32_t seconds = 1;                   // Class A, 1..15
};

struct Tmms {
    std::vector<uint64_t> slots;            // Class B, 1..8 GPS-time slots
};

struct Deadline {
    uint64_t unix_seconds = 0;              // Class C, absolute
};

using Timing = std::variant<Delay, Tmms, Deadline>;

// Transmission window: one radio setting plus exactly one timing mode.
class TransmissionWindow {
public:
    TransmissionWindow() = default;
    TransmissionWindow(Radio radio, Timing timing)
        : radio_(std::move(radio)), timing_(std::move(timing)) {}

    static TransmissionWindow class_a(Radio radio, uint32_t delay_seconds);
    static TransmissionWindow class_b(Radio radio, std::vector<uint64_t> slots);
    static TransmissionWindow class_c(Radio radio, uint64_t deadline_unix_seconds);

    // Class C with the default deadline: now + MAX_DEADLINE_SECONDS.
    static TransmissionWindow class_c(Radio radio);

    // Boundary constructor for callers holding independent optional modes.
    // Throws RanError (Validation) unless exactly one mode is set.
    static TransmissionWindow from_parts(Radio radio,
                                         std::optional<uint32_t> delay,
                                         std::optional<std::vector<uint64_t>> tmms,
                                         std::optional<uint64_t> deadline);

    const Radio& radio() const noexcept { return radio_; }
    const Timing& timing() const noexcept { return timing_; }

    std::optional<uint32_t> delay() const;
    std::optional<std::vector<uint64_t>> tmms() const;
    std::optional<uint64_t> deadline() const;

private:
    Radio radio_;
    Timing timing_;
};

struct DeviceTarget {
    uint64_t dev_eui = 0;
};

struct MulticastTarget {
    uint32_t addr = 0;
};

// Unicast device or multicast group, never both.
using DownstreamTarget = std::variant<DeviceTarget, MulticastTarget>;

struct DownstreamMessage {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    DownstreamTarget target;
    std::optional<uint32_t> target_dev_addr;  // Unicast only; mandatory for join-accept
    TransmissionWindow tx_window;
    std::vector<uint8_t> phy_payload;
};

struct DownstreamAck {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    uint64_t mailbox_id = 0;
};

struct DownstreamResult {
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint64_t transaction_id = 0;
    DownstreamResultCode result_code = DownstreamResultCode::Success;
    std::string result_message;
    uint64_t mailbox_id = 0;
};

// Closed set of wire messages. Alternative index == MessageKind.
using Message = std::variant<UpstreamMessage, UpstreamAck, UpstreamReject,
                             DownstreamMessage, DownstreamAck, DownstreamResult>;

// What the downstream stream delivers to the consumer.
using DownstreamReply = std::variant<DownstreamAck, DownstreamResult>;

MessageKind kind_of(const Message& message) noexcept;
uint64_t transaction_id_of(const Message& message) noexcept;
uint64_t transaction_id_of(const DownstreamReply& reply) noexcept;

bool operator==(const LoRaModulation& a, const LoRaModulation& b);
bool operator==(const FSKModulation& a, const FSKModulation& b);
bool operator==(const FHSSModulation& a, const FHSSModulation& b);
bool operator==(const Radio& a, const Radio& b);
bool operator==(const UpstreamRadio& a, const UpstreamRadio& b);
bool operator==(const Gps& a, const Gps& b);
bool operator==(const UpstreamMessage& a, const UpstreamMessage& b);
bool operator==(const UpstreamAck& a, const UpstreamAck& b);
bool operator==(const UpstreamReject& a, const UpstreamReject& b);
bool operator==(const Delay& a, const Delay& b);
bool operator==(const Tmms& a, const Tmms& b);
bool operator==(const Deadline& a, const Deadline& b);
bool operator==(const TransmissionWindow& a, const TransmissionWindow& b);
bool operator==(const DeviceTarget& a, const DeviceTarget& b);
bool operator==(const MulticastTarget& a, const MulticastTarget& b);
bool operator==(const DownstreamMessage& a, const DownstreamMessage& b);
bool operator==(const DownstreamAck& a, const DownstreamAck& b);
bool operator==(const DownstreamResult& a, const DownstreamResult& b);

} // namespace ran
