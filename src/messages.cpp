// src/messages.cpp
// Message helpers, transmission window construction and value equality.

#include "ran/messages.hpp"
#include "validation.hpp"

#include <algorithm>
#include <chrono>

namespace ran {

bool UpstreamMessage::has_dev_eui(uint64_t dev_eui) const noexcept {
    return std::find(dev_euis.begin(), dev_euis.end(), dev_eui) != dev_euis.end();
}

bool UpstreamMessage::offers_mic(uint32_t mic) const noexcept {
    return std::find(mic_challenge.begin(), mic_challenge.end(), mic) != mic_challenge.end();
}

// --- TransmissionWindow ---

TransmissionWindow TransmissionWindow::class_a(Radio radio, uint32_t delay_seconds) {
    TransmissionWindow w(std::move(radio), Delay{delay_seconds});
    validation::check_tx_window(w);
    return w;
}

TransmissionWindow TransmissionWindow::class_b(Radio radio, std::vector<uint64_t> slots) {
    TransmissionWindow w(std::move(radio), Tmms{std::move(slots)});
    validation::check_tx_window(w);
    return w;
}

TransmissionWindow TransmissionWindow::class_c(Radio radio, uint64_t deadline_unix_seconds) {
    TransmissionWindow w(std::move(radio), Deadline{deadline_unix_seconds});
    validation::check_tx_window(w);
    return w;
}

TransmissionWindow TransmissionWindow::class_c(Radio radio) {
    auto now = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
    return class_c(std::move(radio), now + MAX_DEADLINE_SECONDS);
}

TransmissionWindow TransmissionWindow::from_parts(Radio radio,
                                                  std::optional<uint32_t> delay,
                                                  std::optional<std::vector<uint64_t>> tmms,
                                                  std::optional<uint64_t> deadline) {
    int set = (delay ? 1 : 0) + (tmms ? 1 : 0) + (deadline ? 1 : 0);
    if (set != 1) {
        throw RanError::validation("TxWindow",
            "exactly one of Delay, Tmms, Deadline must be set, got " + std::to_string(set));
    }
    if (delay) return class_a(std::move(radio), *delay);
    if (tmms) return class_b(std::move(radio), std::move(*tmms));
    return class_c(std::move(radio), *deadline);
}

std::optional<uint32_t> TransmissionWindow::delay() const {
    if (auto* d = std::get_if<Delay>(&timing_)) return d->seconds;
    return std::nullopt;
}

std::optional<std::vector<uint64_t>> TransmissionWindow::tmms() const {
    if (auto* t = std::get_if<Tmms>(&timing_)) return t->slots;
    return std::nullopt;
}

std::optional<uint64_t> TransmissionWindow::deadline() const {
    if (auto* d = std::get_if<Deadline>(&timing_)) return d->unix_seconds;
    return std::nullopt;
}

// --- Variant helpers ---

MessageKind kind_of(const Message& message) noexcept {
    return static_cast<MessageKind>(message.index());
}

uint64_t transaction_id_of(const Message& message) noexcept {
    return std::visit([](const auto& m) { return m.transaction_id; }, message);
}

uint64_t transaction_id_of(const DownstreamReply& reply) noexcept {
    return std::visit([](const auto& m) { return m.transaction_id; }, reply);
}

// --- Equality ---

bool operator==(const LoRaModulation& a, const LoRaModulation& b) {
    return a.spreading == b.spreading && a.bandwidth == b.bandwidth;
}

bool operator==(const FSKModulation& a, const FSKModulation& b) {
    return a.frequency_deviation == b.frequency_deviation && a.bit_rate == b.bit_rate;
}

bool operator==(const FHSSModulation& a, const FHSSModulation& b) {
    return a.ocw == b.ocw && a.coding_rate == b.coding_rate;
}

bool operator==(const Radio& a, const Radio& b) {
    return a.frequency == b.frequency && a.modulation == b.modulation;
}

bool operator==(const UpstreamRadio& a, const UpstreamRadio& b) {
    return a.frequency == b.frequency && a.modulation == b.modulation &&
           a.rssi == b.rssi && a.snr == b.snr;
}

bool operator==(const Gps& a, const Gps& b) {
    return a.lat == b.lat && a.lng == b.lng && a.alt == b.alt;
}

bool operator==(const UpstreamMessage& a, const UpstreamMessage& b) {
    return a.protocol_version == b.protocol_version &&
           a.transaction_id == b.transaction_id &&
           a.outdated == b.outdated &&
           a.dev_euis == b.dev_euis &&
           a.radio == b.radio &&
           a.phy_payload_no_mic == b.phy_payload_no_mic &&
           a.mic_challenge == b.mic_challenge &&
           a.gps == b.gps;
}

bool operator==(const UpstreamAck& a, const UpstreamAck& b) {
    return a.protocol_version == b.protocol_version && a.transaction_id == b.transaction_id &&
           a.dev_eui == b.dev_eui && a.mic == b.mic;
}

bool operator==(const UpstreamReject& a, const UpstreamReject& b) {
    return a.protocol_version == b.protocol_version && a.transaction_id == b.transaction_id &&
           a.result_code == b.result_code && a.result_message == b.result_message;
}

bool operator==(const Delay& a, const Delay& b) { return a.seconds == b.seconds; }
bool operator==(const Tmms& a, const Tmms& b) { return a.slots == b.slots; }
bool operator==(const Deadline& a, const Deadline& b) { return a.unix_seconds == b.unix_seconds; }

bool operator==(const TransmissionWindow& a, const TransmissionWindow& b) {
    return a.radio() == b.radio() && a.timing() == b.timing();
}

bool operator==(const DeviceTarget& a, const DeviceTarget& b) { return a.dev_eui == b.dev_eui; }
bool operator==(const MulticastTarget& a, const MulticastTarget& b) { return a.addr == b.addr; }

bool operator==(const DownstreamMessage& a, const DownstreamMessage& b) {
    return a.protocol_version == b.protocol_version &&
           a.transaction_id == b.transaction_id &&
           a.target == b.target &&
           a.target_dev_addr == b.target_dev_addr &&
           a.tx_window == b.tx_window &&
           a.phy_payload == b.phy_payload;
}

bool operator==(const DownstreamAck& a, const DownstreamAck& b) {
    return a.protocol_version == b.protocol_version && a.transaction_id == b.transaction_id &&
           a.mailbox_id == b.mailbox_id;
}

bool operator==(const DownstreamResult& a, const DownstreamResult& b) {
    return a.protocol_version == b.protocol_version && a.transaction_id == b.transaction_id &&
           a.result_code == b.result_code && a.result_message == b.result_message &&
           a.mailbox_id == b.mailbox_id;
}

} // namespace ran
