// tests/fixtures.hpp
// Sample messages shared by the codec and connection tests.

#pragma once

#include "codec.hpp"
#include "ran/messages.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ran {
namespace test {

constexpr uint64_t SAMPLE_DEV_EUI = 0x7ABE1B8C93D7174Full;
constexpr uint32_t SAMPLE_MIC = 0xAA595854u;

inline UpstreamMessage sample_uplink(uint64_t transaction_id,
                                     std::vector<uint64_t> dev_euis = {SAMPLE_DEV_EUI},
                                     std::vector<uint32_t> mic_challenge = {SAMPLE_MIC}) {
    UpstreamMessage m;
    m.transaction_id = transaction_id;
    m.dev_euis = std::move(dev_euis);
    m.radio.frequency = 868100000;
    m.radio.modulation = LoRaModulation{12, 125000};
    m.radio.rssi = -50.0;
    m.radio.snr = 2.0;
    m.phy_payload_no_mic = {0x40, 0x01, 0x02, 0x03, 0x04, 0x00, 0x01, 0x00, 0x01, 0xAB};
    m.mic_challenge = std::move(mic_challenge);
    return m;
}

inline std::string uplink_frame(uint64_t transaction_id,
                                std::vector<uint64_t> dev_euis = {SAMPLE_DEV_EUI},
                                std::vector<uint32_t> mic_challenge = {SAMPLE_MIC}) {
    return codec::encode(sample_uplink(transaction_id, std::move(dev_euis), std::move(mic_challenge)));
}

inline std::string ack_frame(uint64_t transaction_id, uint64_t mailbox_id) {
    DownstreamAck ack;
    ack.transaction_id = transaction_id;
    ack.mailbox_id = mailbox_id;
    return codec::encode(ack);
}

inline std::string result_frame(uint64_t transaction_id, uint64_t mailbox_id,
                                DownstreamResultCode code = DownstreamResultCode::Success,
                                std::string message = "") {
    DownstreamResult result;
    result.transaction_id = transaction_id;
    result.result_code = code;
    result.result_message = std::move(message);
    result.mailbox_id = mailbox_id;
    return codec::encode(result);
}

inline TransmissionWindow class_a_window() {
    return TransmissionWindow::class_a(Radio::lora(868300000, 12, 125000), 1);
}

} // namespace test
} // namespace ran
