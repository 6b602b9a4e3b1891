// bench/bench_common.hpp
// Shared benchmark scenarios — representative uplinks and downlinks.

#pragma once

#include "ran/messages.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ran_bench {

struct BenchScenario {
    const char* name;
    size_t dev_euis;        // Devices sharing the DevAddr
    size_t mic_challenge;   // Candidate MICs offered
    size_t payload_size;    // PHYPayload bytes
};

constexpr BenchScenario SCENARIOS[] = {
    {"single_device", 1, 1, 12},
    {"shared_devaddr", 4, 4, 24},
    {"crowded", 16, 64, 51},
    {"max_payload", 1, 1, 242},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

inline std::vector<uint8_t> generate_payload(size_t size) {
    std::vector<uint8_t> payload(size);
    for (size_t i = 0; i < size; i++) {
        payload[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return payload;
}

inline ran::UpstreamMessage make_uplink(const BenchScenario& scenario, uint64_t transaction_id = 1) {
    ran::UpstreamMessage m;
    m.transaction_id = transaction_id;
    for (size_t i = 0; i < scenario.dev_euis; i++) {
        m.dev_euis.push_back(0x7ABE1B8C93D71700ull + i);
    }
    m.radio.frequency = 868100000;
    m.radio.modulation = ran::LoRaModulation{12, 125000};
    m.radio.rssi = -112.5;
    m.radio.snr = -7.25;
    m.phy_payload_no_mic = generate_payload(scenario.payload_size);
    for (size_t i = 0; i < scenario.mic_challenge; i++) {
        m.mic_challenge.push_back(static_cast<uint32_t>(0xAA595854u + i * 7919));
    }
    m.gps = ran::Gps{52.5200, 13.4050, 34.0};
    return m;
}

inline ran::DownstreamMessage make_downlink(size_t payload_size, uint64_t transaction_id = 1) {
    ran::DownstreamMessage m;
    m.transaction_id = transaction_id;
    m.target = ran::DeviceTarget{0x7ABE1B8C93D7174Full};
    m.target_dev_addr = 0x26011BDA;
    m.tx_window = ran::TransmissionWindow::class_a(ran::Radio::lora(868300000, 12, 125000), 1);
    m.phy_payload = generate_payload(payload_size);
    return m;
}

} // namespace ran_bench
