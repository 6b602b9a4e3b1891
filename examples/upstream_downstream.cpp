// examples/upstream_downstream.cpp
// Minimal LNS loop — settle every uplink and answer each with a Class A downlink.
//
//   cmake -B build -DRAN_BUILD_EXAMPLES=ON && cmake --build build
//   RAN_TOKEN=... ./build/ran_upstream_downstream
//
// Override the endpoint (e.g. a local RAN emulator):
//
//   RAN_URL=ws://localhost:8080/api/v1.0 RAN_TOKEN=... ./build/ran_upstream_downstream

#include "ran/ran.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

int main() {
    const char* token = std::getenv("RAN_TOKEN");
    if (token == nullptr) {
        std::cerr << "RAN_TOKEN is not set" << std::endl;
        return 1;
    }

    try {
        ran::RanConfig config = std::getenv("RAN_URL")
            ? ran::RanConfig::development(token, std::getenv("RAN_URL"))
            : ran::RanConfig::production(token, "eu");
        auto client = ran::Client::create(std::move(config));

        auto upstream = client->upstream().create_connection();
        auto downstream = client->downstream().create_connection();

        // Downlink results are consumed on their own thread.
        std::thread results([&downstream] {
            try {
                for (const auto& reply : downstream.produce()) {
                    if (auto* result = std::get_if<ran::DownstreamResult>(&reply)) {
                        std::cout << "  <- downlink " << result->transaction_id << ": "
                                  << ran::to_string(result->result_code) << std::endl;
                    }
                }
            } catch (const ran::RanError& e) {
                std::cerr << "downstream ended: " << e.what() << std::endl;
            }
        });

        uint64_t next_downlink = 1;
        for (const auto& message : upstream.produce()) {
            std::cout << "  -> uplink " << message.transaction_id
                      << " (" << message.dev_euis.size() << " candidate devices)" << std::endl;

            // A real LNS picks the device whose session key reproduces one of
            // the offered MICs, and rejects with MICFailed when none does.
            if (message.mic_challenge.empty()) {
                upstream.reject(message.transaction_id, ran::UpstreamRejectResultCode::MICFailed);
                continue;
            }
            uint64_t dev_eui = message.dev_euis.front();
            upstream.acknowledge(message.transaction_id, dev_eui, message.mic_challenge.front());

            auto window = ran::TransmissionWindow::class_a(
                ran::Radio{message.radio.frequency, message.radio.modulation}, 1);
            downstream.send(next_downlink++, ran::DeviceTarget{dev_eui}, window, {0x60, 0x00});
        }

        downstream.close();
        results.join();
        client->close();
    } catch (const ran::RanError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
