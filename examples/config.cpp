// Full RanConfig builder — all available options with defaults.
//
//   cmake -B build -DRAN_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/ran_config

#include "ran/ran.hpp"
#include <chrono>
#include <iostream>

int main() {
    try {
        auto config = ran::RanConfig::builder("YOUR_ACCESS_TOKEN")
            .coverage("eu")                                             // default: eu
            // .url("wss://ran-routing.eu.everynet.io/api/v1.0")        // default: derived from coverage
            // .upstream_url(...) / .downstream_url(...)                // default: <url>/stream/{upstream,downstream}
            .network_timeout(std::chrono::milliseconds(30000))          // default: 30s connect/write timeout
            .close_timeout(std::chrono::milliseconds(5000))             // default: 5s graceful shutdown
            .poll_interval(std::chrono::milliseconds(1000))             // default: 1s reader poll
            .downstream_reply_timeout(std::chrono::milliseconds(600000))// default: 10min per downlink
            .buffer_size(1024)                                          // default: 1024 queued messages
            .auto_reconnect(true)                                       // default: on
            .reconnect_initial_delay(std::chrono::milliseconds(1000))   // default: 1s
            .reconnect_max_delay(std::chrono::milliseconds(30000))      // default: 30s
            .reconnect_multiplier(1.5)                                  // default: x1.5 per attempt
            .reconnect_max_attempts(0)                                  // default: 0 = unbounded
            .verify_tls(true)                                           // default: on
            .on_error([](const ran::RanError& e) {                      // default: errors are only logged
                std::cerr << "[ran] " << e.what() << std::endl;
            })
            .build();

        std::cout << "upstream:   " << config.upstream_url() << std::endl;
        std::cout << "downstream: " << config.downstream_url() << std::endl;

        // No network traffic until a connection is created.
        auto client = ran::Client::create(std::move(config));
        client->close();
    } catch (const ran::RanError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
