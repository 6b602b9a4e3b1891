// examples/logging.cpp
// Routing the library's log output through an application-owned spdlog logger.

#include "ran/ran.hpp"
#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

int main() {
    try {
        // Register "ran" before the first connection; the library picks it up.
        auto log = spdlog::basic_logger_mt("ran", "ran-routing.log");
        log->set_level(spdlog::level::debug);
        log->set_pattern("%Y-%m-%dT%H:%M:%S.%f %l %v");

        auto client = ran::Client::create(
            ran::RanConfig::builder("YOUR_ACCESS_TOKEN")
                .url("ws://localhost:8080/api/v1.0")
                .reconnect_max_attempts(3)
                .build()
        );

        // Connection ids (ws[...]) tag every line belonging to one stream.
        try {
            auto upstream = client->upstream().create_connection();
            std::cout << "connected as " << upstream.id() << std::endl;
        } catch (const ran::RanError& e) {
            std::cout << "connect failed (" << e.what() << "), see ran-routing.log" << std::endl;
        }

        client->close();
        log->flush();
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger setup failed: " << e.what() << std::endl;
        return 1;
    } catch (const ran::RanError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
