// include/ran/client.hpp
// RAN routing client — entry point owning the upstream and downstream managers.

#pragma once

#include "config.hpp"
#include "connection_manager.hpp"
#include "error.hpp"
#include <memory>

namespace ran {

// The RAN routing client.
//
// Created via Client::create(config). Endpoints are derived from the config
// (coverage or explicit URL); no network traffic happens until a connection
// is created.
//
// Example:
//   auto client = ran::Client::create(ran::RanConfig::production(token, "eu"));
//   auto upstream = client->upstream().create_connection();
//   auto downstream = client->downstream().create_connection();
//   ...
//   client->close();
class Client {
public:
    // Throws RanError (Configuration) if the transport pools cannot be set up.
    static std::unique_ptr<Client> create(RanConfig config);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    UpstreamConnectionManager& upstream() noexcept { return upstream_; }
    DownstreamConnectionManager& downstream() noexcept { return downstream_; }

    const RanConfig& config() const noexcept { return config_; }

    // Close both managers and every connection they created. Idempotent.
    void close();

private:
    explicit Client(RanConfig config);

    RanConfig config_;
    UpstreamConnectionManager upstream_;
    DownstreamConnectionManager downstream_;
};

} // namespace ran
