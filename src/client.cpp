// src/client.cpp
// RAN routing client.

#include "ran/client.hpp"
#include "ran/log.hpp"

namespace ran {

std::unique_ptr<Client> Client::create(RanConfig config) {
    return std::unique_ptr<Client>(new Client(std::move(config)));
}

Client::Client(RanConfig config)
    : config_(std::move(config)),
      upstream_(config_),
      downstream_(config_) {
    logger()->info("ran routing client ready: upstream {} downstream {}",
                   config_.upstream_url(), config_.downstream_url());
}

Client::~Client() {
    close();
}

void Client::close() {
    upstream_.close();
    downstream_.close();
}

} // namespace ran
