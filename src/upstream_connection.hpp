// src/upstream_connection.hpp
// Upstream connection internals — MIC-challenge obligations per delivered uplink.

#pragma once

#include "registry.hpp"
#include "stream_connection.hpp"
#include "ran/upstream.hpp"

#include <vector>

namespace ran {

struct UpstreamConnection::Inner : public StreamConnection<UpstreamMessage> {
    Inner(RanConfig config, std::shared_ptr<TransportFactory> factory);
    ~Inner() override;

    UpstreamMessage receive(std::chrono::milliseconds timeout);
    void acknowledge(uint64_t transaction_id, uint64_t dev_eui, uint32_t mic);
    void reject(uint64_t transaction_id, UpstreamRejectResultCode result_code,
                std::optional<std::string> result_message);
    size_t outstanding() const { return obligations_.size(); }

    std::optional<UpstreamMessage> next() { return next_for_stream(); }

protected:
    void on_frame(const std::string& text) override;
    void on_session_end(const RanError& cause) override;
    void on_closed() override;

private:
    // What acknowledge() may claim for one delivered uplink.
    struct Obligation {
        std::vector<uint64_t> dev_euis;
        std::vector<uint32_t> mic_challenge;
    };

    TransactionRegistry<Obligation> obligations_;
};

} // namespace ran
