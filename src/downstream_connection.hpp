// src/downstream_connection.hpp
// Downstream connection internals — pending transactions keyed by TransactionID.

#pragma once

#include "pending.hpp"
#include "registry.hpp"
#include "stream_connection.hpp"
#include "ran/downstream.hpp"

namespace ran {

struct DownstreamConnection::Inner : public StreamConnection<DownstreamReply> {
    Inner(RanConfig config, std::shared_ptr<TransportFactory> factory);
    ~Inner() override;

    std::shared_future<DownstreamResult> send(DownstreamMessage message);
    DownstreamReply receive(std::chrono::milliseconds timeout, std::optional<uint64_t> transaction_id);
    DownstreamResult wait_result(uint64_t transaction_id, std::chrono::milliseconds timeout);
    size_t pending() const { return pending_.size(); }

    std::optional<DownstreamReply> next() { return next_for_stream(); }

protected:
    void on_frame(const std::string& text) override;
    void on_idle(Clock::time_point now) override;
    void on_session_end(const RanError& cause) override;
    void on_closed() override;

private:
    void correlate(const DownstreamAck& ack);
    void correlate(const DownstreamResult& result);
    void unmatched(const char* what, uint64_t transaction_id);

    TransactionRegistry<PendingDownstreamPtr> pending_;
};

} // namespace ran
