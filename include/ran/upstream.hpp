// include/ran/upstream.hpp
// Upstream stream connection — uplinks in, acknowledgments and rejects out.

#pragma once

#include "error.hpp"
#include "messages.hpp"
#include "stream.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ran {

// Scoped handle to one upstream stream. Created by
// UpstreamConnectionManager::create_connection(). Destroying the handle
// closes the connection and waits for it to finish.
//
// Every delivered UpstreamMessage opens an obligation that is settled by
// exactly one acknowledge() or reject(). Obligations do not survive a
// reconnect: the network treats them as lost.
//
// Example:
//   auto upstream = client->upstream().create_connection();
//   for (const auto& message : upstream.produce()) {
//       upstream.acknowledge(message.transaction_id, message.dev_euis[0], mic);
//   }
class UpstreamConnection {
public:
    struct Inner;

    explicit UpstreamConnection(std::shared_ptr<Inner> inner);
    ~UpstreamConnection();

    UpstreamConnection(const UpstreamConnection&) = delete;
    UpstreamConnection& operator=(const UpstreamConnection&) = delete;
    UpstreamConnection(UpstreamConnection&&) noexcept;
    UpstreamConnection& operator=(UpstreamConnection&&) noexcept;

    // Inbound uplinks in arrival order. Ends after a graceful close once the
    // buffer is drained; throws RanError on an abnormal end.
    MessageStream<UpstreamMessage> produce();

    // Next uplink. Throws RanError (Timeout) if none arrives within `timeout`.
    UpstreamMessage receive(std::chrono::milliseconds timeout);

    // Prove key possession for an uplink. Throws RanError:
    //   UnknownTransaction — id not outstanding (never delivered or already settled)
    //   Validation         — dev_eui or mic not offered by that uplink; the
    //                        obligation stays open
    void acknowledge(uint64_t transaction_id, uint64_t dev_eui, uint32_t mic);

    // Decline an uplink. Throws RanError (UnknownTransaction) like acknowledge().
    void reject(uint64_t transaction_id, UpstreamRejectResultCode result_code,
                std::optional<std::string> result_message = std::nullopt);

    // Number of delivered uplinks still waiting for acknowledge() or reject().
    size_t outstanding() const;

    // --- Lifecycle ---

    void close();
    void wait_closed();
    bool is_closed() const;
    ConnectionState state() const;
    const std::string& id() const;

private:
    std::shared_ptr<Inner> inner_;
};

} // namespace ran
