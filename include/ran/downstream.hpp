// include/ran/downstream.hpp
// Downstream stream connection — downlinks out, acknowledgments and results in.

#pragma once

#include "error.hpp"
#include "messages.hpp"
#include "stream.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ran {

// Scoped handle to one downstream stream. Created by
// DownstreamConnectionManager::create_connection(). Destroying the handle
// closes the connection and waits for it to finish.
//
// A sent downlink is Sent until the network answers with DownstreamAck
// (mailbox assigned), then resolves with exactly one DownstreamResult or
// expires after the configured reply timeout.
//
// Example:
//   auto downstream = client->downstream().create_connection();
//   auto result = downstream.send(1, ran::DeviceTarget{dev_eui},
//                                 ran::TransmissionWindow::class_a(radio, 1), payload);
//   if (result.get().result_code == ran::DownstreamResultCode::Success) { ... }
class DownstreamConnection {
public:
    struct Inner;

    explicit DownstreamConnection(std::shared_ptr<Inner> inner);
    ~DownstreamConnection();

    DownstreamConnection(const DownstreamConnection&) = delete;
    DownstreamConnection& operator=(const DownstreamConnection&) = delete;
    DownstreamConnection(DownstreamConnection&&) noexcept;
    DownstreamConnection& operator=(DownstreamConnection&&) noexcept;

    // Validate, register and transmit a downlink. The returned future holds
    // the DownstreamResult, or the RanError (Timeout, Transport, Closed) that
    // ended the transaction. Throws RanError:
    //   Validation           — malformed message or deadline beyond the horizon
    //   DuplicateTransaction — id already outstanding on this connection
    //   Closed / Transport   — connection not usable; nothing was registered
    std::shared_future<DownstreamResult> send(uint64_t transaction_id, DownstreamTarget target,
                                              TransmissionWindow tx_window,
                                              std::vector<uint8_t> phy_payload,
                                              std::optional<uint32_t> target_dev_addr = std::nullopt);

    // Inbound acknowledgments and results in arrival order. Ends after a
    // graceful close once drained; throws RanError on an abnormal end.
    // Unread replies never hold up send() futures: past buffer_size the
    // oldest queued reply is dropped.
    MessageStream<DownstreamReply> produce();

    // Next reply, optionally only for `transaction_id`. Throws RanError:
    //   Timeout            — nothing matching within `timeout`; a filtered
    //                        transaction is expired
    //   UnknownTransaction — filtered id neither outstanding nor queued
    DownstreamReply receive(std::chrono::milliseconds timeout,
                            std::optional<uint64_t> transaction_id = std::nullopt);

    // Block for the final result of an outstanding transaction.
    DownstreamResult wait_result(uint64_t transaction_id, std::chrono::milliseconds timeout);

    // Transactions sent and not yet resolved or expired.
    size_t pending() const;

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
