// include/ran/connection_manager.hpp
// Connection managers — factories and owners of stream connections.

#pragma once

#include "config.hpp"
#include "downstream.hpp"
#include "upstream.hpp"
#include <memory>

namespace ran {

class TransportFactory;

// Creates upstream connections over one shared transport pool. close()
// cascades to every live connection; a closed manager refuses new ones.
// Sibling connections each receive a disjoint share of the uplinks.
class UpstreamConnectionManager {
public:
    // Throws RanError (Configuration) if the TLS context cannot be set up.
    explicit UpstreamConnectionManager(RanConfig config);
    UpstreamConnectionManager(RanConfig config, std::shared_ptr<TransportFactory> transports);
    ~UpstreamConnectionManager();

    UpstreamConnectionManager(const UpstreamConnectionManager&) = delete;
    UpstreamConnectionManager& operator=(const UpstreamConnectionManager&) = delete;

    // Open a new upstream stream. Blocks until the first session is up.
    // Throws RanError: Closed if the manager is closed, Transport or
    // ReconnectExhausted if the stream could not be established.
    UpstreamConnection create_connection();

    // Close every live connection and wait for each. Idempotent.
    void close();
    bool is_closed() const;

    // Connections created here whose handles are still alive.
    size_t live_connections() const;

private:
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

// Creates downstream connections over one shared transport pool.
class DownstreamConnectionManager {
public:
    explicit DownstreamConnectionManager(RanConfig config);
    DownstreamConnectionManager(RanConfig config, std::shared_ptr<TransportFactory> transports);
    ~DownstreamConnectionManager();

    DownstreamConnectionManager(const DownstreamConnectionManager&) = delete;
    DownstreamConnectionManager& operator=(const DownstreamConnectionManager&) = delete;

    DownstreamConnection create_connection();

    void close();
    bool is_closed() const;
    size_t live_connections() const;

private:
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace ran
