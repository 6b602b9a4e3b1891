// src/connection_manager.cpp
// Connection managers — one connection set per stream kind over a shared transport pool.

#include "ran/connection_manager.hpp"
#include "downstream_connection.hpp"
#include "upstream_connection.hpp"
#include "websocket.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

namespace ran {

namespace {

// Weakly tracks the connections it created. Handles own the connections;
// the set only needs to reach the live ones on close().
template <typename Connection>
class ConnectionSet {
public:
    ConnectionSet(RanConfig config, std::shared_ptr<TransportFactory> transports)
        : config_(std::move(config)), transports_(std::move(transports)) {
        if (!transports_) {
            throw RanError::configuration("transport factory must not be null");
        }
    }

    std::shared_ptr<Connection> open() {
        auto connection = std::make_shared<Connection>(config_, transports_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) throw RanError::closed("connection manager is closed");
            prune();
            connections_.push_back(connection);
        }
        // A concurrent close() reaches the connection through the set and
        // makes connect() throw Closed.
        connection->connect();
        return connection;
    }

    void close(StreamKind kind) {
        std::vector<std::shared_ptr<Connection>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            for (auto& weak : connections_) {
                if (auto connection = weak.lock()) live.push_back(std::move(connection));
            }
            connections_.clear();
        }

        logger()->debug("closing {} manager with {} live connections", to_string(kind), live.size());
        for (auto& connection : live) {
            connection->close();
        }
        for (auto& connection : live) {
            try {
                if (!connection->wait_closed_for(config_.close_timeout())) {
                    logger()->warn("ws[{}] {} connection did not close within {} ms",
                                   connection->id(), to_string(kind), config_.close_timeout().count());
                }
            } catch (const RanError& e) {
                logger()->warn("ws[{}] {} connection ended with error: {}",
                               connection->id(), to_string(kind), e.what());
            }
        }
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t live() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
            [](const std::weak_ptr<Connection>& weak) {
                auto connection = weak.lock();
                return connection && !connection->is_closed();
            }));
    }

private:
    void prune() {
        connections_.erase(
            std::remove_if(connections_.begin(), connections_.end(),
                           [](const std::weak_ptr<Connection>& weak) { return weak.expired(); }),
            connections_.end());
    }

    const RanConfig config_;
    std::shared_ptr<TransportFactory> transports_;
    mutable std::mutex mutex_;
    bool closed_ = false;
    std::vector<std::weak_ptr<Connection>> connections_;
};

} // anonymous namespace

// --- UpstreamConnectionManager ---

struct UpstreamConnectionManager::Inner {
    ConnectionSet<UpstreamConnection::Inner> connections;

    Inner(RanConfig config, std::shared_ptr<TransportFactory> transports)
        : connections(std::move(config), std::move(transports)) {}
};

UpstreamConnectionManager::UpstreamConnectionManager(RanConfig config)
    : UpstreamConnectionManager(config, std::make_shared<WebSocketTransportFactory>(config)) {}

UpstreamConnectionManager::UpstreamConnectionManager(RanConfig config,
                                                     std::shared_ptr<TransportFactory> transports)
    : inner_(std::make_unique<Inner>(std::move(config), std::move(transports))) {}

UpstreamConnectionManager::~UpstreamConnectionManager() {
    close();
}

UpstreamConnection UpstreamConnectionManager::create_connection() {
    return UpstreamConnection(inner_->connections.open());
}

void UpstreamConnectionManager::close() {
    inner_->connections.close(StreamKind::Upstream);
}

bool UpstreamConnectionManager::is_closed() const {
    return inner_->connections.is_closed();
}

size_t UpstreamConnectionManager::live_connections() const {
    return inner_->connections.live();
}

// --- DownstreamConnectionManager ---

struct DownstreamConnectionManager::Inner {
    ConnectionSet<DownstreamConnection::Inner> connections;

    Inner(RanConfig config, std::shared_ptr<TransportFactory> transports)
        : connections(std::move(config), std::move(transports)) {}
};

DownstreamConnectionManager::DownstreamConnectionManager(RanConfig config)
    : DownstreamConnectionManager(config, std::make_shared<WebSocketTransportFactory>(config)) {}

DownstreamConnectionManager::DownstreamConnectionManager(RanConfig config,
                                                         std::shared_ptr<TransportFactory> transports)
    : inner_(std::make_unique<Inner>(std::move(config), std::move(transports))) {}

DownstreamConnectionManager::~DownstreamConnectionManager() {
    close();
}

DownstreamConnection DownstreamConnectionManager::create_connection() {
    return DownstreamConnection(inner_->connections.open());
}

void DownstreamConnectionManager::close() {
    inner_->connections.close(StreamKind::Downstream);
}

bool DownstreamConnectionManager::is_closed() const {
    return inner_->connections.is_closed();
}

size_t DownstreamConnectionManager::live_connections() const {
    return inner_->connections.live();
}

} // namespace ran
