// tests/mock_transport.hpp
// Scripted in-memory transport pool standing in for the RAN.

#pragma once

#include "transport.hpp"
#include "ran/error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ran {
namespace test {

// Server side of one in-memory session. The test plays the network: it
// delivers frames, reads what the client sent, and ends the session.
class MockSession {
public:
    explicit MockSession(StreamKind kind) : kind_(kind) {}

    StreamKind kind() const noexcept { return kind_; }

    // --- Network side ---

    void deliver(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(std::move(frame));
        }
        cv_.notify_all();
    }

    // Abrupt loss: the client's next read throws Transport.
    void drop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped_ = true;
        }
        cv_.notify_all();
    }

    // Orderly close initiated by the network.
    void close_by_peer() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_closed_ = true;
        }
        cv_.notify_all();
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outbox_;
    }

    // Wait until the client has sent at least `count` frames.
    bool wait_sent(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return outbox_.size() >= count; });
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    // --- Client side ---

    ReadStatus read(std::string& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] {
            return !inbox_.empty() || dropped_ || peer_closed_ || shutdown_;
        });
        if (shutdown_) return ReadStatus::Closed;
        if (!inbox_.empty()) {
            out = std::move(inbox_.front());
            inbox_.pop_front();
            return ReadStatus::Message;
        }
        if (dropped_) throw RanError::transport("connection reset by peer");
        if (peer_closed_) return ReadStatus::Closed;
        return ReadStatus::Idle;
    }

    void send(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || dropped_ || peer_closed_) {
                throw RanError::transport("session is not open");
            }
            outbox_.push_back(text);
        }
        cv_.notify_all();
    }

    void shutdown() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    const StreamKind kind_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    std::vector<std::string> outbox_;
    bool dropped_ = false;
    bool peer_closed_ = false;
    bool shutdown_ = false;
};

using MockSessionPtr = std::shared_ptr<MockSession>;

// Transport pool whose sessions are MockSessions. Connect attempts can be
// scripted to fail.
class MockTransportFactory : public TransportFactory,
                             public std::enable_shared_from_this<MockTransportFactory> {
public:
    // The next `count` connect attempts fail with a Transport error.
    void fail_next_connects(size_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ = count;
    }

    // Every connect attempt fails until called again with false.
    void refuse_connects(bool refuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_ = refuse;
    }

    // create() throws a non-library exception until called again with false.
    void break_create(bool broken) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_ = broken;
    }

    size_t connect_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    size_t session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    // The index-th successfully connected session, waiting for it to appear.
    MockSessionPtr session(size_t index, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return sessions_.size() > index; })) {
            return nullptr;
        }
        return sessions_[index];
    }

    std::unique_ptr<Transport> create(StreamKind kind) override;

    // Called by MockTransport::connect().
    MockSessionPtr open(StreamKind kind) {
        MockSessionPtr session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempts_++;
            if (refuse_) throw RanError::transport("connection refused");
            if (failures_ > 0) {
                failures_--;
                throw RanError::transport("connection refused");
            }
            session = std::make_shared<MockSession>(kind);
            sessions_.push_back(session);
        }
        cv_.notify_all();
        return session;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t failures_ = 0;
    bool refuse_ = false;
    bool broken_ = false;
    size_t attempts_ = 0;
    std::vector<MockSessionPtr> sessions_;
};

class MockTransport : public Transport {
public:
    MockTransport(std::shared_ptr<MockTransportFactory> factory, StreamKind kind)
        : factory_(std::move(factory)), kind_(kind) {}

    void connect() override {
        MockSessionPtr session = factory_->open(kind_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            session->shutdown();
            throw RanError::transport("shut down during connect");
        }
        session_ = std::move(session);
    }

    ReadStatus read_message(std::string& out, std::chrono::milliseconds timeout) override {
        return current()->read(out, timeout);
    }

    void send_text(const std::string& text) override {
        current()->send(text);
    }

    void shutdown() noexcept override {
        MockSessionPtr session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            session = session_;
        }
        if (session) session->shutdown();
    }

private:
    MockSessionPtr current() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) throw RanError::transport("not connected");
        return session_;
    }

    std::shared_ptr<MockTransportFactory> factory_;
    const StreamKind kind_;
    std::mutex mutex_;
    MockSessionPtr session_;
    bool shutdown_ = false;
};

inline std::unique_ptr<Transport> MockTransportFactory::create(StreamKind kind) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_) throw std::runtime_error("out of file descriptors");
    }
    return std::make_unique<MockTransport>(shared_from_this(), kind);
}

} // namespace test
} // namespace ran
