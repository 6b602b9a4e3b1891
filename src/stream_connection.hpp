// src/stream_connection.hpp
// Stream connection core — reader thread, lifecycle state machine, inbound queue.
//
// One transport session at a time, one reader thread per connection. The
// reader decodes frames through on_frame(), sweeps deadlines in on_idle() and
// hands over to the reconnect supervisor when a session is lost.

#pragma once

#include "reconnect.hpp"
#include "transport.hpp"
#include "ran/config.hpp"
#include "ran/error.hpp"
#include "ran/log.hpp"
#include "ran/types.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

namespace ran {

// Random 64-bit identifier rendered as 16 hex digits, used in log lines as ws[<id>].
inline std::string make_connection_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

template <typename Inbound>
class StreamConnection {
public:
    using Clock = std::chrono::steady_clock;

    StreamConnection(StreamKind kind, RanConfig config, std::shared_ptr<TransportFactory> factory)
        : kind_(kind), config_(std::move(config)), factory_(std::move(factory)),
          id_(make_connection_id()), log_(logger()),
          supervisor_(BackoffPolicy::from(config_)) {}

    virtual ~StreamConnection() { stop(); }

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

    // Establish the first session and start the reader thread. Blocks.
    // With auto-reconnect, failed attempts are retried with backoff.
    void connect() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_ || state_ == ConnectionState::Closed) {
                throw RanError::closed();
            }
            state_ = ConnectionState::Connecting;
            connecting_ = true;
        }

        try {
            try {
                if (config_.auto_reconnect()) {
                    supervisor_.run([this] { open_session(); }, retry_logger());
                } else {
                    open_session();
                }
            } catch (const RanError&) {
                throw;
            } catch (const std::exception& e) {
                throw RanError::io(e.what());
            }
        } catch (const RanError& e) {
            bool cancelled;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connecting_ = false;
                state_ = ConnectionState::Closed;
                cancelled = close_requested_ || e.kind() == ErrorKind::Closed;
                if (!cancelled) terminal_ = e;
            }
            cv_.notify_all();
            if (cancelled) throw RanError::closed("connection closed during connect");
            log_->error("ws[{}] {} connect failed: {}", id_, to_string(kind_), e.what());
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            connecting_ = false;
            reader_started_ = true;
            if (!close_requested_) state_ = ConnectionState::Connected;
        }
        reader_ = std::thread(&StreamConnection::run, this);
    }

    // Non-blocking and idempotent.
    void close() {
        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_ || state_ == ConnectionState::Closed) return;
            close_requested_ = true;
            if (!reader_started_ && !connecting_) {
                state_ = ConnectionState::Closed;
                cv_.notify_all();
                return;
            }
            state_ = ConnectionState::Closing;
            transport = transport_;
        }
        log_->debug("ws[{}] closing {} connection", id_, to_string(kind_));
        cv_.notify_all();
        supervisor_.cancel();
        if (transport) transport->shutdown();
    }

    // Blocks until Closed. Throws the terminal error if the connection ended abnormally.
    void wait_closed() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return state_ == ConnectionState::Closed; });
        if (terminal_) throw *terminal_;
    }

    // wait_closed() bounded by `timeout`. Returns false if still not Closed.
    bool wait_closed_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return state_ == ConnectionState::Closed; })) {
            return false;
        }
        if (terminal_) throw *terminal_;
        return true;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == ConnectionState::Closed;
    }

    ConnectionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    const std::string& id() const noexcept { return id_; }
    StreamKind kind() const noexcept { return kind_; }
    std::chrono::milliseconds close_timeout() const noexcept { return config_.close_timeout(); }

protected:
    // Reader-thread hooks.
    virtual void on_frame(const std::string& text) = 0;
    virtual void on_idle(Clock::time_point /*now*/) {}
    virtual void on_session_end(const RanError& /*cause*/) {}
    virtual void on_closed() {}

    // Derived destructors call this before their members go away.
    void stop() {
        close();
        if (reader_.joinable()) {
            if (reader_.get_id() == std::this_thread::get_id()) {
                reader_.detach();
            } else {
                reader_.join();
            }
        }
    }

    const RanConfig& config() const noexcept { return config_; }
    const std::shared_ptr<spdlog::logger>& log() const noexcept { return log_; }

    // Reader thread: enqueue for the consumer, blocking while the buffer is full.
    void push(Inbound message) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return queue_.size() < config_.buffer_size() || close_requested_; });
        if (close_requested_) {
            log_->debug("ws[{}] dropping inbound message during close", id_);
            return;
        }
        queue_.push_back(std::move(message));
        lock.unlock();
        cv_.notify_all();
    }

    // Reader thread: enqueue without ever blocking. When the buffer is full the
    // oldest queued message is dropped to make room.
    void push_latest(Inbound message) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_) return;
            if (queue_.size() >= config_.buffer_size()) {
                queue_.pop_front();
                dropped = true;
            }
            queue_.push_back(std::move(message));
        }
        cv_.notify_all();
        if (dropped) {
            log_->warn("ws[{}] {} buffer full ({}); dropped the oldest queued message",
                       id_, to_string(kind_), config_.buffer_size());
        }
    }

    // Next message for produce(); nullopt after a graceful close once drained.
    std::optional<Inbound> next_for_stream() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || state_ == ConnectionState::Closed; });
        if (!queue_.empty()) {
            Inbound message = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            cv_.notify_all();
            return message;
        }
        if (terminal_) throw *terminal_;
        return std::nullopt;
    }

    // First queued message matching `pred`, waiting until `deadline`.
    // nullopt on timeout; throws once closed with nothing matching.
    template <typename Pred>
    std::optional<Inbound> pop_if(Pred pred, Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            auto it = std::find_if(queue_.begin(), queue_.end(), pred);
            if (it != queue_.end()) {
                Inbound message = std::move(*it);
                queue_.erase(it);
                lock.unlock();
                cv_.notify_all();
                return message;
            }
            if (state_ == ConnectionState::Closed) {
                if (terminal_) throw *terminal_;
                throw RanError::closed();
            }
            if (Clock::now() >= deadline) return std::nullopt;
            cv_.wait_until(lock, deadline);
        }
    }

    template <typename Pred>
    bool queued(Pred pred) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(queue_.begin(), queue_.end(), pred);
    }

    template <typename Pred>
    size_t discard_if(Pred pred) {
        size_t removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::remove_if(queue_.begin(), queue_.end(), pred);
            removed = static_cast<size_t>(std::distance(it, queue_.end()));
            queue_.erase(it, queue_.end());
        }
        if (removed > 0) cv_.notify_all();
        return removed;
    }

    // Throws Closed once close() was called or the connection ended.
    void ensure_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_requested_ || state_ == ConnectionState::Closed) {
            throw RanError::closed();
        }
    }

    void send_text(const std::string& text) {
        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_ || state_ == ConnectionState::Closed) {
                throw RanError::closed();
            }
            if (state_ != ConnectionState::Connected) {
                throw RanError::transport(std::string("connection is ") + to_string(state_));
            }
            transport = transport_;
        }
        transport->send_text(text);
        log_->debug("ws[{}] sent {}", id_, text);
    }

    // Deliver an asynchronous error to the configured callback. Runs on the
    // reader thread; a throwing callback is logged and otherwise ignored.
    void report(const RanError& error) const {
        if (!config_.on_error()) return;
        try {
            config_.on_error()(error);
        } catch (const std::exception& e) {
            log_->error("ws[{}] on_error callback threw: {}", id_, e.what());
        }
    }

private:
    void open_session() {
        std::shared_ptr<Transport> transport = factory_->create(kind_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_) throw RanError::closed();
            transport_ = transport;
        }
        transport->connect();
        uint64_t session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session = ++sessions_;
        }
        log_->info("ws[{}] {} stream connected (session {})", id_, to_string(kind_), session);
    }

    ReconnectSupervisor::RetryCallback retry_logger() {
        return [this](uint32_t attempt, const RanError& error, std::chrono::milliseconds delay) {
            log_->warn("ws[{}] connect attempt {} failed: {}; retrying in {} ms",
                       id_, attempt, error.what(), delay.count());
        };
    }

    bool closing() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_requested_;
    }

    std::shared_ptr<Transport> current_transport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transport_;
    }

    void set_state(ConnectionState state) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_ || state_ == ConnectionState::Closed) return;
            state_ = state;
        }
        cv_.notify_all();
    }

    void run() {
        while (true) {
            std::shared_ptr<Transport> transport = current_transport();
            try {
                std::string text;
                ReadStatus status = transport->read_message(text, config_.poll_interval());
                if (status == ReadStatus::Message) {
                    log_->debug("ws[{}] received {}", id_, text);
                    on_frame(text);
                    continue;
                }
                if (status == ReadStatus::Idle) {
                    on_idle(Clock::now());
                    continue;
                }
                if (closing()) break;
                throw RanError::transport("connection closed by peer");
            } catch (const RanError& e) {
                if (closing()) break;
                if (e.kind() == ErrorKind::Decode || !config_.auto_reconnect()) {
                    fail(e);
                    return;
                }
                if (!recover(e)) return;
            } catch (const std::exception& e) {
                if (closing()) break;
                fail(RanError::io(e.what()));
                return;
            }
        }
        finish();
    }

    // Re-establish the session. Returns false when the connection ended.
    bool recover(const RanError& cause) {
        log_->warn("ws[{}] {} session lost: {}; reconnecting", id_, to_string(kind_), cause.what());
        if (auto transport = current_transport()) transport->shutdown();
        on_session_end(cause);
        set_state(ConnectionState::Disconnected);

        try {
            set_state(ConnectionState::Connecting);
            supervisor_.run([this] { open_session(); }, retry_logger());
        } catch (const RanError& e) {
            if (e.kind() == ErrorKind::Closed || closing()) {
                finish();
            } else {
                fail(e);
            }
            return false;
        } catch (const std::exception& e) {
            if (closing()) {
                finish();
            } else {
                fail(RanError::io(e.what()));
            }
            return false;
        }

        set_state(ConnectionState::Connected);
        log_->info("ws[{}] {} stream reconnected", id_, to_string(kind_));
        return true;
    }

    void fail(const RanError& error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            terminal_ = error;
        }
        log_->error("ws[{}] {} connection failed: {}", id_, to_string(kind_), error.what());
        finish();
        report(error);
    }

    void finish() {
        if (auto transport = current_transport()) transport->shutdown();
        on_closed();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = ConnectionState::Closed;
        }
        cv_.notify_all();
        log_->info("ws[{}] {} connection closed", id_, to_string(kind_));
    }

    const StreamKind kind_;
    const RanConfig config_;
    std::shared_ptr<TransportFactory> factory_;
    const std::string id_;
    std::shared_ptr<spdlog::logger> log_;
    ReconnectSupervisor supervisor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool close_requested_ = false;
    bool connecting_ = false;
    bool reader_started_ = false;
    uint64_t sessions_ = 0;
    std::shared_ptr<Transport> transport_;
    std::deque<Inbound> queue_;
    std::optional<RanError> terminal_;

    std::thread reader_;
};

} // namespace ran
