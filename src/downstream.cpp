// src/downstream.cpp
// Downstream connection: downlink transmission and reply correlation.

#include "downstream_connection.hpp"
#include "codec.hpp"
#include "validation.hpp"

namespace ran {

namespace {

uint64_t unix_now_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

bool matches(const DownstreamReply& reply, const std::optional<uint64_t>& transaction_id) {
    return !transaction_id || transaction_id_of(reply) == *transaction_id;
}

} // anonymous namespace

// --- Inner ---

DownstreamConnection::Inner::Inner(RanConfig config, std::shared_ptr<TransportFactory> factory)
    : StreamConnection<DownstreamReply>(StreamKind::Downstream, std::move(config), std::move(factory)) {}

DownstreamConnection::Inner::~Inner() {
    stop();
}

std::shared_future<DownstreamResult> DownstreamConnection::Inner::send(DownstreamMessage message) {
    ensure_open();
    validation::check(message);
    validation::check_deadline_horizon(message.tx_window, unix_now_seconds());

    auto pending = std::make_shared<PendingDownstream>();
    auto deadline = Clock::now() + config().downstream_reply_timeout();
    if (!pending_.register_entry(message.transaction_id, pending, deadline)) {
        throw RanError::duplicate_transaction(message.transaction_id);
    }

    try {
        send_text(codec::encode(message));
    } catch (const RanError&) {
        pending_.take(message.transaction_id);
        throw;
    }
    return pending->future();
}

DownstreamReply DownstreamConnection::Inner::receive(std::chrono::milliseconds timeout,
                                                     std::optional<uint64_t> transaction_id) {
    auto deadline = Clock::now() + timeout;
    auto wanted = [&transaction_id](const DownstreamReply& reply) { return matches(reply, transaction_id); };

    if (transaction_id && !pending_.contains(*transaction_id) && !queued(wanted)) {
        throw RanError::unknown_transaction(*transaction_id);
    }

    auto reply = pop_if(wanted, deadline);
    if (reply) return std::move(*reply);

    std::string what = "no downstream reply";
    if (transaction_id) {
        what += " for transaction " + std::to_string(*transaction_id);
        if (auto expired = pending_.expire(*transaction_id)) {
            (*expired)->expire(RanError::timeout(what + " within " + std::to_string(timeout.count()) + " ms"));
            log()->warn("ws[{}] downstream transaction {} expired waiting for a reply", id(), *transaction_id);
        }
    }
    throw RanError::timeout(what + " within " + std::to_string(timeout.count()) + " ms");
}

DownstreamResult DownstreamConnection::Inner::wait_result(uint64_t transaction_id,
                                                          std::chrono::milliseconds timeout) {
    std::optional<std::shared_future<DownstreamResult>> future;
    pending_.resolve(transaction_id, [&future](PendingDownstreamPtr& pending) {
        future = pending->future();
        return false;
    });
    if (!future) {
        throw RanError::unknown_transaction(transaction_id);
    }

    if (future->wait_for(timeout) != std::future_status::ready) {
        if (auto expired = pending_.expire(transaction_id)) {
            (*expired)->expire(RanError::timeout("no DownstreamResult for transaction " +
                std::to_string(transaction_id) + " within " + std::to_string(timeout.count()) + " ms"));
            log()->warn("ws[{}] downstream transaction {} expired waiting for its result", id(), transaction_id);
        }
    }
    // Ready now: resolved by the reader or expired by whoever removed it.
    return future->get();
}

void DownstreamConnection::Inner::on_frame(const std::string& text) {
    Message message = codec::decode_expecting(text, {MessageKind::DownstreamAck, MessageKind::DownstreamResult});
    // Futures resolve during correlation, so replies never wait on the consumer.
    if (auto* ack = std::get_if<DownstreamAck>(&message)) {
        correlate(*ack);
        push_latest(std::move(*ack));
    } else {
        auto& result = std::get<DownstreamResult>(message);
        correlate(result);
        push_latest(std::move(result));
    }
}

void DownstreamConnection::Inner::correlate(const DownstreamAck& ack) {
    bool known = pending_.resolve(ack.transaction_id, [&](PendingDownstreamPtr& pending) {
        if (!pending->acked(ack.mailbox_id)) {
            log()->debug("ws[{}] late DownstreamAck for transaction {}", id(), ack.transaction_id);
        }
        return false;
    });
    if (!known) unmatched("DownstreamAck", ack.transaction_id);
}

void DownstreamConnection::Inner::correlate(const DownstreamResult& result) {
    bool known = pending_.resolve(result.transaction_id, [&](PendingDownstreamPtr& pending) {
        pending->resolve(result);
        return true;
    });
    if (!known) unmatched("DownstreamResult", result.transaction_id);
}

void DownstreamConnection::Inner::unmatched(const char* what, uint64_t transaction_id) {
    log()->warn("ws[{}] {} for unknown transaction {}", id(), what, transaction_id);
    report(RanError::unknown_transaction(transaction_id));
}

void DownstreamConnection::Inner::on_idle(Clock::time_point now) {
    pending_.expire_due(now, [this](uint64_t transaction_id, PendingDownstreamPtr& pending) {
        if (pending->expire(RanError::timeout("no DownstreamResult for transaction " +
                                              std::to_string(transaction_id) + " within " +
                                              std::to_string(config().downstream_reply_timeout().count()) +
                                              " ms"))) {
            log()->warn("ws[{}] downstream transaction {} timed out", id(), transaction_id);
        }
    });
}

void DownstreamConnection::Inner::on_session_end(const RanError& cause) {
    auto lost = pending_.drain();
    for (auto& item : lost) {
        item.second->expire(RanError::transport("session lost before DownstreamResult for transaction " +
                                                std::to_string(item.first) + ": " + cause.message()));
    }
    if (!lost.empty()) {
        log()->warn("ws[{}] {} pending downstream transactions failed with the session", id(), lost.size());
    }
}

void DownstreamConnection::Inner::on_closed() {
    auto left = pending_.drain();
    for (auto& item : left) {
        item.second->expire(RanError::closed());
    }
    if (!left.empty()) {
        log()->debug("ws[{}] closed with {} pending downstream transactions", id(), left.size());
    }
}

// --- DownstreamConnection ---

DownstreamConnection::DownstreamConnection(std::shared_ptr<Inner> inner)
    : inner_(std::move(inner)) {}

DownstreamConnection::~DownstreamConnection() {
    if (!inner_) return;
    inner_->close();
    try {
        if (!inner_->wait_closed_for(inner_->close_timeout())) {
            logger()->warn("ws[{}] downstream connection did not close within {} ms",
                           inner_->id(), inner_->close_timeout().count());
        }
    } catch (const RanError& e) {
        logger()->error("ws[{}] downstream connection ended with error: {}", inner_->id(), e.what());
    }
}

DownstreamConnection::DownstreamConnection(DownstreamConnection&&) noexcept = default;

DownstreamConnection& DownstreamConnection::operator=(DownstreamConnection&& other) noexcept {
    if (this != &other) {
        DownstreamConnection old(std::move(*this));
        inner_ = std::move(other.inner_);
    }
    return *this;
}

std::shared_future<DownstreamResult> DownstreamConnection::send(uint64_t transaction_id, DownstreamTarget target,
                                                                TransmissionWindow tx_window,
                                                                std::vector<uint8_t> phy_payload,
                                                                std::optional<uint32_t> target_dev_addr) {
    if (!inner_) throw RanError::closed("connection was moved from");
    DownstreamMessage message;
    message.transaction_id = transaction_id;
    message.target = std::move(target);
    message.target_dev_addr = target_dev_addr;
    message.tx_window = std::move(tx_window);
    message.phy_payload = std::move(phy_payload);
    return inner_->send(std::move(message));
}

MessageStream<DownstreamReply> DownstreamConnection::produce() {
    if (!inner_) throw RanError::closed("connection was moved from");
    std::shared_ptr<Inner> inner = inner_;
    return MessageStream<DownstreamReply>([inner] { return inner->next(); });
}

DownstreamReply DownstreamConnection::receive(std::chrono::milliseconds timeout,
                                              std::optional<uint64_t> transaction_id) {
    if (!inner_) throw RanError::closed("connection was moved from");
    return inner_->receive(timeout, transaction_id);
}

DownstreamResult DownstreamConnection::wait_result(uint64_t transaction_id, std::chrono::milliseconds timeout) {
    if (!inner_) throw RanError::closed("connection was moved from");
    return inner_->wait_result(transaction_id, timeout);
}

size_t DownstreamConnection::pending() const {
    return inner_ ? inner_->pending() : 0;
}

void DownstreamConnection::close() {
    if (inner_) inner_->close();
}

void DownstreamConnection::wait_closed() {
    if (inner_) inner_->wait_closed();
}

bool DownstreamConnection::is_closed() const {
    return !inner_ || inner_->is_closed();
}

ConnectionState DownstreamConnection::state() const {
    return inner_ ? inner_->state() : ConnectionState::Closed;
}

const std::string& DownstreamConnection::id() const {
    static const std::string empty;
    return inner_ ? inner_->id() : empty;
}

} // namespace ran
