// src/upstream.cpp
// Upstream connection: uplink delivery and the acknowledge / reject protocol.

#include "upstream_connection.hpp"
#include "codec.hpp"

#include <algorithm>

namespace ran {

// --- Inner ---

UpstreamConnection::Inner::Inner(RanConfig config, std::shared_ptr<TransportFactory> factory)
    : StreamConnection<UpstreamMessage>(StreamKind::Upstream, std::move(config), std::move(factory)) {}

UpstreamConnection::Inner::~Inner() {
    stop();
}

void UpstreamConnection::Inner::on_frame(const std::string& text) {
    Message message = codec::decode_expecting(text, {MessageKind::Upstream});
    UpstreamMessage& uplink = std::get<UpstreamMessage>(message);

    Obligation obligation{uplink.dev_euis, uplink.mic_challenge};
    if (!obligations_.register_entry(uplink.transaction_id, std::move(obligation))) {
        log()->warn("ws[{}] upstream transaction {} delivered again while outstanding",
                    id(), uplink.transaction_id);
        report(RanError::duplicate_transaction(uplink.transaction_id));
    }
    push(std::move(uplink));
}

void UpstreamConnection::Inner::on_session_end(const RanError& /*cause*/) {
    auto lost = obligations_.drain();
    size_t unconsumed = discard_if([](const UpstreamMessage&) { return true; });
    if (!lost.empty()) {
        log()->warn("ws[{}] {} unsettled upstream transactions lost with the session ({} not yet consumed)",
                    id(), lost.size(), unconsumed);
    }
}

void UpstreamConnection::Inner::on_closed() {
    auto left = obligations_.drain();
    if (!left.empty()) {
        log()->debug("ws[{}] closed with {} unsettled upstream transactions", id(), left.size());
    }
}

UpstreamMessage UpstreamConnection::Inner::receive(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    auto message = pop_if([](const UpstreamMessage&) { return true; }, deadline);
    if (!message) {
        throw RanError::timeout("no upstream message within " + std::to_string(timeout.count()) + " ms");
    }
    return std::move(*message);
}

void UpstreamConnection::Inner::acknowledge(uint64_t transaction_id, uint64_t dev_eui, uint32_t mic) {
    ensure_open();

    bool known = obligations_.resolve(transaction_id, [&](Obligation& obligation) {
        const auto& euis = obligation.dev_euis;
        if (std::find(euis.begin(), euis.end(), dev_eui) == euis.end()) {
            throw RanError::validation("DevEUI",
                "is not offered by upstream transaction " + std::to_string(transaction_id));
        }
        const auto& mics = obligation.mic_challenge;
        if (std::find(mics.begin(), mics.end(), mic) == mics.end()) {
            throw RanError::validation("MIC",
                "is not in the MIC challenge of upstream transaction " + std::to_string(transaction_id));
        }
        return true;
    });
    if (!known) {
        throw RanError::unknown_transaction(transaction_id);
    }

    UpstreamAck ack;
    ack.transaction_id = transaction_id;
    ack.dev_eui = dev_eui;
    ack.mic = mic;
    send_text(codec::encode(ack));
}

void UpstreamConnection::Inner::reject(uint64_t transaction_id, UpstreamRejectResultCode result_code,
                                       std::optional<std::string> result_message) {
    ensure_open();

    if (!obligations_.take(transaction_id)) {
        throw RanError::unknown_transaction(transaction_id);
    }

    UpstreamReject reject;
    reject.transaction_id = transaction_id;
    reject.result_code = result_code;
    reject.result_message = std::move(result_message);
    send_text(codec::encode(reject));
}

// --- UpstreamConnection ---

UpstreamConnection::UpstreamConnection(std::shared_ptr<Inner> inner)
    : inner_(std::move(inner)) {}

UpstreamConnection::~UpstreamConnection() {
    if (!inner_) return;
    inner_->close();
    try {
        if (!inner_->wait_closed_for(inner_->close_timeout())) {
            logger()->warn("ws[{}] upstream connection did not close within {} ms",
                           inner_->id(), inner_->close_timeout().count());
        }
    } catch (const RanError& e) {
        logger()->error("ws[{}] upstream connection ended with error: {}", inner_->id(), e.what());
    }
}

UpstreamConnection::UpstreamConnection(UpstreamConnection&&) noexcept = default;

UpstreamConnection& UpstreamConnection::operator=(UpstreamConnection&& other) noexcept {
    if (this != &other) {
        UpstreamConnection old(std::move(*this));
        inner_ = std::move(other.inner_);
    }
    return *this;
}

MessageStream<UpstreamMessage> UpstreamConnection::produce() {
    if (!inner_) throw RanError::closed("connection was moved from");
    std::shared_ptr<Inner> inner = inner_;
    return MessageStream<UpstreamMessage>([inner] { return inner->next(); });
}

UpstreamMessage UpstreamConnection::receive(std::chrono::milliseconds timeout) {
    if (!inner_) throw RanError::closed("connection was moved from");
    return inner_->receive(timeout);
}

void UpstreamConnection::acknowledge(uint64_t transaction_id, uint64_t dev_eui, uint32_t mic) {
    if (!inner_) throw RanError::closed("connection was moved from");
    inner_->acknowledge(transaction_id, dev_eui, mic);
}

void UpstreamConnection::reject(uint64_t transaction_id, UpstreamRejectResultCode result_code,
                                std::optional<std::string> result_message) {
    if (!inner_) throw RanError::closed("connection was moved from");
    inner_->reject(transaction_id, result_code, std::move(result_message));
}

size_t UpstreamConnection::outstanding() const {
    return inner_ ? inner_->outstanding() : 0;
}

void UpstreamConnection::close() {
    if (inner_) inner_->close();
}

void UpstreamConnection::wait_closed() {
    if (inner_) inner_->wait_closed();
}

bool UpstreamConnection::is_closed() const {
    return !inner_ || inner_->is_closed();
}

ConnectionState UpstreamConnection::state() const {
    return inner_ ? inner_->state() : ConnectionState::Closed;
}

const std::string& UpstreamConnection::id() const {
    static const std::string empty;
    return inner_ ? inner_->id() : empty;
}

} // namespace ran
