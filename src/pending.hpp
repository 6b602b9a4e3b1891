// src/pending.hpp
// Waitable downstream transaction: Sent → Acked → Resolved | Expired.

#pragma once

#include "ran/error.hpp"
#include "ran/messages.hpp"

#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>

namespace ran {

class PendingDownstream {
public:
    enum class Stage : uint8_t { Sent, Acked, Resolved, Expired };

    PendingDownstream() : future_(promise_.get_future().share()) {}

    PendingDownstream(const PendingDownstream&) = delete;
    PendingDownstream& operator=(const PendingDownstream&) = delete;

    // Returns false if the transaction already left the Sent stage.
    bool acked(uint64_t mailbox_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ != Stage::Sent) return false;
        stage_ = Stage::Acked;
        mailbox_id_ = mailbox_id;
        return true;
    }

    // Returns false if the transaction was already resolved or expired.
    bool resolve(const DownstreamResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ == Stage::Resolved || stage_ == Stage::Expired) return false;
        stage_ = Stage::Resolved;
        mailbox_id_ = result.mailbox_id;
        promise_.set_value(result);
        return true;
    }

    // Fail the waiter. Returns false if already final.
    bool expire(const RanError& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ == Stage::Resolved || stage_ == Stage::Expired) return false;
        stage_ = Stage::Expired;
        promise_.set_exception(std::make_exception_ptr(error));
        return true;
    }

    Stage stage() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stage_;
    }

    uint64_t mailbox_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mailbox_id_;
    }

    std::shared_future<DownstreamResult> future() const { return future_; }

private:
    mutable std::mutex mutex_;
    Stage stage_ = Stage::Sent;
    uint64_t mailbox_id_ = 0;
    std::promise<DownstreamResult> promise_;
    std::shared_future<DownstreamResult> future_;
};

using PendingDownstreamPtr = std::shared_ptr<PendingDownstream>;

} // namespace ran
