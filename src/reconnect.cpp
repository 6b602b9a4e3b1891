// src/reconnect.cpp
// Backoff schedule and the retry loop.

#include "reconnect.hpp"

#include <algorithm>
#include <cmath>

namespace ran {

BackoffPolicy BackoffPolicy::from(const RanConfig& config) {
    BackoffPolicy policy;
    policy.initial_delay = config.reconnect_initial_delay();
    policy.max_delay = config.reconnect_max_delay();
    policy.multiplier = config.reconnect_multiplier();
    policy.max_attempts = config.reconnect_max_attempts();
    return policy;
}

ReconnectSupervisor::ReconnectSupervisor(BackoffPolicy policy)
    : policy_(policy), rng_(std::random_device{}()) {}

std::chrono::milliseconds ReconnectSupervisor::base_delay(uint32_t attempt) const {
    double base = static_cast<double>(policy_.initial_delay.count()) *
                  std::pow(policy_.multiplier, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
    double cap = static_cast<double>(policy_.max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(base, cap)));
}

std::chrono::milliseconds ReconnectSupervisor::delay_for(uint32_t attempt) {
    double base = static_cast<double>(base_delay(attempt).count());
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double jitter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jitter = base * policy_.jitter * unit(rng_);
    }
    double delay = std::min(base + jitter, static_cast<double>(policy_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void ReconnectSupervisor::run(const std::function<void()>& attempt, const RetryCallback& on_retry) {
    for (uint32_t n = 1;; n++) {
        if (cancelled()) {
            throw RanError::closed("reconnect cancelled");
        }
        try {
            attempt();
            return;
        } catch (const RanError& e) {
            if (e.kind() == ErrorKind::Closed) throw;
            if (policy_.max_attempts != 0 && n >= policy_.max_attempts) {
                throw RanError::reconnect_exhausted(n, e.message());
            }
            auto delay = delay_for(n);
            if (on_retry) on_retry(n, e, delay);
            if (!sleep_for(delay)) {
                throw RanError::closed("reconnect cancelled");
            }
        }
    }
}

void ReconnectSupervisor::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool ReconnectSupervisor::cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool ReconnectSupervisor::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

} // namespace ran
