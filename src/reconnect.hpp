// src/reconnect.hpp
// Reconnect supervisor — exponential backoff with jitter, interruptible sleeps.

#pragma once

#include "ran/config.hpp"
#include "ran/error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

namespace ran {

struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 1.5;
    uint32_t max_attempts = 0;  // 0 = unbounded
    double jitter = 0.2;        // Up to +20% of the base delay

    static BackoffPolicy from(const RanConfig& config);
};

class ReconnectSupervisor {
public:
    // Called before each sleep with the attempt that just failed, its error and the delay.
    using RetryCallback = std::function<void(uint32_t, const RanError&, std::chrono::milliseconds)>;

    explicit ReconnectSupervisor(BackoffPolicy policy);

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // initial * multiplier^(attempt-1), capped at max_delay (no jitter).
    std::chrono::milliseconds base_delay(uint32_t attempt) const;

    // base_delay plus jitter, still capped at max_delay.
    std::chrono::milliseconds delay_for(uint32_t attempt);

    // Call `attempt` until it returns without throwing. A RanError from
    // `attempt` schedules a retry; any other exception propagates.
    // Throws RanError (ReconnectExhausted) once max_attempts failed,
    // RanError (Closed) if cancel() is called while waiting.
    void run(const std::function<void()>& attempt, const RetryCallback& on_retry = {});

    // Interrupt a pending sleep; run() throws Closed. Idempotent.
    void cancel() noexcept;
    bool cancelled() const noexcept;

    const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    // Returns false when cancelled during the wait.
    bool sleep_for(std::chrono::milliseconds delay);

    BackoffPolicy policy_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::mt19937_64 rng_;
};

} // namespace ran
