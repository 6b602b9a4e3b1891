// include/ran/config.hpp
// Flat configuration class with builder pattern.

#pragma once

#include "error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ran {

class RanConfigBuilder;

// Configuration for the RAN routing client.
class RanConfig {
public:
    using ErrorCallback = std::function<void(const RanError&)>;

    static RanConfigBuilder builder(const std::string& access_token);

    // Presets.
    static RanConfig production(const std::string& access_token, const std::string& coverage = "eu");
    static RanConfig development(const std::string& access_token, const std::string& url);

    const std::string& access_token() const noexcept { return access_token_; }
    const std::string& coverage() const noexcept { return coverage_; }

    // Base URL of the routing API, e.g. wss://ran-routing.eu.everynet.io/api/v1.0
    const std::string& url() const noexcept { return url_; }
    const std::string& upstream_url() const noexcept { return upstream_url_; }
    const std::string& downstream_url() const noexcept { return downstream_url_; }

    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }
    std::chrono::milliseconds close_timeout() const noexcept { return close_timeout_; }
    std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }
    std::chrono::milliseconds downstream_reply_timeout() const noexcept { return downstream_reply_timeout_; }
    size_t buffer_size() const noexcept { return buffer_size_; }

    bool auto_reconnect() const noexcept { return auto_reconnect_; }
    std::chrono::milliseconds reconnect_initial_delay() const noexcept { return reconnect_initial_delay_; }
    std::chrono::milliseconds reconnect_max_delay() const noexcept { return reconnect_max_delay_; }
    double reconnect_multiplier() const noexcept { return reconnect_multiplier_; }
    uint32_t reconnect_max_attempts() const noexcept { return reconnect_max_attempts_; }

    bool verify_tls() const noexcept { return verify_tls_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class RanConfigBuilder;

    std::string access_token_;
    std::string coverage_ = "eu";
    std::string url_;
    std::string upstream_url_;
    std::string downstream_url_;
    std::chrono::milliseconds network_timeout_{30000};
    std::chrono::milliseconds close_timeout_{5000};
    std::chrono::milliseconds poll_interval_{1000};
    std::chrono::milliseconds downstream_reply_timeout_{600000};
    size_t buffer_size_ = 1024;
    bool auto_reconnect_ = true;
    std::chrono::milliseconds reconnect_initial_delay_{1000};
    std::chrono::milliseconds reconnect_max_delay_{30000};
    double reconnect_multiplier_ = 1.5;
    uint32_t reconnect_max_attempts_ = 0;  // 0 = unbounded
    bool verify_tls_ = true;
    ErrorCallback on_error_;
};

// Fluent builder for RanConfig.
class RanConfigBuilder {
public:
    explicit RanConfigBuilder(const std::string& access_token);

    RanConfigBuilder& coverage(std::string coverage);
    RanConfigBuilder& url(std::string url);
    RanConfigBuilder& upstream_url(std::string url);
    RanConfigBuilder& downstream_url(std::string url);
    RanConfigBuilder& network_timeout(std::chrono::milliseconds timeout);
    RanConfigBuilder& close_timeout(std::chrono::milliseconds timeout);
    RanConfigBuilder& poll_interval(std::chrono::milliseconds interval);
    RanConfigBuilder& downstream_reply_timeout(std::chrono::milliseconds timeout);
    RanConfigBuilder& buffer_size(size_t size);
    RanConfigBuilder& auto_reconnect(bool enabled);
    RanConfigBuilder& reconnect_initial_delay(std::chrono::milliseconds delay);
    RanConfigBuilder& reconnect_max_delay(std::chrono::milliseconds delay);
    RanConfigBuilder& reconnect_multiplier(double multiplier);
    RanConfigBuilder& reconnect_max_attempts(uint32_t attempts);
    RanConfigBuilder& verify_tls(bool verify);
    RanConfigBuilder& on_error(RanConfig::ErrorCallback callback);

    // Build the config. Throws RanError (Configuration) on invalid settings.
    RanConfig build() const;

private:
    std::string access_token_;
    RanConfig config_;
};

} // namespace ran
