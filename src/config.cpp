// src/config.cpp
// Configuration builder, presets and stream endpoint derivation.

#include "ran/config.hpp"
#include "validation.hpp"

namespace ran {

namespace {

const char* const UPSTREAM_PATH = "/stream/upstream";
const char* const DOWNSTREAM_PATH = "/stream/downstream";

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Map http(s) to ws(s) and drop trailing slashes.
std::string normalize_base_url(std::string url) {
    if (starts_with(url, "https://")) {
        url = "wss://" + url.substr(8);
    } else if (starts_with(url, "http://")) {
        url = "ws://" + url.substr(7);
    } else if (!starts_with(url, "wss://") && !starts_with(url, "ws://")) {
        throw RanError::configuration("url must use ws, wss, http or https: " + url);
    }
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

void check_stream_url(const std::string& url, const char* name) {
    if (!starts_with(url, "wss://") && !starts_with(url, "ws://")) {
        throw RanError::configuration(std::string(name) + " must be a ws:// or wss:// URL: " + url);
    }
}

void check_coverage(const std::string& coverage) {
    if (coverage.empty()) {
        throw RanError::configuration("coverage must not be empty");
    }
    for (char c : coverage) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        if (!ok) {
            throw RanError::configuration("coverage must be a lowercase host label: " + coverage);
        }
    }
}

void check_positive(std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
        throw RanError::configuration(std::string(name) + " must be positive");
    }
}

} // namespace

// --- RanConfig presets ---

RanConfigBuilder RanConfig::builder(const std::string& access_token) {
    return RanConfigBuilder(access_token);
}

RanConfig RanConfig::production(const std::string& access_token, const std::string& coverage) {
    return RanConfig::builder(access_token).coverage(coverage).build();
}

RanConfig RanConfig::development(const std::string& access_token, const std::string& url) {
    return RanConfig::builder(access_token)
        .url(url)
        .verify_tls(false)
        .reconnect_initial_delay(std::chrono::milliseconds(200))
        .reconnect_max_delay(std::chrono::milliseconds(2000))
        .build();
}

// --- RanConfigBuilder ---

RanConfigBuilder::RanConfigBuilder(const std::string& access_token)
    : access_token_(access_token) {}

RanConfigBuilder& RanConfigBuilder::coverage(std::string coverage) {
    config_.coverage_ = std::move(coverage);
    return *this;
}

RanConfigBuilder& RanConfigBuilder::url(std::string url) {
    config_.url_ = std::move(url);
    return *this;
}

RanConfigBuilder& RanConfigBuilder::upstream_url(std::string url) {
    config_.upstream_url_ = std::move(url);
    return *this;
}

RanConfigBuilder& RanConfigBuilder::downstream_url(std::string url) {
    config_.downstream_url_ = std::move(url);
    return *this;
}

RanConfigBuilder& RanConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::close_timeout(std::chrono::milliseconds timeout) {
    config_.close_timeout_ = timeout;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::poll_interval(std::chrono::milliseconds interval) {
    config_.poll_interval_ = interval;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::downstream_reply_timeout(std::chrono::milliseconds timeout) {
    config_.downstream_reply_timeout_ = timeout;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::buffer_size(size_t size) {
    config_.buffer_size_ = size;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::auto_reconnect(bool enabled) {
    config_.auto_reconnect_ = enabled;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::reconnect_initial_delay(std::chrono::milliseconds delay) {
    config_.reconnect_initial_delay_ = delay;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::reconnect_max_delay(std::chrono::milliseconds delay) {
    config_.reconnect_max_delay_ = delay;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::reconnect_multiplier(double multiplier) {
    config_.reconnect_multiplier_ = multiplier;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::reconnect_max_attempts(uint32_t attempts) {
    config_.reconnect_max_attempts_ = attempts;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::verify_tls(bool verify) {
    config_.verify_tls_ = verify;
    return *this;
}

RanConfigBuilder& RanConfigBuilder::on_error(RanConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

RanConfig RanConfigBuilder::build() const {
    validation::check_access_token(access_token_);

    RanConfig result = config_;
    result.access_token_ = access_token_;

    if (result.url_.empty()) {
        check_coverage(result.coverage_);
        result.url_ = "wss://ran-routing." + result.coverage_ + ".everynet.io/api/v1.0";
    } else {
        result.url_ = normalize_base_url(result.url_);
    }

    if (result.upstream_url_.empty()) {
        result.upstream_url_ = result.url_ + UPSTREAM_PATH;
    }
    if (result.downstream_url_.empty()) {
        result.downstream_url_ = result.url_ + DOWNSTREAM_PATH;
    }
    check_stream_url(result.upstream_url_, "upstream_url");
    check_stream_url(result.downstream_url_, "downstream_url");

    check_positive(result.network_timeout_, "network_timeout");
    check_positive(result.close_timeout_, "close_timeout");
    check_positive(result.poll_interval_, "poll_interval");
    check_positive(result.downstream_reply_timeout_, "downstream_reply_timeout");
    check_positive(result.reconnect_initial_delay_, "reconnect_initial_delay");

    if (result.buffer_size_ == 0) {
        throw RanError::configuration("buffer_size must be positive");
    }
    if (result.reconnect_max_delay_ < result.reconnect_initial_delay_) {
        throw RanError::configuration("reconnect_max_delay must not be below reconnect_initial_delay");
    }
    if (!(result.reconnect_multiplier_ >= 1.0)) {
        throw RanError::configuration("reconnect_multiplier must be at least 1.0");
    }
    return result;
}

} // namespace ran
