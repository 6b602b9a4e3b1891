// tests/config_test.cpp
// Unit tests for RanConfig and builder.

#include <gtest/gtest.h>
#include "ran/config.hpp"

using namespace ran;

namespace {
const char* const TOKEN = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
}

TEST(ConfigTest, ProductionDefaults) {
    auto config = RanConfig::production(TOKEN);
    EXPECT_EQ(config.coverage(), "eu");
    EXPECT_EQ(config.url(), "wss://ran-routing.eu.everynet.io/api/v1.0");
    EXPECT_EQ(config.upstream_url(), "wss://ran-routing.eu.everynet.io/api/v1.0/stream/upstream");
    EXPECT_EQ(config.downstream_url(), "wss://ran-routing.eu.everynet.io/api/v1.0/stream/downstream");
    EXPECT_EQ(config.network_timeout(), std::chrono::milliseconds(30000));
    EXPECT_EQ(config.close_timeout(), std::chrono::milliseconds(5000));
    EXPECT_EQ(config.poll_interval(), std::chrono::milliseconds(1000));
    EXPECT_EQ(config.downstream_reply_timeout(), std::chrono::milliseconds(600000));
    EXPECT_EQ(config.buffer_size(), 1024u);
    EXPECT_TRUE(config.auto_reconnect());
    EXPECT_EQ(config.reconnect_initial_delay(), std::chrono::milliseconds(1000));
    EXPECT_EQ(config.reconnect_max_delay(), std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(config.reconnect_multiplier(), 1.5);
    EXPECT_EQ(config.reconnect_max_attempts(), 0u);
    EXPECT_TRUE(config.verify_tls());
    EXPECT_FALSE(static_cast<bool>(config.on_error()));
}

TEST(ConfigTest, CoverageSelectsHost) {
    auto config = RanConfig::production(TOKEN, "us");
    EXPECT_EQ(config.url(), "wss://ran-routing.us.everynet.io/api/v1.0");
}

TEST(ConfigTest, InvalidCoverage) {
    EXPECT_THROW(RanConfig::production(TOKEN, ""), RanError);
    EXPECT_THROW(RanConfig::production(TOKEN, "EU"), RanError);
    EXPECT_THROW(RanConfig::production(TOKEN, "eu/evil"), RanError);
}

TEST(ConfigTest, DevelopmentPreset) {
    auto config = RanConfig::development(TOKEN, "http://localhost:8080/api/v1.0/");
    EXPECT_EQ(config.url(), "ws://localhost:8080/api/v1.0");
    EXPECT_EQ(config.upstream_url(), "ws://localhost:8080/api/v1.0/stream/upstream");
    EXPECT_FALSE(config.verify_tls());
    EXPECT_EQ(config.reconnect_initial_delay(), std::chrono::milliseconds(200));
    EXPECT_EQ(config.reconnect_max_delay(), std::chrono::milliseconds(2000));
}

TEST(ConfigTest, HttpsMapsToWss) {
    auto config = RanConfig::builder(TOKEN).url("https://example.com/api").build();
    EXPECT_EQ(config.downstream_url(), "wss://example.com/api/stream/downstream");
}

TEST(ConfigTest, ExplicitUrlOverridesCoverage) {
    auto config = RanConfig::builder(TOKEN).coverage("us").url("wss://lns.local/api").build();
    EXPECT_EQ(config.url(), "wss://lns.local/api");
}

TEST(ConfigTest, ExplicitStreamUrls) {
    auto config = RanConfig::builder(TOKEN)
        .upstream_url("ws://127.0.0.1:9000/up")
        .downstream_url("ws://127.0.0.1:9000/down")
        .build();
    EXPECT_EQ(config.upstream_url(), "ws://127.0.0.1:9000/up");
    EXPECT_EQ(config.downstream_url(), "ws://127.0.0.1:9000/down");
}

TEST(ConfigTest, InvalidUrlScheme) {
    EXPECT_THROW(RanConfig::builder(TOKEN).url("ftp://example.com").build(), RanError);
    EXPECT_THROW(RanConfig::builder(TOKEN).upstream_url("http://example.com/up").build(), RanError);
}

TEST(ConfigTest, BuilderCustomValues) {
    int calls = 0;
    auto config = RanConfig::builder(TOKEN)
        .network_timeout(std::chrono::milliseconds(5000))
        .close_timeout(std::chrono::milliseconds(1000))
        .poll_interval(std::chrono::milliseconds(50))
        .downstream_reply_timeout(std::chrono::milliseconds(2000))
        .buffer_size(16)
        .auto_reconnect(false)
        .reconnect_initial_delay(std::chrono::milliseconds(10))
        .reconnect_max_delay(std::chrono::milliseconds(100))
        .reconnect_multiplier(2.0)
        .reconnect_max_attempts(3)
        .verify_tls(false)
        .on_error([&calls](const RanError&) { calls++; })
        .build();

    EXPECT_EQ(config.network_timeout(), std::chrono::milliseconds(5000));
    EXPECT_EQ(config.close_timeout(), std::chrono::milliseconds(1000));
    EXPECT_EQ(config.poll_interval(), std::chrono::milliseconds(50));
    EXPECT_EQ(config.downstream_reply_timeout(), std::chrono::milliseconds(2000));
    EXPECT_EQ(config.buffer_size(), 16u);
    EXPECT_FALSE(config.auto_reconnect());
    EXPECT_EQ(config.reconnect_initial_delay(), std::chrono::milliseconds(10));
    EXPECT_EQ(config.reconnect_max_delay(), std::chrono::milliseconds(100));
    EXPECT_DOUBLE_EQ(config.reconnect_multiplier(), 2.0);
    EXPECT_EQ(config.reconnect_max_attempts(), 3u);
    EXPECT_FALSE(config.verify_tls());

    ASSERT_TRUE(static_cast<bool>(config.on_error()));
    config.on_error()(RanError::timeout("x"));
    EXPECT_EQ(calls, 1);
}

TEST(ConfigTest, EmptyToken) {
    try {
        RanConfig::production("");
        FAIL() << "expected RanError";
    } catch (const RanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }
}

TEST(ConfigTest, TokenWithWhitespace) {
    EXPECT_THROW(RanConfig::production("abc def"), RanError);
    EXPECT_THROW(RanConfig::production("abc\r\nX-Injected: 1"), RanError);
}

TEST(ConfigTest, NonPositiveDurations) {
    EXPECT_THROW(RanConfig::builder(TOKEN).network_timeout(std::chrono::milliseconds(0)).build(), RanError);
    EXPECT_THROW(RanConfig::builder(TOKEN).poll_interval(std::chrono::milliseconds(-1)).build(), RanError);
    EXPECT_THROW(RanConfig::builder(TOKEN).downstream_reply_timeout(std::chrono::milliseconds(0)).build(), RanError);
}

TEST(ConfigTest, ZeroBufferSize) {
    EXPECT_THROW(RanConfig::builder(TOKEN).buffer_size(0).build(), RanError);
}

TEST(ConfigTest, ReconnectBounds) {
    EXPECT_THROW(RanConfig::builder(TOKEN)
        .reconnect_initial_delay(std::chrono::milliseconds(500))
        .reconnect_max_delay(std::chrono::milliseconds(100))
        .build(), RanError);
    EXPECT_THROW(RanConfig::builder(TOKEN).reconnect_multiplier(0.5).build(), RanError);
}

TEST(ConfigTest, ErrorKindNames) {
    EXPECT_STREQ(to_string(ErrorKind::ReconnectExhausted), "ReconnectExhausted");
    EXPECT_STREQ(to_string(ErrorKind::UnknownTransaction), "UnknownTransaction");
}
