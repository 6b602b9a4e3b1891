// tests/json_test.cpp
// JSON writer tests and frame reading edge cases.

#include <gtest/gtest.h>
#include "codec.hpp"
#include "json.hpp"
#include "ran/error.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using namespace ran;

// ==================== Writer ====================

TEST(JsonWriterTest, NestedObjectsAndArrays) {
    json::Writer w;
    w.begin_object()
        .field("A", static_cast<uint64_t>(1))
        .key("B").begin_object().field("C", true).end_object();
    w.array("D", std::vector<uint8_t>{1, 2, 3});
    w.end_object();
    EXPECT_EQ(w.str(), R"({"A":1,"B":{"C":true},"D":[1,2,3]})");
}

TEST(JsonWriterTest, EmptyContainers) {
    json::Writer w;
    w.begin_object();
    w.array("L", std::vector<uint32_t>{});
    w.key("O").begin_object().end_object();
    w.end_object();
    EXPECT_EQ(w.str(), R"({"L":[],"O":{}})");
}

TEST(JsonWriterTest, FullRangeUnsigned) {
    json::Writer w;
    w.begin_object().field("V", UINT64_MAX).end_object();
    EXPECT_EQ(w.str(), R"({"V":18446744073709551615})");
}

TEST(JsonWriterTest, DoublesUseShortestExactForm) {
    json::Writer w;
    w.begin_object()
        .field("Lat", 51.178889)
        .field("RSSI", -50.0)
        .field("SNR", 2.5)
        .end_object();
    EXPECT_EQ(w.str(), R"({"Lat":51.178889,"RSSI":-50,"SNR":2.5})");
}

TEST(JsonWriterTest, EscapesStrings) {
    json::Writer w;
    w.begin_object().field("M", std::string("a\"b\\c\nd\x01")).end_object();
    EXPECT_EQ(w.str(), "{\"M\":\"a\\\"b\\\\c\\nd\\u0001\"}");
}

// ==================== Frame reading ====================

namespace {

std::string ack_with(const std::string& mailbox) {
    return R"({"ProtocolVersion":1,"TransactionID":7,"MailboxID":)" + mailbox + "}";
}

std::string uplink_with_dev_euis(const std::string& dev_euis) {
    return R"({"ProtocolVersion":1,"TransactionID":1,"DevEUIs":)" + dev_euis +
           R"(,"Radio":{"Frequency":868100000,"LoRa":{"Spreading":7,"Bandwidth":125000},)"
           R"("RSSI":-50,"SNR":2.5},"PHYPayloadNoMIC":[64],"MICChallenge":[1,2]})";
}

std::string decode_error(const std::string& text) {
    try {
        codec::decode(text);
    } catch (const RanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decode) << text;
        return e.what();
    }
    ADD_FAILURE() << "decoded: " << text;
    return "";
}

} // anonymous namespace

TEST(JsonReadTest, KeepsFullRangeDevEuisExact) {
    auto message = codec::decode(uplink_with_dev_euis("[18446744073709551615, 8844537008791951183]"));
    const auto& uplink = std::get<UpstreamMessage>(message);
    ASSERT_EQ(uplink.dev_euis.size(), 2u);
    EXPECT_EQ(uplink.dev_euis[0], UINT64_MAX);
    EXPECT_EQ(uplink.dev_euis[1], 8844537008791951183ull);
}

TEST(JsonReadTest, IntegerBeyondUint64IsRejected) {
    decode_error(uplink_with_dev_euis("[18446744073709551616]"));
}

TEST(JsonReadTest, NegativeAndFractionalIdsAreRejected) {
    for (const char* mailbox : {"-1", "1.5", "1e3"}) {
        EXPECT_NE(decode_error(ack_with(mailbox)).find("MailboxID must be a non-negative integer"),
                  std::string::npos) << mailbox;
    }
}

TEST(JsonReadTest, IntegerRadioValuesReadAsDoubles) {
    auto message = codec::decode(uplink_with_dev_euis("[1]"));
    const auto& uplink = std::get<UpstreamMessage>(message);
    EXPECT_DOUBLE_EQ(uplink.radio.rssi, -50.0);
    EXPECT_DOUBLE_EQ(uplink.radio.snr, 2.5);
}

TEST(JsonReadTest, ByteValuesAreRangeChecked) {
    std::string text = uplink_with_dev_euis("[1]");
    text.replace(text.find("[64]"), 4, "[256]");
    EXPECT_NE(decode_error(text).find("PHYPayloadNoMIC is out of range"), std::string::npos);
}

TEST(JsonReadTest, NullFieldCountsAsAbsent) {
    std::string text = R"({"ProtocolVersion":1,"TransactionID":7,"MailboxID":3,"ResultCode":null})";
    auto message = codec::decode(text);
    EXPECT_EQ(std::get<DownstreamAck>(message).mailbox_id, 3u);

    EXPECT_NE(decode_error(ack_with("null")).find("no known message"), std::string::npos);
}

TEST(JsonReadTest, UnicodeEscapesInResultMessage) {
    auto message = codec::decode(
        R"({"ProtocolVersion":1,"TransactionID":7,"MailboxID":3,"ResultCode":"Success",)"
        R"("ResultMessage":"\u00e9 \ud83d\ude00 a\/b"})");
    EXPECT_EQ(std::get<DownstreamResult>(message).result_message, "\xC3\xA9 \xF0\x9F\x98\x80 a/b");
}

TEST(JsonReadTest, TypeMismatchNamesTheField) {
    EXPECT_NE(decode_error(ack_with("\"1\"")).find("MailboxID must be"), std::string::npos);
}

TEST(JsonReadTest, MalformedTextIsDecodeError) {
    const char* bad[] = {
        "", "{", "[1,]", "{\"a\" 1}", "{\"a\":1,}", "tru", "\"abc", "01x",
        "{} extra", "\"\\x\"", "-", "1.", "[1 2]",
    };
    for (const char* text : bad) {
        EXPECT_NE(decode_error(text).find("malformed JSON"), std::string::npos) << text;
    }
}

TEST(JsonReadTest, DeepNestingIsRejected) {
    std::string deep = R"({"ProtocolVersion":1,"TransactionID":7,"MailboxID":3,"X":)";
    deep += std::string(100, '[');
    deep += std::string(100, ']');
    deep += "}";
    EXPECT_NE(decode_error(deep).find("nesting too deep"), std::string::npos);
}
