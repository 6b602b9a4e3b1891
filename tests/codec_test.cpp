// tests/codec_test.cpp
// Wire codec tests — exact key layout, kind detection, round-trips and malformed frames.

#include <gtest/gtest.h>
#include "codec.hpp"
#include "ran/error.hpp"
#include "fixtures.hpp"

#include <cstdint>
#include <string>

using namespace ran;
using namespace ran::test;

namespace {

ErrorKind decode_error_kind(const std::string& text) {
    try {
        codec::decode(text);
    } catch (const RanError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decoded: " << text;
    return ErrorKind::Io;
}

} // anonymous namespace

// ==================== Encoding ====================

TEST(CodecEncodeTest, DownstreamClassA) {
    DownstreamMessage m;
    m.transaction_id = 1;
    m.target = DeviceTarget{1};
    m.tx_window = TransmissionWindow::class_a(Radio::lora(868300000, 1, 1), 1);
    m.phy_payload = {'f', 'f', 'f'};

    EXPECT_EQ(codec::encode(m),
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":1,)"
        R"("TxWindow":{"Radio":{"Frequency":868300000,"LoRa":{"Spreading":1,"Bandwidth":1}},"Delay":1},)"
        R"("PHYPayload":[102,102,102]})");
}

TEST(CodecEncodeTest, DownstreamMulticastClassC) {
    DownstreamMessage m;
    m.transaction_id = 7;
    m.target = MulticastTarget{0x01020304};
    m.tx_window = TransmissionWindow::class_c(Radio::lora(869525000, 9, 125000), 1700000000);
    m.phy_payload = {0x60};

    EXPECT_EQ(codec::encode(m),
        R"({"ProtocolVersion":1,"TransactionID":7,"Addr":16909060,)"
        R"("TxWindow":{"Radio":{"Frequency":869525000,"LoRa":{"Spreading":9,"Bandwidth":125000}},)"
        R"("Deadline":1700000000},"PHYPayload":[96]})");
}

TEST(CodecEncodeTest, DownstreamClassBWithTargetDevAddr) {
    DownstreamMessage m;
    m.transaction_id = 3;
    m.target = DeviceTarget{SAMPLE_DEV_EUI};
    m.target_dev_addr = 0x26011BDA;
    m.tx_window = TransmissionWindow::class_b(Radio::lora(869525000, 9, 125000), {1000, 1032});
    m.phy_payload = {0x20};

    std::string text = codec::encode(m);
    EXPECT_NE(text.find(R"("TargetDevAddr":637606874)"), std::string::npos);
    EXPECT_NE(text.find(R"("Tmms":[1000,1032])"), std::string::npos);
    EXPECT_EQ(text.find("Delay"), std::string::npos);
    EXPECT_EQ(text.find("Deadline"), std::string::npos);
}

TEST(CodecEncodeTest, UpstreamAck) {
    UpstreamAck ack;
    ack.transaction_id = 42;
    ack.dev_eui = 8844537008791951183ull;
    ack.mic = 170883;
    EXPECT_EQ(codec::encode(ack),
        R"({"ProtocolVersion":1,"TransactionID":42,"DevEUI":8844537008791951183,"MIC":170883})");
}

TEST(CodecEncodeTest, UpstreamRejectOmitsAbsentMessage) {
    UpstreamReject reject;
    reject.transaction_id = 5;
    reject.result_code = UpstreamRejectResultCode::MICFailed;
    EXPECT_EQ(codec::encode(reject),
        R"({"ProtocolVersion":1,"TransactionID":5,"ResultCode":"MICFailed"})");

    reject.result_code = UpstreamRejectResultCode::Other;
    reject.result_message = "device unknown";
    EXPECT_EQ(codec::encode(reject),
        R"({"ProtocolVersion":1,"TransactionID":5,"ResultCode":"Other","ResultMessage":"device unknown"})");
}

TEST(CodecEncodeTest, UpstreamOmitsAbsentOptionals) {
    std::string text = codec::encode(sample_uplink(1));
    EXPECT_EQ(text.find("Outdated"), std::string::npos);
    EXPECT_EQ(text.find("Gps"), std::string::npos);
    EXPECT_NE(text.find(R"("RSSI":-50)"), std::string::npos);
    EXPECT_NE(text.find(R"("MICChallenge":[2857982036])"), std::string::npos);
}

TEST(CodecEncodeTest, RejectsInvalidMessage) {
    UpstreamAck ack;  // TransactionID 0
    try {
        codec::encode(ack);
        FAIL() << "expected RanError";
    } catch (const RanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_EQ(e.field(), "TransactionID");
    }
}

// ==================== Kind detection ====================

TEST(CodecDecodeTest, DetectsEveryKind) {
    EXPECT_EQ(kind_of(codec::decode(uplink_frame(1))), MessageKind::Upstream);
    EXPECT_EQ(kind_of(codec::decode(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":2,"MIC":3})")), MessageKind::UpstreamAck);
    EXPECT_EQ(kind_of(codec::decode(
        R"({"ProtocolVersion":1,"TransactionID":1,"ResultCode":"Other"})")), MessageKind::UpstreamReject);
    EXPECT_EQ(kind_of(codec::decode(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":1,"TxWindow":{"Radio":{"Frequency":1,"LoRa":{"Spreading":7,"Bandwidth":125000}},"Delay":1},"PHYPayload":[]})")),
        MessageKind::Downstream);
    EXPECT_EQ(kind_of(codec::decode(ack_frame(1, 9))), MessageKind::DownstreamAck);
    EXPECT_EQ(kind_of(codec::decode(result_frame(1, 9))), MessageKind::DownstreamResult);
}

TEST(CodecDecodeTest, UnknownKeysAreIgnored) {
    auto m = codec::decode(R"({"ProtocolVersion":1,"TransactionID":4,"MailboxID":8,"Extra":{"x":[1]}})");
    auto& ack = std::get<DownstreamAck>(m);
    EXPECT_EQ(ack.transaction_id, 4u);
    EXPECT_EQ(ack.mailbox_id, 8u);
}

TEST(CodecDecodeTest, ProtocolVersionAboveOneIsAccepted) {
    auto m = codec::decode(R"({"ProtocolVersion":2,"TransactionID":4,"MailboxID":8})");
    EXPECT_EQ(std::get<DownstreamAck>(m).protocol_version, 2u);
}

TEST(CodecDecodeTest, UpstreamWithAllFields) {
    auto m = codec::decode(
        R"({"ProtocolVersion":1,"TransactionID":77,"Outdated":true,"DevEUIs":[8844537008791951183],)"
        R"("Radio":{"Frequency":868100000,"LoRa":{"Spreading":12,"Bandwidth":125000},"RSSI":-50.0,"SNR":2.0},)"
        R"("PHYPayloadNoMIC":[64,1,2],"MICChallenge":[1308830714,114830713,170883],)"
        R"("Gps":{"Lat":51.178889,"Lng":-1.826111}})");
    const auto& up = std::get<UpstreamMessage>(m);
    EXPECT_EQ(up.transaction_id, 77u);
    ASSERT_TRUE(up.outdated.has_value());
    EXPECT_TRUE(*up.outdated);
    ASSERT_EQ(up.dev_euis.size(), 1u);
    EXPECT_EQ(up.dev_euis[0], 8844537008791951183ull);
    EXPECT_EQ(std::get<LoRaModulation>(up.radio.modulation).spreading, 12u);
    EXPECT_DOUBLE_EQ(up.radio.rssi, -50.0);
    EXPECT_EQ(up.mic_challenge, (std::vector<uint32_t>{1308830714, 114830713, 170883}));
    ASSERT_TRUE(up.gps.has_value());
    EXPECT_DOUBLE_EQ(up.gps->lat, 51.178889);
    EXPECT_DOUBLE_EQ(up.gps->lng, -1.826111);
    EXPECT_FALSE(up.gps->alt.has_value());
}

// ==================== Round-trips ====================

TEST(CodecRoundTripTest, AllSixVariants) {
    UpstreamMessage up = sample_uplink(1, {1, 2}, {10, 20, 30});
    up.outdated = false;
    up.gps = Gps{51.178889, -1.826111, 102.5};
    up.radio.modulation = FHSSModulation{137, "1/3"};

    UpstreamAck up_ack{PROTOCOL_VERSION, 2, SAMPLE_DEV_EUI, SAMPLE_MIC};
    UpstreamReject up_reject{PROTOCOL_VERSION, 3, UpstreamRejectResultCode::Other, std::string("nope")};

    DownstreamMessage down;
    down.transaction_id = 4;
    down.target = DeviceTarget{UINT64_MAX};
    down.target_dev_addr = 0xFFFFFFFF;
    down.tx_window = TransmissionWindow::class_b(
        Radio{869525000, FSKModulation{25000, 50000}}, {1, 2, 3, 4, 5, 6, 7, 8});
    down.phy_payload = {0, 255, 128};

    DownstreamAck down_ack{PROTOCOL_VERSION, 5, 55};
    DownstreamResult down_result{PROTOCOL_VERSION, 6, DownstreamResultCode::TooLate, "late \"again\"", 66};

    const Message messages[] = {up, up_ack, up_reject, down, down_ack, down_result};
    for (const auto& original : messages) {
        Message decoded = codec::decode(codec::encode(original));
        EXPECT_EQ(decoded.index(), original.index());
        EXPECT_TRUE(decoded == original) << codec::encode(original);
    }
}

// ==================== Malformed frames ====================

TEST(CodecDecodeTest, MalformedFramesAreDecodeErrors) {
    const std::string bad[] = {
        "not json",
        "[1,2,3]",
        R"({"ProtocolVersion":1,"TransactionID":1})",                                  // no kind
        R"({"ProtocolVersion":1,"TransactionID":1,"MailboxID":-1})",                   // negative
        R"({"ProtocolVersion":1,"TransactionID":"1","MailboxID":1})",                  // string id
        R"({"ProtocolVersion":1,"TransactionID":0,"MailboxID":1})",                    // zero id
        R"({"ProtocolVersion":0,"TransactionID":1,"MailboxID":1})",                    // zero version
        R"({"ProtocolVersion":1,"TransactionID":1,"ResultCode":"Maybe"})",             // unknown code
    };
    for (const auto& text : bad) {
        EXPECT_EQ(decode_error_kind(text), ErrorKind::Decode) << text;
    }
}

TEST(CodecDecodeTest, UpstreamConstraintViolations) {
    const std::string radio =
        R"("Radio":{"Frequency":1,"LoRa":{"Spreading":7,"Bandwidth":125000},"RSSI":0,"SNR":0})";
    EXPECT_EQ(decode_error_kind(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUIs":[],)" + radio +
        R"(,"PHYPayloadNoMIC":[],"MICChallenge":[1]})"), ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUIs":[1],)" + radio +
        R"(,"PHYPayloadNoMIC":[256],"MICChallenge":[1]})"), ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUIs":[1],)" + radio +
        R"(,"PHYPayloadNoMIC":[],"MICChallenge":[4294967296]})"), ErrorKind::Decode);
}

TEST(CodecDecodeTest, TxWindowModesAreMutuallyExclusive) {
    const std::string head =
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":1,"PHYPayload":[],"TxWindow":{"Radio":{"Frequency":1,"LoRa":{"Spreading":7,"Bandwidth":125000}})";
    EXPECT_EQ(decode_error_kind(head + R"(,"Delay":1,"Deadline":100}})"), ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(head + R"(}})"), ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(head + R"(,"Delay":16}})"), ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(head + R"(,"Tmms":[1,2,3,4,5,6,7,8,9]}})"), ErrorKind::Decode);
}

TEST(CodecDecodeTest, RadioNeedsExactlyOneModulation) {
    EXPECT_EQ(decode_error_kind(
        R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":1,"PHYPayload":[],"TxWindow":{"Radio":{"Frequency":1,)"
        R"("LoRa":{"Spreading":7,"Bandwidth":125000},"FSK":{"FrequencyDeviation":1,"BitRate":1}},"Delay":1}})"),
        ErrorKind::Decode);
}

TEST(CodecDecodeTest, DownstreamNeedsExactlyOneTarget) {
    const std::string window =
        R"("TxWindow":{"Radio":{"Frequency":1,"LoRa":{"Spreading":7,"Bandwidth":125000}},"Delay":1},"PHYPayload":[])";
    EXPECT_EQ(decode_error_kind(R"({"ProtocolVersion":1,"TransactionID":1,"DevEUI":1,"Addr":2,)" + window + "}"),
              ErrorKind::Decode);
    EXPECT_EQ(decode_error_kind(R"({"ProtocolVersion":1,"TransactionID":1,)" + window + "}"),
              ErrorKind::Decode);
}

TEST(CodecDecodeTest, ExpectingRejectsWrongStream) {
    try {
        codec::decode_expecting(ack_frame(1, 2), {MessageKind::Upstream});
        FAIL() << "expected RanError";
    } catch (const RanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decode);
        EXPECT_NE(std::string(e.what()).find("DownstreamAck"), std::string::npos);
    }
    EXPECT_NO_THROW(codec::decode_expecting(uplink_frame(1), {MessageKind::Upstream}));
}
