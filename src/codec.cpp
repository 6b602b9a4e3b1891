// src/codec.cpp
// JSON wire codec: CamelCase keys, exact 64-bit integers, byte arrays as lists.

#include "codec.hpp"
#include "validation.hpp"

#include <algorithm>

namespace ran {
namespace codec {

namespace {

constexpr uint64_t MAX_U32 = validation::MAX_U32;

// ==================== Encoding ====================

void write_modulation(json::Writer& w, const Modulation& modulation) {
    if (auto* lora = std::get_if<LoRaModulation>(&modulation)) {
        w.key("LoRa").begin_object()
            .field("Spreading", static_cast<uint64_t>(lora->spreading))
            .field("Bandwidth", lora->bandwidth)
            .end_object();
    } else if (auto* fsk = std::get_if<FSKModulation>(&modulation)) {
        w.key("FSK").begin_object()
            .field("FrequencyDeviation", fsk->frequency_deviation)
            .field("BitRate", fsk->bit_rate)
            .end_object();
    } else if (auto* fhss = std::get_if<FHSSModulation>(&modulation)) {
        w.key("FHSS").begin_object()
            .field("Ocw", fhss->ocw)
            .field("CodingRate", fhss->coding_rate)
            .end_object();
    }
}

void write_header(json::Writer& w, uint32_t protocol_version, uint64_t transaction_id) {
    w.field("ProtocolVersion", static_cast<uint64_t>(protocol_version));
    w.field("TransactionID", transaction_id);
}

void write_body(json::Writer& w, const UpstreamMessage& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    if (m.outdated) w.field("Outdated", *m.outdated);
    w.array("DevEUIs", m.dev_euis);

    w.key("Radio").begin_object();
    w.field("Frequency", m.radio.frequency);
    write_modulation(w, m.radio.modulation);
    w.field("RSSI", m.radio.rssi);
    w.field("SNR", m.radio.snr);
    w.end_object();

    w.array("PHYPayloadNoMIC", m.phy_payload_no_mic);
    w.array("MICChallenge", m.mic_challenge);

    if (m.gps) {
        w.key("Gps").begin_object();
        w.field("Lat", m.gps->lat);
        w.field("Lng", m.gps->lng);
        if (m.gps->alt) w.field("Alt", *m.gps->alt);
        w.end_object();
    }
}

void write_body(json::Writer& w, const UpstreamAck& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    w.field("DevEUI", m.dev_eui);
    w.field("MIC", static_cast<uint64_t>(m.mic));
}

void write_body(json::Writer& w, const UpstreamReject& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    w.field("ResultCode", to_string(m.result_code));
    if (m.result_message) w.field("ResultMessage", *m.result_message);
}

void write_body(json::Writer& w, const DownstreamMessage& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    if (auto* device = std::get_if<DeviceTarget>(&m.target)) {
        w.field("DevEUI", device->dev_eui);
    } else {
        w.field("Addr", static_cast<uint64_t>(std::get<MulticastTarget>(m.target).addr));
    }
    if (m.target_dev_addr) w.field("TargetDevAddr", static_cast<uint64_t>(*m.target_dev_addr));

    const TransmissionWindow& window = m.tx_window;
    w.key("TxWindow").begin_object();
    w.key("Radio").begin_object();
    w.field("Frequency", window.radio().frequency);
    write_modulation(w, window.radio().modulation);
    w.end_object();
    if (auto delay = window.delay()) {
        w.field("Delay", static_cast<uint64_t>(*delay));
    } else if (auto tmms = window.tmms()) {
        w.array("Tmms", *tmms);
    } else if (auto deadline = window.deadline()) {
        w.field("Deadline", *deadline);
    }
    w.end_object();

    w.array("PHYPayload", m.phy_payload);
}

void write_body(json::Writer& w, const DownstreamAck& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    w.field("MailboxID", m.mailbox_id);
}

void write_body(json::Writer& w, const DownstreamResult& m) {
    write_header(w, m.protocol_version, m.transaction_id);
    w.field("ResultCode", to_string(m.result_code));
    w.field("ResultMessage", m.result_message);
    w.field("MailboxID", m.mailbox_id);
}

// ==================== Decoding ====================

constexpr int MAX_DEPTH = 64;

const Json* optional_field(const Json& obj, const char* key) {
    auto it = obj.find(key);
    return (it == obj.end() || it->is_null()) ? nullptr : &*it;
}

bool has(const Json& obj, const char* key) {
    return optional_field(obj, key) != nullptr;
}

const Json& required(const Json& obj, const char* key) {
    const Json* v = optional_field(obj, key);
    if (v == nullptr) {
        throw RanError::decode(std::string("missing field ") + key);
    }
    return *v;
}

const Json& required_object(const Json& obj, const char* key) {
    const Json& v = required(obj, key);
    if (!v.is_object()) throw RanError::decode(std::string(key) + " must be an object");
    return v;
}

const Json& required_array(const Json& obj, const char* key) {
    const Json& v = required(obj, key);
    if (!v.is_array()) throw RanError::decode(std::string(key) + " must be a list");
    return v;
}

uint64_t as_u64(const Json& v, const char* what) {
    // "-0" parses as a signed zero.
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() == 0) return 0;
    throw RanError::decode(std::string(what) + " must be a non-negative integer");
}

uint64_t as_u64(const Json& v, const char* what, uint64_t max) {
    uint64_t n = as_u64(v, what);
    if (n > max) throw RanError::decode(std::string(what) + " is out of range");
    return n;
}

double as_double(const Json& v, const char* what) {
    if (!v.is_number()) throw RanError::decode(std::string(what) + " must be a number");
    return v.get<double>();
}

bool as_bool(const Json& v, const char* what) {
    if (!v.is_boolean()) throw RanError::decode(std::string(what) + " must be a boolean");
    return v.get<bool>();
}

const std::string& as_string(const Json& v, const char* what) {
    if (!v.is_string()) throw RanError::decode(std::string(what) + " must be a string");
    return v.get_ref<const std::string&>();
}

Json parse_frame(const std::string& text) {
    Json::parser_callback_t limit_depth = [](int depth, Json::parse_event_t, Json&) {
        if (depth > MAX_DEPTH) throw RanError::decode("malformed JSON: nesting too deep");
        return true;
    };
    try {
        return Json::parse(text, limit_depth);
    } catch (const Json::parse_error& e) {
        throw RanError::decode(std::string("malformed JSON: ") + e.what());
    }
}

uint32_t read_u32(const Json& obj, const char* key) {
    return static_cast<uint32_t>(as_u64(required(obj, key), key, MAX_U32));
}

template <typename Int>
std::vector<Int> read_int_list(const Json& obj, const char* key, uint64_t max) {
    const Json& list = required_array(obj, key);
    std::vector<Int> out;
    out.reserve(list.size());
    for (const auto& item : list) {
        out.push_back(static_cast<Int>(as_u64(item, key, max)));
    }
    return out;
}

std::vector<uint8_t> read_bytes(const Json& obj, const char* key) {
    return read_int_list<uint8_t>(obj, key, 0xFF);
}

Modulation read_modulation(const Json& radio) {
    const Json* lora = optional_field(radio, "LoRa");
    const Json* fsk = optional_field(radio, "FSK");
    const Json* fhss = optional_field(radio, "FHSS");

    int present = (lora ? 1 : 0) + (fsk ? 1 : 0) + (fhss ? 1 : 0);
    if (present != 1) {
        throw RanError::decode("Radio must carry exactly one of LoRa, FSK, FHSS");
    }

    if (lora) {
        if (!lora->is_object()) throw RanError::decode("LoRa must be an object");
        return LoRaModulation{
            static_cast<uint32_t>(as_u64(required(*lora, "Spreading"), "Spreading", 12)),
            as_u64(required(*lora, "Bandwidth"), "Bandwidth"),
        };
    }
    if (fsk) {
        if (!fsk->is_object()) throw RanError::decode("FSK must be an object");
        return FSKModulation{
            as_u64(required(*fsk, "FrequencyDeviation"), "FrequencyDeviation"),
            as_u64(required(*fsk, "BitRate"), "BitRate"),
        };
    }
    if (!fhss->is_object()) throw RanError::decode("FHSS must be an object");
    return FHSSModulation{
        as_u64(required(*fhss, "Ocw"), "Ocw"),
        as_string(required(*fhss, "CodingRate"), "CodingRate"),
    };
}

Radio read_radio(const Json& radio) {
    Radio out;
    out.frequency = as_u64(required(radio, "Frequency"), "Frequency");
    out.modulation = read_modulation(radio);
    return out;
}

UpstreamRadio read_upstream_radio(const Json& radio) {
    UpstreamRadio out;
    out.frequency = as_u64(required(radio, "Frequency"), "Frequency");
    out.modulation = read_modulation(radio);
    out.rssi = as_double(required(radio, "RSSI"), "RSSI");
    out.snr = as_double(required(radio, "SNR"), "SNR");
    return out;
}

uint32_t read_protocol_version(const Json& root) {
    return read_u32(root, "ProtocolVersion");
}

uint64_t read_transaction_id(const Json& root) {
    return as_u64(required(root, "TransactionID"), "TransactionID");
}

UpstreamMessage read_upstream(const Json& root) {
    UpstreamMessage m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);
    if (auto* outdated = optional_field(root, "Outdated")) {
        m.outdated = as_bool(*outdated, "Outdated");
    }
    m.dev_euis = read_int_list<uint64_t>(root, "DevEUIs", UINT64_MAX);
    m.radio = read_upstream_radio(required_object(root, "Radio"));
    m.phy_payload_no_mic = read_bytes(root, "PHYPayloadNoMIC");
    m.mic_challenge = read_int_list<uint32_t>(root, "MICChallenge", MAX_U32);
    if (auto* gps = optional_field(root, "Gps")) {
        if (!gps->is_object()) throw RanError::decode("Gps must be an object");
        Gps g;
        g.lat = as_double(required(*gps, "Lat"), "Lat");
        g.lng = as_double(required(*gps, "Lng"), "Lng");
        if (auto* alt = optional_field(*gps, "Alt")) g.alt = as_double(*alt, "Alt");
        m.gps = g;
    }
    return m;
}

UpstreamAck read_upstream_ack(const Json& root) {
    UpstreamAck m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);
    m.dev_eui = as_u64(required(root, "DevEUI"), "DevEUI");
    m.mic = read_u32(root, "MIC");
    return m;
}

UpstreamReject read_upstream_reject(const Json& root) {
    UpstreamReject m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);
    const std::string& code = as_string(required(root, "ResultCode"), "ResultCode");
    auto parsed = parse_upstream_reject_code(code);
    if (!parsed) throw RanError::decode("unknown upstream ResultCode '" + code + "'");
    m.result_code = *parsed;
    if (auto* msg = optional_field(root, "ResultMessage")) {
        m.result_message = as_string(*msg, "ResultMessage");
    }
    return m;
}

TransmissionWindow read_tx_window(const Json& window) {
    Radio radio = read_radio(required_object(window, "Radio"));

    std::optional<uint32_t> delay;
    std::optional<std::vector<uint64_t>> tmms;
    std::optional<uint64_t> deadline;
    if (auto* d = optional_field(window, "Delay")) {
        delay = static_cast<uint32_t>(as_u64(*d, "Delay", MAX_U32));
    }
    if (optional_field(window, "Tmms")) {
        tmms = read_int_list<uint64_t>(window, "Tmms", UINT64_MAX);
    }
    if (auto* dl = optional_field(window, "Deadline")) {
        deadline = as_u64(*dl, "Deadline");
    }
    return TransmissionWindow::from_parts(std::move(radio), delay, std::move(tmms), deadline);
}

DownstreamMessage read_downstream(const Json& root) {
    DownstreamMessage m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);

    const Json* dev_eui = optional_field(root, "DevEUI");
    const Json* addr = optional_field(root, "Addr");
    if ((dev_eui != nullptr) == (addr != nullptr)) {
        throw RanError::decode("Downstream must carry exactly one of DevEUI, Addr");
    }
    if (dev_eui) {
        m.target = DeviceTarget{as_u64(*dev_eui, "DevEUI")};
    } else {
        m.target = MulticastTarget{static_cast<uint32_t>(as_u64(*addr, "Addr", MAX_U32))};
    }
    if (auto* tda = optional_field(root, "TargetDevAddr")) {
        m.target_dev_addr = static_cast<uint32_t>(as_u64(*tda, "TargetDevAddr", MAX_U32));
    }
    m.tx_window = read_tx_window(required_object(root, "TxWindow"));
    m.phy_payload = read_bytes(root, "PHYPayload");
    return m;
}

DownstreamAck read_downstream_ack(const Json& root) {
    DownstreamAck m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);
    m.mailbox_id = as_u64(required(root, "MailboxID"), "MailboxID");
    return m;
}

DownstreamResult read_downstream_result(const Json& root) {
    DownstreamResult m;
    m.protocol_version = read_protocol_version(root);
    m.transaction_id = read_transaction_id(root);
    const std::string& code = as_string(required(root, "ResultCode"), "ResultCode");
    auto parsed = parse_downstream_result_code(code);
    if (!parsed) throw RanError::decode("unknown downstream ResultCode '" + code + "'");
    m.result_code = *parsed;
    m.result_message = as_string(required(root, "ResultMessage"), "ResultMessage");
    m.mailbox_id = as_u64(required(root, "MailboxID"), "MailboxID");
    return m;
}

Message read_message(const Json& root) {
    switch (detect_kind(root)) {
        case MessageKind::Upstream:         return read_upstream(root);
        case MessageKind::UpstreamAck:      return read_upstream_ack(root);
        case MessageKind::UpstreamReject:   return read_upstream_reject(root);
        case MessageKind::Downstream:       return read_downstream(root);
        case MessageKind::DownstreamAck:    return read_downstream_ack(root);
        case MessageKind::DownstreamResult: return read_downstream_result(root);
    }
    throw RanError::decode("unknown message kind");
}

} // namespace

// ==================== Public API ====================

std::string encode(const Message& message) {
    validation::check(message);

    json::Writer w;
    w.begin_object();
    std::visit([&w](const auto& m) { write_body(w, m); }, message);
    w.end_object();
    return w.take();
}

MessageKind detect_kind(const Json& root) {
    if (!root.is_object()) {
        throw RanError::decode("frame is not a JSON object");
    }
    if (has(root, "MICChallenge")) return MessageKind::Upstream;
    if (has(root, "MIC") && has(root, "DevEUI")) return MessageKind::UpstreamAck;
    if (has(root, "ResultCode")) {
        return has(root, "MailboxID") ? MessageKind::DownstreamResult : MessageKind::UpstreamReject;
    }
    if (has(root, "MailboxID")) return MessageKind::DownstreamAck;
    if (has(root, "TxWindow")) return MessageKind::Downstream;
    throw RanError::decode("frame matches no known message");
}

Message decode(const std::string& text) {
    Json root = parse_frame(text);
    try {
        Message message = read_message(root);
        validation::check(message);
        return message;
    } catch (const RanError& e) {
        if (e.kind() == ErrorKind::Validation) {
            throw RanError::decode(e.message());
        }
        throw;
    }
}

Message decode_expecting(const std::string& text, std::initializer_list<MessageKind> expected) {
    Message message = decode(text);
    MessageKind kind = kind_of(message);
    if (std::find(expected.begin(), expected.end(), kind) == expected.end()) {
        throw RanError::decode(std::string("unexpected ") + to_string(kind) + " message on this stream");
    }
    return message;
}

} // namespace codec
} // namespace ran
