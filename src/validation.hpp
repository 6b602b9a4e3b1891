// src/validation.hpp
// Internal input validation — applied on encode, on decode and at API boundaries.

#pragma once

#include "ran/error.hpp"
#include "ran/messages.hpp"
#include "ran/types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace ran {
namespace validation {

constexpr uint64_t MAX_U32 = 0xFFFFFFFFull;

inline void check_protocol_version(uint32_t version) {
    if (version == 0) {
        throw RanError::validation("ProtocolVersion", "must be positive");
    }
}

inline void check_transaction_id(uint64_t transaction_id) {
    if (transaction_id == 0) {
        throw RanError::validation("TransactionID", "must be positive");
    }
}

inline void check_modulation(const Modulation& modulation) {
    if (auto* lora = std::get_if<LoRaModulation>(&modulation)) {
        if (lora->spreading > 12) {
            throw RanError::validation("LoRa.Spreading", "must be at most 12");
        }
    } else if (auto* fhss = std::get_if<FHSSModulation>(&modulation)) {
        if (fhss->coding_rate.empty()) {
            throw RanError::validation("FHSS.CodingRate", "is required");
        }
    }
}

inline void check_radio(const Radio& radio) {
    check_modulation(radio.modulation);
}

inline void check_radio(const UpstreamRadio& radio) {
    check_modulation(radio.modulation);
}

inline void check_timing(const Timing& timing) {
    if (auto* d = std::get_if<Delay>(&timing)) {
        if (d->seconds == 0 || d->seconds > 15) {
            throw RanError::validation("TxWindow.Delay", "must be within 1..15");
        }
    } else if (auto* t = std::get_if<Tmms>(&timing)) {
        if (t->slots.empty()) {
            throw RanError::validation("TxWindow.Tmms", "must contain at least one slot");
        }
        if (t->slots.size() > MAX_TMMS_SLOTS) {
            throw RanError::validation("TxWindow.Tmms", "must contain at most 8 slots");
        }
    } else if (auto* dl = std::get_if<Deadline>(&timing)) {
        if (dl->unix_seconds == 0) {
            throw RanError::validation("TxWindow.Deadline", "must be positive");
        }
    }
}

inline void check_tx_window(const TransmissionWindow& window) {
    check_radio(window.radio());
    check_timing(window.timing());
}

// Class C deadlines may not lie further than MAX_DEADLINE_SECONDS from issue time.
inline void check_deadline_horizon(const TransmissionWindow& window, uint64_t now_unix_seconds) {
    auto deadline = window.deadline();
    if (deadline && *deadline > now_unix_seconds + MAX_DEADLINE_SECONDS) {
        throw RanError::validation("TxWindow.Deadline",
            "must be at most " + std::to_string(MAX_DEADLINE_SECONDS) + "s after issue time");
    }
}

inline void check(const UpstreamMessage& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
    if (m.dev_euis.empty()) {
        throw RanError::validation("DevEUIs", "must not be empty");
    }
    if (m.mic_challenge.empty()) {
        throw RanError::validation("MICChallenge", "must not be empty");
    }
    if (m.mic_challenge.size() > MAX_MIC_CHALLENGE) {
        throw RanError::validation("MICChallenge", "must contain at most 4096 candidates");
    }
    check_radio(m.radio);
}

inline void check(const UpstreamAck& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
}

inline void check(const UpstreamReject& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
}

inline void check(const DownstreamMessage& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
    if (std::holds_alternative<MulticastTarget>(m.target) && m.target_dev_addr) {
        throw RanError::validation("TargetDevAddr", "is only allowed for unicast targets");
    }
    check_tx_window(m.tx_window);
}

inline void check(const DownstreamAck& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
    if (m.mailbox_id == 0) {
        throw RanError::validation("MailboxID", "must be positive");
    }
}

inline void check(const DownstreamResult& m) {
    check_protocol_version(m.protocol_version);
    check_transaction_id(m.transaction_id);
    if (m.mailbox_id == 0) {
        throw RanError::validation("MailboxID", "must be positive");
    }
}

inline void check(const Message& m) {
    std::visit([](const auto& value) { check(value); }, m);
}

// Access tokens travel in a query string and a header line.
inline void check_access_token(const std::string& token) {
    if (token.empty()) {
        throw RanError::configuration("access token is required");
    }
    for (char c : token) {
        auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7f) {
            throw RanError::configuration("access token contains whitespace or control characters");
        }
    }
}

} // namespace validation
} // namespace ran
