// src/frame.hpp
// RFC 6455 framing and handshake helpers — transport-agnostic.

#pragma once

#include "ran/error.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace ran {
namespace ws {

// Largest message (after reassembly) accepted from the server.
constexpr uint64_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

enum class Opcode : uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA,
};

struct FrameHeader {
    bool fin = false;
    Opcode opcode = Opcode::Continuation;
    bool masked = false;
    uint64_t payload_len = 0;
    uint8_t mask_key[4] = {};
    size_t header_len = 0;
};

inline bool is_control(Opcode op) {
    return (static_cast<uint8_t>(op) & 0x8) != 0;
}

// Parse a frame header. Returns false if more bytes are needed.
// Throws RanError (Transport) on a protocol violation.
inline bool parse_frame_header(const uint8_t* data, size_t len, FrameHeader& out) {
    if (len < 2) return false;

    uint8_t byte0 = data[0];
    uint8_t byte1 = data[1];
    if ((byte0 & 0x70) != 0) {
        throw RanError::transport("websocket frame uses reserved bits");
    }
    out.fin = (byte0 & 0x80) != 0;
    out.opcode = static_cast<Opcode>(byte0 & 0x0F);
    out.masked = (byte1 & 0x80) != 0;

    uint8_t op = byte0 & 0x0F;
    if (op > 0x2 && op < 0x8) throw RanError::transport("websocket frame uses reserved opcode");
    if (op > 0xA) throw RanError::transport("websocket frame uses reserved opcode");

    uint64_t payload_len = byte1 & 0x7F;
    size_t header_len = 2;
    if (payload_len == 126) {
        if (len < 4) return false;
        payload_len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_len = 4;
    } else if (payload_len == 127) {
        if (len < 10) return false;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | data[2 + i];
        }
        header_len = 10;
    }

    if (is_control(out.opcode) && (payload_len > 125 || !out.fin)) {
        throw RanError::transport("websocket control frame is fragmented or too long");
    }
    if (payload_len > MAX_MESSAGE_SIZE) {
        throw RanError::transport("websocket frame exceeds " + std::to_string(MAX_MESSAGE_SIZE) + " bytes");
    }

    if (out.masked) {
        if (len < header_len + 4) return false;
        std::memcpy(out.mask_key, data + header_len, 4);
        header_len += 4;
    }

    out.payload_len = payload_len;
    out.header_len = header_len;
    return true;
}

inline void apply_mask(uint8_t* payload, size_t len, const uint8_t mask_key[4]) {
    for (size_t i = 0; i < len; i++) {
        payload[i] ^= mask_key[i % 4];
    }
}

// Append one frame. Client frames pass a mask key; pass nullptr for an unmasked frame.
inline void append_frame(std::string& out, Opcode opcode, const char* payload, size_t len,
                         const uint8_t* mask_key) {
    out.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

    uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    if (len <= 125) {
        out.push_back(static_cast<char>(mask_bit | static_cast<uint8_t>(len)));
    } else if (len <= 65535) {
        out.push_back(static_cast<char>(mask_bit | 126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    } else {
        out.push_back(static_cast<char>(mask_bit | 127));
        for (int i = 0; i < 8; i++) {
            out.push_back(static_cast<char>((static_cast<uint64_t>(len) >> (56 - i * 8)) & 0xFF));
        }
    }

    if (mask_key) {
        out.append(reinterpret_cast<const char*>(mask_key), 4);
        size_t start = out.size();
        out.append(payload, len);
        apply_mask(reinterpret_cast<uint8_t*>(&out[start]), len, mask_key);
    } else {
        out.append(payload, len);
    }
}

inline std::string base64(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

inline void random_bytes(unsigned char* out, size_t len) {
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw RanError::io("RAND_bytes failed");
    }
}

// 16 random bytes, base64 encoded (Sec-WebSocket-Key).
inline std::string make_client_key() {
    unsigned char nonce[16];
    random_bytes(nonce, sizeof(nonce));
    return base64(nonce, sizeof(nonce));
}

// base64(SHA-1(key + GUID)) — the expected Sec-WebSocket-Accept value.
inline std::string accept_key(const std::string& client_key) {
    static const char* const GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string input = client_key + GUID;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        throw RanError::io("SHA-1 digest failed");
    }
    return base64(digest, digest_len);
}

} // namespace ws
} // namespace ran
