// src/json.hpp
// Streaming JSON writer for outbound frames.
//
// Appends bytes straight into a string (no DOM). Frames are read back with
// nlohmann::json in codec.cpp.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace ran {
namespace json {

// ==================== Writer ====================

class Writer {
public:
    Writer() { buf_.reserve(256); }

    Writer& begin_object() {
        before_value();
        buf_.push_back('{');
        counts_.push_back(0);
        return *this;
    }

    Writer& end_object() {
        buf_.push_back('}');
        counts_.pop_back();
        return *this;
    }

    Writer& begin_array() {
        before_value();
        buf_.push_back('[');
        counts_.push_back(0);
        return *this;
    }

    Writer& end_array() {
        buf_.push_back(']');
        counts_.pop_back();
        return *this;
    }

    Writer& key(const char* k) {
        if (!counts_.empty() && counts_.back() > 0) buf_.push_back(',');
        buf_.push_back('"');
        write_escaped(k, std::strlen(k));
        buf_.push_back('"');
        buf_.push_back(':');
        pending_key_ = true;
        return *this;
    }

    Writer& value(uint64_t v) {
        before_value();
        char tmp[24];
        int n = std::snprintf(tmp, sizeof(tmp), "%llu", static_cast<unsigned long long>(v));
        if (n > 0) buf_.append(tmp, static_cast<size_t>(n));
        return *this;
    }

    Writer& value(uint32_t v) { return value(static_cast<uint64_t>(v)); }

    Writer& value(double v) {
        before_value();
        char tmp[32];
        // Shortest of %.15g / %.17g that reads back as the same double.
        int n = std::snprintf(tmp, sizeof(tmp), "%.15g", v);
        if (std::strtod(tmp, nullptr) != v) {
            n = std::snprintf(tmp, sizeof(tmp), "%.17g", v);
        }
        if (n > 0) buf_.append(tmp, static_cast<size_t>(n));
        return *this;
    }

    Writer& value(bool v) {
        before_value();
        buf_.append(v ? "true" : "false");
        return *this;
    }

    Writer& value(const std::string& v) {
        before_value();
        buf_.push_back('"');
        write_escaped(v.data(), v.size());
        buf_.push_back('"');
        return *this;
    }

    Writer& value(const char* v) { return value(std::string(v)); }

    template <typename T>
    Writer& field(const char* k, const T& v) {
        key(k);
        return value(v);
    }

    template <typename Int>
    Writer& array(const char* k, const std::vector<Int>& values) {
        key(k);
        begin_array();
        for (auto v : values) value(static_cast<uint64_t>(v));
        return end_array();
    }

    const std::string& str() const noexcept { return buf_; }
    std::string take() { return std::move(buf_); }

private:
    std::string buf_;
    std::vector<size_t> counts_;
    bool pending_key_ = false;

    void before_value() {
        if (pending_key_) {
            pending_key_ = false;
            counts_.back()++;
            return;
        }
        if (!counts_.empty()) {
            if (counts_.back() > 0) buf_.push_back(',');
            counts_.back()++;
        }
    }

    static bool needs_escape(char c) {
        return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
    }

    void write_escaped(const char* s, size_t len) {
        // Bulk-copy runs of safe characters.
        size_t i = 0;
        while (i < len) {
            size_t run_start = i;
            while (i < len && !needs_escape(s[i])) ++i;
            if (i > run_start) buf_.append(s + run_start, i - run_start);

            if (i < len) {
                char c = s[i];
                switch (c) {
                    case '"':  buf_.append("\\\""); break;
                    case '\\': buf_.append("\\\\"); break;
                    case '\b': buf_.append("\\b"); break;
                    case '\f': buf_.append("\\f"); break;
                    case '\n': buf_.append("\\n"); break;
                    case '\r': buf_.append("\\r"); break;
                    case '\t': buf_.append("\\t"); break;
                    default: {
                        char hex[7];
                        std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                        buf_.append(hex, 6);
                        break;
                    }
                }
                ++i;
            }
        }
    }
};

} // namespace json
} // namespace ran
