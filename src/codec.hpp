// src/codec.hpp
// JSON wire codec for the six stream messages.

#pragma once

#include "json.hpp"
#include "ran/messages.hpp"

#include <initializer_list>
#include <string>

#include <nlohmann/json.hpp>

namespace ran {
namespace codec {

using Json = nlohmann::json;

// Encode one message as a JSON text frame. Absent optionals are omitted.
// Throws RanError (Validation) if the message violates a wire constraint.
std::string encode(const Message& message);

// Determine the message kind from the mandatory key set.
// Throws RanError (Decode) when the keys match no known message.
MessageKind detect_kind(const Json& root);

// Decode one text frame. Unknown keys are ignored.
// Throws RanError (Decode) on malformed JSON, nesting deeper than 64 levels,
// unknown kind or invalid fields.
Message decode(const std::string& text);

// Decode and require the kind to be one of `expected`.
Message decode_expecting(const std::string& text, std::initializer_list<MessageKind> expected);

} // namespace codec
} // namespace ran
