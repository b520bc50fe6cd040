#pragma once

#include <string>
#include <string_view>

#include "wirepool/core/error.hpp"
#include "wirepool/core/codec/message.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Codec
================================================================================

Default wire format:

    {"type":"<type>","timestamp":<ms>,"data":<payload>}

Encoding:
  • `type` is escaped as a JSON string
  • `timestamp` is written only when non-zero
  • `data` is written verbatim when the payload is an object, array, number
    or boolean in JSON text; any other payload (plain text, JSON strings)
    is written as an escaped JSON string; an empty payload is written as null

Decoding:
  • Root must be a JSON object
  • `type` defaults to "data" when absent or not a string
  • `timestamp` defaults to 0 when absent or not an unsigned integer
  • `payload` is the minified `data` member when present (empty for null,
    the unescaped contents for a string),
    otherwise the minified document itself (frames from peers that do not
    wrap their body are carried whole)
  • Malformed input yields Error::DecodeError and is never thrown

The codec never logs. The pool decides what to do with a failed frame.
================================================================================
*/

namespace wirepool::core::codec {

class Json {
public:
    void encode(const Message& msg, std::string& out) noexcept;

    [[nodiscard]]
    Error decode(std::string_view data, Message& out) noexcept;

private:
    bool is_structured_(std::string_view payload) noexcept;

    simdjson::dom::parser parser_;
};

} // namespace wirepool::core::codec
