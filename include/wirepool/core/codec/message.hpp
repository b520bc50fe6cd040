#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wirepool::core::codec {

// -----------------------------------------------------------------------------
// Message
// -----------------------------------------------------------------------------
//
// Decoded application frame. The pool only interprets `type` (to separate
// control traffic from application traffic); `payload` is opaque encoded
// text carried through unchanged.
//
struct Message {
    std::string type;
    std::string payload;            // encoded body, empty when absent
    std::uint64_t timestamp_ms{0};  // sender clock, 0 when absent
};

// Control frame types exchanged by the pool itself
inline constexpr std::string_view TYPE_PING      = "ping";
inline constexpr std::string_view TYPE_PONG      = "pong";
inline constexpr std::string_view TYPE_HEARTBEAT = "heartbeat";
// Assigned to frames that carry no type field
inline constexpr std::string_view TYPE_DATA      = "data";

// Control frames never count as application activity
[[nodiscard]]
inline bool is_control(const Message& msg) noexcept {
    return msg.type == TYPE_PING || msg.type == TYPE_PONG || msg.type == TYPE_HEARTBEAT;
}

} // namespace wirepool::core::codec
