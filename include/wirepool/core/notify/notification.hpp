#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "wirepool/core/category.hpp"
#include "wirepool/core/channel/id.hpp"
#include "wirepool/core/channel/state.hpp"
#include "wirepool/core/codec/message.hpp"
#include "wirepool/core/transport/error.hpp"

namespace wirepool::core::notify {

// ===============================================================
// NOTIFICATION KIND
// ===============================================================
enum class Kind : uint8_t {
    Established,      // channel reached connected (initial or reconnect)
    Message,          // decoded inbound application message
    Closed,           // channel left the pool (close, reaper, eviction)
    Error,            // channel entered error
    PermanentFailure  // reconnect attempts exhausted, channel evicted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::Established:      return "Established";
        case Kind::Message:          return "Message";
        case Kind::Closed:           return "Closed";
        case Kind::Error:            return "Error";
        case Kind::PermanentFailure: return "PermanentFailure";
        default:                     return "Unknown";
    }
}

// Delivered to the consumer sink after the pool lock is released, in the
// order the pool produced them.
struct Notification {
    Kind kind{Kind::Message};
    Category category{Category::General};
    std::string tenant_id;
    channel::Id channel_id{channel::INVALID_ID};
    channel::Cause cause{channel::Cause::None};
    transport::Error transport_error{transport::Error::None};
    codec::Message message;  // Kind::Message only
};

// Fire-and-forget consumer callback. Must not block for long; may call back
// into the pool.
using Sink = std::function<void(const Notification&)>;

} // namespace wirepool::core::notify
