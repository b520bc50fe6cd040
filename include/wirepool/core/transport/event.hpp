#pragma once

/*
===============================================================================
 wirepool::core::transport::Event
===============================================================================

Control-plane event reported by a raw channel and drained by the pool
through poll_event().

    • Close  → the channel was closed (remote close or unexpected drop)
    • Error  → transport-level failure while the channel was established

Data frames travel separately through poll_frame().

Event is a small trivially copyable POD so implementations can queue it in a
lock-free ring or a plain deque.
===============================================================================
*/

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "wirepool/core/transport/error.hpp"

namespace wirepool::core::transport {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
    case EventType::Close: return "Close";
    case EventType::Error: return "Error";
    default:               return "Unknown";
    }
}

struct Event {

    EventType type{EventType::Close};

    // RemoteClosed for a graceful close, the failure reason otherwise
    transport::Error error{transport::Error::None};

    static constexpr Event make_close(transport::Error reason = transport::Error::RemoteClosed) noexcept {
        Event ev;
        ev.type  = EventType::Close;
        ev.error = reason;
        return ev;
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "transport::Event must be trivially copyable");
static_assert(sizeof(Event) <= 8, "transport::Event should remain small");

} // namespace wirepool::core::transport
