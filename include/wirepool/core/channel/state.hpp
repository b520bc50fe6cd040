#pragma once

#include <cstdint>
#include <string_view>


namespace wirepool::core::channel {

// ===============================================================
// CHANNEL STATUS ENUM
// ===============================================================
enum class Status : uint8_t {
    Connecting,
    Connected,
    Idle,
    Active,
    Error,
    Disconnected
};

// ------------------------------------------------------------
// Status → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Connecting:    return "Connecting";
        case Status::Connected:     return "Connected";
        case Status::Idle:          return "Idle";
        case Status::Active:        return "Active";
        case Status::Error:         return "Error";
        case Status::Disconnected:  return "Disconnected";
        default:                    return "Unknown";
    }
}

// Statuses that hold an established transport
[[nodiscard]]
inline constexpr bool is_established(Status s) noexcept {
    return s == Status::Connected || s == Status::Active || s == Status::Idle;
}

// Statuses that accept application sends
[[nodiscard]]
inline constexpr bool is_sendable(Status s) noexcept {
    return s == Status::Connected || s == Status::Active;
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- Transport lifecycle ---
    HandshakeSucceeded,
    HandshakeFailed,
    TransportFailed,

    // --- Ownership ---
    Acquired,
    Released,

    // --- Recovery ---
    RetryStarted,
    GaveUp,

    // --- Teardown ---
    CloseRequested
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::HandshakeSucceeded: return "HandshakeSucceeded";
        case Event::HandshakeFailed:    return "HandshakeFailed";
        case Event::TransportFailed:    return "TransportFailed";
        case Event::Acquired:           return "Acquired";
        case Event::Released:           return "Released";
        case Event::RetryStarted:       return "RetryStarted";
        case Event::GaveUp:             return "GaveUp";
        case Event::CloseRequested:     return "CloseRequested";
        default:                        return "UnknownEvent";
    }
}


// ===============================================================
// CAUSE ENUM (why a transition happened; carried into logs)
// ===============================================================
enum class Cause : uint8_t {
    None,
    Acquire,          // handed to a caller
    Release,          // returned by its caller
    Reconnected,      // re-establishment succeeded
    LocalClose,       // explicit close() / close_all()
    IdleTimeout,      // reaped by the idle reaper
    ProbeFailed,      // health probe could not be delivered
    TransportError,   // transport reported an error or a write failed
    RemoteClosed,     // peer closed the channel
    HandshakeFailed,  // establishment failed
    RetryExhausted,   // reconnect attempts exhausted
    Evicted,          // closed by policy instead of being re-established
    Shutdown          // pool stopped
};

[[nodiscard]]
inline constexpr std::string_view to_string(Cause c) noexcept {
    switch (c) {
        case Cause::None:            return "None";
        case Cause::Acquire:         return "Acquire";
        case Cause::Release:         return "Release";
        case Cause::Reconnected:     return "Reconnected";
        case Cause::LocalClose:      return "LocalClose";
        case Cause::IdleTimeout:     return "IdleTimeout";
        case Cause::ProbeFailed:     return "ProbeFailed";
        case Cause::TransportError:  return "TransportError";
        case Cause::RemoteClosed:    return "RemoteClosed";
        case Cause::HandshakeFailed: return "HandshakeFailed";
        case Cause::RetryExhausted:  return "RetryExhausted";
        case Cause::Evicted:         return "Evicted";
        case Cause::Shutdown:        return "Shutdown";
        default:                     return "Unknown";
    }
}


// ===============================================================
// TRANSITION TABLE
// ===============================================================
//
//   Connecting   --HandshakeSucceeded-->  Connected
//   Connecting   --HandshakeFailed----->  Error
//   Connected    --Acquired------------>  Active
//   Idle         --Acquired------------>  Active
//   Connected    --Released------------>  Idle
//   Active       --Released------------>  Idle
//   Connected    --TransportFailed----->  Error
//   Active       --TransportFailed----->  Error
//   Idle         --TransportFailed----->  Error
//   Error        --RetryStarted-------->  Connecting
//   Error        --GaveUp-------------->  Disconnected
//   (any but Disconnected) --CloseRequested--> Disconnected
//
// Disconnected is terminal. Returns false (and leaves `to` untouched) for
// any pair not listed above.
//
[[nodiscard]]
inline constexpr bool next(Status from, Event ev, Status& to) noexcept {
    if (from == Status::Disconnected) {
        return false;
    }
    switch (ev) {
        case Event::HandshakeSucceeded:
            if (from != Status::Connecting) return false;
            to = Status::Connected;
            return true;
        case Event::HandshakeFailed:
            if (from != Status::Connecting) return false;
            to = Status::Error;
            return true;
        case Event::Acquired:
            if (from != Status::Connected && from != Status::Idle) return false;
            to = Status::Active;
            return true;
        case Event::Released:
            if (from != Status::Connected && from != Status::Active) return false;
            to = Status::Idle;
            return true;
        case Event::TransportFailed:
            if (!is_established(from)) return false;
            to = Status::Error;
            return true;
        case Event::RetryStarted:
            if (from != Status::Error) return false;
            to = Status::Connecting;
            return true;
        case Event::GaveUp:
            if (from != Status::Error) return false;
            to = Status::Disconnected;
            return true;
        case Event::CloseRequested:
            to = Status::Disconnected;
            return true;
    }
    return false;
}

} // namespace wirepool::core::channel
