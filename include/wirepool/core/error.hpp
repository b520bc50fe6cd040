#pragma once

#include <string_view>

namespace wirepool::core {

/*
===============================================================================
 core::Error
===============================================================================

Result classification for every fallible pool operation.

Pool operations never throw. They return one of these values, and the caller
decides how to react. Transport-specific failure detail is carried separately
by transport::Error and is only visible in logs and notifications.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Caller-visible outcomes --------------------------------------------
    Timeout,          // acquire() waited past its deadline
    NotReady,         // send() on a channel not in connected/active
    TransportError,   // establishment or write failed at the transport layer
    DecodeError,      // inbound frame could not be decoded (codec boundary only)
    PermanentFailure, // reconnect attempts exhausted; channel evicted

    // --- Contract errors -----------------------------------------------------
    UnknownChannel,   // id not present in the live index
    InvalidState,     // pool not started, or already stopped
    InvalidConfig,    // configuration rejected at load or start
    Cancelled,        // waiter rejected by shutdown, or establishment discarded by close
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:             return "None";
    case Error::Timeout:          return "Timeout";
    case Error::NotReady:         return "NotReady";
    case Error::TransportError:   return "TransportError";
    case Error::DecodeError:      return "DecodeError";
    case Error::PermanentFailure: return "PermanentFailure";
    case Error::UnknownChannel:   return "UnknownChannel";
    case Error::InvalidState:     return "InvalidState";
    case Error::InvalidConfig:    return "InvalidConfig";
    case Error::Cancelled:        return "Cancelled";
    default:                      return "Unknown";
    }
}

} // namespace wirepool::core
