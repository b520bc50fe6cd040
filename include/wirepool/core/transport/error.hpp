#pragma once

#include <string_view>

namespace wirepool::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification, abstracted away from the concrete
channel implementation (socket library, in-process loopback, mock).

The pool uses it to classify failures:
- establishment errors (ConnectionFailed, HandshakeFailed, Timeout)
- runtime failures surfaced through transport events
- benign termination (LocalShutdown, RemoteClosed)
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors ------------------------------------------
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Establishment aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the channel gracefully

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Establishment or liveness timeout
    ConnectionFailed, // Establishment failed (routing, refused, DNS)
    HandshakeFailed,  // Connectivity exists but session negotiation failed

    // --- Protocol / fatal ---------------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation
    TransportFailure, // Unclassified transport failure
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace wirepool::core
