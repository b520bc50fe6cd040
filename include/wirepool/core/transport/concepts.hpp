#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <concepts>

#include "wirepool/core/category.hpp"
#include "wirepool/core/transport/error.hpp"
#include "wirepool/core/transport/event.hpp"

namespace wirepool::core::transport {

// -----------------------------------------------------------------------------
// RawChannelConcept
// -----------------------------------------------------------------------------
//
// Minimal contract for one established bidirectional session.
//
// The raw channel:
//
//   • Is created already established by a FactoryConcept
//   • Queues inbound frames and control events internally
//   • Exposes poll_frame() / poll_event() for the pool to drain
//   • Never calls back into the pool
//
// Threading: the pool only touches a raw channel while holding its own
// mutex, so implementations need to synchronize only with their own IO
// threads.
//
// -----------------------------------------------------------------------------

template<class C>
concept RawChannelConcept =
    requires(
        C ch,
        std::string_view data,
        std::string& frame,
        Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ch.close() } noexcept -> std::same_as<void>;
    { ch.is_open() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Sending (false = write failed, channel is unusable)
    // ---------------------------------------------------------------------

    { ch.send(data) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Polling
    // ---------------------------------------------------------------------

    { ch.poll_frame(frame) } noexcept -> std::same_as<bool>;
    { ch.poll_event(ev) } noexcept -> std::same_as<bool>;
};


// -----------------------------------------------------------------------------
// FactoryConcept
// -----------------------------------------------------------------------------
//
// Channel-establishment primitive. open() performs the full handshake and
// either fills `out` with an established channel (Error::None) or reports
// why establishment failed.
//
// open() runs without the pool lock held and may be invoked concurrently
// from several threads (acquirers and the maintenance worker).
//
// -----------------------------------------------------------------------------

template<class F>
concept FactoryConcept =
    requires {
        typename F::channel_type;
    } &&
    RawChannelConcept<typename F::channel_type> &&
    requires(
        F f,
        Category category,
        std::unique_ptr<typename F::channel_type>& out
    )
{
    { f.open(category, out) } noexcept -> std::same_as<Error>;
};

} // namespace wirepool::core::transport
