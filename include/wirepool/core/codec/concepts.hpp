#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "wirepool/core/error.hpp"
#include "wirepool/core/codec/message.hpp"

namespace wirepool::core::codec {

// -----------------------------------------------------------------------------
// CodecConcept
// -----------------------------------------------------------------------------
//
// Wire format used by the pool for application and control frames.
//
//   encode(): appends the encoded form of `msg` to `out`
//   decode(): Error::None on success, Error::DecodeError otherwise.
//             `out` is unspecified on failure.
//
// A codec instance is owned by one pool and only used under the pool lock.
//
// -----------------------------------------------------------------------------

template<class C>
concept CodecConcept =
    std::default_initializable<C> &&
    requires(
        C codec,
        const Message& msg,
        std::string& out,
        std::string_view data,
        Message& decoded
    )
{
    { codec.encode(msg, out) } noexcept -> std::same_as<void>;
    { codec.decode(data, decoded) } noexcept -> std::same_as<Error>;
};

} // namespace wirepool::core::codec
