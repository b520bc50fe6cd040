#pragma once

#include <cstdint>

namespace wirepool::core::channel {

// Opaque channel identifier. Assigned from a per-pool monotonic counter and
// never reused within a pool's lifetime; 0 is never assigned.
using Id = std::uint64_t;

inline constexpr Id INVALID_ID = 0;

} // namespace wirepool::core::channel
