#pragma once

#include "wirepool/core/category.hpp"
#include "wirepool/core/channel/id.hpp"
#include "wirepool/core/channel/state.hpp"

namespace wirepool::core::channel {

// Edge-triggered status change, recorded by the pool for every transition
// and drained with Manager::poll_transition().
struct Transition {
    Id id{INVALID_ID};
    Category category{Category::General};
    Status from{Status::Connecting};
    Status to{Status::Connecting};
    Cause cause{Cause::None};
};

} // namespace wirepool::core::channel
