#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wirepool/core/category.hpp"
#include "wirepool/core/channel/id.hpp"
#include "wirepool/core/channel/state.hpp"
#include "wirepool/core/channel/metrics.hpp"

namespace wirepool::core::channel {

// Detached copy of one channel's bookkeeping. Safe to keep after the pool
// lock is released; never refers back into the pool.
struct Info {
    Id id{INVALID_ID};
    Category category{Category::General};
    std::string tenant_id;
    std::string requester_role;
    Priority priority{Priority::Low};
    Status status{Status::Connecting};
    bool owned{false};

    std::chrono::steady_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_activity{};

    std::uint64_t message_count{0};
    std::uint32_t reconnect_attempts{0};
    std::uint64_t epoch{0};
    std::chrono::milliseconds retry_delay{0};
    bool retry_pending{false};

    Metrics metrics{};

    std::size_t history_size{0};
    std::vector<std::string> subscriptions;
};

} // namespace wirepool::core::channel
