#pragma once

#include <array>
#include <chrono>
#include <cstdint>

#include "wirepool/core/category.hpp"

namespace wirepool::core::config {

// -----------------------------------------------------------------------------
// CategoryPolicy
// -----------------------------------------------------------------------------
//
// Static limits applied to every channel of one category.
//
//   max_channels            live channels allowed at once (>= 1)
//   priority                default priority; acquire context may override
//   idle_timeout            idle channels older than this are reaped
//   max_reconnect_attempts  re-establishment cap before permanent failure
//   heartbeat_interval      heartbeat cadence, 0 disables heartbeats
//   session_retain          history entries kept when a channel is released
//
struct CategoryPolicy {
    std::uint32_t max_channels{1};
    Priority priority{Priority::Low};
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    std::uint32_t max_reconnect_attempts{0};
    std::chrono::milliseconds heartbeat_interval{0};
    std::uint32_t session_retain{10};
};

using PolicyTable = std::array<CategoryPolicy, CATEGORY_COUNT>;

// Production defaults, indexed by Category
[[nodiscard]]
inline constexpr PolicyTable default_policies() noexcept {
    using namespace std::chrono_literals;
    PolicyTable table{};
    table[index_of(Category::Voice)]     = CategoryPolicy{3,  Priority::High,     2min,  5,  10s, 10};
    table[index_of(Category::Chat)]      = CategoryPolicy{8,  Priority::Medium,   10min, 3,  30s, 50};
    table[index_of(Category::Inventory)] = CategoryPolicy{5,  Priority::Critical, 1min,  10, 5s,  10};
    table[index_of(Category::Alerts)]    = CategoryPolicy{3,  Priority::Critical, 30min, 7,  15s, 10};
    table[index_of(Category::General)]   = CategoryPolicy{10, Priority::Low,      5min,  2,  60s, 10};
    return table;
}

} // namespace wirepool::core::config
