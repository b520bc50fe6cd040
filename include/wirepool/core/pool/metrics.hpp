#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "wirepool/core/category.hpp"
#include "lcr/format.hpp"

namespace wirepool::core::pool {

// Per-category channel counts
struct CategoryCounts {
    std::size_t total{0};
    std::size_t connecting{0};
    std::size_t connected{0};
    std::size_t active{0};
    std::size_t idle{0};
    std::size_t error{0};
    std::size_t waiting{0};
};

// -----------------------------------------------------------------------------
// PoolMetrics
// -----------------------------------------------------------------------------
//
// Point-in-time aggregation taken under the pool lock. Pure read side: taking
// a snapshot never changes pool state.
//
//   active_connections    channels in connected or active
//   utilization           active_connections / total_connections (0 if empty)
//   reused_connections    channels that carried more than one message
//   average_latency_ms    mean of per-channel averages across all channels
//                         (channels never probed count as 0)
//   cost_savings          reused_connections * config establishment_cost
//
struct PoolMetrics {
    std::size_t total_connections{0};
    std::size_t active_connections{0};
    std::size_t idle_connections{0};
    std::size_t error_connections{0};
    std::size_t connecting_connections{0};
    std::size_t waiting_callers{0};

    std::uint64_t messages_handled{0};
    double average_latency_ms{0.0};
    double utilization{0.0};
    std::size_t reused_connections{0};
    double cost_savings{0.0};

    // Steady-clock time of the last idle reaper pass (epoch if never run)
    std::chrono::steady_clock::time_point last_cleanup{};

    std::array<CategoryCounts, CATEGORY_COUNT> by_category{};

    [[nodiscard]] const CategoryCounts& category(Category c) const noexcept {
        return by_category[index_of(c)];
    }

    void dump(std::ostream& os) const {
        os << "\n=== Pool Metrics ===\n";
        os << "  Total connections     : " << total_connections << '\n';
        os << "  Active (conn+active)  : " << active_connections << '\n';
        os << "  Idle                  : " << idle_connections << '\n';
        os << "  Error                 : " << error_connections << '\n';
        os << "  Connecting            : " << connecting_connections << '\n';
        os << "  Waiting callers       : " << waiting_callers << '\n';
        os << "  Messages handled      : " << lcr::format_number_exact(messages_handled) << '\n';
        os << "  Average latency       : " << average_latency_ms << " ms\n";
        os << "  Utilization           : " << lcr::format_percent(utilization) << '\n';
        os << "  Reused connections    : " << reused_connections << '\n';
        os << "  Cost savings          : " << cost_savings << '\n';
        os << "\n  category   total  active  idle  error  waiting\n";
        for (auto c : ALL_CATEGORIES) {
            const auto& k = category(c);
            os << "  " << to_string(c);
            for (auto pad = to_string(c).size(); pad < 10; ++pad) os << ' ';
            os << ' ' << k.total << "      " << (k.active + k.connected) << "       " << k.idle
               << "     " << k.error << "      " << k.waiting << '\n';
        }
    }
};

} // namespace wirepool::core::pool
