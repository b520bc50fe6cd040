#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include "wirepool/core/category.hpp"
#include "wirepool/core/error.hpp"
#include "wirepool/core/config/policy.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"

namespace wirepool::core::config {

/*
================================================================================
Pool Configuration
================================================================================

Runtime configuration of one pool::Manager. All fields have production
defaults; a default-constructed Pool is valid.

  policies               per-category limits (enum-indexed, fixed size)
  backoff                reconnect delay table; attempt N waits
                         backoff[min(N - 1, size - 1)]
  wait_timeout           default acquire() deadline
  health_check_interval  liveness probe cadence
  cleanup_interval       idle reaper cadence
  session_capacity       history entries kept per channel while owned
  establishment_cost     estimated cost of opening one channel; reused
                         channels are reported as savings in PoolMetrics

Every duration is bounded by MAX_DURATION so deadlines computed on the
steady clock cannot overflow.

validate() is run by Manager::start(); an invalid configuration never
reaches a running pool.
================================================================================
*/

inline constexpr std::chrono::milliseconds MAX_DURATION{std::chrono::hours(24 * 365)};

struct Pool {
    PolicyTable policies = default_policies();

    std::vector<std::chrono::milliseconds> backoff{
        std::chrono::seconds(1),
        std::chrono::seconds(2),
        std::chrono::seconds(5),
        std::chrono::seconds(10),
        std::chrono::seconds(30)
    };

    std::chrono::milliseconds wait_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds cleanup_interval{std::chrono::seconds(60)};
    std::size_t session_capacity{256};
    double establishment_cost{0.01};

    [[nodiscard]] const CategoryPolicy& policy(Category c) const noexcept {
        return policies[index_of(c)];
    }

    [[nodiscard]] CategoryPolicy& policy(Category c) noexcept {
        return policies[index_of(c)];
    }
};


[[nodiscard]]
inline Error validate(const Pool& cfg) noexcept {
    for (auto c : ALL_CATEGORIES) {
        const auto& p = cfg.policy(c);
        if (p.max_channels == 0) {
            WP_ERROR("[CONFIG] " << to_string(c) << ": max_channels must be >= 1");
            return Error::InvalidConfig;
        }
        if (p.idle_timeout.count() <= 0) {
            WP_ERROR("[CONFIG] " << to_string(c) << ": idle_timeout must be positive");
            return Error::InvalidConfig;
        }
        if (p.heartbeat_interval.count() < 0) {
            WP_ERROR("[CONFIG] " << to_string(c) << ": heartbeat_interval must not be negative");
            return Error::InvalidConfig;
        }
        if (p.idle_timeout > MAX_DURATION || p.heartbeat_interval > MAX_DURATION) {
            WP_ERROR("[CONFIG] " << to_string(c) << ": intervals must not exceed "
                     << lcr::format_duration(MAX_DURATION));
            return Error::InvalidConfig;
        }
        if (p.session_retain > cfg.session_capacity) {
            WP_ERROR("[CONFIG] " << to_string(c) << ": session_retain exceeds session_capacity");
            return Error::InvalidConfig;
        }
    }
    if (cfg.backoff.empty()) {
        WP_ERROR("[CONFIG] backoff table must not be empty");
        return Error::InvalidConfig;
    }
    for (auto d : cfg.backoff) {
        if (d.count() < 0 || d > MAX_DURATION) {
            WP_ERROR("[CONFIG] backoff delays must be in [0, " << lcr::format_duration(MAX_DURATION) << "]");
            return Error::InvalidConfig;
        }
    }
    if (cfg.wait_timeout.count() <= 0 || cfg.wait_timeout > MAX_DURATION) {
        WP_ERROR("[CONFIG] wait_timeout must be in (0, " << lcr::format_duration(MAX_DURATION) << "]");
        return Error::InvalidConfig;
    }
    if (cfg.health_check_interval.count() <= 0 || cfg.cleanup_interval.count() <= 0 ||
        cfg.health_check_interval > MAX_DURATION || cfg.cleanup_interval > MAX_DURATION) {
        WP_ERROR("[CONFIG] maintenance intervals must be in (0, " << lcr::format_duration(MAX_DURATION) << "]");
        return Error::InvalidConfig;
    }
    if (cfg.session_capacity == 0) {
        WP_ERROR("[CONFIG] session_capacity must be >= 1");
        return Error::InvalidConfig;
    }
    if (!(cfg.establishment_cost >= 0.0)) {
        WP_ERROR("[CONFIG] establishment_cost must not be negative");
        return Error::InvalidConfig;
    }
    return Error::None;
}

} // namespace wirepool::core::config
