#pragma once

#include <string>
#include <string_view>

#include "wirepool/core/error.hpp"
#include "wirepool/core/config/pool.hpp"

/*
================================================================================
JSON configuration loader
================================================================================

Reads a JSON document into a config::Pool. Every member is optional; absent
members keep the value already held by `out` (normally the defaults).

    {
      "wait_timeout_ms": 30000,
      "health_check_interval_ms": 30000,
      "cleanup_interval_ms": 60000,
      "session_capacity": 256,
      "establishment_cost": 0.01,
      "backoff_ms": [1000, 2000, 5000, 10000, 30000],
      "categories": {
        "chat": {
          "max_channels": 8,
          "priority": "medium",
          "idle_timeout_ms": 600000,
          "max_reconnect_attempts": 3,
          "heartbeat_interval_ms": 30000,
          "session_retain": 50
        }
      }
    }

Unknown members, unknown category names, unknown priorities, values of the
wrong type and durations above MAX_DURATION are rejected with Error::InvalidConfig. The result is
validated before it is stored: on any failure `out` is left untouched.
================================================================================
*/

namespace wirepool::core::config {

[[nodiscard]]
Error load_json(std::string_view json, Pool& out) noexcept;

[[nodiscard]]
Error load_file(const std::string& path, Pool& out) noexcept;

} // namespace wirepool::core::config
