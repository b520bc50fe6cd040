#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

#include "wirepool/core/category.hpp"


namespace wirepool::core::policy {

/*
===============================================================================
Reconnection Policy
===============================================================================

Pure functions. No clocks, no state: the pool owns the attempt counter and
the retry deadline, this header only answers two questions.

1) How long to wait before attempt N (1-based)?

       delay(N) = table[min(N - 1, table.size() - 1)]

   The last entry repeats once the table is exhausted.

2) What to do with a channel that just failed?

       Failure           Priority     attempts < max   Decision
       -------------------------------------------------------------
       Error             any          yes              Retry
       Error             any          no               GiveUp
       UnexpectedClose   Critical     yes              Retry
       UnexpectedClose   Critical     no               GiveUp
       UnexpectedClose   other        -                Evict
       CleanClose        any          -                Evict

   Retry   → schedule re-establishment after delay(attempts + 1)
   GiveUp  → error → disconnected, PermanentFailure reported
   Evict   → disconnected, no recovery, no PermanentFailure
===============================================================================
*/

enum class Failure : uint8_t {
    Error,            // transport error, failed write or failed probe
    UnexpectedClose,  // channel dropped without a graceful close
    CleanClose        // peer closed the channel gracefully
};

[[nodiscard]]
inline constexpr std::string_view to_string(Failure f) noexcept {
    switch (f) {
        case Failure::Error:           return "Error";
        case Failure::UnexpectedClose: return "UnexpectedClose";
        case Failure::CleanClose:      return "CleanClose";
        default:                       return "Unknown";
    }
}

enum class Decision : uint8_t {
    Retry,
    GiveUp,
    Evict
};

[[nodiscard]]
inline constexpr std::string_view to_string(Decision d) noexcept {
    switch (d) {
        case Decision::Retry:  return "Retry";
        case Decision::GiveUp: return "GiveUp";
        case Decision::Evict:  return "Evict";
        default:               return "Unknown";
    }
}


[[nodiscard]]
inline constexpr Decision decide(Priority priority, Failure failure,
                                 std::uint32_t attempts, std::uint32_t max_attempts) noexcept {
    if (failure == Failure::CleanClose) {
        return Decision::Evict;
    }
    if (failure == Failure::UnexpectedClose && priority != Priority::Critical) {
        return Decision::Evict;
    }
    return (attempts < max_attempts) ? Decision::Retry : Decision::GiveUp;
}


// Delay before 1-based attempt `attempt`. The table must not be empty
// (config::validate() guarantees it for a running pool).
[[nodiscard]]
inline std::chrono::milliseconds backoff_delay(const std::vector<std::chrono::milliseconds>& table,
                                               std::uint32_t attempt) noexcept {
    if (table.empty()) [[unlikely]] {
        return std::chrono::milliseconds{0};
    }
    const std::size_t idx = std::min<std::size_t>(attempt == 0 ? 0 : attempt - 1, table.size() - 1);
    return table[idx];
}

} // namespace wirepool::core::policy
