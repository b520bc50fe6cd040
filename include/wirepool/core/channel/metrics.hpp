#pragma once

#include <cstdint>

namespace wirepool::core::channel {

// Cumulative traffic counters for one channel's lifetime.
// Plain values: read and written under the pool mutex only.
struct Metrics {
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
    std::uint64_t messages_handled{0};
    std::uint64_t errors{0};

    // Running mean of probe round trips
    double average_latency_ms{0.0};
    std::uint64_t latency_samples{0};

    void record_latency(double ms) noexcept {
        ++latency_samples;
        average_latency_ms += (ms - average_latency_ms) / static_cast<double>(latency_samples);
    }
};

} // namespace wirepool::core::channel
