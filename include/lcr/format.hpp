#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <chrono>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format a millisecond duration for humans
// Examples:
//   250      -> "250 ms"
//   1'500    -> "1.50 s"
//   90'000   -> "1.50 min"
inline std::string format_duration(std::chrono::milliseconds d) {
    double value = static_cast<double>(d.count());
    const char* unit = "ms";

    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "s";
        if (value >= 60.0) {
            value /= 60.0;
            unit = "min";
        }
    }
    else {
        return std::format("{} ms", d.count());
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format a ratio in [0, 1] as a percentage
// Example: 0.6667 -> "66.7%"
inline std::string format_percent(double ratio) {
    return std::format("{:.1f}%", ratio * 100.0);
}

} // namespace lcr
