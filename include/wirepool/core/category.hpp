#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace wirepool::core {

// -----------------------------------------------------------------------------
// Traffic categories
// -----------------------------------------------------------------------------
//
// Each category owns an independent channel budget, idle timeout, reconnect
// cap and priority (see config::CategoryPolicy). The set is closed: adding a
// category means extending this enum and the default policy table.
//
enum class Category : uint8_t {
    Voice,      // streaming audio
    Chat,       // conversational traffic
    Inventory,  // inventory push updates
    Alerts,     // business alert push
    General     // everything else
};

inline constexpr std::size_t CATEGORY_COUNT = 5;

inline constexpr std::array<Category, CATEGORY_COUNT> ALL_CATEGORIES{
    Category::Voice, Category::Chat, Category::Inventory, Category::Alerts, Category::General
};

[[nodiscard]]
inline constexpr std::size_t index_of(Category c) noexcept {
    return static_cast<std::size_t>(c);
}

[[nodiscard]]
inline constexpr std::string_view to_string(Category c) noexcept {
    switch (c) {
        case Category::Voice:     return "voice";
        case Category::Chat:      return "chat";
        case Category::Inventory: return "inventory";
        case Category::Alerts:    return "alerts";
        case Category::General:   return "general";
    }
    return "unknown";
}

// Unknown names are rejected, never mapped to General.
[[nodiscard]]
inline constexpr bool parse_category(std::string_view name, Category& out) noexcept {
    for (auto c : ALL_CATEGORIES) {
        if (to_string(c) == name) {
            out = c;
            return true;
        }
    }
    return false;
}


// -----------------------------------------------------------------------------
// Priority
// -----------------------------------------------------------------------------
//
// Critical channels are re-established on any close; lower priorities are
// only re-established after transport errors.
//
enum class Priority : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]]
inline constexpr std::string_view to_string(Priority p) noexcept {
    switch (p) {
        case Priority::Low:      return "low";
        case Priority::Medium:   return "medium";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]]
inline constexpr bool parse_priority(std::string_view name, Priority& out) noexcept {
    for (auto p : {Priority::Low, Priority::Medium, Priority::High, Priority::Critical}) {
        if (to_string(p) == name) {
            out = p;
            return true;
        }
    }
    return false;
}

} // namespace wirepool::core
