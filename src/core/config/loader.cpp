#include "wirepool/core/config/loader.hpp"

#include <cstdint>

#include "simdjson.h"
#include "lcr/log/logger.hpp"


namespace wirepool::core::config {

namespace {

[[nodiscard]]
bool read_u64_(const simdjson::dom::element& el, std::string_view key, std::uint64_t& out) noexcept {
    if (el.get_uint64().get(out) != simdjson::SUCCESS) {
        WP_ERROR("[CONFIG] '" << key << "' must be a non-negative integer");
        return false;
    }
    return true;
}

[[nodiscard]]
bool read_ms_(const simdjson::dom::element& el, std::string_view key, std::chrono::milliseconds& out) noexcept {
    std::uint64_t v = 0;
    if (!read_u64_(el, key, v)) {
        return false;
    }
    if (v > static_cast<std::uint64_t>(MAX_DURATION.count())) {
        WP_ERROR("[CONFIG] '" << key << "' exceeds " << MAX_DURATION.count() << " ms");
        return false;
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(v));
    return true;
}

[[nodiscard]]
bool read_u32_(const simdjson::dom::element& el, std::string_view key, std::uint32_t& out) noexcept {
    std::uint64_t v = 0;
    if (!read_u64_(el, key, v)) {
        return false;
    }
    if (v > UINT32_MAX) {
        WP_ERROR("[CONFIG] '" << key << "' out of range");
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

[[nodiscard]]
bool parse_policy_(Category category, const simdjson::dom::element& el, CategoryPolicy& policy) noexcept {
    simdjson::dom::object obj;
    if (el.get_object().get(obj)) {
        WP_ERROR("[CONFIG] category '" << to_string(category) << "' must be an object");
        return false;
    }
    for (auto field : obj) {
        const std::string_view key = field.key;
        bool ok = false;
        if (key == "max_channels") {
            ok = read_u32_(field.value, key, policy.max_channels);
        }
        else if (key == "priority") {
            std::string_view name;
            if (field.value.get_string().get(name) == simdjson::SUCCESS && parse_priority(name, policy.priority)) {
                ok = true;
            }
            else {
                WP_ERROR("[CONFIG] category '" << to_string(category) << "': unknown priority");
            }
        }
        else if (key == "idle_timeout_ms") {
            ok = read_ms_(field.value, key, policy.idle_timeout);
        }
        else if (key == "max_reconnect_attempts") {
            ok = read_u32_(field.value, key, policy.max_reconnect_attempts);
        }
        else if (key == "heartbeat_interval_ms") {
            ok = read_ms_(field.value, key, policy.heartbeat_interval);
        }
        else if (key == "session_retain") {
            ok = read_u32_(field.value, key, policy.session_retain);
        }
        else {
            WP_ERROR("[CONFIG] category '" << to_string(category) << "': unknown member '" << key << "'");
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

[[nodiscard]]
bool parse_categories_(const simdjson::dom::element& el, Pool& cfg) noexcept {
    simdjson::dom::object obj;
    if (el.get_object().get(obj)) {
        WP_ERROR("[CONFIG] 'categories' must be an object");
        return false;
    }
    for (auto field : obj) {
        Category category;
        if (!parse_category(field.key, category)) {
            WP_ERROR("[CONFIG] unknown category '" << field.key << "'");
            return false;
        }
        if (!parse_policy_(category, field.value, cfg.policy(category))) {
            return false;
        }
    }
    return true;
}

[[nodiscard]]
bool parse_backoff_(const simdjson::dom::element& el, Pool& cfg) noexcept {
    simdjson::dom::array arr;
    if (el.get_array().get(arr)) {
        WP_ERROR("[CONFIG] 'backoff_ms' must be an array");
        return false;
    }
    cfg.backoff.clear();
    for (auto item : arr) {
        std::chrono::milliseconds delay{0};
        if (!read_ms_(item, "backoff_ms[]", delay)) {
            return false;
        }
        cfg.backoff.push_back(delay);
    }
    return true;
}

[[nodiscard]]
Error parse_document_(const simdjson::dom::element& root, Pool& cfg) noexcept {
    simdjson::dom::object obj;
    if (root.get_object().get(obj)) {
        WP_ERROR("[CONFIG] root must be an object");
        return Error::InvalidConfig;
    }
    for (auto field : obj) {
        const std::string_view key = field.key;
        bool ok = false;
        if (key == "wait_timeout_ms") {
            ok = read_ms_(field.value, key, cfg.wait_timeout);
        }
        else if (key == "health_check_interval_ms") {
            ok = read_ms_(field.value, key, cfg.health_check_interval);
        }
        else if (key == "cleanup_interval_ms") {
            ok = read_ms_(field.value, key, cfg.cleanup_interval);
        }
        else if (key == "session_capacity") {
            std::uint64_t v = 0;
            ok = read_u64_(field.value, key, v);
            cfg.session_capacity = static_cast<std::size_t>(v);
        }
        else if (key == "establishment_cost") {
            double v = 0.0;
            if (field.value.get_double().get(v) == simdjson::SUCCESS && v >= 0.0) {
                cfg.establishment_cost = v;
                ok = true;
            }
            else {
                WP_ERROR("[CONFIG] 'establishment_cost' must be a non-negative number");
            }
        }
        else if (key == "backoff_ms") {
            ok = parse_backoff_(field.value, cfg);
        }
        else if (key == "categories") {
            ok = parse_categories_(field.value, cfg);
        }
        else {
            WP_ERROR("[CONFIG] unknown member '" << key << "'");
        }
        if (!ok) {
            return Error::InvalidConfig;
        }
    }
    return validate(cfg);
}

} // namespace


Error load_json(std::string_view json, Pool& out) noexcept {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(json.data(), json.size()).get(root);
    if (error) {
        WP_ERROR("[CONFIG] JSON parse error: " << simdjson::error_message(error));
        return Error::InvalidConfig;
    }
    Pool candidate = out;
    const auto result = parse_document_(root, candidate);
    if (result == Error::None) {
        out = std::move(candidate);
    }
    return result;
}


Error load_file(const std::string& path, Pool& out) noexcept {
    simdjson::padded_string content;
    auto error = simdjson::padded_string::load(path).get(content);
    if (error) {
        WP_ERROR("[CONFIG] cannot read '" << path << "': " << simdjson::error_message(error));
        return Error::InvalidConfig;
    }
    WP_INFO("[CONFIG] loading " << path);
    return load_json(std::string_view(content.data(), content.size()), out);
}

} // namespace wirepool::core::config
