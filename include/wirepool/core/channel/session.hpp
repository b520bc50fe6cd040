#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "wirepool/core/codec/message.hpp"

namespace wirepool::core::channel {

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------
//
// Per-channel application state carried across ownership changes:
//
//   • history        recent application messages (both directions), bounded
//                    by `capacity` while the channel is owned and trimmed to
//                    the category's retention on release
//   • subscriptions  topic list, preserved as-is across release and reuse
//
// Not thread-safe. Guarded by the owning pool's mutex.
//
class Session {
public:
    explicit Session(std::size_t capacity = 256) noexcept
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    void record(codec::Message msg) {
        history_.push_back(std::move(msg));
        while (history_.size() > capacity_) {
            history_.pop_front();
        }
    }

    // Keep only the newest `retain` entries
    void trim(std::size_t retain) noexcept {
        while (history_.size() > retain) {
            history_.pop_front();
        }
    }

    // Returns false when the topic was already present
    bool subscribe(std::string_view topic) {
        if (is_subscribed(topic)) {
            return false;
        }
        subscriptions_.emplace_back(topic);
        return true;
    }

    // Returns false when the topic was not present
    bool unsubscribe(std::string_view topic) {
        auto it = std::find(subscriptions_.begin(), subscriptions_.end(), topic);
        if (it == subscriptions_.end()) {
            return false;
        }
        subscriptions_.erase(it);
        return true;
    }

    [[nodiscard]] bool is_subscribed(std::string_view topic) const noexcept {
        return std::find(subscriptions_.begin(), subscriptions_.end(), topic) != subscriptions_.end();
    }

    [[nodiscard]] const std::deque<codec::Message>& history() const noexcept { return history_; }
    [[nodiscard]] const std::vector<std::string>& subscriptions() const noexcept { return subscriptions_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<codec::Message> history_;
    std::vector<std::string> subscriptions_;
};

} // namespace wirepool::core::channel
