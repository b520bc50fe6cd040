#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <algorithm>

#include "wirepool/core/category.hpp"
#include "wirepool/core/error.hpp"
#include "wirepool/core/channel/id.hpp"
#include "lcr/log/logger.hpp"

namespace wirepool::core::pool {

/*
===============================================================================
 Wait Queue
===============================================================================

Callers blocked on channel scarcity, grouped by (category, tenant, role).

Ordering:
  - Strict FIFO within one key.
  - Across keys of the same category the oldest entry (lowest sequence
    number) goes first when a capacity slot, rather than a specific
    channel, becomes available.

Ownership:
  - Waiter objects live on the blocked caller's stack. The queue stores
    non-owning pointers; the caller removes its own entry before returning
    if nobody settled it.

Settlement:
  - Every entry is settled exactly once (done = true), with one of:
        Grant::Channel  → a released channel handed over directly
        Grant::Slot     → a reserved connecting channel the caller must open
        Grant::Rejected → result carries the reason (e.g. Cancelled)
    or removed by its own caller on deadline (Timeout).
  - settle_() notifies while the pool mutex is still held, so the waiter
    cannot return and destroy its condition variable in between.

Thread-safety:
  - NOT thread-safe on its own. Guarded by the pool mutex.
===============================================================================
*/

struct Key {
    Category category{Category::General};
    std::string tenant_id;
    std::string requester_role;

    bool operator==(const Key&) const = default;
};

struct KeyHash {
    std::size_t operator()(const Key& k) const noexcept {
        std::size_t h = std::hash<std::string_view>{}(k.tenant_id);
        h ^= std::hash<std::string_view>{}(k.requester_role) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<std::size_t>(k.category) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

enum class Grant : uint8_t {
    None,
    Channel,
    Slot,
    Rejected
};

struct Waiter {
    using clock = std::chrono::steady_clock;

    Key key;
    Priority priority{Priority::Low};   // applied if the waiter is granted a slot
    clock::time_point enqueued_at{};
    clock::time_point deadline{};
    std::uint64_t seq{0};

    std::condition_variable cv;

    // --- Outcome (written once, under the pool mutex) ---
    bool done{false};
    Grant grant{Grant::None};
    channel::Id channel_id{channel::INVALID_ID};
    Error result{Error::None};
};


class WaitQueue {
public:
    void enqueue(Waiter& w) {
        w.seq = ++seq_;
        queues_[w.key].push_back(&w);
        ++size_;
        WP_TRACE("[WAITQ] enqueued " << to_string(w.key.category) << "/" << w.key.tenant_id
                 << "/" << w.key.requester_role << " (depth=" << size_ << ")");
    }

    // Oldest entry with exactly this key, or nullptr
    [[nodiscard]]
    Waiter* pop_oldest(const Key& key) {
        auto it = queues_.find(key);
        if (it == queues_.end()) {
            return nullptr;
        }
        return take_front_(it);
    }

    // Oldest entry of any key in this category, or nullptr
    [[nodiscard]]
    Waiter* pop_oldest(Category category) {
        auto best = queues_.end();
        for (auto it = queues_.begin(); it != queues_.end(); ++it) {
            if (it->first.category != category) {
                continue;
            }
            if (best == queues_.end() || it->second.front()->seq < best->second.front()->seq) {
                best = it;
            }
        }
        if (best == queues_.end()) {
            return nullptr;
        }
        return take_front_(best);
    }

    // Removes an entry that is still queued. Returns false if it was already
    // taken out (settled by someone else).
    bool remove(Waiter& w) {
        auto it = queues_.find(w.key);
        if (it == queues_.end()) {
            return false;
        }
        auto& q = it->second;
        auto pos = std::find(q.begin(), q.end(), &w);
        if (pos == q.end()) {
            return false;
        }
        q.erase(pos);
        --size_;
        if (q.empty()) {
            queues_.erase(it);
        }
        return true;
    }

    // Settles every queued entry with Grant::Rejected / `reason`
    void reject_all(Error reason) {
        for (auto& [key, q] : queues_) {
            for (Waiter* w : q) {
                settle(*w, Grant::Rejected, channel::INVALID_ID, reason);
            }
        }
        queues_.clear();
        size_ = 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] std::size_t size(Category category) const noexcept {
        std::size_t n = 0;
        for (const auto& [key, q] : queues_) {
            if (key.category == category) {
                n += q.size();
            }
        }
        return n;
    }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // Records the outcome and wakes the waiter. Call with the pool mutex held.
    static void settle(Waiter& w, Grant grant, channel::Id id, Error result) noexcept {
        w.done       = true;
        w.grant      = grant;
        w.channel_id = id;
        w.result     = result;
        w.cv.notify_one();
    }

private:
    using map_type = std::unordered_map<Key, std::deque<Waiter*>, KeyHash>;

    Waiter* take_front_(map_type::iterator it) {
        auto& q = it->second;
        Waiter* w = q.front();
        q.pop_front();
        --size_;
        if (q.empty()) {
            queues_.erase(it);
        }
        return w;
    }

private:
    map_type queues_;
    std::size_t size_{0};
    std::uint64_t seq_{0};
};

} // namespace wirepool::core::pool
