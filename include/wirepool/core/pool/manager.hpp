#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wirepool/core/category.hpp"
#include "wirepool/core/error.hpp"
#include "wirepool/core/telemetry.hpp"
#include "wirepool/core/config/pool.hpp"
#include "wirepool/core/transport/concepts.hpp"
#include "wirepool/core/codec/concepts.hpp"
#include "wirepool/core/codec/json.hpp"
#include "wirepool/core/codec/message.hpp"
#include "wirepool/core/channel/channel.hpp"
#include "wirepool/core/channel/info.hpp"
#include "wirepool/core/channel/state.hpp"
#include "wirepool/core/channel/transition.hpp"
#include "wirepool/core/notify/notification.hpp"
#include "wirepool/core/policy/reconnect.hpp"
#include "wirepool/core/pool/metrics.hpp"
#include "wirepool/core/pool/telemetry.hpp"
#include "wirepool/core/pool/wait_queue.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace wirepool::core::pool {

/*
===============================================================================
 wirepool::core::pool::Manager
===============================================================================

Bounded pool of long-lived bidirectional channels, partitioned by traffic
category.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Hand out channels: idle reuse, creation under the category limit, or a
  deadline-bounded wait
- Take channels back: direct hand-off to the oldest matching waiter, or idle
- Enforce per-category limits at all times (connecting and error channels
  hold their slot)
- Decode inbound frames and forward application messages to the sink
- Recover from transport failures with bounded, prioritized retry
- Probe liveness, send heartbeats, reap stale idle channels
- Aggregate metrics on demand

-------------------------------------------------------------------------------
 Concurrency Model
-------------------------------------------------------------------------------
- One mutex guards the channel index, every channel and the wait queue.
  No pool state is touched without it.
- acquire() is the only blocking call. Each waiter sleeps on its own
  condition variable until settled or until its deadline.
- Transport establishment (Factory::open) always runs with the mutex
  released. The slot is held meanwhile by the Connecting channel in the
  index; the opener re-looks up its id afterwards and discards the result
  if the channel was closed in between.
- Notifications are collected under the mutex and delivered to the sink
  after it is released.

-------------------------------------------------------------------------------
 Progress Model
-------------------------------------------------------------------------------
Nothing happens in the background unless poll() is called, either by the
owner or by a pool::Worker. poll():
    1. drains transport frames and control events
    2. sends due heartbeats
    3. runs due re-establishments
    4. runs health_check() / reap_idle() when their interval elapsed

-------------------------------------------------------------------------------
 Hand-off liveness
-------------------------------------------------------------------------------
A channel is never handed to a caller (idle reuse or direct hand-off on
release) without checking that its transport is still open. A stale
candidate goes through the normal failure path instead.

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- No inheritance and no virtual functions
- Transport and codec injected through concepts; fully testable with mocks
- No exceptions; every fallible call returns core::Error

===============================================================================
*/

template <
    transport::FactoryConcept Factory,
    codec::CodecConcept Codec = codec::Json
>
class Manager {
public:
    using raw_type     = typename Factory::channel_type;
    using channel_type = channel::Channel<raw_type>;
    using clock        = std::chrono::steady_clock;

    // Caller context for acquire(). Channels are reused only across
    // identical (category, tenant_id, requester_role) keys.
    struct Context {
        std::string tenant_id{"main"};
        std::string requester_role{"customer"};
        std::optional<Priority> priority{};   // overrides the category default
    };

public:
    explicit Manager(Factory& factory, config::Pool cfg = {})
        : factory_(factory)
        , cfg_(std::move(cfg))
    {}

    // Rejects waiters and closes every channel
    ~Manager() {
        stop();
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error start() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return Error::InvalidState;
        }
        if (auto err = config::validate(cfg_); err != Error::None) {
            return err;
        }
        const auto now = clock::now();
        last_health_run_  = now;
        last_cleanup_run_ = now;
        running_ = true;
        WP_INFO("[POOL] started (wait_timeout=" << lcr::format_duration(cfg_.wait_timeout)
                << ", health=" << lcr::format_duration(cfg_.health_check_interval)
                << ", cleanup=" << lcr::format_duration(cfg_.cleanup_interval) << ")");
        return Error::None;
    }

    // Idempotent. Waiters are rejected with Error::Cancelled.
    inline void stop() noexcept {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
            const auto pending = waiters_.size();
            waiters_.reject_all(Error::Cancelled);
            WP_TL1(telemetry_.waiters.store(0));
            for (auto id : ids_()) {
                if (auto* ch = find_(id)) {
                    terminate_(*ch, channel::Cause::Shutdown, outbox);
                }
            }
            WP_INFO("[POOL] stopped (" << pending << " waiter(s) cancelled)");
        }
        deliver_(outbox);
    }

    [[nodiscard]]
    inline bool is_running() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    // -------------------------------------------------------------------------
    // Acquire / release / close
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error acquire(Category category, const Context& ctx, channel::Id& out) {
        return acquire(category, ctx, out, cfg_.wait_timeout);
    }

    // Blocks for at most `timeout` when the category is saturated.
    [[nodiscard]]
    Error acquire(Category category, const Context& ctx, channel::Id& out, std::chrono::milliseconds timeout) {
        out = channel::INVALID_ID;
        WP_TL1(telemetry_.acquire_calls_total.inc());

        Outbox outbox;
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_) {
            WP_WARN("[POOL] acquire rejected: pool not running");
            return Error::InvalidState;
        }

        const auto& limits = cfg_.policy(category);
        Key key{category, ctx.tenant_id, ctx.requester_role};
        const Priority priority = ctx.priority.value_or(limits.priority);

        // (a) idle channel with the same key
        if (auto* ch = take_idle_(key, outbox)) {
            activate_(*ch);
            out = ch->id;
            WP_TL1(telemetry_.acquire_reused_total.inc());
            WP_DEBUG("[POOL] acquire " << to_string(category) << "/" << key.tenant_id
                     << " reused channel #" << out);
            lock.unlock();
            deliver_(outbox);
            return Error::None;
        }

        // (b) room for a new channel
        if (live_count_(category) < limits.max_channels) {
            auto& ch = create_(key, priority);
            const auto id = ch.id;
            WP_TL1(telemetry_.acquire_created_total.inc());
            lock.unlock();
            deliver_(outbox);
            return establish_(id, category, out);
        }

        // (c) wait for a hand-off or a freed slot
        Waiter waiter;
        waiter.key         = key;
        waiter.priority    = priority;
        waiter.enqueued_at = clock::now();
        waiter.deadline    = deadline_after_(waiter.enqueued_at, timeout);
        waiters_.enqueue(waiter);
        WP_TL1(telemetry_.acquire_queued_total.inc());
        WP_TL1(telemetry_.waiters.inc());
        WP_DEBUG("[POOL] acquire " << to_string(category) << "/" << key.tenant_id
                 << " queued (limit " << limits.max_channels << " reached, waiting up to "
                 << lcr::format_duration(timeout) << ")");

        lock.unlock();
        deliver_(outbox);
        lock.lock();

        const bool settled = waiter.cv.wait_until(lock, waiter.deadline, [&] { return waiter.done; });
        if (!settled) {
            waiters_.remove(waiter);
            WP_TL1(telemetry_.waiters.dec());
            WP_TL1(telemetry_.acquire_timeouts_total.inc());
            WP_WARN("[POOL] acquire " << to_string(category) << "/" << key.tenant_id
                    << " timed out after " << lcr::format_duration(timeout));
            return Error::Timeout;
        }

        switch (waiter.grant) {
        case Grant::Channel:
            out = waiter.channel_id;
            return Error::None;
        case Grant::Slot: {
            const auto id = waiter.channel_id;
            lock.unlock();
            return establish_(id, category, out);
        }
        case Grant::Rejected:
        case Grant::None:
            break;
        }
        return waiter.result == Error::None ? Error::Cancelled : waiter.result;
    }

    // Returns the channel to the pool. The oldest waiter with the same key
    // receives it directly; otherwise it becomes idle. Unknown ids are
    // ignored.
    void release(channel::Id id) {
        WP_TL1(telemetry_.release_calls_total.inc());
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto* ch = find_(id);
            if (!ch) {
                WP_WARN("[POOL] release of unknown channel #" << id << " ignored");
                return;
            }
            if (!ch->owned) {
                WP_DEBUG("[POOL] channel #" << id << " already released");
                return;
            }
            ch->owned = false;
            ch->session.trim(cfg_.policy(ch->category).session_retain);
            if (channel::is_sendable(ch->status)) {
                offer_(*ch, channel::Cause::Release, outbox);
            }
            // Connecting / Error: offered once re-established
        }
        deliver_(outbox);
    }

    // Idempotent. Safe while a re-establishment is in flight.
    void close(channel::Id id) {
        WP_TL1(telemetry_.close_calls_total.inc());
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto* ch = find_(id);
            if (!ch) {
                WP_DEBUG("[POOL] close of unknown channel #" << id << " ignored");
                return;
            }
            terminate_(*ch, channel::Cause::LocalClose, outbox);
        }
        deliver_(outbox);
    }

    // Closes every channel. The pool keeps running.
    void close_all() {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto ids = ids_();
            for (auto id : ids) {
                if (auto* ch = find_(id)) {
                    WP_TL1(telemetry_.close_calls_total.inc());
                    terminate_(*ch, channel::Cause::LocalClose, outbox);
                }
            }
            WP_INFO("[POOL] closed all channels (" << ids.size() << ")");
        }
        deliver_(outbox);
    }

    // -------------------------------------------------------------------------
    // Data path
    // -------------------------------------------------------------------------

    // Never blocks on pool capacity.
    [[nodiscard]]
    Error send(channel::Id id, const codec::Message& msg) {
        WP_TL1(telemetry_.send_calls_total.inc());
        Outbox outbox;
        Error result = Error::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto* ch = find_(id);
            if (!ch) {
                return Error::UnknownChannel;
            }
            if (!channel::is_sendable(ch->status)) {
                WP_TL1(telemetry_.send_rejected_total.inc());
                WP_DEBUG("[POOL] send on channel #" << id << " rejected (status="
                         << channel::to_string(ch->status) << ")");
                return Error::NotReady;
            }
            encode_buffer_.clear();
            codec_.encode(msg, encode_buffer_);
            if (!write_(*ch, encode_buffer_)) {
                WP_TL1(telemetry_.send_failed_total.inc());
                WP_WARN("[POOL] send on channel #" << id << " failed at transport");
                fail_(*ch, policy::Failure::Error, channel::Cause::TransportError,
                      transport::Error::TransportFailure, outbox);
                result = Error::TransportError;
            }
            else {
                ++ch->message_count;
                ++ch->metrics.messages_handled;
                ch->last_activity = clock::now();
                if (!codec::is_control(msg)) {
                    ch->session.record(msg);
                }
            }
        }
        deliver_(outbox);
        return result;
    }

    [[nodiscard]]
    Error subscribe(channel::Id id, std::string_view topic) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* ch = find_(id);
        if (!ch) {
            return Error::UnknownChannel;
        }
        if (ch->session.subscribe(topic)) {
            WP_DEBUG("[POOL] channel #" << id << " subscribed to '" << topic << "'");
        }
        return Error::None;
    }

    [[nodiscard]]
    Error unsubscribe(channel::Id id, std::string_view topic) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* ch = find_(id);
        if (!ch) {
            return Error::UnknownChannel;
        }
        if (ch->session.unsubscribe(topic)) {
            WP_DEBUG("[POOL] channel #" << id << " unsubscribed from '" << topic << "'");
        }
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Maintenance
    // -------------------------------------------------------------------------

    void poll() {
        {
            Outbox outbox;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_) {
                    return;
                }
                drain_transports_(outbox);
                send_heartbeats_(outbox);
            }
            deliver_(outbox);
        }

        run_due_reconnects_();

        bool health_due = false;
        bool cleanup_due = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            health_due  = running_ && (now - last_health_run_ >= cfg_.health_check_interval);
            cleanup_due = running_ && (now - last_cleanup_run_ >= cfg_.cleanup_interval);
        }
        if (health_due) {
            health_check();
        }
        if (cleanup_due) {
            reap_idle();
        }
    }

    // Probes every established channel. A channel whose transport is no
    // longer open, or that cannot take the probe, enters error.
    void health_check() {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            last_health_run_ = now;
            std::size_t probed = 0;
            std::size_t failed = 0;
            for (auto id : ids_()) {
                auto* ch = find_(id);
                if (!ch || !channel::is_established(ch->status)) {
                    continue;
                }
                probe_buffer_.clear();
                codec_.encode(codec::Message{std::string(codec::TYPE_PING), {}, wall_clock_ms_()}, probe_buffer_);
                if (!ch->transport_open() || !write_(*ch, probe_buffer_)) {
                    ++failed;
                    WP_TL1(telemetry_.probe_failures_total.inc());
                    WP_WARN("[POOL] channel #" << id << " (" << to_string(ch->category) << ") failed health probe");
                    fail_(*ch, policy::Failure::Error, channel::Cause::ProbeFailed,
                          transport::Error::Timeout, outbox);
                    continue;
                }
                ++probed;
                ch->probe_sent_at = now;
                ch->probe_outstanding = true;
                WP_TL1(telemetry_.probes_sent_total.inc());
            }
            WP_DEBUG("[POOL] health check: " << probed << " probed, " << failed << " failed");
        }
        deliver_(outbox);
    }

    // Closes idle channels whose last activity is older than the
    // category's idle timeout.
    void reap_idle() {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = clock::now();
            last_cleanup_run_ = now;
            last_cleanup_ = now;
            std::size_t reaped = 0;
            for (auto id : ids_()) {
                auto* ch = find_(id);
                if (!ch || ch->status != channel::Status::Idle) {
                    continue;
                }
                const auto idle_for = now - ch->last_activity;
                if (idle_for > cfg_.policy(ch->category).idle_timeout) {
                    ++reaped;
                    WP_TL1(telemetry_.reaped_total.inc());
                    WP_INFO("[POOL] reaping channel #" << id << " (" << to_string(ch->category)
                            << ") idle for "
                            << lcr::format_duration(std::chrono::duration_cast<std::chrono::milliseconds>(idle_for)));
                    terminate_(*ch, channel::Cause::IdleTimeout, outbox);
                }
            }
            if (reaped > 0) {
                WP_INFO("[POOL] idle reaper closed " << reaped << " channel(s)");
            }
        }
        deliver_(outbox);
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]]
    PoolMetrics metrics_snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        PoolMetrics m;
        double latency_sum = 0.0;
        for (const auto& [id, ch] : channels_) {
            auto& cat = m.by_category[index_of(ch->category)];
            ++cat.total;
            ++m.total_connections;
            switch (ch->status) {
            case channel::Status::Connecting:
                ++cat.connecting;
                ++m.connecting_connections;
                break;
            case channel::Status::Connected:
                ++cat.connected;
                ++m.active_connections;
                break;
            case channel::Status::Active:
                ++cat.active;
                ++m.active_connections;
                break;
            case channel::Status::Idle:
                ++cat.idle;
                ++m.idle_connections;
                break;
            case channel::Status::Error:
                ++cat.error;
                ++m.error_connections;
                break;
            case channel::Status::Disconnected:
                break;
            }
            m.messages_handled += ch->metrics.messages_handled;
            latency_sum += ch->metrics.average_latency_ms;
            if (ch->message_count > 1) {
                ++m.reused_connections;
            }
        }
        for (auto c : ALL_CATEGORIES) {
            m.by_category[index_of(c)].waiting = waiters_.size(c);
        }
        m.waiting_callers = waiters_.size();
        m.average_latency_ms = m.total_connections
            ? latency_sum / static_cast<double>(m.total_connections)
            : 0.0;
        m.cost_savings = static_cast<double>(m.reused_connections) * cfg_.establishment_cost;
        m.utilization = m.total_connections
            ? static_cast<double>(m.active_connections) / static_cast<double>(m.total_connections)
            : 0.0;
        m.last_cleanup = last_cleanup_;
        return m;
    }

    [[nodiscard]]
    bool find(channel::Id id, channel::Info& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(id);
        if (it == channels_.end()) {
            return false;
        }
        out = it->second->info();
        return true;
    }

    [[nodiscard]]
    std::vector<channel::Info> channels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<channel::Info> out;
        out.reserve(channels_.size());
        for (const auto& [id, ch] : channels_) {
            out.push_back(ch->info());
        }
        sort_by_id_(out);
        return out;
    }

    [[nodiscard]]
    std::vector<channel::Info> channels(Category category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<channel::Info> out;
        for (const auto& [id, ch] : channels_) {
            if (ch->category == category) {
                out.push_back(ch->info());
            }
        }
        sort_by_id_(out);
        return out;
    }

    // Drains one recorded status transition (oldest first)
    [[nodiscard]]
    bool poll_transition(channel::Transition& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return transitions_.pop(out);
    }

    void on_notify(notify::Sink sink) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
    }

    [[nodiscard]]
    const telemetry::Pool& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    const config::Pool& config() const noexcept {
        return cfg_;
    }

#ifdef WP_UNIT_TEST
public:
    // Moves a channel's last activity into the past
    void force_last_activity(channel::Id id, clock::time_point t) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* ch = find_(id)) {
            ch->last_activity = t;
        }
    }

    // Makes a scheduled re-establishment due immediately
    void force_retry_due(channel::Id id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* ch = find_(id)) {
            ch->next_retry = clock::now();
        }
    }

    [[nodiscard]]
    bool next_retry_at(channel::Id id, clock::time_point& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(id);
        if (it == channels_.end() || !it->second->retry_pending) {
            return false;
        }
        out = it->second->next_retry;
        return true;
    }

    // Makes both maintenance passes due on the next poll()
    void force_maintenance_due() {
        std::lock_guard<std::mutex> lock(mutex_);
        last_health_run_  = clock::time_point{};
        last_cleanup_run_ = clock::time_point{};
    }
#endif // WP_UNIT_TEST

private:
    using Outbox = std::vector<notify::Notification>;

    // -------------------------------------------------------------------------
    // Index helpers (mutex held)
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline channel_type* find_(channel::Id id) noexcept {
        auto it = channels_.find(id);
        return it == channels_.end() ? nullptr : it->second.get();
    }

    // Stable copy of the current ids; the index may shrink while iterating
    [[nodiscard]]
    std::vector<channel::Id> ids_() const {
        std::vector<channel::Id> ids;
        ids.reserve(channels_.size());
        for (const auto& [id, ch] : channels_) {
            ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    static void sort_by_id_(std::vector<channel::Info>& v) {
        std::sort(v.begin(), v.end(), [](const channel::Info& a, const channel::Info& b) { return a.id < b.id; });
    }

    // Every channel in the index holds a slot, whatever its status
    [[nodiscard]]
    std::size_t live_count_(Category category) const noexcept {
        std::size_t n = 0;
        for (const auto& [id, ch] : channels_) {
            if (ch->category == category) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]]
    static Key key_of_(const channel_type& ch) {
        return Key{ch.category, ch.tenant_id, ch.requester_role};
    }

    // Inserts a Connecting channel owned by the caller that will open it
    channel_type& create_(const Key& key, Priority priority) {
        const auto id = ++next_id_;
        auto ch = std::make_unique<channel_type>(
            id, key.category, key.tenant_id, key.requester_role, priority, cfg_.session_capacity, clock::now());
        ch->owned = true;
        ch->in_flight = true;
        auto& ref = *ch;
        channels_.emplace(id, std::move(ch));
        WP_DEBUG("[POOL] created channel #" << id << " (" << to_string(key.category) << "/" << key.tenant_id
                 << "/" << key.requester_role << ", priority=" << to_string(priority) << ")");
        return ref;
    }

    // Removes a channel that already reached Disconnected and hands the
    // freed slot to the oldest waiter of its category
    void erase_(channel::Id id, Category category) {
        channels_.erase(id);
        grant_slots_(category);
    }

    void grant_slots_(Category category) {
        if (!running_) {
            return;
        }
        const auto max_channels = cfg_.policy(category).max_channels;
        while (live_count_(category) < max_channels) {
            Waiter* w = waiters_.pop_oldest(category);
            if (!w) {
                return;
            }
            auto& ch = create_(w->key, w->priority);
            WP_TL1(telemetry_.waiters.dec());
            WaitQueue::settle(*w, Grant::Slot, ch.id, Error::None);
        }
    }

    // -------------------------------------------------------------------------
    // State transitions (mutex held)
    // -------------------------------------------------------------------------

    bool set_status_(channel_type& ch, channel::Event ev, channel::Cause cause) {
        channel::Status to;
        const auto from = ch.status;
        if (!channel::next(from, ev, to)) {
            WP_WARN("[POOL] channel #" << ch.id << " ignored " << channel::to_string(ev)
                    << " in status " << channel::to_string(from));
            return false;
        }
        ch.status = to;
        transitions_.push_overwrite(channel::Transition{ch.id, ch.category, from, to, cause});
        WP_DEBUG("[POOL] channel #" << ch.id << " (" << to_string(ch.category) << "): "
                 << channel::to_string(from) << " -> " << channel::to_string(to)
                 << " (" << channel::to_string(cause) << ")");
        return true;
    }

    void activate_(channel_type& ch) {
        if (ch.status != channel::Status::Active) {
            (void)set_status_(ch, channel::Event::Acquired, channel::Cause::Acquire);
        }
        ch.owned = true;
        ch.last_activity = clock::now();
    }

    // now + timeout, saturating at the clock's maximum
    [[nodiscard]]
    static clock::time_point deadline_after_(clock::time_point now, std::chrono::milliseconds timeout) noexcept {
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
        if (timeout >= headroom) {
            return clock::time_point::max();
        }
        return now + timeout;
    }

    // Oldest idle channel with this key whose transport is still open.
    // Stale candidates are failed and skipped.
    channel_type* take_idle_(const Key& key, Outbox& outbox) {
        for (;;) {
            channel_type* best = nullptr;
            for (auto& [id, ch] : channels_) {
                if (ch->status != channel::Status::Idle || ch->owned) {
                    continue;
                }
                if (ch->category != key.category || ch->tenant_id != key.tenant_id ||
                    ch->requester_role != key.requester_role) {
                    continue;
                }
                if (!best || ch->last_activity < best->last_activity) {
                    best = ch.get();
                }
            }
            if (!best) {
                return nullptr;
            }
            if (best->transport_open()) {
                return best;
            }
            WP_TL1(telemetry_.handoff_stale_total.inc());
            WP_WARN("[POOL] idle channel #" << best->id << " is stale, not reused");
            fail_(*best, policy::Failure::Error, channel::Cause::ProbeFailed,
                  transport::Error::TransportFailure, outbox);
        }
    }

    // An unowned, established channel becomes available: hand it to the
    // oldest waiter with the same key, or park it as idle.
    void offer_(channel_type& ch, channel::Cause cause, Outbox& outbox) {
        if (!ch.transport_open()) {
            WP_TL1(telemetry_.handoff_stale_total.inc());
            WP_WARN("[POOL] channel #" << ch.id << " is stale at hand-off");
            fail_(ch, policy::Failure::Error, channel::Cause::ProbeFailed,
                  transport::Error::TransportFailure, outbox);
            return;
        }
        if (Waiter* w = waiters_.pop_oldest(key_of_(ch))) {
            activate_(ch);
            WP_TL1(telemetry_.waiters.dec());
            WP_TL1(telemetry_.handoffs_total.inc());
            WP_DEBUG("[POOL] channel #" << ch.id << " handed to waiting caller");
            WaitQueue::settle(*w, Grant::Channel, ch.id, Error::None);
            return;
        }
        (void)set_status_(ch, channel::Event::Released, cause);
    }

    // Closes the transport, marks Disconnected and removes the channel
    void terminate_(channel_type& ch, channel::Cause cause, Outbox& outbox,
                    transport::Error terr = transport::Error::LocalShutdown) {
        if (ch.transport) {
            ch.transport->close();
            ch.transport.reset();
        }
        (void)set_status_(ch, channel::Event::CloseRequested, cause);
        if (ch.in_flight) {
            WP_INFO("[POOL] channel #" << ch.id << " closed during establishment, result will be discarded");
        }
        push_(outbox, ch, notify::Kind::Closed, cause, terr);
        const auto id = ch.id;
        const auto category = ch.category;
        erase_(id, category);
    }

    // Failure path: evict, schedule a retry, or give up
    void fail_(channel_type& ch, policy::Failure failure, channel::Cause cause,
               transport::Error terr, Outbox& outbox) {
        const auto max_attempts = cfg_.policy(ch.category).max_reconnect_attempts;
        const auto decision = policy::decide(ch.priority, failure, ch.reconnect_attempts, max_attempts);

        if (decision == policy::Decision::Evict) {
            WP_TL1(telemetry_.evicted_total.inc());
            WP_INFO("[POOL] evicting channel #" << ch.id << " (" << to_string(ch.category) << ", "
                    << to_string(ch.priority) << ") after " << policy::to_string(failure)
                    << " (" << channel::to_string(cause) << ")");
            terminate_(ch, channel::Cause::Evicted, outbox, terr);
            return;
        }

        if (ch.transport) {
            ch.transport->close();
            ch.transport.reset();
        }
        ++ch.metrics.errors;
        ch.probe_outstanding = false;
        const auto ev = (ch.status == channel::Status::Connecting)
            ? channel::Event::HandshakeFailed
            : channel::Event::TransportFailed;
        (void)set_status_(ch, ev, cause);
        push_(outbox, ch, notify::Kind::Error, cause, terr);

        if (decision == policy::Decision::Retry) {
            ++ch.reconnect_attempts;
            ch.retry_delay = policy::backoff_delay(cfg_.backoff, ch.reconnect_attempts);
            ch.next_retry = clock::now() + ch.retry_delay;
            ch.retry_pending = true;
            WP_INFO("[POOL] channel #" << ch.id << " (" << to_string(ch.category) << ") "
                    << channel::to_string(cause) << ", retry " << ch.reconnect_attempts << "/"
                    << max_attempts << " in " << lcr::format_duration(ch.retry_delay));
            return;
        }

        // GiveUp
        WP_TL1(telemetry_.permanent_failures_total.inc());
        WP_ERROR("[POOL] channel #" << ch.id << " (" << to_string(ch.category) << ") permanently failed after "
                 << ch.reconnect_attempts << " reconnect attempt(s)");
        ch.retry_pending = false;
        (void)set_status_(ch, channel::Event::GaveUp, channel::Cause::RetryExhausted);
        push_(outbox, ch, notify::Kind::PermanentFailure, channel::Cause::RetryExhausted, terr);
        const auto id = ch.id;
        const auto category = ch.category;
        erase_(id, category);
    }

    [[nodiscard]]
    bool write_(channel_type& ch, const std::string& bytes) {
        if (!ch.transport || !ch.transport->send(bytes)) {
            return false;
        }
        ch.metrics.bytes_sent += bytes.size();
        return true;
    }

    // -------------------------------------------------------------------------
    // Establishment (mutex NOT held on entry)
    // -------------------------------------------------------------------------

    // Opens the transport for a Connecting channel created for the caller
    // and hands it over as Active.
    Error establish_(channel::Id id, Category category, channel::Id& out) {
        std::unique_ptr<raw_type> raw;
        const auto terr = factory_.open(category, raw);

        Outbox outbox;
        Error result = Error::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto* ch = find_(id);
            if (!ch) {
                if (raw) {
                    raw->close();
                }
                WP_INFO("[POOL] channel #" << id << " was closed while connecting");
                return Error::Cancelled;
            }
            ch->in_flight = false;
            if (terr != transport::Error::None || !raw) {
                ++ch->metrics.errors;
                WP_WARN("[POOL] channel #" << id << " (" << to_string(category) << ") establishment failed: "
                        << transport::to_string(terr));
                (void)set_status_(*ch, channel::Event::HandshakeFailed, channel::Cause::HandshakeFailed);
                (void)set_status_(*ch, channel::Event::GaveUp, channel::Cause::HandshakeFailed);
                push_(outbox, *ch, notify::Kind::Error, channel::Cause::HandshakeFailed, terr);
                erase_(id, category);
                result = Error::TransportError;
            }
            else {
                attach_(*ch, std::move(raw), channel::Cause::None, outbox);
                activate_(*ch);
                out = id;
            }
        }
        deliver_(outbox);
        return result;
    }

    void attach_(channel_type& ch, std::unique_ptr<raw_type> raw, channel::Cause cause, Outbox& outbox) {
        const auto now = clock::now();
        ch.transport = std::move(raw);
        ch.probe_outstanding = false;
        ch.last_heartbeat = now;
        ++ch.epoch;
        (void)set_status_(ch, channel::Event::HandshakeSucceeded, cause);
        push_(outbox, ch, notify::Kind::Established, cause, transport::Error::None);
    }

    void run_due_reconnects_() {
        std::vector<std::pair<channel::Id, Category>> due;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            const auto now = clock::now();
            for (auto& [id, ch] : channels_) {
                if (!ch->retry_pending || ch->in_flight || ch->status != channel::Status::Error) {
                    continue;
                }
                if (ch->next_retry > now) {
                    continue;
                }
                ch->retry_pending = false;
                ch->in_flight = true;
                (void)set_status_(*ch, channel::Event::RetryStarted, channel::Cause::None);
                WP_TL1(telemetry_.reconnect_attempts_total.inc());
                due.emplace_back(id, ch->category);
            }
        }

        for (const auto& [id, category] : due) {
            std::unique_ptr<raw_type> raw;
            const auto terr = factory_.open(category, raw);

            Outbox outbox;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto* ch = find_(id);
                if (!ch) {
                    if (raw) {
                        raw->close();
                    }
                    WP_INFO("[POOL] channel #" << id << " was closed during reconnect, result discarded");
                    continue;
                }
                ch->in_flight = false;
                if (terr != transport::Error::None || !raw) {
                    WP_TL1(telemetry_.reconnect_failure_total.inc());
                    fail_(*ch, policy::Failure::Error, channel::Cause::HandshakeFailed, terr, outbox);
                }
                else {
                    WP_TL1(telemetry_.reconnect_success_total.inc());
                    WP_INFO("[POOL] channel #" << id << " (" << to_string(category) << ") reconnected (epoch "
                            << (ch->epoch + 1) << ")");
                    attach_(*ch, std::move(raw), channel::Cause::Reconnected, outbox);
                    if (!ch->owned) {
                        offer_(*ch, channel::Cause::Reconnected, outbox);
                    }
                }
            }
            deliver_(outbox);
        }
    }

    // -------------------------------------------------------------------------
    // Inbound / liveness (mutex held)
    // -------------------------------------------------------------------------

    void drain_transports_(Outbox& outbox) {
        for (auto id : ids_()) {
            auto* ch = find_(id);
            if (!ch || !ch->transport || !channel::is_established(ch->status)) {
                continue;
            }
            while (ch->transport && ch->transport->poll_frame(frame_buffer_)) {
                handle_frame_(*ch, frame_buffer_, outbox);
                ch = find_(id);
                if (!ch) {
                    break;
                }
            }
            if (!ch || !ch->transport) {
                continue;
            }
            transport::Event ev;
            if (ch->transport->poll_event(ev)) {
                handle_event_(*ch, ev, outbox);
            }
        }
    }

    void handle_event_(channel_type& ch, const transport::Event& ev, Outbox& outbox) {
        switch (ev.type) {
        case transport::EventType::Close: {
            const bool clean = (ev.error == transport::Error::RemoteClosed ||
                                ev.error == transport::Error::LocalShutdown);
            WP_INFO("[POOL] channel #" << ch.id << " (" << to_string(ch.category) << ") closed by transport ("
                    << transport::to_string(ev.error) << ")");
            fail_(ch,
                  clean ? policy::Failure::CleanClose : policy::Failure::UnexpectedClose,
                  channel::Cause::RemoteClosed, ev.error, outbox);
            break;
        }
        case transport::EventType::Error:
            WP_WARN("[POOL] channel #" << ch.id << " (" << to_string(ch.category) << ") transport error: "
                    << transport::to_string(ev.error));
            fail_(ch, policy::Failure::Error, channel::Cause::TransportError, ev.error, outbox);
            break;
        }
    }

    void handle_frame_(channel_type& ch, const std::string& frame, Outbox& outbox) {
        WP_TL1(telemetry_.frames_received_total.inc());
        codec::Message msg;
        if (codec_.decode(frame, msg) != Error::None) {
            WP_TL1(telemetry_.decode_errors_total.inc());
            ++ch.metrics.errors;
            WP_WARN("[POOL] channel #" << ch.id << " dropped undecodable frame (" << frame.size() << " bytes)");
            return;
        }
        ch.metrics.bytes_received += frame.size();

        if (msg.type == codec::TYPE_PONG) {
            if (ch.probe_outstanding) {
                const auto rtt = std::chrono::duration<double, std::milli>(clock::now() - ch.probe_sent_at);
                ch.metrics.record_latency(rtt.count());
                ch.probe_outstanding = false;
            }
            return;
        }
        if (msg.type == codec::TYPE_PING) {
            probe_buffer_.clear();
            codec_.encode(codec::Message{std::string(codec::TYPE_PONG), {}, msg.timestamp_ms}, probe_buffer_);
            if (!write_(ch, probe_buffer_)) {
                fail_(ch, policy::Failure::Error, channel::Cause::TransportError,
                      transport::Error::TransportFailure, outbox);
            }
            return;
        }
        if (msg.type == codec::TYPE_HEARTBEAT) {
            return;
        }

        ++ch.metrics.messages_handled;
        ch.last_activity = clock::now();
        ch.session.record(msg);
        push_(outbox, ch, notify::Kind::Message, channel::Cause::None, transport::Error::None, std::move(msg));
    }

    void send_heartbeats_(Outbox& outbox) {
        const auto now = clock::now();
        for (auto id : ids_()) {
            auto* ch = find_(id);
            if (!ch || !channel::is_established(ch->status)) {
                continue;
            }
            const auto interval = cfg_.policy(ch->category).heartbeat_interval;
            if (interval.count() <= 0 || now - ch->last_heartbeat < interval) {
                continue;
            }
            ch->last_heartbeat = now;
            probe_buffer_.clear();
            codec_.encode(codec::Message{std::string(codec::TYPE_HEARTBEAT), {}, wall_clock_ms_()}, probe_buffer_);
            if (!write_(*ch, probe_buffer_)) {
                fail_(*ch, policy::Failure::Error, channel::Cause::TransportError,
                      transport::Error::TransportFailure, outbox);
                continue;
            }
            WP_TL1(telemetry_.heartbeats_sent_total.inc());
        }
    }

    // -------------------------------------------------------------------------
    // Notifications
    // -------------------------------------------------------------------------

    static void push_(Outbox& outbox, const channel_type& ch, notify::Kind kind, channel::Cause cause,
                      transport::Error terr, codec::Message msg = {}) {
        notify::Notification n;
        n.kind            = kind;
        n.category        = ch.category;
        n.tenant_id       = ch.tenant_id;
        n.channel_id      = ch.id;
        n.cause           = cause;
        n.transport_error = terr;
        n.message         = std::move(msg);
        outbox.push_back(std::move(n));
    }

    // Mutex must NOT be held
    void deliver_(Outbox& outbox) {
        if (outbox.empty()) {
            return;
        }
        notify::Sink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        if (!sink) {
            return;
        }
        for (const auto& n : outbox) {
            sink(n);
        }
    }

    [[nodiscard]]
    static std::uint64_t wall_clock_ms_() noexcept {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

private:
    Factory& factory_;
    config::Pool cfg_;
    Codec codec_;

    mutable std::mutex mutex_;
    bool running_{false};

    std::unordered_map<channel::Id, std::unique_ptr<channel_type>> channels_;
    channel::Id next_id_{channel::INVALID_ID};
    WaitQueue waiters_;

    lcr::local::ring_buffer<channel::Transition, 256> transitions_;

    clock::time_point last_health_run_{};
    clock::time_point last_cleanup_run_{};
    clock::time_point last_cleanup_{};

    // Scratch buffers (mutex held)
    std::string encode_buffer_;
    std::string probe_buffer_;
    std::string frame_buffer_;

    std::mutex sink_mutex_;
    notify::Sink sink_;

    telemetry::Pool telemetry_;
};

} // namespace wirepool::core::pool
