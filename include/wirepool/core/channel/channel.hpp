#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "wirepool/core/category.hpp"
#include "wirepool/core/channel/id.hpp"
#include "wirepool/core/channel/info.hpp"
#include "wirepool/core/channel/metrics.hpp"
#include "wirepool/core/channel/session.hpp"
#include "wirepool/core/channel/state.hpp"
#include "wirepool/core/transport/concepts.hpp"

namespace wirepool::core::channel {

/*
===============================================================================
 Channel<Raw>
===============================================================================

One pooled transport session plus its bookkeeping.

Ownership:
  - Created, mutated and destroyed only by pool::Manager, under its mutex.
  - Owns its raw transport through std::unique_ptr. The pointer is null
    while a (re-)establishment is in flight or after the transport failed.

Recovery fields:
  - next_retry / retry_pending   scheduled re-establishment
  - retry_delay                  backoff applied to the last scheduled attempt
  - in_flight                    an open() is running without the lock

A close() that races an in-flight open() removes the channel from the
index; the opener finds its id gone and discards the new transport.

Liveness fields:
  - probe_sent_at / probe_outstanding   last health probe and its pong
  - last_heartbeat                      last heartbeat frame sent
===============================================================================
*/

template<transport::RawChannelConcept Raw>
struct Channel {
    using clock = std::chrono::steady_clock;

    Channel(Id id_, Category category_, std::string tenant, std::string role,
            Priority priority_, std::size_t session_capacity, clock::time_point now)
        : id(id_)
        , category(category_)
        , tenant_id(std::move(tenant))
        , requester_role(std::move(role))
        , priority(priority_)
        , created_at(now)
        , last_activity(now)
        , session(session_capacity)
    {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // --- Identity / context ---
    const Id id;
    const Category category;
    const std::string tenant_id;
    const std::string requester_role;
    const Priority priority;

    // --- Lifecycle ---
    Status status{Status::Connecting};
    bool owned{false};
    clock::time_point created_at;
    clock::time_point last_activity;
    std::uint64_t message_count{0};
    std::uint32_t reconnect_attempts{0};
    std::uint64_t epoch{0};

    Session session;
    Metrics metrics{};

    std::unique_ptr<Raw> transport;

    // --- Recovery ---
    clock::time_point next_retry{};
    std::chrono::milliseconds retry_delay{0};
    bool retry_pending{false};
    bool in_flight{false};

    // --- Liveness ---
    clock::time_point probe_sent_at{};
    bool probe_outstanding{false};
    clock::time_point last_heartbeat{};

    [[nodiscard]] bool transport_open() const noexcept {
        return transport && transport->is_open();
    }

    [[nodiscard]] Info info() const {
        Info out;
        out.id                 = id;
        out.category           = category;
        out.tenant_id          = tenant_id;
        out.requester_role     = requester_role;
        out.priority           = priority;
        out.status             = status;
        out.owned              = owned;
        out.created_at         = created_at;
        out.last_activity      = last_activity;
        out.message_count      = message_count;
        out.reconnect_attempts = reconnect_attempts;
        out.epoch              = epoch;
        out.retry_delay        = retry_delay;
        out.retry_pending      = retry_pending;
        out.metrics            = metrics;
        out.history_size       = session.history().size();
        out.subscriptions      = session.subscriptions();
        return out;
    }
};

} // namespace wirepool::core::channel
