/*
===============================================================================
 pool::Manager — Group A: Acquisition
===============================================================================

Scope:
------
acquire() along its three paths (idle reuse, creation, waiting) and its
failure modes, driven with the mock transport and no worker thread.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

A1. A new channel goes connecting → connected → active and is owned
A2. Caller priority overrides the category default
A3. Idle channels are reused only for an identical key
A4. A saturated category makes callers wait and time out
A5. A failed establishment frees its slot and reports TransportError
A6. A stopped pool rejects acquisition
A7. A freed slot is granted to the oldest waiter of the category
A8. Among idle matches the least recently active channel is reused
A9. A timeout beyond the clock's range waits instead of expiring at once

-------------------------------------------------------------------------------
Non-Goals
-------------------------------------------------------------------------------
- Direct hand-off on release (Group B)
- Reconnection (Group D)

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>

#include "common/harness/pool.hpp"

using namespace std::chrono_literals;
using namespace wirepool::core::test;
using channel::Status;


void test_A1_new_channel() {
    std::cout << "[TEST] Group A1: new channel lifecycle\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);

    const auto info = h.info_of(id);
    TEST_CHECK(info.status == Status::Active);
    TEST_CHECK(info.owned);
    TEST_CHECK(info.category == Category::Chat);
    TEST_CHECK(info.tenant_id == "main");
    TEST_CHECK(info.requester_role == "customer");
    TEST_CHECK(info.priority == Priority::Medium);
    TEST_CHECK(info.epoch == 1);
    TEST_CHECK(info.reconnect_attempts == 0);

    const auto seq = h.statuses_of(id);
    TEST_CHECK(seq.size() == 3);
    TEST_CHECK(seq[0] == Status::Connecting);
    TEST_CHECK(seq[1] == Status::Connected);
    TEST_CHECK(seq[2] == Status::Active);

    TEST_CHECK(h.factory.opened() == 1);
    TEST_CHECK(h.count(notify::Kind::Established) == 1);
    TEST_CHECK(h.pool->telemetry().acquire_created_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


void test_A2_priority_override() {
    std::cout << "[TEST] Group A2: priority override\n";

    harness::Pool h;

    Context ctx;
    ctx.priority = Priority::Critical;
    const auto id = h.acquire_now(Category::General, ctx);
    TEST_CHECK(h.info_of(id).priority == Priority::Critical);

    const auto plain = h.acquire_now(Category::General);
    TEST_CHECK(h.info_of(plain).priority == Priority::Low);

    std::cout << "[TEST] OK\n";
}


void test_A3_idle_reuse() {
    std::cout << "[TEST] Group A3: idle reuse by key\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Voice);
    h.pool->release(id);
    TEST_CHECK(h.status_of(id) == Status::Idle);

    const auto again = h.acquire_now(Category::Voice);
    TEST_CHECK(again == id);
    TEST_CHECK(h.status_of(id) == Status::Active);
    TEST_CHECK(h.factory.opened() == 1);
    TEST_CHECK(h.pool->telemetry().acquire_reused_total.load() == 1);

    h.pool->release(id);

    // Different tenant never shares
    Context other;
    other.tenant_id = "acme";
    const auto foreign = h.acquire_now(Category::Voice, other);
    TEST_CHECK(foreign != id);
    TEST_CHECK(h.status_of(id) == Status::Idle);

    // Different role never shares
    Context agent;
    agent.requester_role = "agent";
    const auto agent_id = h.acquire_now(Category::Voice, agent);
    TEST_CHECK(agent_id != id);
    TEST_CHECK(agent_id != foreign);
    TEST_CHECK(h.factory.opened() == 3);

    std::cout << "[TEST] OK\n";
}


void test_A4_saturation_timeout() {
    std::cout << "[TEST] Group A4: saturated category times out\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    const auto b = h.acquire_now(Category::Chat);
    TEST_CHECK(a != b);

    channel::Id id = channel::INVALID_ID;
    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK(h.pool->acquire(Category::Chat, Context{}, id, 40ms) == Error::Timeout);
    const auto waited = std::chrono::steady_clock::now() - t0;
    TEST_CHECK(waited >= 40ms);
    TEST_CHECK(id == channel::INVALID_ID);

    const auto m = h.pool->metrics_snapshot();
    TEST_CHECK(m.waiting_callers == 0);
    TEST_CHECK(m.category(Category::Chat).total == 2);
    TEST_CHECK(h.pool->telemetry().acquire_timeouts_total.load() == 1);

    // Other categories are unaffected
    (void)h.acquire_now(Category::Voice);

    std::cout << "[TEST] OK\n";
}


void test_A5_establishment_failure() {
    std::cout << "[TEST] Group A5: establishment failure\n";

    harness::Pool h;
    h.factory.push_result(transport::Error::ConnectionFailed);

    channel::Id id = channel::INVALID_ID;
    TEST_CHECK(h.pool->acquire(Category::Alerts, Context{}, id, 10ms) == Error::TransportError);
    TEST_CHECK(id == channel::INVALID_ID);
    TEST_CHECK(h.pool->channels().empty());
    TEST_CHECK(h.count(notify::Kind::Error) == 1);

    const auto errs = h.notifications_of(notify::Kind::Error);
    TEST_CHECK(errs[0].cause == channel::Cause::HandshakeFailed);
    TEST_CHECK(errs[0].transport_error == transport::Error::ConnectionFailed);

    // Never retried: the slot is free again
    TEST_CHECK(h.factory.open_calls() == 1);
    const auto ok = h.acquire_now(Category::Alerts);
    TEST_CHECK(ok != channel::INVALID_ID);

    std::cout << "[TEST] OK\n";
}


void test_A6_not_running() {
    std::cout << "[TEST] Group A6: stopped pool\n";

    harness::Pool h;
    h.pool->stop();
    TEST_CHECK(!h.pool->is_running());

    channel::Id id = channel::INVALID_ID;
    TEST_CHECK(h.pool->acquire(Category::Chat, Context{}, id, 10ms) == Error::InvalidState);
    TEST_CHECK(h.factory.open_calls() == 0);

    // Restartable, but not twice
    TEST_CHECK(h.pool->start() == Error::None);
    TEST_CHECK(h.pool->start() == Error::InvalidState);

    std::cout << "[TEST] OK\n";
}


void test_A7_slot_granted_to_waiter() {
    std::cout << "[TEST] Group A7: freed slot goes to the oldest waiter\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    (void)h.acquire_now(Category::Chat);

    // Different key than the holders: only a slot can serve it
    Context other;
    other.tenant_id = "acme";

    channel::Id got = channel::INVALID_ID;
    Error result = Error::None;
    std::thread waiter([&] {
        result = h.pool->acquire(Category::Chat, other, got, 2000ms);
    });

    TEST_CHECK(h.wait_for_waiters(1));
    h.pool->close(a);
    waiter.join();

    TEST_CHECK(result == Error::None);
    TEST_CHECK(got != channel::INVALID_ID);
    TEST_CHECK(got != a);
    TEST_CHECK(!h.exists(a));

    const auto info = h.info_of(got);
    TEST_CHECK(info.tenant_id == "acme");
    TEST_CHECK(info.status == Status::Active);
    TEST_CHECK(h.pool->metrics_snapshot().category(Category::Chat).total == 2);
    TEST_CHECK(h.pool->telemetry().acquire_queued_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


void test_A8_oldest_idle_wins() {
    std::cout << "[TEST] Group A8: least recently active idle channel is reused\n";

    harness::Pool h;
    const auto first = h.acquire_now(Category::Voice);
    const auto second = h.acquire_now(Category::Voice);
    h.pool->release(first);
    h.pool->release(second);
    TEST_CHECK(h.status_of(first) == Status::Idle);
    TEST_CHECK(h.status_of(second) == Status::Idle);

    // The later channel looks older
    const auto now = std::chrono::steady_clock::now();
    h.pool->force_last_activity(first, now - 1min);
    h.pool->force_last_activity(second, now - 5min);

    const auto picked = h.acquire_now(Category::Voice);
    TEST_CHECK(picked == second);
    TEST_CHECK(h.status_of(first) == Status::Idle);

    const auto next = h.acquire_now(Category::Voice);
    TEST_CHECK(next == first);
    TEST_CHECK(h.factory.opened() == 2);
    TEST_CHECK(h.pool->telemetry().acquire_reused_total.load() == 2);

    std::cout << "[TEST] OK\n";
}


void test_A9_unbounded_timeout() {
    std::cout << "[TEST] Group A9: very long timeout keeps waiting\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    (void)h.acquire_now(Category::Chat);

    channel::Id got = channel::INVALID_ID;
    Error result = Error::Timeout;
    std::thread waiter([&] {
        result = h.pool->acquire(Category::Chat, Context{}, got, std::chrono::hours(24 * 365 * 1000));
    });

    TEST_CHECK(h.wait_for_waiters(1));
    std::this_thread::sleep_for(50ms);
    TEST_CHECK(h.pool->metrics_snapshot().waiting_callers == 1);
    TEST_CHECK(h.pool->telemetry().acquire_timeouts_total.load() == 0);

    h.pool->release(a);
    waiter.join();

    TEST_CHECK(result == Error::None);
    TEST_CHECK(got == a);
    TEST_CHECK(h.status_of(a) == Status::Active);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_A1_new_channel();
    test_A2_priority_override();
    test_A3_idle_reuse();
    test_A4_saturation_timeout();
    test_A5_establishment_failure();
    test_A6_not_running();
    test_A7_slot_granted_to_waiter();
    test_A8_oldest_idle_wins();
    test_A9_unbounded_timeout();

    std::cout << "\n[GROUP A — ACQUISITION TESTS PASSED]\n";
    return 0;
}
