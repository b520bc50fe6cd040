/*
===============================================================================
 pool::Manager — Group B: Release & Hand-off
===============================================================================

Scope:
------
release() semantics: idle parking, direct hand-off to waiters, liveness
checks at hand-off and session state carried across ownership changes.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

B1. Release parks the channel as idle; repeated or unknown release is a no-op
B2. A released channel goes straight to the oldest waiter with the same key
B3. Waiters with a different key are not served by a release
B4. A stale idle channel is never reused
B5. A stale channel is never handed to a waiter on release
B6. History is trimmed to the category retention; subscriptions survive

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>

#include "common/harness/pool.hpp"

using namespace std::chrono_literals;
using namespace wirepool::core::test;
using channel::Status;


void test_B1_release_to_idle() {
    std::cout << "[TEST] Group B1: release to idle\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);

    h.pool->release(id);
    auto info = h.info_of(id);
    TEST_CHECK(info.status == Status::Idle);
    TEST_CHECK(!info.owned);

    h.pool->release(id);
    TEST_CHECK(h.status_of(id) == Status::Idle);

    h.pool->release(12345);
    TEST_CHECK(h.pool->channels().size() == 1);
    TEST_CHECK(h.pool->telemetry().release_calls_total.load() == 3);

    const auto seq = h.statuses_of(id);
    TEST_CHECK(seq.back() == Status::Idle);

    std::cout << "[TEST] OK\n";
}


void test_B2_direct_handoff() {
    std::cout << "[TEST] Group B2: direct hand-off to waiter\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    const auto b = h.acquire_now(Category::Chat);

    channel::Id got = channel::INVALID_ID;
    Error result = Error::Timeout;
    std::thread waiter([&] {
        result = h.pool->acquire(Category::Chat, Context{}, got, 2000ms);
    });

    TEST_CHECK(h.wait_for_waiters(1));
    h.pool->release(b);
    waiter.join();

    TEST_CHECK(result == Error::None);
    TEST_CHECK(got == b);
    TEST_CHECK(h.status_of(b) == Status::Active);
    TEST_CHECK(h.info_of(b).owned);
    TEST_CHECK(h.status_of(a) == Status::Active);
    TEST_CHECK(h.factory.opened() == 2);
    TEST_CHECK(h.pool->telemetry().handoffs_total.load() == 1);

    // Never passed through idle
    for (auto s : h.statuses_of(b)) {
        TEST_CHECK(s != Status::Idle);
    }

    std::cout << "[TEST] OK\n";
}


void test_B3_key_mismatch() {
    std::cout << "[TEST] Group B3: release does not serve other keys\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    (void)h.acquire_now(Category::Chat);

    Context other;
    other.requester_role = "agent";

    channel::Id got = channel::INVALID_ID;
    Error result = Error::Timeout;
    std::thread waiter([&] {
        result = h.pool->acquire(Category::Chat, other, got, 2000ms);
    });

    TEST_CHECK(h.wait_for_waiters(1));
    h.pool->release(a);
    TEST_CHECK(h.status_of(a) == Status::Idle);
    std::this_thread::sleep_for(20ms);
    TEST_CHECK(h.pool->metrics_snapshot().waiting_callers == 1);

    // Closing the idle channel frees its slot for the waiter
    h.pool->close(a);
    waiter.join();

    TEST_CHECK(result == Error::None);
    TEST_CHECK(got != a);
    TEST_CHECK(h.info_of(got).requester_role == "agent");

    std::cout << "[TEST] OK\n";
}


void test_B4_stale_idle_not_reused() {
    std::cout << "[TEST] Group B4: stale idle channel is not reused\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);
    h.pool->release(id);

    h.factory.state(0)->drop();

    const auto fresh = h.acquire_now(Category::Chat);
    TEST_CHECK(fresh != id);
    TEST_CHECK(h.status_of(id) == Status::Error);
    TEST_CHECK(h.info_of(id).retry_pending);
    TEST_CHECK(h.pool->telemetry().handoff_stale_total.load() == 1);

    const auto errs = h.notifications_of(notify::Kind::Error);
    TEST_CHECK(errs.size() == 1);
    TEST_CHECK(errs[0].channel_id == id);
    TEST_CHECK(errs[0].cause == channel::Cause::ProbeFailed);

    std::cout << "[TEST] OK\n";
}


void test_B5_stale_at_handoff() {
    std::cout << "[TEST] Group B5: stale channel is not handed off\n";

    harness::Pool h;
    const auto a = h.acquire_now(Category::Chat);
    (void)h.acquire_now(Category::Chat);

    channel::Id got = channel::INVALID_ID;
    Error result = Error::Timeout;
    std::thread waiter([&] {
        result = h.pool->acquire(Category::Chat, Context{}, got, 2000ms);
    });

    TEST_CHECK(h.wait_for_waiters(1));
    h.factory.state(0)->drop();
    h.pool->release(a);

    TEST_CHECK(h.status_of(a) == Status::Error);
    TEST_CHECK(h.pool->metrics_snapshot().waiting_callers == 1);

    // Once re-established, the unowned channel is offered to the waiter
    h.pool->force_retry_due(a);
    h.pool->poll();
    waiter.join();

    TEST_CHECK(result == Error::None);
    TEST_CHECK(got == a);
    const auto info = h.info_of(a);
    TEST_CHECK(info.status == Status::Active);
    TEST_CHECK(info.epoch == 2);
    TEST_CHECK(h.factory.opened() == 3);

    std::cout << "[TEST] OK\n";
}


void test_B6_session_across_release() {
    std::cout << "[TEST] Group B6: session retention across release\n";

    auto cfg = harness::small_config();
    cfg.policy(Category::Chat).session_retain = 2;
    harness::Pool h(cfg);

    const auto id = h.acquire_now(Category::Chat);
    TEST_CHECK(h.pool->subscribe(id, "room-1") == Error::None);
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(h.pool->send(id, codec::Message{"chat", std::to_string(i), 0}) == Error::None);
    }
    TEST_CHECK(h.info_of(id).history_size == 5);

    h.pool->release(id);
    auto info = h.info_of(id);
    TEST_CHECK(info.history_size == 2);
    TEST_CHECK(info.subscriptions.size() == 1);
    TEST_CHECK(info.subscriptions[0] == "room-1");

    const auto again = h.acquire_now(Category::Chat);
    TEST_CHECK(again == id);
    TEST_CHECK(h.info_of(again).subscriptions.size() == 1);
    TEST_CHECK(h.info_of(again).message_count == 5);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_B1_release_to_idle();
    test_B2_direct_handoff();
    test_B3_key_mismatch();
    test_B4_stale_idle_not_reused();
    test_B5_stale_at_handoff();
    test_B6_session_across_release();

    std::cout << "\n[GROUP B — RELEASE & HAND-OFF TESTS PASSED]\n";
    return 0;
}
