/*
===============================================================================
 channel — Status Machine & Session Unit Tests
===============================================================================

Scope:
------
The channel transition table (channel::next) and per-channel Session state.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

1. Every listed transition is accepted with the documented target
2. Unlisted pairs are rejected and leave the output untouched
3. Disconnected is terminal
4. Session history is bounded by capacity and trimmed by retention
5. Subscriptions are unique and survive trimming

===============================================================================
*/

#include <iostream>

#include "wirepool/core/channel/state.hpp"
#include "wirepool/core/channel/session.hpp"
#include "common/test_check.hpp"

using namespace wirepool::core;
using channel::Status;
using channel::Event;


static bool goes(Status from, Event ev, Status expected) {
    Status to = from;
    return channel::next(from, ev, to) && to == expected;
}

static bool rejected(Status from, Event ev) {
    Status to = Status::Active;
    const bool ok = channel::next(from, ev, to);
    return !ok && to == Status::Active;
}


void test_accepted_transitions() {
    std::cout << "[TEST] Accepted transitions\n";

    TEST_CHECK(goes(Status::Connecting, Event::HandshakeSucceeded, Status::Connected));
    TEST_CHECK(goes(Status::Connecting, Event::HandshakeFailed,    Status::Error));
    TEST_CHECK(goes(Status::Connected,  Event::Acquired,           Status::Active));
    TEST_CHECK(goes(Status::Idle,       Event::Acquired,           Status::Active));
    TEST_CHECK(goes(Status::Connected,  Event::Released,           Status::Idle));
    TEST_CHECK(goes(Status::Active,     Event::Released,           Status::Idle));
    TEST_CHECK(goes(Status::Connected,  Event::TransportFailed,    Status::Error));
    TEST_CHECK(goes(Status::Active,     Event::TransportFailed,    Status::Error));
    TEST_CHECK(goes(Status::Idle,       Event::TransportFailed,    Status::Error));
    TEST_CHECK(goes(Status::Error,      Event::RetryStarted,       Status::Connecting));
    TEST_CHECK(goes(Status::Error,      Event::GaveUp,             Status::Disconnected));

    for (auto s : {Status::Connecting, Status::Connected, Status::Idle, Status::Active, Status::Error}) {
        TEST_CHECK(goes(s, Event::CloseRequested, Status::Disconnected));
    }

    std::cout << "[TEST] OK\n";
}


void test_rejected_transitions() {
    std::cout << "[TEST] Rejected transitions\n";

    TEST_CHECK(rejected(Status::Connected,  Event::HandshakeSucceeded));
    TEST_CHECK(rejected(Status::Active,     Event::Acquired));
    TEST_CHECK(rejected(Status::Idle,       Event::Released));
    TEST_CHECK(rejected(Status::Connecting, Event::Acquired));
    TEST_CHECK(rejected(Status::Connecting, Event::TransportFailed));
    TEST_CHECK(rejected(Status::Error,      Event::Acquired));
    TEST_CHECK(rejected(Status::Connected,  Event::RetryStarted));
    TEST_CHECK(rejected(Status::Idle,       Event::GaveUp));

    // Terminal
    for (auto ev : {Event::HandshakeSucceeded, Event::HandshakeFailed, Event::TransportFailed,
                    Event::Acquired, Event::Released, Event::RetryStarted, Event::GaveUp,
                    Event::CloseRequested}) {
        TEST_CHECK(rejected(Status::Disconnected, ev));
    }

    static_assert(channel::is_sendable(Status::Active));
    static_assert(!channel::is_sendable(Status::Idle));
    static_assert(channel::is_established(Status::Idle));
    static_assert(!channel::is_established(Status::Error));

    std::cout << "[TEST] OK\n";
}


void test_session() {
    std::cout << "[TEST] Session history and subscriptions\n";

    channel::Session s(4);
    TEST_CHECK(s.capacity() == 4);

    for (int i = 0; i < 6; ++i) {
        s.record(codec::Message{"chat", std::to_string(i), 0});
    }
    TEST_CHECK(s.history().size() == 4);
    TEST_CHECK(s.history().front().payload == "2");
    TEST_CHECK(s.history().back().payload == "5");

    TEST_CHECK(s.subscribe("orders"));
    TEST_CHECK(!s.subscribe("orders"));
    TEST_CHECK(s.subscribe("prices"));
    TEST_CHECK(s.is_subscribed("prices"));

    s.trim(1);
    TEST_CHECK(s.history().size() == 1);
    TEST_CHECK(s.history().front().payload == "5");
    TEST_CHECK(s.subscriptions().size() == 2);

    TEST_CHECK(s.unsubscribe("orders"));
    TEST_CHECK(!s.unsubscribe("orders"));
    TEST_CHECK(!s.is_subscribed("orders"));

    channel::Session zero(0);
    TEST_CHECK(zero.capacity() == 1);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_accepted_transitions();
    test_rejected_transitions();
    test_session();

    std::cout << "\n[CHANNEL STATE TESTS PASSED]\n";
    return 0;
}
