/*
===============================================================================
 pool::Manager — Group C: Data Path
===============================================================================

Scope:
------
Outbound send() and the inbound frame path driven by poll().

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

C1. send() encodes through the codec and updates channel bookkeeping
C2. send() on unknown or non-sendable channels is rejected without I/O
C3. A failed write moves the channel to error with a retry scheduled
C4. Control messages are sent but never recorded in the session
C5. Inbound application frames are forwarded to the sink
C6. Undecodable frames are dropped and counted
C7. Inbound pings are answered; pongs record probe latency
C8. Subscriptions are tracked per channel

===============================================================================
*/

#include <chrono>
#include <iostream>

#include "common/harness/pool.hpp"

using namespace std::chrono_literals;
using namespace wirepool::core::test;
using channel::Status;


void test_C1_send() {
    std::cout << "[TEST] Group C1: send\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);

    TEST_CHECK(h.pool->send(id, codec::Message{"chat", R"({"text":"hello"})", 0}) == Error::None);

    const auto frames = h.factory.state(0)->sent_frames();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(frames[0] == R"({"type":"chat","data":{"text":"hello"}})");

    const auto info = h.info_of(id);
    TEST_CHECK(info.message_count == 1);
    TEST_CHECK(info.metrics.messages_handled == 1);
    TEST_CHECK(info.metrics.bytes_sent == frames[0].size());
    TEST_CHECK(info.history_size == 1);

    std::cout << "[TEST] OK\n";
}


void test_C2_send_rejected() {
    std::cout << "[TEST] Group C2: send rejected\n";

    harness::Pool h;
    TEST_CHECK(h.pool->send(99, codec::Message{"chat", "1", 0}) == Error::UnknownChannel);

    const auto id = h.acquire_now(Category::Chat);
    h.pool->release(id);
    TEST_CHECK(h.pool->send(id, codec::Message{"chat", "1", 0}) == Error::NotReady);
    TEST_CHECK(h.factory.state(0)->sent_frames().empty());
    TEST_CHECK(h.pool->telemetry().send_rejected_total.load() == 1);

    h.pool->close(id);
    TEST_CHECK(h.pool->send(id, codec::Message{"chat", "1", 0}) == Error::UnknownChannel);

    std::cout << "[TEST] OK\n";
}


void test_C3_send_failure() {
    std::cout << "[TEST] Group C3: write failure\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);
    h.factory.state(0)->set_fail_sends(true);

    TEST_CHECK(h.pool->send(id, codec::Message{"chat", "1", 0}) == Error::TransportError);

    const auto info = h.info_of(id);
    TEST_CHECK(info.status == Status::Error);
    TEST_CHECK(info.retry_pending);
    TEST_CHECK(info.reconnect_attempts == 1);
    TEST_CHECK(info.message_count == 0);
    TEST_CHECK(info.metrics.errors == 1);

    const auto errs = h.notifications_of(notify::Kind::Error);
    TEST_CHECK(errs.size() == 1);
    TEST_CHECK(errs[0].cause == channel::Cause::TransportError);

    // Error channels reject sends until re-established
    TEST_CHECK(h.pool->send(id, codec::Message{"chat", "2", 0}) == Error::NotReady);
    TEST_CHECK(h.pool->telemetry().send_failed_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


void test_C4_control_not_recorded() {
    std::cout << "[TEST] Group C4: control messages\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Voice);

    TEST_CHECK(h.pool->send(id, codec::Message{std::string(codec::TYPE_HEARTBEAT), "", 0}) == Error::None);
    const auto info = h.info_of(id);
    TEST_CHECK(info.message_count == 1);
    TEST_CHECK(info.history_size == 0);
    TEST_CHECK(h.factory.state(0)->sent_count("\"heartbeat\"") == 1);

    std::cout << "[TEST] OK\n";
}


void test_C5_inbound_message() {
    std::cout << "[TEST] Group C5: inbound application frame\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Inventory);

    const std::string frame = R"({"type":"stock","timestamp":7,"data":{"sku":"A-1","qty":4}})";
    h.factory.state(0)->push_frame(frame);
    h.pool->poll();

    const auto msgs = h.notifications_of(notify::Kind::Message);
    TEST_CHECK(msgs.size() == 1);
    TEST_CHECK(msgs[0].channel_id == id);
    TEST_CHECK(msgs[0].category == Category::Inventory);
    TEST_CHECK(msgs[0].tenant_id == "main");
    TEST_CHECK(msgs[0].message.type == "stock");
    TEST_CHECK(msgs[0].message.timestamp_ms == 7);
    TEST_CHECK(msgs[0].message.payload == R"({"sku":"A-1","qty":4})");

    const auto info = h.info_of(id);
    TEST_CHECK(info.metrics.bytes_received == frame.size());
    TEST_CHECK(info.metrics.messages_handled == 1);
    TEST_CHECK(info.history_size == 1);
    TEST_CHECK(h.pool->telemetry().frames_received_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


void test_C6_undecodable_frame() {
    std::cout << "[TEST] Group C6: undecodable frame\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);

    h.factory.state(0)->push_frame("{not json");
    h.factory.state(0)->push_frame(R"({"type":"chat","data":1})");
    h.pool->poll();

    // The bad frame is dropped; the next one still arrives
    TEST_CHECK(h.count(notify::Kind::Message) == 1);
    const auto info = h.info_of(id);
    TEST_CHECK(info.status == Status::Active);
    TEST_CHECK(info.metrics.errors == 1);
    TEST_CHECK(h.pool->telemetry().decode_errors_total.load() == 1);

    std::cout << "[TEST] OK\n";
}


void test_C7_ping_pong() {
    std::cout << "[TEST] Group C7: ping / pong\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Chat);
    auto state = h.factory.state(0);

    state->push_frame(R"({"type":"ping","timestamp":123})");
    h.pool->poll();
    TEST_CHECK(state->sent_count(R"({"type":"pong","timestamp":123,"data":null})") == 1);
    TEST_CHECK(h.count(notify::Kind::Message) == 0);
    TEST_CHECK(h.info_of(id).history_size == 0);

    // Probe then answer it
    h.pool->health_check();
    TEST_CHECK(state->sent_count("\"ping\"") == 1);
    std::this_thread::sleep_for(5ms);
    state->push_frame(R"({"type":"pong"})");
    h.pool->poll();

    const auto info = h.info_of(id);
    TEST_CHECK(info.metrics.latency_samples == 1);
    TEST_CHECK(info.metrics.average_latency_ms >= 5.0);

    // An unsolicited pong is ignored
    state->push_frame(R"({"type":"pong"})");
    h.pool->poll();
    TEST_CHECK(h.info_of(id).metrics.latency_samples == 1);

    std::cout << "[TEST] OK\n";
}


void test_C8_subscriptions() {
    std::cout << "[TEST] Group C8: subscriptions\n";

    harness::Pool h;
    const auto id = h.acquire_now(Category::Alerts);

    TEST_CHECK(h.pool->subscribe(id, "fraud") == Error::None);
    TEST_CHECK(h.pool->subscribe(id, "fraud") == Error::None);
    TEST_CHECK(h.pool->subscribe(id, "outage") == Error::None);
    TEST_CHECK(h.info_of(id).subscriptions.size() == 2);

    TEST_CHECK(h.pool->unsubscribe(id, "fraud") == Error::None);
    const auto info = h.info_of(id);
    TEST_CHECK(info.subscriptions.size() == 1);
    TEST_CHECK(info.subscriptions[0] == "outage");

    TEST_CHECK(h.pool->subscribe(777, "fraud") == Error::UnknownChannel);
    TEST_CHECK(h.pool->unsubscribe(777, "fraud") == Error::UnknownChannel);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_C1_send();
    test_C2_send_rejected();
    test_C3_send_failure();
    test_C4_control_not_recorded();
    test_C5_inbound_message();
    test_C6_undecodable_frame();
    test_C7_ping_pong();
    test_C8_subscriptions();

    std::cout << "\n[GROUP C — DATA PATH TESTS PASSED]\n";
    return 0;
}
