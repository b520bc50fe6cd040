#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "wirepool/core.hpp"
#include "common/cli/params.hpp"
#include "common/loopback_transport.hpp"

using namespace wirepool::core;

using DemoPool = pool::Manager<wirepool::examples::LoopbackFactory>;


int main(int argc, char** argv) {
    const auto params = wirepool::examples::cli::configure(argc, argv,
        "wirepool demo: concurrent clients sharing a bounded channel pool");
    params.dump("=== Demo Parameters", std::cout);

    config::Pool cfg;
    if (!params.config_path.empty()) {
        if (auto err = config::load_file(params.config_path, cfg); err != Error::None) {
            std::cerr << "Invalid configuration: " << to_string(err) << std::endl;
            return 1;
        }
    }

    Category category = Category::Chat;
    (void)parse_category(params.category, category);

    wirepool::examples::LoopbackFactory factory(params.fail_rate);
    DemoPool manager(factory, cfg);

    std::atomic<std::uint64_t> received{0};
    std::atomic<std::uint64_t> established{0};
    std::atomic<std::uint64_t> permanent{0};
    manager.on_notify([&](const notify::Notification& n) {
        switch (n.kind) {
        case notify::Kind::Message:          received.fetch_add(1, std::memory_order_relaxed); break;
        case notify::Kind::Established:      established.fetch_add(1, std::memory_order_relaxed); break;
        case notify::Kind::PermanentFailure: permanent.fetch_add(1, std::memory_order_relaxed); break;
        default: break;
        }
    });

    if (auto err = manager.start(); err != Error::None) {
        std::cerr << "Pool failed to start: " << to_string(err) << std::endl;
        return 1;
    }

    pool::Worker<DemoPool> worker(manager, std::chrono::milliseconds(5));
    worker.start();

    std::atomic<bool> running{true};
    std::atomic<std::uint64_t> served{0};
    std::atomic<std::uint64_t> timeouts{0};
    std::atomic<std::uint64_t> failures{0};
    std::atomic<std::uint64_t> sent{0};

    DemoPool::Context ctx;
    ctx.tenant_id = params.tenant;
    ctx.requester_role = params.role;

    std::vector<std::thread> clients;
    clients.reserve(params.clients);
    for (std::uint32_t i = 0; i < params.clients; ++i) {
        clients.emplace_back([&, i] {
            std::uint64_t seq = 0;
            while (running.load(std::memory_order_relaxed)) {
                channel::Id id = channel::INVALID_ID;
                const auto err = manager.acquire(category, ctx, id, std::chrono::milliseconds(2000));
                if (err == Error::Timeout) {
                    timeouts.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                if (err != Error::None) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    continue;
                }
                served.fetch_add(1, std::memory_order_relaxed);
                for (int k = 0; k < 3; ++k) {
                    std::string payload = "{\"client\":" + std::to_string(i) + ",\"seq\":" + std::to_string(++seq) + "}";
                    if (manager.send(id, codec::Message{std::string(to_string(category)), std::move(payload), 0}) != Error::None) {
                        break;
                    }
                    sent.fetch_add(1, std::memory_order_relaxed);
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                manager.release(id);
            }
        });
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.duration_s);
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        const auto m = manager.metrics_snapshot();
        std::cout << "[DEMO] channels=" << m.total_connections
                  << " active=" << m.active_connections
                  << " idle=" << m.idle_connections
                  << " error=" << m.error_connections
                  << " waiting=" << m.waiting_callers
                  << " sent=" << sent.load() << std::endl;
    }

    running.store(false);
    for (auto& t : clients) {
        t.join();
    }
    worker.stop();

    manager.metrics_snapshot().dump(std::cout);
    manager.telemetry().debug_dump(std::cout);

    std::cout << "\n========== DEMO SUMMARY ==========" << std::endl;
    std::cout << "Acquisitions served : " << served.load() << std::endl;
    std::cout << "Acquire timeouts    : " << timeouts.load() << std::endl;
    std::cout << "Acquire failures    : " << failures.load() << std::endl;
    std::cout << "Messages sent       : " << sent.load() << std::endl;
    std::cout << "Messages received   : " << received.load() << std::endl;
    std::cout << "Establishments      : " << established.load() << std::endl;
    std::cout << "Permanent failures  : " << permanent.load() << std::endl;

    manager.stop();
    return 0;
}
