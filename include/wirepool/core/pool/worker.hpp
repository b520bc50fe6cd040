#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "lcr/log/logger.hpp"


namespace wirepool::core::pool {

// -----------------------------------------------------------------------------
// Worker
// -----------------------------------------------------------------------------
//
// Background thread that drives Pool::poll() at a fixed tick, so inbound
// frames, heartbeats, reconnects and the health/reaper passes make progress
// without the owner polling.
//
// Pool is any type with a `void poll()` member (normally pool::Manager).
// The pool must outlive the worker.
//
template<class Pool>
class Worker {
public:
    explicit Worker(Pool& pool, std::chrono::milliseconds tick = std::chrono::milliseconds(10)) noexcept
        : pool_(pool)
        , tick_(tick.count() > 0 ? tick : std::chrono::milliseconds(1))
    {}

    ~Worker() { stop(); }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// Starts the background thread. No-op (returns false) if already running.
    bool start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return false;
        }
        worker_ = std::thread(&Worker::run_loop_, this);
        WP_INFO("[WORKER] started (tick=" << tick_.count() << " ms)");
        return true;
    }

    /// Requests stop and joins the thread. Idempotent.
    void stop() {
        bool expected = true;
        if (running_.compare_exchange_strong(expected, false)) {
            {
                std::lock_guard<std::mutex> lk(mtx_);
            }
            cv_.notify_one();
        }
        if (worker_.joinable()) {
            worker_.join();
            WP_INFO("[WORKER] stopped after " << ticks_.load(std::memory_order_relaxed) << " tick(s)");
        }
    }

    /// Wakes the thread for an immediate poll
    void wake() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            wake_ = true;
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint64_t ticks() const noexcept {
        return ticks_.load(std::memory_order_relaxed);
    }

private:
    void run_loop_() {
        while (running_.load(std::memory_order_acquire)) {
            pool_.poll();
            ticks_.fetch_add(1, std::memory_order_relaxed);

            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, tick_, [&] {
                return wake_ || !running_.load(std::memory_order_acquire);
            });
            wake_ = false;
        }
    }

private:
    Pool& pool_;
    const std::chrono::milliseconds tick_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};

    std::thread worker_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool wake_{false};
};

} // namespace wirepool::core::pool
