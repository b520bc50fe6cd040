#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    void copy_to(counter& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};
using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");


// ---------------------------------------------------------------------------
// gauge - instantaneous value that can go up and down, with a high-water mark
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) gauge {
    gauge() = default;

    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;

    void copy_to(gauge& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        other.peak_.store(peak_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline T peak() const noexcept { return peak_.load(std::memory_order_relaxed); }

    inline void store(T v) noexcept {
        value_.store(v, std::memory_order_relaxed);
        raise_peak_(v);
    }

    inline void inc(T n = 1) noexcept {
        raise_peak_(value_.fetch_add(n, std::memory_order_relaxed) + n);
    }

    inline void dec(T n = 1) noexcept { value_.fetch_sub(n, std::memory_order_relaxed); }

    inline void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
        peak_.store(0, std::memory_order_relaxed);
    }

private:
    inline void raise_peak_(T v) noexcept {
        T current = peak_.load(std::memory_order_relaxed);
        while (v > current &&
               !peak_.compare_exchange_weak(current, v, std::memory_order_relaxed, std::memory_order_relaxed)) {
        }
    }

private:
    std::atomic<T> value_{0};
    std::atomic<T> peak_{0};
};
using gauge32 = gauge<uint32_t>;
using gauge64 = gauge<uint64_t>;
static_assert(std::is_standard_layout_v<gauge64>, "gauge64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
