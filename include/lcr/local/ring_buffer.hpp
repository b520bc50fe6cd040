#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded fixed-capacity ring buffer.
//
// Characteristics:
//   • O(1) push/pop, no dynamic allocation
//   • Power-of-two capacity for modulo-free wraparound
//   • Two overflow disciplines:
//       - push()           rejects the new item when full
//       - push_overwrite() discards the oldest item when full
//
// Thread-safety:
//   - NOT thread-safe. Callers serialize access externally (e.g. under the
//     owner's mutex).
//
// Example:
//   ring_buffer<Transition, 256> history;
//   history.push_overwrite(t);
//   Transition oldest;
//   while (history.pop(oldest)) { ... }
//
// Template parameters:
//   T         - element type (default constructible, movable)
//   Capacity  - power of two, >= 2. One slot is kept free, so at most
//               Capacity - 1 items are held.
//------------------------------------------------------------------------------
template <typename T, size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() noexcept = default;

    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    inline bool push(T item) noexcept {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false;
        buffer_[head_] = std::move(item);
        head_ = next;
        return true;
    }

    // Returns true when an older item was dropped to make room
    inline bool push_overwrite(T item) noexcept {
        bool dropped = false;
        if (full()) [[unlikely]] {
            tail_ = (tail_ + 1) & MASK;
            ++dropped_;
            dropped = true;
        }
        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) & MASK;
        return dropped;
    }

    inline bool pop(T& out) noexcept {
        if (tail_ == head_) [[unlikely]]
            return false;
        out = std::move(buffer_[tail_]);
        tail_ = (tail_ + 1) & MASK;
        return true;
    }

    inline bool empty() const noexcept { return head_ == tail_; }

    inline bool full() const noexcept {
        return ((head_ + 1) & MASK) == tail_;
    }

    inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    inline size_t size() const noexcept {
        return (head_ - tail_) & MASK;
    }

    // Items discarded by push_overwrite() since construction
    inline uint64_t dropped() const noexcept { return dropped_; }

    inline void clear() noexcept {
        head_ = tail_ = 0;
    }

private:
    static constexpr size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    size_t head_{0};
    size_t tail_{0};
    uint64_t dropped_{0};
};

} // namespace local
} // namespace lcr
