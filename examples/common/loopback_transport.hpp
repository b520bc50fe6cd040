#pragma once

/*
===============================================================================
 Loopback transport (demo only)
===============================================================================

In-process stand-in for a network transport:

  - Application frames written to a channel come back as inbound frames
  - Pings are answered with a pong, so probe latency is measurable
  - With probability `fail_rate`:
      • open() fails with ConnectionFailed
      • a write fails and the channel reports an error event
  - Raw channels are polled and written under the pool lock; the shared
    random source is guarded by its own mutex

Not part of the library.
===============================================================================
*/

#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

#include "wirepool/core/category.hpp"
#include "wirepool/core/transport/concepts.hpp"
#include "wirepool/core/transport/error.hpp"
#include "wirepool/core/transport/event.hpp"


namespace wirepool::examples {

namespace transport = wirepool::core::transport;

class Dice {
public:
    Dice(double fail_rate, unsigned seed)
        : fail_rate_(fail_rate)
        , rng_(seed)
    {}

    [[nodiscard]] bool fails() {
        if (fail_rate_ <= 0.0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        return dist_(rng_) < fail_rate_;
    }

private:
    const double fail_rate_;
    std::mutex mtx_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};


class LoopbackChannel {
public:
    explicit LoopbackChannel(Dice& dice) noexcept
        : dice_(dice)
    {}

    bool send(std::string_view data) noexcept {
        if (!open_) {
            return false;
        }
        if (dice_.fails()) {
            events_.push_back(transport::Event::make_error(transport::Error::TransportFailure));
            return false;
        }
        if (data.find("\"type\":\"ping\"") != std::string_view::npos) {
            inbound_.emplace_back("{\"type\":\"pong\"}");
        }
        else if (data.find("\"type\":\"heartbeat\"") == std::string_view::npos) {
            inbound_.emplace_back(data);
        }
        return true;
    }

    void close() noexcept {
        open_ = false;
        inbound_.clear();
    }

    bool is_open() noexcept {
        return open_;
    }

    bool poll_frame(std::string& out) noexcept {
        if (inbound_.empty()) {
            return false;
        }
        out = std::move(inbound_.front());
        inbound_.pop_front();
        return true;
    }

    bool poll_event(transport::Event& ev) noexcept {
        if (events_.empty()) {
            return false;
        }
        ev = events_.front();
        events_.pop_front();
        return true;
    }

private:
    Dice& dice_;
    bool open_{true};
    std::deque<std::string> inbound_;
    std::deque<transport::Event> events_;
};

static_assert(transport::RawChannelConcept<LoopbackChannel>);


class LoopbackFactory {
public:
    using channel_type = LoopbackChannel;

    LoopbackFactory(double fail_rate, unsigned seed = 42)
        : dice_(fail_rate, seed)
    {}

    transport::Error open(core::Category, std::unique_ptr<LoopbackChannel>& out) noexcept {
        if (dice_.fails()) {
            return transport::Error::ConnectionFailed;
        }
        out = std::make_unique<LoopbackChannel>(dice_);
        return transport::Error::None;
    }

private:
    Dice dice_;
};

static_assert(transport::FactoryConcept<LoopbackFactory>);

} // namespace wirepool::examples
