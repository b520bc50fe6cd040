#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic.hpp"
#include "lcr/format.hpp"

namespace wirepool::core::pool::telemetry {

// ============================================================================
// Pool Telemetry
//
// Cumulative counters for pool decisions. Mechanical facts only; the
// point-in-time view (counts by status, utilization) is PoolMetrics.
// Updated through WP_TL1(...) and compiled out unless
// WIREPOOL_ENABLE_TELEMETRY_L1 is defined.
// ============================================================================

struct alignas(64) Pool final {
    // ---------------------------------------------------------------------
    // Acquisition
    // ---------------------------------------------------------------------

    // acquire() invoked
    lcr::metrics::atomic::counter64 acquire_calls_total;

    // Served by an idle channel with a matching key
    lcr::metrics::atomic::counter64 acquire_reused_total;

    // Served by a newly created channel
    lcr::metrics::atomic::counter64 acquire_created_total;

    // Had to wait in the queue
    lcr::metrics::atomic::counter64 acquire_queued_total;

    // Deadline elapsed while queued
    lcr::metrics::atomic::counter64 acquire_timeouts_total;

    // Released channel handed directly to a waiter
    lcr::metrics::atomic::counter64 handoffs_total;

    // Hand-off candidate rejected by the liveness check
    lcr::metrics::atomic::counter64 handoff_stale_total;

    // Currently queued callers (with high-water mark)
    lcr::metrics::atomic::gauge64 waiters;

    // ---------------------------------------------------------------------
    // Ownership & teardown
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 release_calls_total;
    lcr::metrics::atomic::counter64 close_calls_total;

    // Removed by the idle reaper
    lcr::metrics::atomic::counter64 reaped_total;

    // Closed by policy instead of being re-established
    lcr::metrics::atomic::counter64 evicted_total;

    // ---------------------------------------------------------------------
    // Send gating
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 send_calls_total;

    // Rejected because the channel was not connected/active
    lcr::metrics::atomic::counter64 send_rejected_total;

    // Accepted by the pool but failed at the transport
    lcr::metrics::atomic::counter64 send_failed_total;

    // ---------------------------------------------------------------------
    // Recovery
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 reconnect_attempts_total;
    lcr::metrics::atomic::counter64 reconnect_success_total;
    lcr::metrics::atomic::counter64 reconnect_failure_total;
    lcr::metrics::atomic::counter64 permanent_failures_total;

    // ---------------------------------------------------------------------
    // Liveness
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 probes_sent_total;
    lcr::metrics::atomic::counter64 probe_failures_total;
    lcr::metrics::atomic::counter64 heartbeats_sent_total;

    // ---------------------------------------------------------------------
    // Inbound
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 frames_received_total;
    lcr::metrics::atomic::counter64 decode_errors_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Pool& other) const noexcept {
        acquire_calls_total.copy_to(other.acquire_calls_total);
        acquire_reused_total.copy_to(other.acquire_reused_total);
        acquire_created_total.copy_to(other.acquire_created_total);
        acquire_queued_total.copy_to(other.acquire_queued_total);
        acquire_timeouts_total.copy_to(other.acquire_timeouts_total);
        handoffs_total.copy_to(other.handoffs_total);
        handoff_stale_total.copy_to(other.handoff_stale_total);
        waiters.copy_to(other.waiters);

        release_calls_total.copy_to(other.release_calls_total);
        close_calls_total.copy_to(other.close_calls_total);
        reaped_total.copy_to(other.reaped_total);
        evicted_total.copy_to(other.evicted_total);

        send_calls_total.copy_to(other.send_calls_total);
        send_rejected_total.copy_to(other.send_rejected_total);
        send_failed_total.copy_to(other.send_failed_total);

        reconnect_attempts_total.copy_to(other.reconnect_attempts_total);
        reconnect_success_total.copy_to(other.reconnect_success_total);
        reconnect_failure_total.copy_to(other.reconnect_failure_total);
        permanent_failures_total.copy_to(other.permanent_failures_total);

        probes_sent_total.copy_to(other.probes_sent_total);
        probe_failures_total.copy_to(other.probe_failures_total);
        heartbeats_sent_total.copy_to(other.heartbeats_sent_total);

        frames_received_total.copy_to(other.frames_received_total);
        decode_errors_total.copy_to(other.decode_errors_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Pool Telemetry ===\n";

        os << "Acquisition\n";
        os << "  Acquire calls         : " << lcr::format_number_exact(acquire_calls_total.load()) << '\n';
        os << "  Reused idle           : " << lcr::format_number_exact(acquire_reused_total.load()) << '\n';
        os << "  Created               : " << lcr::format_number_exact(acquire_created_total.load()) << '\n';
        os << "  Queued                : " << lcr::format_number_exact(acquire_queued_total.load()) << '\n';
        os << "  Timeouts              : " << lcr::format_number_exact(acquire_timeouts_total.load()) << '\n';
        os << "  Hand-offs             : " << lcr::format_number_exact(handoffs_total.load()) << '\n';
        os << "  Stale hand-offs       : " << lcr::format_number_exact(handoff_stale_total.load()) << '\n';
        os << "  Waiters (now/peak)    : " << waiters.load() << " / " << waiters.peak() << '\n';

        os << "\nTeardown\n";
        os << "  Release calls         : " << lcr::format_number_exact(release_calls_total.load()) << '\n';
        os << "  Close calls           : " << lcr::format_number_exact(close_calls_total.load()) << '\n';
        os << "  Reaped idle           : " << lcr::format_number_exact(reaped_total.load()) << '\n';
        os << "  Evicted               : " << lcr::format_number_exact(evicted_total.load()) << '\n';

        os << "\nSend\n";
        os << "  Send calls            : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Send rejected         : " << lcr::format_number_exact(send_rejected_total.load()) << '\n';
        os << "  Send failed           : " << lcr::format_number_exact(send_failed_total.load()) << '\n';

        os << "\nRecovery\n";
        os << "  Reconnect attempts    : " << lcr::format_number_exact(reconnect_attempts_total.load()) << '\n';
        os << "  Reconnect success     : " << lcr::format_number_exact(reconnect_success_total.load()) << '\n';
        os << "  Reconnect failure     : " << lcr::format_number_exact(reconnect_failure_total.load()) << '\n';
        os << "  Permanent failures    : " << lcr::format_number_exact(permanent_failures_total.load()) << '\n';

        os << "\nLiveness\n";
        os << "  Probes sent           : " << lcr::format_number_exact(probes_sent_total.load()) << '\n';
        os << "  Probe failures        : " << lcr::format_number_exact(probe_failures_total.load()) << '\n';
        os << "  Heartbeats sent       : " << lcr::format_number_exact(heartbeats_sent_total.load()) << '\n';

        os << "\nInbound\n";
        os << "  Frames received       : " << lcr::format_number_exact(frames_received_total.load()) << '\n';
        os << "  Decode errors         : " << lcr::format_number_exact(decode_errors_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Pool>, "telemetry::Pool must be standard layout");
static_assert(std::is_trivially_destructible_v<Pool>, "telemetry::Pool must be trivially destructible");
static_assert(alignof(Pool) == 64, "telemetry::Pool must be cache-line aligned");

} // namespace wirepool::core::pool::telemetry
