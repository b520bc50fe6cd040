#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: cumulative pool counters (acquire/release/reconnect/health). Cheap,
//     relaxed atomics only.
// L2: per-frame counters on the inbound path.
// -----------------------------------------------------------------------------

#if defined(WIREPOOL_ENABLE_TELEMETRY_L1)
    #define WP_TL1(expr) expr
#else
    #define WP_TL1(expr) ((void)0)
#endif

#if defined(WIREPOOL_ENABLE_TELEMETRY_L2)
    #define WP_TL2(expr) expr
#else
    #define WP_TL2(expr) ((void)0)
#endif
