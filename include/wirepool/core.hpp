#pragma once

/*
================================================================================
Wirepool Core
================================================================================

Channel pool for long-lived bidirectional transports, partitioned by traffic
category:

    wirepool::core::pool::Manager<Factory, Codec>

composed of:
  - config        per-category policy table, pool settings, JSON loader
  - transport     raw channel / factory contracts (concepts)
  - codec         wire format contract and the default JSON codec
  - channel       pooled channel entity, status machine, snapshots
  - policy        reconnect decision and backoff table
  - pool          wait queue, metrics, telemetry, manager, worker

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------
  - acquire() / release() / close() / send() from any thread
  - progress (inbound frames, reconnects, health, reaper) driven by
    Manager::poll(), either called by the owner or by pool::Worker
================================================================================
*/

#include "wirepool/core/category.hpp"
#include "wirepool/core/error.hpp"
#include "wirepool/core/config/policy.hpp"
#include "wirepool/core/config/pool.hpp"
#include "wirepool/core/config/loader.hpp"
#include "wirepool/core/transport/concepts.hpp"
#include "wirepool/core/codec/json.hpp"
#include "wirepool/core/channel/info.hpp"
#include "wirepool/core/channel/transition.hpp"
#include "wirepool/core/notify/notification.hpp"
#include "wirepool/core/pool/manager.hpp"
#include "wirepool/core/pool/worker.hpp"
