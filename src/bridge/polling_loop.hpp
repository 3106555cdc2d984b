#pragma once

#include "bridge_loop.hpp"

// Single-threaded loop over non-blocking descriptors.
//
// Each iteration: cancellation check, one local read, drain the channel,
// service the helper, pump queued writes, flush the terminal. When nothing
// moved it waits one poll interval, either sleeping (BUSY_POLL) or in
// poll(2) on the live descriptors (READINESS).
class PollingLoop : public BridgeLoop {
public:
    LoopOutcome run(LoopContext& ctx) override;
};
