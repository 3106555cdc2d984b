#pragma once

#include <boost/asio.hpp>
#include "bridge_loop.hpp"

namespace net = boost::asio;

// Event-driven loop on an io_context, run on the calling thread.
//
// Coroutines (net::spawn):
// - terminal reader: wait_read on stdin, parked while the helper owns it
// - channel reader:  drain the channel on socket readiness
// - channel writer:  pump queued bytes when the socket is writable
// - terminal writer: one ordered writer for everything the terminal gets
// - helper pump:     helper stdout -> channel during a transfer
// - tick:            cancellation checkpoint every ASYNC_TICK_MS
//
// The descriptors are dup()ed so asio can own and close its copies.
class AsyncLoop : public BridgeLoop {
public:
    explicit AsyncLoop(net::io_context& ioc) : ioc_(ioc) {}

    LoopOutcome run(LoopContext& ctx) override;

private:
    net::io_context& ioc_;
};
