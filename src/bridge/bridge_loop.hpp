#pragma once

#include <core/cancellation.hpp>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/types.hpp>
#include <ssh/channel.hpp>
#include "local_terminal.hpp"
#include "stream_router.hpp"

enum class LoopExit {
    REMOTE_EOF,    // remote shell closed the channel
    LOCAL_EOF,     // local input ended
    CANCELLED,     // token was cancelled
    IO_ERROR,      // see LoopOutcome::error
};

const char* loop_exit_name(LoopExit exit);

struct LoopOutcome {
    LoopExit exit = LoopExit::REMOTE_EOF;
    SessionError error;
};

// Everything a loop needs for one interactive session. All references
// outlive the loop.
struct LoopContext {
    Channel& channel;
    LocalTerminal& terminal;
    StreamRouter& router;
    const CancellationToken& cancel;
    TraceSink& trace;
    const Settings& settings;
};

// Drives data between the local terminal and the channel until one side
// ends, an I/O error occurs or the token is cancelled. Routing decisions
// live in StreamRouter; a loop only decides how to wait.
class BridgeLoop {
public:
    virtual ~BridgeLoop() = default;
    virtual LoopOutcome run(LoopContext& ctx) = 0;
};
