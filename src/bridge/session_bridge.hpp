#pragma once

#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <core/cancellation.hpp>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/target.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "bridge_loop.hpp"
#include "helper_launcher.hpp"
#include "session_state.hpp"

// One remote session from connect to teardown.
//
//   run_interactive(): connect, authenticate, PTY shell, raw mode, then the
//                      bridge loop until EOF, cancellation or error.
//   execute():         connect, authenticate, run one command, collect output.
//
// Raw mode is entered only once the shell is open and is restored as the
// very last teardown step, on every path out of the interactive session.
class SessionBridge {
public:
    SessionBridge(std::unique_ptr<Transport> transport, const Settings& settings,
                  CancellationToken& cancel, TraceSink& trace);
    ~SessionBridge();

    SessionBridge(const SessionBridge&) = delete;
    SessionBridge& operator=(const SessionBridge&) = delete;

    // Defaults to STDIN_FILENO / STDOUT_FILENO.
    void set_terminal_fds(int in_fd, int out_fd);
    void set_path_prompt(PathPrompt prompt) { path_prompt_ = std::move(prompt); }

    // Required for the async backend; the loop shares the transport's context.
    void set_async_context(boost::asio::io_context* ioc) { ioc_ = ioc; }

    // Returns the process exit code: the remote exit status on a clean end,
    // 130 when cancelled, 2 for CONFIG errors, 255 for any other failure.
    int run_interactive(const ConnectTarget& target);

    Result<ExecResult> execute(const ConnectTarget& target, const std::string& command);

    SessionState state() const { return state_.state(); }
    const SessionStateMachine& state_machine() const { return state_; }
    const SessionError& last_error() const { return state_.failure(); }

    static int exit_code_for(const SessionError& err);

private:
    std::unique_ptr<Transport> transport_;
    const Settings& settings_;
    CancellationToken& cancel_;
    TraceSink& trace_;
    SessionStateMachine state_;
    PathPrompt path_prompt_;
    boost::asio::io_context* ioc_ = nullptr;
    int in_fd_;
    int out_fd_;

    Result<void> establish(const ConnectTarget& target);
    void fail(const SessionError& err);
    LoopOutcome run_loop(LoopContext& ctx);
    Result<void> collect_output(Channel& channel, ExecResult& result);
};
