#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <core/log.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <ssh/channel.hpp>
#include "helper_launcher.hpp"
#include "local_terminal.hpp"
#include "oob_detector.hpp"
#include "session_state.hpp"

// Decides where every chunk goes. Shared by the polling and async loops,
// which only differ in how they wait.
//
//   local input   -> channel (after the Alt+D check and outbound detection)
//   channel data  -> terminal, or the helper's stdin during a transfer
//   helper stdout -> channel
//
// Writes toward the channel and the helper are queued and drained by
// pump_*(), so nothing here blocks on a slow peer.
class StreamRouter {
public:
    StreamRouter(Channel& channel, LocalTerminal& terminal, SessionStateMachine& state,
                 HelperLauncher& launcher, TraceSink& trace);
    ~StreamRouter();

    StreamRouter(const StreamRouter&) = delete;
    StreamRouter& operator=(const StreamRouter&) = delete;

    Result<void> on_local_input(const char* data, std::size_t len);
    Result<void> on_remote_output(const char* data, std::size_t len);

    // Move helper stdout to the channel queue and notice helper exit.
    // Returns true if anything moved or the transfer ended.
    Result<bool> service_helper();

    Result<void> pump_to_channel();
    void pump_to_helper();

    bool transfer_active() const { return helper_ != nullptr; }
    int helper_stdout_fd() const { return helper_ ? helper_->stdout_fd() : -1; }
    int transfer_count() const { return transfer_count_; }
    bool has_pending_channel_writes() const { return !to_channel_.empty(); }
    std::size_t pending_to_channel() const { return to_channel_.size(); }

    HelperLauncher& launcher() { return launcher_; }

    // Teardown during a transfer: stop the helper, give the terminal back.
    void abort_transfer();

private:
    Channel& channel_;
    LocalTerminal& terminal_;
    SessionStateMachine& state_;
    HelperLauncher& launcher_;
    TraceSink& trace_;

    std::unique_ptr<platform::ProcessHandle> helper_;
    DetectionKind helper_kind_ = DetectionKind::DOWNLOAD;
    std::string to_channel_;
    std::string to_helper_;
    int transfer_count_ = 0;

    Result<void> begin_transfer(const DetectionEvent& event, const char* rest, std::size_t rest_len);
    void cancel_transfer(const std::string& why);
    void finish_transfer();
    void queue_to_channel(const char* data, std::size_t len);
};
