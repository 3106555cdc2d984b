#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/cancellation.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>
#include "oob_detector.hpp"

struct TransferPlan {
    DetectionKind kind = DetectionKind::DOWNLOAD;
    bool aborted = false;          // upload cancelled: nothing to spawn
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;
    std::string local_path;        // upload source
};

// Asks for the file to upload. nullopt or "" cancels the upload.
using PathPrompt = std::function<std::optional<std::string>(const std::string& question)>;

// How the prompt and the picker wait for their input. The default blocks in
// poll(); the async loop swaps in a wait that yields to its io_context.
enum class InputWait { READY, TIMEOUT, STOPPED };
using InputWaiter = std::function<InputWait(int fd, int timeout_ms)>;

// Turns a detection into a running lrzsz helper.
//
// Upload:   ask for a local path (picker command, else a line prompt on the
//           terminal), then spawn send_helper + args + path.
// Download: spawn receive_helper + args inside download_dir.
//
// The helper's stdin/stdout are pipes for the bridge to pump to and from the
// channel; its stderr stays on the real terminal for progress output.
class HelperLauncher {
public:
    HelperLauncher(const Settings& settings, int in_fd, int out_fd,
                   const CancellationToken* cancel = nullptr);

    // Replace the default picker / terminal prompt.
    void set_path_prompt(PathPrompt prompt) { prompt_ = std::move(prompt); }

    // nullptr restores the blocking wait.
    void set_input_waiter(InputWaiter waiter) { waiter_ = std::move(waiter); }

    Result<TransferPlan> prepare(const DetectionEvent& event);

    // SUBPROCESS error if the helper cannot be started.
    Result<platform::ProcessHandle> launch(const TransferPlan& plan);

    // Written to the channel when an upload is cancelled: stops the remote rz.
    static std::string abort_sequence();

    // Status line on the terminal ("\r\nrzterm: ...\r\n").
    void notice(const std::string& msg);

    // Line editor for a terminal in raw mode. nullopt on Ctrl-C, EOF or
    // cancellation.
    std::optional<std::string> prompt_line(const std::string& question);

    // Runs upload_picker and returns the path it prints. nullopt when no
    // picker is configured, it fails, or the session is cancelled meanwhile
    // (the picker is then terminated).
    std::optional<std::string> run_picker();

private:
    const Settings& settings_;
    int in_fd_;
    int out_fd_;
    const CancellationToken* cancel_;
    PathPrompt prompt_;
    InputWaiter waiter_;

    bool cancelled() const { return cancel_ && cancel_->cancelled(); }
    InputWait wait_input(int fd);
    std::optional<std::string> ask_path(const std::string& question);
};
