#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <core/types.hpp>
#include <platform/nonblocking_io.hpp>

// The local terminal has one owner at a time. While the transfer helper owns
// it, bridge reads are refused and bridge output is held back in order,
// to be written once the bridge reclaims the terminal. Output queued before
// the handoff is not held back.
class LocalTerminal {
public:
    enum class Owner { BRIDGE, HELPER };

    LocalTerminal(int in_fd, int out_fd);

    int input_fd() const { return in_fd_; }
    int output_fd() const { return out_fd_; }
    Owner owner() const { return owner_; }
    bool bridge_owns() const { return owner_ == Owner::BRIDGE; }

    void hand_to_helper();
    void reclaim();

    // IO error while the helper owns the terminal.
    Result<platform::IoResult> read(char* buf, std::size_t len);

    // Queue output; it reaches the terminal on the next flush().
    void write(const char* data, std::size_t len);

    // Write the deliverable output. Deferred (Ok) while an external writer
    // has a write in flight, so bytes never overtake each other.
    Result<void> flush(int timeout_ms);

    // Hand the deliverable output to an external writer (the async loop's
    // ordered writer).
    std::string take_pending();

    // Set by the external writer around each write.
    void set_write_in_flight(bool busy) { write_in_flight_ = busy; }

    std::size_t queued_bytes() const { return pending_.size(); }

    // Called after write() queues something.
    void set_on_pending(std::function<void()> fn) { on_pending_ = std::move(fn); }

private:
    int in_fd_;
    int out_fd_;
    Owner owner_ = Owner::BRIDGE;
    std::string pending_;
    std::size_t owed_ = 0;   // bytes at the front of pending_ queued before the handoff
    bool write_in_flight_ = false;
    std::function<void()> on_pending_;

    std::size_t deliverable() const;
};
