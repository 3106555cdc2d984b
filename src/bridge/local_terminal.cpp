#include "local_terminal.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

LocalTerminal::LocalTerminal(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

void LocalTerminal::hand_to_helper() {
    owner_ = Owner::HELPER;
    owed_ = pending_.size();
    rzterm_log(fmt::format("terminal handed to helper ({} bytes still owed)", owed_));
}

void LocalTerminal::reclaim() {
    owner_ = Owner::BRIDGE;
    owed_ = 0;
    rzterm_log(fmt::format("terminal reclaimed ({} bytes queued)", pending_.size()));
}

Result<platform::IoResult> LocalTerminal::read(char* buf, std::size_t len) {
    if (owner_ != Owner::BRIDGE) {
        return Result<platform::IoResult>::Err(ErrorKind::IO,
                                               "Terminal is owned by the transfer helper");
    }
    return Result<platform::IoResult>::Ok(platform::read_nonblocking(in_fd_, buf, len));
}

void LocalTerminal::write(const char* data, std::size_t len) {
    if (len == 0) return;
    pending_.append(data, len);
    if (on_pending_) on_pending_();
}

std::size_t LocalTerminal::deliverable() const {
    return owner_ == Owner::BRIDGE ? pending_.size() : owed_;
}

Result<void> LocalTerminal::flush(int timeout_ms) {
    if (write_in_flight_) return Result<void>::Ok();
    std::string out = take_pending();
    if (out.empty()) return Result<void>::Ok();
    return platform::write_all(out_fd_, out.data(), out.size(), timeout_ms);
}

std::string LocalTerminal::take_pending() {
    std::size_t n = deliverable();
    std::string out = pending_.substr(0, n);
    pending_.erase(0, n);
    owed_ = 0;
    return out;
}
