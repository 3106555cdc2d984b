#include "channel.hpp"
#include <cerrno>

static platform::IoResult rejected() {
    return platform::IoResult{platform::IoStatus::ERROR, 0, EBADF};
}

platform::IoResult Channel::read(char* buf, std::size_t len) {
    if (closed_) return rejected();
    return do_read(buf, len);
}

platform::IoResult Channel::read_stderr(char* buf, std::size_t len) {
    if (closed_) return rejected();
    return do_read_stderr(buf, len);
}

platform::IoResult Channel::write(const char* data, std::size_t len) {
    if (closed_) return rejected();
    return do_write(data, len);
}

Result<void> Channel::send_eof() {
    if (closed_) return Result<void>::Err(ErrorKind::CHANNEL, "Channel already closed");
    return do_send_eof();
}

Result<void> Channel::close() {
    if (closed_) return Result<void>::Ok();
    closed_ = true;
    close_count_++;
    return do_close();
}
