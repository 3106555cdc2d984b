#pragma once

#include <chrono>
#include <memory>
#include <core/cancellation.hpp>
#include "transport.hpp"
#include "libssh2_session.hpp"
#include "libssh2_channel.hpp"

// libssh2 over a plain socket; EAGAIN waits are poll() calls bounded by the
// connect timeout and interrupted by cancellation.
class LibraryTransport : public Transport {
public:
    LibraryTransport(int connect_timeout_secs, const CancellationToken& cancel,
                     TransportBackend backend = TransportBackend::LIBRARY);
    ~LibraryTransport() override;

    Result<void> connect(const ConnectTarget& target) override;
    Result<void> authenticate(const ConnectTarget& target) override;
    Result<Channel*> open_shell(const std::string& term, platform::TermSize size) override;
    Result<Channel*> exec(const std::string& command) override;
    void disconnect() override;

    TransportBackend backend() const override { return backend_; }

private:
    int timeout_secs_;
    const CancellationToken& cancel_;
    TransportBackend backend_;
    int sock_ = -1;
    std::chrono::steady_clock::time_point deadline_;
    std::unique_ptr<Libssh2Session> session_;
    std::unique_ptr<Libssh2Channel> channel_;

    Result<void> poll_wait(int directions);
    void reset_deadline();
    Result<LIBSSH2_CHANNEL*> new_channel();
};
