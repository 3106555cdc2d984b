#pragma once

#include <functional>
#include <memory>
#include <string>
#include <ssh/channel.hpp>
#include <ssh/transport.hpp>

// Channel over the local end of a socketpair. The test drives the other end
// as the remote shell. Stderr is served from a string.
class FakeChannel : public Channel {
public:
    explicit FakeChannel(int fd);
    ~FakeChannel() override;

    int poll_fd() const override { return fd_; }
    int exit_status() const override { return exit_status_; }

    void set_exit_status(int status) { exit_status_ = status; }
    void set_stderr(const std::string& data) { stderr_ = data; }

protected:
    platform::IoResult do_read(char* buf, std::size_t len) override;
    platform::IoResult do_read_stderr(char* buf, std::size_t len) override;
    platform::IoResult do_write(const char* data, std::size_t len) override;
    Result<void> do_send_eof() override;
    Result<void> do_close() override;

private:
    int fd_;
    int exit_status_ = -1;
    bool stdout_eof_ = false;
    std::string stderr_;
};

struct FakeScript {
    SessionError connect_error;
    SessionError auth_error;
    SessionError shell_error;

    // exec(): what the remote command produces
    std::string exec_stdout;
    std::string exec_stderr;
    int exec_status = 0;

    // open_shell(): the remote end of the socketpair, to script the shell
    std::function<void(int remote_fd)> on_shell;
    int shell_status = -1;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeScript script = FakeScript{},
                           TransportBackend backend = TransportBackend::LIBRARY);
    ~FakeTransport() override;

    Result<void> connect(const ConnectTarget& target) override;
    Result<void> authenticate(const ConnectTarget& target) override;
    Result<Channel*> open_shell(const std::string& term, platform::TermSize size) override;
    Result<Channel*> exec(const std::string& command) override;
    void disconnect() override;

    TransportBackend backend() const override { return backend_; }

    FakeChannel* channel() const { return channel_.get(); }
    int remote_fd() const { return remote_fd_; }
    int connect_calls() const { return connect_calls_; }
    int disconnect_calls() const { return disconnect_calls_; }
    const std::string& last_command() const { return last_command_; }
    const std::string& last_term() const { return last_term_; }

private:
    FakeScript script_;
    TransportBackend backend_;
    std::unique_ptr<FakeChannel> channel_;
    int remote_fd_ = -1;
    int connect_calls_ = 0;
    int disconnect_calls_ = 0;
    std::string last_command_;
    std::string last_term_;

    Result<int> make_pair();
};
