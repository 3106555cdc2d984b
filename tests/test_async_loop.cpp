#include <gtest/gtest.h>
#include <bridge/async_loop.hpp>
#include <bridge/session_bridge.hpp>
#include <core/constants.hpp>
#include <platform/nonblocking_io.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include "fake_transport.hpp"
#include <atomic>
#include <chrono>
#include <pty.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono;

// ── AsyncLoop on plain pipes ──

class AsyncLoopTest : public ::testing::Test {
protected:
    int remote_ = -1;
    int in_rd_ = -1, in_wr_ = -1;
    int out_rd_ = -1, out_wr_ = -1;
    std::unique_ptr<FakeChannel> channel_;
    SessionStateMachine state_;
    CancellationToken cancel_;
    TraceSink trace_;
    Settings settings_;
    net::io_context ioc_;
    int transfers_ = 0;

    void SetUp() override {
        platform::ignore_sigpipe();
        int sp[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sp), 0);
        channel_ = std::make_unique<FakeChannel>(sp[0]);
        remote_ = sp[1];

        int a[2], b[2];
        ASSERT_EQ(pipe(a), 0);
        ASSERT_EQ(pipe(b), 0);
        in_rd_ = a[0];
        in_wr_ = a[1];
        out_rd_ = b[0];
        out_wr_ = b[1];

        for (auto s : {SessionState::CONNECTING, SessionState::AUTHENTICATING,
                       SessionState::SHELL_REQUESTED, SessionState::INTERACTIVE}) {
            ASSERT_TRUE(state_.transition(s).is_ok());
        }
    }

    void TearDown() override {
        channel_.reset();
        for (int fd : {remote_, in_rd_, in_wr_, out_rd_, out_wr_}) {
            if (fd >= 0) close(fd);
        }
    }

    LoopOutcome run_loop() {
        LocalTerminal terminal(in_rd_, out_wr_);
        HelperLauncher launcher(settings_, in_rd_, out_wr_);
        StreamRouter router(*channel_, terminal, state_, launcher, trace_);
        LoopContext ctx{*channel_, terminal, router, cancel_, trace_, settings_};
        AsyncLoop loop(ioc_);
        auto outcome = loop.run(ctx);
        transfers_ = router.transfer_count();
        return outcome;
    }

    std::string drain_output() {
        platform::set_nonblocking(out_rd_);
        std::string got;
        char buf[256];
        for (;;) {
            auto r = platform::read_nonblocking(out_rd_, buf, sizeof(buf));
            if (r.status != platform::IoStatus::DATA) break;
            got.append(buf, r.n);
        }
        return got;
    }
};

TEST_F(AsyncLoopTest, RemoteOutputThenEof) {
    ASSERT_EQ(write(remote_, "motd\r\n$ ", 8), 8);
    shutdown(remote_, SHUT_WR);

    auto outcome = run_loop();
    EXPECT_EQ(outcome.exit, LoopExit::REMOTE_EOF);
    EXPECT_EQ(drain_output(), "motd\r\n$ ");
}

TEST_F(AsyncLoopTest, LocalInputReachesChannelThenLocalEof) {
    ASSERT_EQ(write(in_wr_, "pwd\r", 4), 4);
    close(in_wr_);
    in_wr_ = -1;

    auto outcome = run_loop();
    EXPECT_EQ(outcome.exit, LoopExit::LOCAL_EOF);

    platform::set_nonblocking(remote_);
    char buf[16];
    auto r = platform::read_nonblocking(remote_, buf, sizeof(buf));
    ASSERT_EQ(r.status, platform::IoStatus::DATA);
    EXPECT_EQ(std::string(buf, r.n), "pwd\r");
}

TEST_F(AsyncLoopTest, PreCancelledTokenStopsOnFirstTick) {
    cancel_.cancel();
    auto start = steady_clock::now();
    auto outcome = run_loop();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
    EXPECT_EQ(outcome.exit, LoopExit::CANCELLED);
    EXPECT_LT(elapsed, ASYNC_TICK_MS + 500);
}

TEST_F(AsyncLoopTest, StderrGoesToTerminal) {
    channel_->set_stderr("warning: something\n");
    shutdown(remote_, SHUT_WR);

    auto outcome = run_loop();
    EXPECT_EQ(outcome.exit, LoopExit::REMOTE_EOF);
    EXPECT_EQ(drain_output(), "warning: something\n");
}

TEST_F(AsyncLoopTest, UploadPromptDoesNotStallChannel) {
    // No picker and no prompt hook: the path is read from the terminal
    ASSERT_EQ(write(in_wr_, "rz\r", 3), 3);
    std::thread remote([this] {
        platform::sleep_ms(150);
        shutdown(remote_, SHUT_WR);
    });
    std::thread guard([this] {
        for (int i = 0; i < 300 && !cancel_.cancelled(); i++) platform::sleep_ms(10);
        cancel_.cancel();
    });

    auto start = steady_clock::now();
    auto outcome = run_loop();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
    cancel_.cancel();
    remote.join();
    guard.join();

    EXPECT_EQ(outcome.exit, LoopExit::REMOTE_EOF);
    EXPECT_LT(elapsed, 1000);
    EXPECT_EQ(state_.state(), SessionState::INTERACTIVE);
    EXPECT_EQ(transfers_, 1);
    EXPECT_NE(drain_output().find("local file to upload"), std::string::npos);
}

TEST_F(AsyncLoopTest, DownloadHelperOutputReachesRemote) {
    settings_.receive_helper = "head";
    settings_.receive_helper_args = {"-c", "10"};
    std::string zmodem = "**\x18" "B0123456789ab";

    std::string echoed;
    std::thread remote([&] {
        ASSERT_EQ(write(remote_, zmodem.data(), zmodem.size()), (ssize_t)zmodem.size());
        char buf[64];
        auto deadline = steady_clock::now() + seconds(3);
        while (echoed.size() < 10 && steady_clock::now() < deadline) {
            if (!platform::wait_readable(remote_, 20)) continue;
            ssize_t n = read(remote_, buf, sizeof(buf));
            if (n <= 0) break;
            echoed.append(buf, n);
        }
        platform::sleep_ms(300);
        ASSERT_EQ(write(remote_, "done\r\n", 6), 6);
        shutdown(remote_, SHUT_WR);
    });

    auto outcome = run_loop();
    remote.join();

    EXPECT_EQ(outcome.exit, LoopExit::REMOTE_EOF);
    EXPECT_EQ(echoed, zmodem.substr(0, 10));
    EXPECT_EQ(state_.state(), SessionState::INTERACTIVE);
    EXPECT_EQ(transfers_, 1);
    EXPECT_NE(drain_output().find("done\r\n"), std::string::npos);
}

TEST_F(AsyncLoopTest, LargeOutputArrivesInOrder) {
    std::string expected;
    for (int i = 0; i < 10000; i++) expected += "line " + std::to_string(i) + "\r\n";
    ASSERT_GT(expected.size(), 64u * 1024);

    std::thread remote([&] {
        const char* p = expected.data();
        std::size_t left = expected.size();
        while (left > 0) {
            ssize_t n = write(remote_, p, left);
            if (n <= 0) break;
            p += n;
            left -= n;
        }
        shutdown(remote_, SHUT_WR);
    });

    std::string got;
    std::thread terminal([&] {
        char buf[4096];
        auto deadline = steady_clock::now() + seconds(5);
        while (got.size() < expected.size() && steady_clock::now() < deadline) {
            if (!platform::wait_readable(out_rd_, 20)) continue;
            ssize_t n = read(out_rd_, buf, sizeof(buf));
            if (n > 0) got.append(buf, n);
        }
    });

    auto outcome = run_loop();
    remote.join();
    terminal.join();

    EXPECT_EQ(outcome.exit, LoopExit::REMOTE_EOF);
    ASSERT_EQ(got.size(), expected.size());
    EXPECT_TRUE(got == expected);
}

// ── Through SessionBridge with the async backend ──

class AsyncBridgeTest : public ::testing::Test {
protected:
    int master_ = -1;
    int slave_ = -1;
    Settings settings_;
    CancellationToken cancel_;
    TraceSink trace_;
    ConnectTarget target_;
    net::io_context ioc_;

    void SetUp() override {
        ASSERT_EQ(openpty(&master_, &slave_, nullptr, nullptr, nullptr), 0);
        platform::TerminalGuard::reset_stats();
        target_.host = "example.org";
        target_.username = "alice";
    }

    void TearDown() override {
        close(slave_);
        close(master_);
    }

    std::unique_ptr<SessionBridge> make_bridge(FakeScript script) {
        auto transport = std::make_unique<FakeTransport>(std::move(script), TransportBackend::ASYNC);
        auto bridge = std::make_unique<SessionBridge>(std::move(transport), settings_, cancel_, trace_);
        bridge->set_terminal_fds(slave_, slave_);
        bridge->set_async_context(&ioc_);
        return bridge;
    }
};

TEST_F(AsyncBridgeTest, RelaysAndReturnsRemoteStatus) {
    FakeScript script;
    script.shell_status = 4;
    script.on_shell = [](int remote) {
        ASSERT_EQ(write(remote, "bye\r\n", 5), 5);
        shutdown(remote, SHUT_WR);
    };
    auto bridge = make_bridge(script);

    EXPECT_EQ(bridge->run_interactive(target_), 4);
    EXPECT_EQ(bridge->state(), SessionState::TERMINATED);

    std::string got;
    char buf[64];
    auto deadline = steady_clock::now() + seconds(2);
    while (got.size() < 5 && steady_clock::now() < deadline) {
        if (!platform::wait_readable(master_, 20)) continue;
        ssize_t n = read(master_, buf, sizeof(buf));
        if (n > 0) got.append(buf, n);
    }
    EXPECT_EQ(got, "bye\r\n");

    auto stats = platform::TerminalGuard::stats();
    EXPECT_EQ(stats.entered, 1);
    EXPECT_EQ(stats.restored, 1);
}

TEST_F(AsyncBridgeTest, CancellationFromAnotherThread) {
    FakeScript script;
    auto bridge = make_bridge(script);

    int code = -1;
    std::thread session([&] { code = bridge->run_interactive(target_); });

    auto deadline = steady_clock::now() + seconds(2);
    while (bridge->state() != SessionState::INTERACTIVE && steady_clock::now() < deadline) {
        platform::sleep_ms(1);
    }
    auto cancelled_at = steady_clock::now();
    cancel_.cancel();
    session.join();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - cancelled_at).count();

    EXPECT_EQ(code, EXIT_CANCELLED);
    EXPECT_EQ(bridge->state(), SessionState::TERMINATED);
    EXPECT_LT(elapsed, ASYNC_TICK_MS + 300);
    EXPECT_EQ(platform::TerminalGuard::stats().restored, 1);
}
