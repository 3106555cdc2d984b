#include <gtest/gtest.h>
#include <bridge/session_bridge.hpp>
#include <core/constants.hpp>
#include <platform/nonblocking_io.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include "fake_transport.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <pty.h>
#include <sys/socket.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono;

static bool same_attrs(const termios& a, const termios& b) {
    return a.c_iflag == b.c_iflag && a.c_oflag == b.c_oflag && a.c_cflag == b.c_cflag &&
           a.c_lflag == b.c_lflag && std::memcmp(a.c_cc, b.c_cc, sizeof(a.c_cc)) == 0;
}

class SessionBridgeTest : public ::testing::Test {
protected:
    int master_ = -1;
    int slave_ = -1;
    termios before_{};
    Settings settings_;
    CancellationToken cancel_;
    TraceSink trace_;
    ConnectTarget target_;

    void SetUp() override {
        ASSERT_EQ(openpty(&master_, &slave_, nullptr, nullptr, nullptr), 0);
        ASSERT_EQ(tcgetattr(slave_, &before_), 0);
        platform::TerminalGuard::reset_stats();
        target_.host = "example.org";
        target_.username = "alice";
    }

    void TearDown() override {
        close(slave_);
        close(master_);
    }

    std::unique_ptr<SessionBridge> make_bridge(FakeTransport*& fake, FakeScript script,
                                               TransportBackend backend = TransportBackend::LIBRARY) {
        auto transport = std::make_unique<FakeTransport>(std::move(script), backend);
        fake = transport.get();
        auto bridge = std::make_unique<SessionBridge>(std::move(transport), settings_, cancel_, trace_);
        bridge->set_terminal_fds(slave_, slave_);
        return bridge;
    }

    std::string read_master(std::size_t want, int timeout_ms = 2000) {
        std::string got;
        char buf[256];
        auto deadline = steady_clock::now() + milliseconds(timeout_ms);
        while (got.size() < want && steady_clock::now() < deadline) {
            if (!platform::wait_readable(master_, 20)) continue;
            ssize_t n = read(master_, buf, sizeof(buf));
            if (n > 0) got.append(buf, n);
        }
        return got;
    }

    bool attrs_restored() {
        termios after{};
        if (tcgetattr(slave_, &after) != 0) return false;
        return same_attrs(before_, after);
    }
};

// ── Exec ──

TEST_F(SessionBridgeTest, ExecEchoHi) {
    FakeScript script;
    script.exec_stdout = "hi\n";
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    auto r = bridge->execute(target_, "echo hi");
    ASSERT_TRUE(r.is_ok()) << describe(r.error);
    EXPECT_EQ(r.value.stdout_data, "hi\n");
    EXPECT_EQ(r.value.stderr_data, "");
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(fake->last_command(), "echo hi");
    EXPECT_EQ(bridge->state(), SessionState::TERMINATED);
    EXPECT_EQ(fake->channel()->close_count(), 1);

    auto stats = platform::TerminalGuard::stats();
    EXPECT_EQ(stats.entered, 0);
    EXPECT_EQ(stats.restored, 0);
}

TEST_F(SessionBridgeTest, ExecCollectsStderrAndStatus) {
    FakeScript script;
    script.exec_stdout = "partial";
    script.exec_stderr = "oops\n";
    script.exec_status = 3;
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    auto r = bridge->execute(target_, "false");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.stdout_data, "partial");
    EXPECT_EQ(r.value.stderr_data, "oops\n");
    EXPECT_EQ(r.value.exit_code, 3);
    EXPECT_TRUE(r.value.failed());
}

TEST_F(SessionBridgeTest, ExecAuthFailure) {
    FakeScript script;
    script.auth_error = auth_error(AuthReason::PASSWORD_REJECTED, "denied");
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    auto r = bridge->execute(target_, "true");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::AUTH);
    EXPECT_EQ(r.error.auth_reason, AuthReason::PASSWORD_REJECTED);
    EXPECT_EQ(bridge->state(), SessionState::FAILED);
}

TEST_F(SessionBridgeTest, ExecCancelled) {
    FakeScript script;
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);
    cancel_.cancel();
    auto r = bridge->execute(target_, "sleep 100");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::CANCELLED);
}

// ── Failures before the shell ──

TEST_F(SessionBridgeTest, ConnectFailureNeverTouchesTerminal) {
    FakeScript script;
    script.connect_error = SessionError{ErrorKind::TRANSPORT, AuthReason::NONE, "Connection refused"};
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    EXPECT_EQ(bridge->run_interactive(target_), EXIT_TRANSPORT_FAILURE);
    EXPECT_EQ(bridge->state(), SessionState::FAILED);
    EXPECT_EQ(bridge->last_error().kind, ErrorKind::TRANSPORT);

    auto stats = platform::TerminalGuard::stats();
    EXPECT_EQ(stats.entered, 0);
    EXPECT_EQ(stats.restored, 0);
    EXPECT_TRUE(attrs_restored());
}

TEST_F(SessionBridgeTest, AuthFailureNeverTouchesTerminal) {
    FakeScript script;
    script.auth_error = auth_error(AuthReason::NO_IDENTITY_ACCEPTED, "agent had no usable key");
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    EXPECT_EQ(bridge->run_interactive(target_), EXIT_TRANSPORT_FAILURE);
    EXPECT_EQ(bridge->last_error().auth_reason, AuthReason::NO_IDENTITY_ACCEPTED);
    EXPECT_EQ(platform::TerminalGuard::stats().entered, 0);
}

TEST_F(SessionBridgeTest, ShellRefusedNeverTouchesTerminal) {
    FakeScript script;
    script.shell_error = SessionError{ErrorKind::CHANNEL, AuthReason::NONE, "pty refused"};
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    EXPECT_EQ(bridge->run_interactive(target_), EXIT_TRANSPORT_FAILURE);
    EXPECT_EQ(bridge->last_error().kind, ErrorKind::CHANNEL);
    EXPECT_EQ(platform::TerminalGuard::stats().entered, 0);
}

TEST_F(SessionBridgeTest, MalformedTargetIsConfigError) {
    FakeScript script;
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);
    target_.host = "";

    EXPECT_EQ(bridge->run_interactive(target_), EXIT_CONFIG_ERROR);
    EXPECT_EQ(fake->connect_calls(), 0);
    EXPECT_EQ(bridge->last_error().kind, ErrorKind::CONFIG);
}

TEST_F(SessionBridgeTest, PasswordWithExecBackendIsConfigError) {
    FakeScript script;
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script, TransportBackend::EXEC_REPLACE);
    target_.credential = PasswordCredential{"pw"};

    EXPECT_EQ(bridge->run_interactive(target_), EXIT_CONFIG_ERROR);
    EXPECT_EQ(fake->connect_calls(), 0);
}

// ── Interactive ──

TEST_F(SessionBridgeTest, RemoteEofEndsCleanly) {
    FakeScript script;
    script.shell_status = 7;
    script.on_shell = [](int remote) {
        ASSERT_EQ(write(remote, "welcome\r\n", 9), 9);
        shutdown(remote, SHUT_WR);
    };
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    EXPECT_EQ(bridge->run_interactive(target_), 7);
    EXPECT_EQ(read_master(9), "welcome\r\n");
    EXPECT_EQ(bridge->state(), SessionState::TERMINATED);
    EXPECT_EQ(fake->channel()->close_count(), 1);
    EXPECT_EQ(fake->last_term(), settings_.term);

    auto stats = platform::TerminalGuard::stats();
    EXPECT_EQ(stats.entered, 1);
    EXPECT_EQ(stats.restored, 1);
    EXPECT_TRUE(attrs_restored());

    auto history = bridge->state_machine().history();
    ASSERT_GE(history.size(), 3u);
    EXPECT_EQ(history[history.size() - 2], SessionState::CLOSING);
}

TEST_F(SessionBridgeTest, UnknownRemoteStatusExitsZero) {
    FakeScript script;
    script.on_shell = [](int remote) { shutdown(remote, SHUT_WR); };
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);
    EXPECT_EQ(bridge->run_interactive(target_), 0);
}

TEST_F(SessionBridgeTest, KeystrokesReachRemote) {
    std::atomic<int> remote{-1};
    FakeScript script;
    script.on_shell = [&remote](int fd) { remote = fd; };
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    int code = -1;
    std::thread session([&] { code = bridge->run_interactive(target_); });

    auto deadline = steady_clock::now() + seconds(2);
    while (remote < 0 && steady_clock::now() < deadline) platform::sleep_ms(5);
    while (bridge->state() != SessionState::INTERACTIVE && steady_clock::now() < deadline) {
        platform::sleep_ms(1);
    }
    ASSERT_GE(remote.load(), 0);
    ASSERT_EQ(bridge->state(), SessionState::INTERACTIVE);

    ASSERT_EQ(write(master_, "ls\r", 3), 3);
    std::string got;
    char buf[16];
    while (got.size() < 3 && steady_clock::now() < deadline) {
        if (!platform::wait_readable(remote, 20)) continue;
        ssize_t n = read(remote, buf, sizeof(buf));
        if (n > 0) got.append(buf, n);
    }
    EXPECT_EQ(got, "ls\r");

    cancel_.cancel();
    session.join();
    EXPECT_EQ(code, EXIT_CANCELLED);
}

TEST_F(SessionBridgeTest, CancellationTerminatesWithinOnePollInterval) {
    settings_.poll_interval_ms = 20;
    std::atomic<bool> shell_open{false};
    FakeScript script;
    script.on_shell = [&shell_open](int) { shell_open = true; };
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);

    int code = -1;
    std::thread session([&] { code = bridge->run_interactive(target_); });

    auto deadline = steady_clock::now() + seconds(2);
    while (!shell_open && steady_clock::now() < deadline) platform::sleep_ms(5);
    while (bridge->state() != SessionState::INTERACTIVE && steady_clock::now() < deadline) {
        platform::sleep_ms(1);
    }
    ASSERT_EQ(bridge->state(), SessionState::INTERACTIVE);

    auto cancelled_at = steady_clock::now();
    cancel_.cancel();
    session.join();
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - cancelled_at).count();

    EXPECT_EQ(code, EXIT_CANCELLED);
    EXPECT_EQ(bridge->state(), SessionState::TERMINATED);
    // One interval plus scheduling slack
    EXPECT_LT(elapsed, settings_.poll_interval_ms + 200);
    EXPECT_TRUE(attrs_restored());
    EXPECT_EQ(fake->channel()->close_count(), 1);

    auto stats = platform::TerminalGuard::stats();
    EXPECT_EQ(stats.entered, 1);
    EXPECT_EQ(stats.restored, 1);
}

TEST_F(SessionBridgeTest, ReadinessStrategyRelaysOutput) {
    settings_.wait_strategy = WaitStrategy::READINESS;
    FakeScript script;
    script.on_shell = [](int remote) {
        ASSERT_EQ(write(remote, "$ ", 2), 2);
        shutdown(remote, SHUT_WR);
    };
    FakeTransport* fake = nullptr;
    auto bridge = make_bridge(fake, script);
    EXPECT_EQ(bridge->run_interactive(target_), 0);
    EXPECT_EQ(read_master(2), "$ ");
}

TEST(SessionBridgeExitCodes, Mapping) {
    EXPECT_EQ(SessionBridge::exit_code_for(SessionError{}), 0);
    EXPECT_EQ(SessionBridge::exit_code_for(SessionError{ErrorKind::CONFIG, AuthReason::NONE, ""}), 2);
    EXPECT_EQ(SessionBridge::exit_code_for(SessionError{ErrorKind::CANCELLED, AuthReason::NONE, ""}), 130);
    EXPECT_EQ(SessionBridge::exit_code_for(auth_error(AuthReason::KEY_REJECTED, "")), 255);
    EXPECT_EQ(SessionBridge::exit_code_for(SessionError{ErrorKind::IO, AuthReason::NONE, ""}), 255);
}
