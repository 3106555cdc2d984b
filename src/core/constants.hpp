#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + handshake + auth
constexpr int DEFAULT_POLL_INTERVAL_MS   = 5;     // Busy-poll sleep between loop iterations
constexpr int ASYNC_TICK_MS              = 50;    // Cancellation checkpoint in the async loop
constexpr int EXEC_READ_TIMEOUT_SECS     = 300;   // Max time waiting for a remote command
constexpr int CHANNEL_CLOSE_TIMEOUT_MS   = 2000;  // Wait for the remote close acknowledgement
constexpr int LOCAL_WRITE_TIMEOUT_MS     = 5000;  // write_all deadline on a stalled terminal

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t LOCAL_READ_BUF_SIZE   = 1024;
constexpr std::size_t CHANNEL_READ_BUF_SIZE = 16384;
constexpr std::size_t HELPER_READ_BUF_SIZE  = 16384;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_CONFIG_ERROR          = 2;
constexpr int EXIT_TRANSPORT_FAILURE     = 255;   // same as ssh(1)
constexpr int EXIT_CANCELLED             = 130;   // 128 + SIGINT

// ── Terminal ────────────────────────────────────────────────
constexpr const char* DEFAULT_TERM_TYPE  = "xterm-256color";
constexpr int DEFAULT_TERM_COLS          = 80;
constexpr int DEFAULT_TERM_ROWS          = 24;

// Alt+D as delivered by the terminal: ESC 'd'. Toggles the trace sink.
constexpr unsigned char TRACE_TOGGLE_KEY[] = {0x1B, 'd'};

// ── SSH ─────────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int SSH_KEEPALIVE_SECS         = 30;
