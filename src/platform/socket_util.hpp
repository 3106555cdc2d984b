#pragma once

// Socket utilities for the libssh2 transports.

#include <poll.h>
#include <string>
#include <core/types.hpp>

#define RZTERM_INVALID_SOCKET (-1)

namespace platform {

// Resolve host and open a non-blocking TCP connection, waiting at most
// timeout_ms for it to complete. Errors are TRANSPORT errors.
Result<int> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probes on a connected socket.
void enable_keepalive(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

// Close a socket.
void close_socket(int sock);

} // namespace platform
