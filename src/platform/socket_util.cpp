#include "socket_util.hpp"
#include "nonblocking_io.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <fmt/format.h>

namespace platform {

// Try one resolved address. Returns the connected socket or -1 with err set.
static int connect_one(const struct addrinfo* ai, int timeout_ms, int& err) {
    int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        err = errno;
        return RZTERM_INVALID_SOCKET;
    }

    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        err = errno;
        close_socket(sock);
        return RZTERM_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            err = ETIMEDOUT;
            close_socket(sock);
            return RZTERM_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            err = sock_err;
            close_socket(sock);
            return RZTERM_INVALID_SOCKET;
        }
    }
    return sock;
}

Result<int> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return Result<int>::Err(ErrorKind::TRANSPORT,
                                fmt::format("Failed to resolve host {}: {}", host, gai_strerror(rc)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int err = 0;
    int sock = RZTERM_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            err = ETIMEDOUT;
            break;
        }
        sock = connect_one(ai, static_cast<int>(remaining), err);
        if (sock >= 0) break;
    }
    freeaddrinfo(res);

    if (sock < 0) {
        if (err == ETIMEDOUT) {
            return Result<int>::Err(ErrorKind::TRANSPORT,
                                    fmt::format("Connection timed out: {}:{}", host, port));
        }
        return Result<int>::Err(ErrorKind::TRANSPORT,
                                fmt::format("Failed to connect to {}:{}: {}", host, port,
                                            std::strerror(err)));
    }
    return Result<int>::Ok(sock);
}

void enable_keepalive(int sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(int sock) {
    if (sock >= 0) close(sock);
}

} // namespace platform
