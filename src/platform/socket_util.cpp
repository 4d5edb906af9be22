#include "socket_util.hpp"
#include <fmt/format.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(int sock, bool enabled) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    fcntl(sock, F_SETFL, flags);
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

// Non-blocking connect on one resolved address, waiting at most timeout_ms.
static int connect_one(const struct addrinfo* rp, int timeout_ms, std::string& err) {
    int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock < 0) {
        err = fmt::format("socket: {}", std::strerror(errno));
        return -1;
    }

    set_nonblocking(sock, true);
    int ret = ::connect(sock, rp->ai_addr, rp->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        err = fmt::format("connect: {}", std::strerror(errno));
        close_socket(sock);
        return -1;
    }

    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            err = "connection timed out";
            close_socket(sock);
            return -1;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            err = fmt::format("connect: {}", std::strerror(sock_err));
            close_socket(sock);
            return -1;
        }
    }

    set_nonblocking(sock, false);
    return sock;
}

int connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        err = fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai));
        return -1;
    }

    int sock = -1;
    for (auto* rp = res; rp != nullptr; rp = rp->ai_next) {
        sock = connect_one(rp, timeout_ms, err);
        if (sock >= 0) break;
    }
    freeaddrinfo(res);

    if (sock < 0) {
        err = fmt::format("Failed to connect to {}:{} ({})", host, port, err);
    }
    return sock;
}

void enable_keepalive(int sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
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

void close_socket(int sock) {
    if (sock >= 0) ::close(sock);
}

} // namespace platform
