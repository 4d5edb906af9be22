#pragma once

// POSIX socket helpers used by the libssh2 transport.

#include <poll.h>
#include <string>

namespace platform {

// Set a socket to non-blocking (true) or blocking (false) mode.
void set_nonblocking(int sock, bool enabled = true);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(int sock, short events, int timeout_ms);

// Resolve host:port and connect with a bounded wait. Returns the connected
// (blocking) socket, or -1 with err filled.
int connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// Enable TCP keepalive probing on the socket.
void enable_keepalive(int sock);

// Close a socket.
void close_socket(int sock);

} // namespace platform
