#pragma once

// POSIX socket utilities.

#include <string>
#include <poll.h>
#include <core/types.hpp>
#include <core/deadline.hpp>

using socket_t = int;
#define JUMPRUN_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Enable TCP keepalive probing on a connected socket.
void enable_keepalive(socket_t sock);

enum class ConnectFailure {
    Unresolved,
    Refused,
    TimedOut,
    Cancelled,
};

struct ConnectResult {
    socket_t sock = JUMPRUN_INVALID_SOCKET;
    ConnectFailure failure = ConnectFailure::Refused;
    std::string error;

    bool ok() const { return sock != JUMPRUN_INVALID_SOCKET; }
};

// Resolve host (IPv4/IPv6/name) and connect a non-blocking TCP socket,
// trying each address until one connects or the deadline passes.
ConnectResult connect_tcp(const std::string& host, int port, const Deadline& deadline);

// Connected pair of local stream sockets; both ends are non-blocking.
Result<std::pair<socket_t, socket_t>> make_socketpair();

} // namespace platform
