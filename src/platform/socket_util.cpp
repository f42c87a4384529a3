#include "socket_util.hpp"
#include <core/constants.hpp>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

void enable_keepalive(socket_t sock) {
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

// Wait for a non-blocking connect to finish. Returns 0 on success, the
// socket error otherwise, or ETIMEDOUT/ECANCELED when the deadline wins.
static int wait_connected(socket_t sock, const Deadline& deadline) {
    while (true) {
        if (deadline.cancelled()) return ECANCELED;
        if (deadline.expired()) return ETIMEDOUT;

        int revents = poll_socket(sock, POLLOUT, deadline.remaining_ms(100));
        if (revents == 0) continue;

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) != 0) {
            return errno;
        }
        return sock_err;
    }
}

// Shared between connect_tcp and its resolver thread; whichever side
// finishes last owns the addrinfo list.
struct Resolution {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int gai = 0;
    struct addrinfo* addrs = nullptr;
};

static bool resolve_stopped(const std::string& host, const Deadline& deadline, ConnectResult& result) {
    if (deadline.cancelled()) {
        result.failure = ConnectFailure::Cancelled;
        result.error = fmt::format("Resolving host {} cancelled", host);
        return true;
    }
    if (deadline.expired()) {
        result.failure = ConnectFailure::TimedOut;
        result.error = fmt::format("Resolving host {} timed out", host);
        return true;
    }
    return false;
}

// getaddrinfo has no timeout of its own, so it runs on a detached thread
// and the caller waits only as long as the deadline allows.
static bool resolve_host(const std::string& host, int port, const Deadline& deadline,
                         struct addrinfo** out, ConnectResult& result) {
    if (resolve_stopped(host, deadline, result)) return false;

    auto state = std::make_shared<Resolution>();
    std::string service = std::to_string(port);

    try {
        std::thread([state, host, service] {
            struct addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo* addrs = nullptr;
            int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);

            std::lock_guard<std::mutex> lock(state->mu);
            if (state->abandoned) {
                if (addrs) freeaddrinfo(addrs);
                return;
            }
            state->gai = gai;
            state->addrs = addrs;
            state->done = true;
            state->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        result.failure = ConnectFailure::Unresolved;
        result.error = fmt::format("Failed to resolve host {}: {}", host, e.what());
        return false;
    }

    std::unique_lock<std::mutex> lock(state->mu);
    while (!state->done) {
        if (resolve_stopped(host, deadline, result)) {
            state->abandoned = true;
            return false;
        }
        int wait_ms = std::max(1, deadline.remaining_ms(IO_POLL_INTERVAL_MS));
        state->cv.wait_for(lock, std::chrono::milliseconds(wait_ms));
    }

    if (state->gai != 0 || !state->addrs) {
        if (state->addrs) freeaddrinfo(state->addrs);
        result.failure = ConnectFailure::Unresolved;
        result.error = fmt::format("Failed to resolve host {}: {}", host, gai_strerror(state->gai));
        return false;
    }
    *out = state->addrs;
    return true;
}

ConnectResult connect_tcp(const std::string& host, int port, const Deadline& deadline) {
    ConnectResult result;

    struct addrinfo* addrs = nullptr;
    if (!resolve_host(host, port, deadline, &addrs, result)) return result;

    std::string last_error = "no usable address";
    for (auto* ai = addrs; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        int err = 0;
        if (ret < 0) {
            err = (errno == EINPROGRESS) ? wait_connected(sock, deadline) : errno;
        }

        if (err == 0) {
            freeaddrinfo(addrs);
            enable_keepalive(sock);
            result.sock = sock;
            return result;
        }

        close_socket(sock);
        if (err == ETIMEDOUT && deadline.expired()) {
            freeaddrinfo(addrs);
            result.failure = ConnectFailure::TimedOut;
            result.error = fmt::format("Connection to {}:{} timed out", host, port);
            return result;
        }
        if (err == ECANCELED) {
            freeaddrinfo(addrs);
            result.failure = ConnectFailure::Cancelled;
            result.error = fmt::format("Connection to {}:{} cancelled", host, port);
            return result;
        }
        last_error = std::strerror(err);
    }

    freeaddrinfo(addrs);
    result.failure = ConnectFailure::Refused;
    result.error = fmt::format("Failed to connect to {}:{}: {}", host, port, last_error);
    return result;
}

Result<std::pair<socket_t, socket_t>> make_socketpair() {
    int sv[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv) < 0) {
        return Result<std::pair<socket_t, socket_t>>::Err(
            fmt::format("socketpair() failed: {}", std::strerror(errno)));
    }
    set_nonblocking(sv[0]);
    set_nonblocking(sv[1]);
    return Result<std::pair<socket_t, socket_t>>::Ok({sv[0], sv[1]});
}

} // namespace platform
