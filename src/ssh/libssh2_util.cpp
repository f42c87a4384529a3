#include "libssh2_util.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <fmt/format.h>

std::string libssh2_error(LIBSSH2_SESSION* session) {
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len == 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

bool wait_session(LIBSSH2_SESSION* session, socket_t sock, const Deadline& deadline) {
    if (deadline.done()) return false;

    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock, events, deadline.remaining_ms(IO_POLL_INTERVAL_MS * 10));
    return !deadline.done();
}

RemoteError deadline_error(const Deadline& deadline, ErrorKind timeout_kind,
                           const std::string& what) {
    if (deadline.cancelled()) {
        return RemoteError{ErrorKind::Cancelled, fmt::format("{}: cancelled", what)};
    }
    return RemoteError{timeout_kind, fmt::format("{}: timed out", what)};
}
