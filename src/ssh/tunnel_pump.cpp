#include "tunnel_pump.hpp"
#include <core/constants.hpp>
#include <core/deadline.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

TunnelPump::TunnelPump(LIBSSH2_SESSION* outer_session,
                       LIBSSH2_CHANNEL* channel,
                       std::shared_ptr<std::mutex> outer_mutex,
                       socket_t outer_sock,
                       socket_t local_end)
    : outer_session_(outer_session), channel_(channel),
      outer_mutex_(std::move(outer_mutex)), outer_sock_(outer_sock),
      local_end_(local_end) {}

TunnelPump::~TunnelPump() {
    stop();
}

void TunnelPump::start() {
    thread_ = std::thread(&TunnelPump::run, this);
}

void TunnelPump::run() {
    char buf[TUNNEL_BUF_SIZE];
    std::string to_local;
    std::string to_channel;

    while (!stop_.load()) {
        struct pollfd fds[2];
        fds[0] = {outer_sock_, POLLIN, 0};
        fds[1] = {local_end_, static_cast<short>(to_channel.empty() ? POLLIN : 0), 0};
        if (!to_local.empty()) fds[1].events |= POLLOUT;
        poll(fds, 2, IO_POLL_INTERVAL_MS * 5);

        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            lost_ = true;
            break;
        }

        // channel → local
        bool remote_closed = false;
        while (to_local.size() < static_cast<size_t>(TUNNEL_BUF_SIZE) * 4) {
            ssize_t n;
            {
                std::lock_guard<std::mutex> lock(*outer_mutex_);
                n = libssh2_channel_read(channel_, buf, sizeof(buf));
                if (n == 0 && libssh2_channel_eof(channel_)) remote_closed = true;
            }
            if (n > 0) {
                to_local.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                lost_ = true;
            }
            break;
        }

        while (!to_local.empty()) {
            ssize_t w = ::write(local_end_, to_local.data(), to_local.size());
            if (w > 0) {
                to_local.erase(0, static_cast<size_t>(w));
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
            // Inner session went away
            stop_ = true;
            break;
        }

        if (lost_.load() || (remote_closed && to_local.empty())) {
            lost_ = true;
            break;
        }

        // local → channel
        if (to_channel.empty() && (fds[1].revents & (POLLIN | POLLHUP))) {
            ssize_t n = ::read(local_end_, buf, sizeof(buf));
            if (n > 0) {
                to_channel.assign(buf, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            }
        }

        while (!to_channel.empty()) {
            ssize_t w;
            {
                std::lock_guard<std::mutex> lock(*outer_mutex_);
                w = libssh2_channel_write(channel_, to_channel.data(), to_channel.size());
            }
            if (w > 0) {
                to_channel.erase(0, static_cast<size_t>(w));
                continue;
            }
            if (w != LIBSSH2_ERROR_EAGAIN) lost_ = true;
            break;
        }
        if (lost_.load()) break;
    }

    // Let the inner session see EOF instead of hanging on a dead tunnel
    ::shutdown(local_end_, SHUT_RDWR);
}

RemoteResult<void> TunnelPump::stop() {
    if (stopped_) return RemoteResult<void>::Ok();
    stopped_ = true;

    stop_ = true;
    if (thread_.joinable()) thread_.join();

    std::string error;
    if (channel_) {
        auto deadline = Deadline::after(std::chrono::milliseconds(CLOSE_GRACE_MS));
        int rc;
        while (true) {
            {
                std::lock_guard<std::mutex> lock(*outer_mutex_);
                rc = libssh2_channel_close(channel_);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN || deadline.expired()) break;
            platform::sleep_ms(IO_POLL_INTERVAL_MS);
        }
        // A lost outer connection cannot acknowledge the close; that is expected
        if (rc != 0 && !lost_.load()) {
            error = fmt::format("closing tunnel channel failed (rc={})", rc);
        }
        {
            std::lock_guard<std::mutex> lock(*outer_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }

    if (local_end_ >= 0) {
        platform::close_socket(local_end_);
        local_end_ = JUMPRUN_INVALID_SOCKET;
    }

    if (!error.empty()) {
        return RemoteResult<void>::Err(ErrorKind::TransportLost, error);
    }
    return RemoteResult<void>::Ok();
}
