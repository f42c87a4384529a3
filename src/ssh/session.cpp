#include "session.hpp"
#include "auth.hpp"
#include "host_key.hpp"
#include "libssh2_util.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>

SshSession::SshSession(const RemoteDescriptor& hop, Logger log)
    : hop_(hop), log_(std::move(log)), session_(nullptr), sock_(JUMPRUN_INVALID_SOCKET),
      io_mutex_(std::make_shared<std::mutex>()), active_(false), closed_(false) {
}

SshSession::~SshSession() {
    auto result = close();
    if (result.is_err()) {
        log_.error("Closing session in destructor failed",
                   {{"host", hop_.identity()}, {"error", result.error.message}});
    }
}

RemoteError SshSession::transport_error(const std::string& what) const {
    if (tunnel_ && tunnel_->lost()) {
        return RemoteError{ErrorKind::TransportLost,
                           fmt::format("{}: tunnel through previous hop lost", what)};
    }
    return RemoteError{ErrorKind::TransportLost, fmt::format("{}: {}", what, libssh2_error(session_))};
}

// ── Establish ──────────────────────────────────────────────────

RemoteResult<void> SshSession::establish(SshSession* via, const HopOptions& options,
                                         const Deadline& deadline) {
    log_.debug(via ? "Opening tunneled hop" : "Opening direct hop",
               {{"host", hop_.identity()}});

    auto step = open_transport(via, deadline);
    if (step.is_ok()) step = handshake(deadline);
    if (step.is_ok()) {
        step = verify_host_key(session_, hop_, options.known_hosts_path,
                               options.strict_host_key_checking, log_);
    }
    if (step.is_ok()) {
        step = authenticate(session_, sock_, hop_, options.identity_files, deadline, log_);
    }

    if (step.is_err()) {
        // Release the partial hop; it never became part of a chain
        auto cleanup = close();
        if (cleanup.is_err()) {
            log_.debug("Releasing partial hop failed",
                       {{"host", hop_.identity()}, {"error", cleanup.error.message}});
        }
        return step;
    }

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    active_ = true;
    log_.info("Hop established", {{"host", hop_.identity()}, {"tunneled", via ? "yes" : "no"}});
    return RemoteResult<void>::Ok();
}

RemoteResult<void> SshSession::open_transport(SshSession* via, const Deadline& deadline) {
    if (!via) {
        auto conn = platform::connect_tcp(hop_.host, hop_.port, deadline);
        if (conn.ok()) {
            sock_ = conn.sock;
            platform::enable_keepalive(sock_);
            return RemoteResult<void>::Ok();
        }
        switch (conn.failure) {
        case platform::ConnectFailure::TimedOut:
            return RemoteResult<void>::Err(ErrorKind::LoginTimedOut, conn.error);
        case platform::ConnectFailure::Cancelled:
            return RemoteResult<void>::Err(ErrorKind::Cancelled, conn.error);
        default:
            return RemoteResult<void>::Err(ErrorKind::HostUnreachable, conn.error);
        }
    }

    auto channel = via->open_tunnel(hop_.host, hop_.port, deadline);
    if (channel.is_err()) return RemoteResult<void>::Err(channel.error);

    auto pair = platform::make_socketpair();
    if (pair.is_err()) {
        std::lock_guard<std::mutex> lock(*via->io_mutex());
        libssh2_channel_free(channel.value);
        return RemoteResult<void>::Err(ErrorKind::Fatal, pair.error);
    }

    tunnel_ = std::make_unique<TunnelPump>(via->raw_session(), channel.value, via->io_mutex(),
                                           via->socket(), pair.value.first);
    tunnel_->start();
    sock_ = pair.value.second;
    return RemoteResult<void>::Ok();
}

RemoteResult<void> SshSession::handshake(const Deadline& deadline) {
    session_ = libssh2_session_init();
    if (!session_) {
        return RemoteResult<void>::Err(ErrorKind::Fatal, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    const std::string what = fmt::format("SSH handshake with {}", hop_.identity());
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_session(session_, sock_, deadline)) {
            return RemoteResult<void>::Err(deadline_error(deadline, ErrorKind::LoginTimedOut, what));
        }
    }
    if (ret != 0) {
        return RemoteResult<void>::Err(ErrorKind::HostUnreachable,
                                       fmt::format("{} failed: {}", what, libssh2_error(session_)));
    }
    return RemoteResult<void>::Ok();
}

RemoteResult<LIBSSH2_CHANNEL*> SshSession::open_tunnel(const std::string& host, int port,
                                                       const Deadline& deadline) {
    const std::string what = fmt::format("Tunnel {} -> {}:{}", hop_.identity(), host, port);
    LIBSSH2_CHANNEL* ch = nullptr;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_direct_tcpip(session_, host.c_str(), port);
            if (ch) break;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return RemoteResult<LIBSSH2_CHANNEL*>::Err(ErrorKind::HostUnreachable,
                    fmt::format("{} refused: {}", what, libssh2_error(session_)));
            }
        }
        if (!wait_session(session_, sock_, deadline)) {
            return RemoteResult<LIBSSH2_CHANNEL*>::Err(
                deadline_error(deadline, ErrorKind::LoginTimedOut, what));
        }
    }
    return RemoteResult<LIBSSH2_CHANNEL*>::Ok(ch);
}

// ── Execute ────────────────────────────────────────────────────

RemoteResult<CommandResult> SshSession::execute(const std::string& command_line,
                                                const std::string& input,
                                                const Deadline& deadline) {
    using Outcome = RemoteResult<CommandResult>;
    if (!active_ || !session_) {
        return Outcome::Err(ErrorKind::TransportLost, "Session is not open");
    }

    const std::string what = fmt::format("Command on {}", hop_.identity());

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* ch = nullptr;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (ch) break;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return Outcome::Err(transport_error("Failed to open exec channel"));
            }
        }
        if (!wait_session(session_, sock_, deadline)) {
            return Outcome::Err(deadline_error(deadline, ErrorKind::CommandTimedOut, what));
        }
    }

    auto release = [&]() {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
    };

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(ch, command_line.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_session(session_, sock_, deadline)) {
            release();
            return Outcome::Err(deadline_error(deadline, ErrorKind::CommandTimedOut, what));
        }
    }
    if (rc != 0) {
        auto err = transport_error("Failed to exec command on channel");
        release();
        return Outcome::Err(err);
    }

    // Feed stdin and drain stdout/stderr in one loop so a remote process
    // that writes before reading cannot stall us on a full window.
    CommandResult result;
    size_t sent = 0;
    bool eof_sent = false;
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        bool progress = false;

        if (sent < input.size()) {
            ssize_t w;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                w = libssh2_channel_write(ch, input.data() + sent, input.size() - sent);
            }
            if (w > 0) {
                sent += static_cast<size_t>(w);
                progress = true;
            } else if (w != LIBSSH2_ERROR_EAGAIN) {
                auto err = transport_error("Channel write error sending input");
                release();
                return Outcome::Err(err);
            }
        } else if (!eof_sent) {
            int eof_rc;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                eof_rc = libssh2_channel_send_eof(ch);
            }
            if (eof_rc == 0) {
                eof_sent = true;
                progress = true;
            } else if (eof_rc != LIBSSH2_ERROR_EAGAIN) {
                auto err = transport_error("Failed to send EOF");
                release();
                return Outcome::Err(err);
            }
        }

        ssize_t n_out;
        ssize_t n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) result.stdout_data.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) result.stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch) != 0;
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            auto err = transport_error("SSH channel read error");
            release();
            return Outcome::Err(err);
        }
        if (n_out > 0 || n_err > 0) progress = true;
        if (eof && n_out <= 0 && n_err <= 0) break;

        if (deadline.done()) {
            release();
            return Outcome::Err(deadline_error(deadline, ErrorKind::CommandTimedOut, what));
        }
        if (!progress) {
            int next_keepalive = 0;
            int ka;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                ka = libssh2_keepalive_send(session_, &next_keepalive);
            }
            if (ka < 0 && ka != LIBSSH2_ERROR_EAGAIN) {
                auto err = transport_error("Keepalive failed");
                release();
                return Outcome::Err(err);
            }
            wait_session(session_, sock_, deadline);
        }
    }

    // Collect the exit status
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch);
            if (rc == 0) rc = libssh2_channel_wait_closed(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_session(session_, sock_, deadline)) {
            release();
            return Outcome::Err(deadline_error(deadline, ErrorKind::CommandTimedOut, what));
        }
    }
    if (rc != 0) {
        auto err = transport_error("Failed to close exec channel");
        release();
        return Outcome::Err(err);
    }

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        result.exit_status = libssh2_channel_get_exit_status(ch);

        char* signal = nullptr;
        size_t signal_len = 0;
        if (libssh2_channel_get_exit_signal(ch, &signal, &signal_len, nullptr, nullptr,
                                            nullptr, nullptr) == 0 && signal) {
            result.exit_signal.assign(signal, signal_len);
            libssh2_free(session_, signal);
        }
    }
    release();

    return Outcome::Ok(std::move(result));
}

// ── Close ──────────────────────────────────────────────────────

RemoteResult<void> SshSession::close() {
    if (closed_) return RemoteResult<void>::Ok();
    closed_ = true;
    active_ = false;

    std::string error;

    if (session_) {
        // The disconnect message still travels through our tunnel, so the
        // pump is stopped only afterwards.
        auto deadline = Deadline::after(std::chrono::milliseconds(CLOSE_GRACE_MS));
        int rc;
        while (true) {
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                rc = libssh2_session_disconnect(session_, "Normal disconnection");
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) break;
            if (!wait_session(session_, sock_, deadline)) break;
        }
        if (rc != 0 && !(tunnel_ && tunnel_->lost())) {
            error = fmt::format("disconnect failed: {}", libssh2_error(session_));
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = JUMPRUN_INVALID_SOCKET;
    }

    if (tunnel_) {
        auto stopped = tunnel_->stop();
        if (stopped.is_err()) {
            if (!error.empty()) error += "; ";
            error += stopped.error.message;
        }
        tunnel_.reset();
    }

    if (!error.empty()) {
        return RemoteResult<void>::Err(ErrorKind::TransportLost,
                                       fmt::format("{}: {}", hop_.identity(), error));
    }
    log_.debug("Hop closed", {{"host", hop_.identity()}});
    return RemoteResult<void>::Ok();
}
