#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/logger.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"
#include "tunnel_pump.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One SSH session to one hop. Either over a direct TCP socket, or over a
// socketpair whose other end is pumped through a direct-tcpip channel of
// the previous hop's session.
class SshSession : public HopConnection {
public:
    SshSession(const RemoteDescriptor& hop, Logger log);
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Connect, handshake, verify the host key and authenticate.
    // On failure everything this hop acquired is already released.
    RemoteResult<void> establish(SshSession* via, const HopOptions& options,
                                 const Deadline& deadline);

    const RemoteDescriptor& descriptor() const override { return hop_; }
    RemoteResult<CommandResult> execute(const std::string& command_line,
                                        const std::string& input,
                                        const Deadline& deadline) override;
    RemoteResult<void> close() override;
    bool is_open() const override { return active_; }

    // Open a direct-tcpip channel to host:port from this hop
    RemoteResult<LIBSSH2_CHANNEL*> open_tunnel(const std::string& host, int port,
                                               const Deadline& deadline);

    LIBSSH2_SESSION* raw_session() { return session_; }
    socket_t socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    RemoteDescriptor hop_;
    Logger log_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::unique_ptr<TunnelPump> tunnel_;
    std::shared_ptr<std::mutex> io_mutex_;
    bool active_;
    bool closed_;

    RemoteResult<void> open_transport(SshSession* via, const Deadline& deadline);
    RemoteResult<void> handshake(const Deadline& deadline);
    RemoteError transport_error(const std::string& what) const;
};
