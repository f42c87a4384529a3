#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/errors.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Relays bytes between a direct-tcpip channel on the previous hop and one
// end of a local socketpair. The next hop's SSH session runs over the other
// end, so it exists only while this pump and the previous hop are alive.
class TunnelPump {
public:
    TunnelPump(LIBSSH2_SESSION* outer_session,
               LIBSSH2_CHANNEL* channel,
               std::shared_ptr<std::mutex> outer_mutex,
               socket_t outer_sock,
               socket_t local_end);
    ~TunnelPump();

    TunnelPump(const TunnelPump&) = delete;
    TunnelPump& operator=(const TunnelPump&) = delete;

    void start();

    // Join the relay thread, close the channel on the previous hop and the
    // local socket. Only the first call does any work.
    RemoteResult<void> stop();

    // The channel or the outer connection went away
    bool lost() const { return lost_.load(); }

private:
    LIBSSH2_SESSION* outer_session_;
    LIBSSH2_CHANNEL* channel_;
    std::shared_ptr<std::mutex> outer_mutex_;
    socket_t outer_sock_;
    socket_t local_end_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> lost_{false};
    bool stopped_ = false;

    void run();
};
