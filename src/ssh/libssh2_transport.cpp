#include "libssh2_transport.hpp"
#include "session.hpp"
#include <libssh2.h>
#include <fmt/format.h>

Libssh2Transport::Libssh2Transport(Logger log)
    : log_(std::move(log)), initialized_(libssh2_init(0) == 0) {
    if (!initialized_) {
        log_.critical("Failed to initialize libssh2");
    }
}

Libssh2Transport::~Libssh2Transport() {
    if (initialized_) libssh2_exit();
}

RemoteResult<std::unique_ptr<HopConnection>> Libssh2Transport::open(const RemoteDescriptor& hop,
                                                                    HopConnection* via,
                                                                    const HopOptions& options,
                                                                    const Deadline& deadline) {
    using Opened = RemoteResult<std::unique_ptr<HopConnection>>;

    if (!initialized_) {
        return Opened::Err(ErrorKind::Fatal, "libssh2 is not initialized");
    }

    SshSession* via_session = nullptr;
    if (via) {
        via_session = dynamic_cast<SshSession*>(via);
        if (!via_session || !via_session->is_open()) {
            return Opened::Err(ErrorKind::TransportLost,
                               fmt::format("Previous hop for {} is not an open SSH session",
                                           hop.identity()));
        }
    }

    auto session = std::make_unique<SshSession>(hop, log_);
    auto result = session->establish(via_session, options, deadline);
    if (result.is_err()) {
        return Opened::Err(result.error);
    }
    return Opened::Ok(std::move(session));
}
