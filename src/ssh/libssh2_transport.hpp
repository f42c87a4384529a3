#pragma once

#include <core/logger.hpp>
#include "transport.hpp"

// Transport backed by libssh2. Owns the library's global init/exit, so
// exactly one instance should live for the duration of the program.
class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(Logger log);
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    bool initialized() const { return initialized_; }

    RemoteResult<std::unique_ptr<HopConnection>> open(const RemoteDescriptor& hop,
                                                      HopConnection* via,
                                                      const HopOptions& options,
                                                      const Deadline& deadline) override;

private:
    Logger log_;
    bool initialized_;
};
