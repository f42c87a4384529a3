#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/errors.hpp>
#include <core/types.hpp>
#include <core/deadline.hpp>
#include <remote/remote_descriptor.hpp>

// Per-hop connection settings shared by every hop of a chain.
struct HopOptions {
    bool strict_host_key_checking = false;
    std::string known_hosts_path;
    std::vector<std::string> identity_files;
};

// One live, authenticated transport connection (a hop).
class HopConnection {
public:
    virtual ~HopConnection() = default;

    virtual const RemoteDescriptor& descriptor() const = 0;

    // Run a command line on a fresh exec channel. `input` is written to the
    // remote stdin, followed by EOF. Fails with CommandTimedOut, Cancelled or
    // TransportLost; a non-zero exit status is a successful result.
    virtual RemoteResult<CommandResult> execute(const std::string& command_line,
                                                const std::string& input,
                                                const Deadline& deadline) = 0;

    // Tear the connection down. Safe to call more than once; only the first
    // call does any work.
    virtual RemoteResult<void> close() = 0;

    virtual bool is_open() const = 0;
};

// Opens hops. `via` is the previous hop of the chain, or nullptr for a
// direct connection from this machine.
class Transport {
public:
    virtual ~Transport() = default;

    virtual RemoteResult<std::unique_ptr<HopConnection>> open(const RemoteDescriptor& hop,
                                                              HopConnection* via,
                                                              const HopOptions& options,
                                                              const Deadline& deadline) = 0;
};
