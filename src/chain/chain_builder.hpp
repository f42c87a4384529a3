#pragma once

#include <atomic>
#include <memory>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <remote/remote_spec.hpp>
#include <ssh/transport.hpp>
#include "connection_chain.hpp"

// Opens the hops of a RemoteSpec one after the other, each tunneled through
// the previous one. Never hands out a partially open chain: on failure at
// hop i, hops i-1..0 are closed before the error is returned, and any close
// failures ride along as cleanup_errors.
class ChainBuilder {
public:
    ChainBuilder(Transport& transport, HopOptions options, Logger log);

    // The whole build is bounded by spec.login_timeout. `cancel` aborts it
    // early with kind Cancelled.
    RemoteResult<std::unique_ptr<ConnectionChain>> build(const RemoteSpec& spec,
                                                         const std::atomic<bool>* cancel = nullptr);

    const HopOptions& options() const { return options_; }

private:
    Transport& transport_;
    HopOptions options_;
    Logger log_;
};
