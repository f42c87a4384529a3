#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <chain/chain_builder.hpp>
#include <chain/chain_lease.hpp>
#include <remote/remote_spec.hpp>

// Result for one remote of a dispatch batch, keyed by its identity.
struct RemoteOutcome {
    std::string remote;
    RemoteResult<CommandResult> result;
};

// Runs one unit of work against every remote of a batch, each through its
// own chain, at most `max_parallel` at a time. A failing remote never
// affects the others.
class TaskDispatcher {
public:
    TaskDispatcher(ChainBuilder& builder, Logger log, size_t max_parallel);

    // One outcome per spec, in the order of `specs`. Once `cancel` is set,
    // in-flight remotes abandon their current phase and remotes not yet
    // started are reported Cancelled without being attempted.
    std::vector<RemoteOutcome> dispatch(const std::vector<RemoteSpec>& specs,
                                        const RemoteTask& task,
                                        const std::string& task_name,
                                        const std::atomic<bool>* cancel = nullptr);

    size_t max_parallel() const { return max_parallel_; }

private:
    ChainBuilder& builder_;
    Logger log_;
    size_t max_parallel_;

    RemoteResult<CommandResult> run_one(const RemoteSpec& spec, const RemoteTask& task,
                                        const std::string& task_name,
                                        const std::atomic<bool>* cancel);
};

// true when every outcome succeeded
bool all_succeeded(const std::vector<RemoteOutcome>& outcomes);
