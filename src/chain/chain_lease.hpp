#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <core/types.hpp>
#include "chain_builder.hpp"

// Scoped ownership of one chain for the duration of one task.
//
//   ChainLease lease(builder, log);
//   auto acquired = lease.acquire(spec, cancel);
//   ... lease.end_host()->execute(...) ...
//   auto cleanup = lease.release();   // also done by the destructor
//
// Release closes every hop exactly once, innermost first, whatever
// happened in between.
class ChainLease {
public:
    ChainLease(ChainBuilder& builder, Logger log);
    ~ChainLease();

    ChainLease(const ChainLease&) = delete;
    ChainLease& operator=(const ChainLease&) = delete;

    RemoteResult<void> acquire(const RemoteSpec& spec, const std::atomic<bool>* cancel = nullptr);

    bool acquired() const { return chain_ != nullptr && !chain_->released(); }
    HopConnection* end_host() const;
    size_t hop_count() const { return chain_ ? chain_->size() : 0; }

    // Close the chain. Only the first call closes anything.
    std::vector<CleanupError> release();

private:
    ChainBuilder& builder_;
    Logger log_;
    std::unique_ptr<ConnectionChain> chain_;
};

// What a unit of work gets to see while its chain is held
struct TaskContext {
    HopConnection& end_host;
    const RemoteSpec& spec;
    const std::atomic<bool>* cancel;
};

using RemoteTask = std::function<RemoteResult<CommandResult>(const TaskContext&)>;

// Acquire a chain for `spec`, run `task` on its end host, release the
// chain. Release always happens; its errors are attached as cleanup_errors
// and never replace the task's own result. An exception escaping the task
// becomes a Fatal error.
RemoteResult<CommandResult> run_remote_task(ChainBuilder& builder,
                                            const RemoteSpec& spec,
                                            const RemoteTask& task,
                                            const std::atomic<bool>* cancel,
                                            const Logger& log);
