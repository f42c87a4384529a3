#include "chain_lease.hpp"
#include <fmt/format.h>

ChainLease::ChainLease(ChainBuilder& builder, Logger log)
    : builder_(builder), log_(std::move(log)) {
}

ChainLease::~ChainLease() {
    // Errors are logged by the chain itself
    release();
}

RemoteResult<void> ChainLease::acquire(const RemoteSpec& spec, const std::atomic<bool>* cancel) {
    if (chain_) {
        return RemoteResult<void>::Err(ErrorKind::Fatal, "Chain lease is already in use");
    }
    auto built = builder_.build(spec, cancel);
    if (built.is_err()) {
        auto result = RemoteResult<void>::Err(built.error);
        result.cleanup_errors = std::move(built.cleanup_errors);
        return result;
    }
    chain_ = std::move(built.value);
    return RemoteResult<void>::Ok();
}

HopConnection* ChainLease::end_host() const {
    if (!acquired()) return nullptr;
    return chain_->last();
}

std::vector<CleanupError> ChainLease::release() {
    if (!chain_) return {};
    return chain_->close_all();
}

RemoteResult<CommandResult> run_remote_task(ChainBuilder& builder,
                                            const RemoteSpec& spec,
                                            const RemoteTask& task,
                                            const std::atomic<bool>* cancel,
                                            const Logger& log) {
    using Outcome = RemoteResult<CommandResult>;

    ChainLease lease(builder, log);
    auto acquired = lease.acquire(spec, cancel);
    if (acquired.is_err()) {
        auto result = Outcome::Err(acquired.error);
        result.cleanup_errors = std::move(acquired.cleanup_errors);
        return result;
    }

    Outcome result = Outcome::Err(ErrorKind::Fatal, "Task produced no result");
    try {
        result = task(TaskContext{*lease.end_host(), spec, cancel});
    } catch (const std::exception& e) {
        log.error("Task raised", {{"remote", spec.identity()}, {"error", e.what()}});
        result = Outcome::Err(ErrorKind::Fatal, fmt::format("Task raised: {}", e.what()));
    } catch (...) {
        log.error("Task raised", {{"remote", spec.identity()}, {"error", "unknown exception"}});
        result = Outcome::Err(ErrorKind::Fatal, "Task raised an unknown exception");
    }

    auto cleanup = lease.release();
    result.cleanup_errors.insert(result.cleanup_errors.end(), cleanup.begin(), cleanup.end());
    return result;
}
