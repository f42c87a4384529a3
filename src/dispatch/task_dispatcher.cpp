#include "task_dispatcher.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <thread>

TaskDispatcher::TaskDispatcher(ChainBuilder& builder, Logger log, size_t max_parallel)
    : builder_(builder), log_(std::move(log)), max_parallel_(std::max<size_t>(1, max_parallel)) {
}

RemoteResult<CommandResult> TaskDispatcher::run_one(const RemoteSpec& spec,
                                                    const RemoteTask& task,
                                                    const std::string& task_name,
                                                    const std::atomic<bool>* cancel) {
    using Outcome = RemoteResult<CommandResult>;
    const std::string remote = spec.identity();

    if (cancel && cancel->load()) {
        log_.debug("Remote skipped", {{"remote", remote}, {"task", task_name}});
        return Outcome::Err(ErrorKind::Cancelled, "Batch cancelled before this remote started");
    }

    log_.debug("Remote started", {{"remote", remote}, {"task", task_name}});
    Logger remote_log = log_.child("remote");

    Outcome result = Outcome::Err(ErrorKind::Fatal, "Remote produced no result");
    try {
        result = run_remote_task(builder_, spec, task, cancel, remote_log);
    } catch (const std::exception& e) {
        result = Outcome::Err(ErrorKind::Fatal, fmt::format("Unhandled error: {}", e.what()));
    } catch (...) {
        result = Outcome::Err(ErrorKind::Fatal, "Unhandled error of unknown type");
    }

    if (result.is_err()) {
        log_.error("Remote failed", {{"remote", remote},
                                     {"error", result.error.message},
                                     {"kind", error_kind_name(result.error.kind)},
                                     {"task", task_name}});
    }
    for (const auto& cleanup : result.cleanup_errors) {
        log_.error("Cleanup failed", {{"remote", remote},
                                      {"hop", fmt::format("{} ({})", cleanup.hop_index, cleanup.host)},
                                      {"error", cleanup.message}});
    }
    log_.debug("Remote finished", {{"remote", remote}, {"task", task_name},
                                   {"ok", result.is_ok() ? "yes" : "no"}});
    return result;
}

std::vector<RemoteOutcome> TaskDispatcher::dispatch(const std::vector<RemoteSpec>& specs,
                                                    const RemoteTask& task,
                                                    const std::string& task_name,
                                                    const std::atomic<bool>* cancel) {
    std::vector<RemoteOutcome> outcomes(specs.size());
    for (size_t i = 0; i < specs.size(); i++) {
        outcomes[i].remote = specs[i].identity();
    }
    if (specs.empty()) return outcomes;

    // Each worker claims the next unstarted remote; slots are written by
    // exactly one worker, so outcomes needs no lock.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= specs.size()) return;
            outcomes[i].result = run_one(specs[i], task, task_name, cancel);
        }
    };

    size_t n_workers = std::min(max_parallel_, specs.size());
    log_.debug("Dispatching", {{"task", task_name},
                               {"remotes", std::to_string(specs.size())},
                               {"workers", std::to_string(n_workers)}});

    if (n_workers == 1) {
        worker();
        return outcomes;
    }

    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    for (size_t w = 0; w < n_workers; w++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) t.join();
    return outcomes;
}

bool all_succeeded(const std::vector<RemoteOutcome>& outcomes) {
    return std::all_of(outcomes.begin(), outcomes.end(),
                       [](const RemoteOutcome& o) { return o.result.is_ok(); });
}
