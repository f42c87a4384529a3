#include "chain_builder.hpp"
#include <fmt/format.h>
#include <chrono>

ChainBuilder::ChainBuilder(Transport& transport, HopOptions options, Logger log)
    : transport_(transport), options_(std::move(options)), log_(std::move(log)) {
}

RemoteResult<std::unique_ptr<ConnectionChain>> ChainBuilder::build(const RemoteSpec& spec,
                                                                   const std::atomic<bool>* cancel) {
    using Built = RemoteResult<std::unique_ptr<ConnectionChain>>;

    auto hops = spec.hops();
    auto chain = std::make_unique<ConnectionChain>(log_);
    auto deadline = Deadline::after(
        std::chrono::duration_cast<std::chrono::milliseconds>(spec.login_timeout), cancel);

    HopOptions options = options_;
    options.strict_host_key_checking = spec.strict_host_key_checking;
    if (!options.strict_host_key_checking) {
        log_.debug("Host keys accepted without strict checking",
                   {{"remote", spec.identity()}});
    }

    for (size_t i = 0; i < hops.size(); i++) {
        const auto& hop = hops[i];
        RemoteError failure;

        if (deadline.cancelled()) {
            failure = RemoteError{ErrorKind::Cancelled,
                                  fmt::format("Cancelled before opening {}", hop.identity())};
        } else if (deadline.expired()) {
            failure = RemoteError{ErrorKind::LoginTimedOut,
                                  fmt::format("Login timeout of {}s exceeded before opening {}",
                                              spec.login_timeout.count(), hop.identity())};
        } else {
            log_.debug("Opening hop", {{"hop", std::to_string(i)}, {"host", hop.identity()}});
            auto opened = transport_.open(hop, chain->last(), options, deadline);
            if (opened.is_ok()) {
                chain->push(std::move(opened.value));
                continue;
            }
            failure = opened.error;
        }

        // Hops 0..i-1 are closed innermost first before the error leaves
        log_.warning("Opening hop failed",
                   {{"hop", std::to_string(i)}, {"host", hop.identity()},
                    {"kind", error_kind_name(failure.kind)}, {"error", failure.message}});
        auto cleanup = chain->close_all();
        auto result = Built::Err(failure);
        result.cleanup_errors = std::move(cleanup);
        return result;
    }

    log_.info("Chain established", {{"remote", spec.identity()}, {"hops", std::to_string(chain->size())}});
    return Built::Ok(std::move(chain));
}
