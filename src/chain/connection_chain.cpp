#include "connection_chain.hpp"

ConnectionChain::~ConnectionChain() {
    // Errors are logged by close_all
    close_all();
}

void ConnectionChain::push(std::unique_ptr<HopConnection> hop) {
    hops_.push_back(std::move(hop));
}

HopConnection* ConnectionChain::last() const {
    return hops_.empty() ? nullptr : hops_.back().get();
}

HopConnection* ConnectionChain::hop(size_t index) const {
    return index < hops_.size() ? hops_[index].get() : nullptr;
}

std::vector<CleanupError> ConnectionChain::close_all() {
    std::vector<CleanupError> errors;
    if (released_) return errors;
    released_ = true;

    for (size_t i = hops_.size(); i-- > 0;) {
        auto& hop = hops_[i];
        if (!hop) continue;
        std::string host = hop->descriptor().identity();
        auto result = hop->close();
        if (result.is_err()) {
            log_.error("Closing hop failed",
                      {{"hop", std::to_string(i)}, {"host", host}, {"error", describe(result.error)}});
            errors.push_back(CleanupError{static_cast<int>(i), host, describe(result.error)});
        } else {
            log_.debug("Hop released", {{"hop", std::to_string(i)}, {"host", host}});
        }
        // Destroy innermost first too: a tunneled hop must go before its carrier
        hop.reset();
    }
    hops_.clear();
    return errors;
}
