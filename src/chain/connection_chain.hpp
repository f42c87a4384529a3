#pragma once

#include <memory>
#include <vector>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <ssh/transport.hpp>

// Ordered hops of one chain; index 0 is the outermost jump host, the last
// index is the end host. Owns every hop exclusively.
class ConnectionChain {
public:
    explicit ConnectionChain(Logger log) : log_(std::move(log)) {}
    ~ConnectionChain();

    ConnectionChain(const ConnectionChain&) = delete;
    ConnectionChain& operator=(const ConnectionChain&) = delete;

    void push(std::unique_ptr<HopConnection> hop);

    size_t size() const { return hops_.size(); }
    bool empty() const { return hops_.empty(); }
    bool released() const { return released_; }

    // Innermost open hop, nullptr when empty
    HopConnection* last() const;
    HopConnection* hop(size_t index) const;

    // Close every hop, innermost first. A failing close does not stop the
    // remaining ones. Only the first call closes anything.
    std::vector<CleanupError> close_all();

private:
    Logger log_;
    std::vector<std::unique_ptr<HopConnection>> hops_;
    bool released_ = false;
};
