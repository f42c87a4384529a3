#pragma once

#include <atomic>
#include <chrono>
#include <algorithm>

// A point in time after which the current phase is abandoned, optionally
// combined with a cancellation flag shared by a whole dispatch batch.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline(clock::time_point at, const std::atomic<bool>* cancel = nullptr)
        : at_(at), cancel_(cancel) {}

    static Deadline after(std::chrono::milliseconds budget,
                          const std::atomic<bool>* cancel = nullptr) {
        return Deadline(clock::now() + budget, cancel);
    }

    bool expired() const { return clock::now() >= at_; }
    bool cancelled() const { return cancel_ && cancel_->load(); }

    // Either reason to stop waiting
    bool done() const { return expired() || cancelled(); }

    // Milliseconds left, clamped to [0, cap_ms]
    int remaining_ms(int cap_ms) const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - clock::now()).count();
        if (left <= 0) return 0;
        return static_cast<int>(std::min<long long>(left, cap_ms));
    }

private:
    clock::time_point at_;
    const std::atomic<bool>* cancel_;
};
