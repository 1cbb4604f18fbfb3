#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "extraction_errors.hpp"

namespace code_extraction {

// Cooperative stop signal shared by every task of a batch: a manual cancel flag
// plus an optional deadline. Checked between stages and regions, never preemptive.
class CancellationToken {
public:
    using clock = std::chrono::steady_clock;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }

    void set_deadline(clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(mtx_);
        deadline_ = deadline;
    }

    void set_budget(std::chrono::milliseconds budget) { set_deadline(clock::now() + budget); }

    bool cancelled() const { return cancelled_.load(); }

    bool expired() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return deadline_ && clock::now() >= *deadline_;
    }

    bool stop_requested() const { return cancelled() || expired(); }

    // Throws RunCancelled when the token has fired. Manual cancel wins over the deadline.
    void throw_if_stopped(const std::string& where) const {
        if (cancelled()) throw RunCancelled("Run cancelled at " + where, false);
        if (expired()) throw RunCancelled("Time budget exhausted at " + where, true);
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_;
    std::optional<clock::time_point> deadline_;
};

} // namespace code_extraction
