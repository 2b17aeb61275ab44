#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace linksim {

/// Cooperative cancellation flag, shared between the host and a run.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Called by the solver every `yield_interval` iterations so a
/// single-threaded host can service other work.
using YieldFn = std::function<void(int iteration)>;

/// Host-supplied hooks for long computations. Both are optional.
struct SolverControl {
    const CancellationToken* cancel = nullptr;  // non-owning
    YieldFn yield;
    int yield_interval = 100;
};

// ─── IterationCheckpoint ──────────────────────────────────────
// Invoked at every iteration boundary. Throws RunCancelled once the
// token is set; forwards to the yield hook on schedule.

class IterationCheckpoint {
public:
    IterationCheckpoint(const SolverControl& control, std::string phase)
        : control_(control), phase_(std::move(phase)) {}

    /// Throws RunCancelled.
    void reached(int iteration);

private:
    const SolverControl& control_;
    std::string phase_;
};

} // namespace linksim
