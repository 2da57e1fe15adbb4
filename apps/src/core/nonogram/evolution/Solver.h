#pragma once

#include "ConvergenceTracker.h"
#include "GeneticEngine.h"
#include "SolverConfig.h"
#include "core/Result.h"
#include "core/nonogram/Puzzle.h"

#include <memory>
#include <thread>

namespace NonoGen {

/**
 * Handle to a solve running on its own thread.
 *
 * Move-only. Destroying a handle whose run is still going cancels it and waits
 * for the generation in flight to finish.
 */
class RunHandle {
public:
    RunHandle(RunHandle&& other) noexcept;
    // Cancels and joins this handle's own run first, so it may block briefly.
    RunHandle& operator=(RunHandle&& other);
    ~RunHandle();

    RunHandle(const RunHandle&) = delete;
    RunHandle& operator=(const RunHandle&) = delete;

    // Ask the run to stop at the next generation boundary. Idempotent.
    void cancel();

    bool isFinished() const;

    // Live, restartable view of the recorded generations.
    ProgressView progress() const;

    // Blocks until the run is terminal. The returned reference lives as long as the handle.
    const SolveResult& result();

private:
    struct RunState;

    explicit RunHandle(std::unique_ptr<RunState> state);
    void joinThread();

    std::unique_ptr<RunState> state_;
    std::thread thread_;

    friend Result<RunHandle, ConfigError> start(const Puzzle& puzzle, const SolverConfig& config);
};

/**
 * Validate `config` and launch a solve. The puzzle is copied, so the caller's
 * instance may go away. Invalid configs are rejected before any generation runs.
 */
Result<RunHandle, ConfigError> start(const Puzzle& puzzle, const SolverConfig& config);

/**
 * Run a solve on the calling thread.
 */
Result<SolveResult, ConfigError> solve(const Puzzle& puzzle, const SolverConfig& config);

} // namespace NonoGen
