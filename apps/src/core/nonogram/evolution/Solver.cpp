#include "Solver.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace NonoGen {

struct RunHandle::RunState {
    explicit RunState(const Puzzle& source) : puzzle(source) {}

    Puzzle puzzle;
    std::shared_ptr<ConvergenceTracker> tracker = std::make_shared<ConvergenceTracker>();
    std::unique_ptr<GeneticEngine> engine;
    std::atomic<bool> cancelRequested{ false };

    std::mutex resultMutex;
    std::condition_variable resultCv;
    std::optional<SolveResult> result;
};

RunHandle::RunHandle(std::unique_ptr<RunState> state) : state_(std::move(state))
{}

RunHandle::RunHandle(RunHandle&& other) noexcept
    : state_(std::move(other.state_)), thread_(std::move(other.thread_))
{}

RunHandle& RunHandle::operator=(RunHandle&& other)
{
    if (this != &other) {
        cancel();
        joinThread();
        state_ = std::move(other.state_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

RunHandle::~RunHandle()
{
    cancel();
    joinThread();
}

void RunHandle::joinThread()
{
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RunHandle::cancel()
{
    if (state_ && !state_->cancelRequested.exchange(true)) {
        LOG_INFO(Evolution, "Cancellation requested");
    }
}

bool RunHandle::isFinished() const
{
    NONOGEN_ASSERT(state_ != nullptr, "run handle was moved from");
    std::lock_guard<std::mutex> lock(state_->resultMutex);
    return state_->result.has_value();
}

ProgressView RunHandle::progress() const
{
    NONOGEN_ASSERT(state_ != nullptr, "run handle was moved from");
    return ProgressView(state_->tracker);
}

const SolveResult& RunHandle::result()
{
    NONOGEN_ASSERT(state_ != nullptr, "run handle was moved from");
    std::unique_lock<std::mutex> lock(state_->resultMutex);
    state_->resultCv.wait(lock, [this]() { return state_->result.has_value(); });
    return state_->result.value();
}

Result<RunHandle, ConfigError> start(const Puzzle& puzzle, const SolverConfig& config)
{
    auto state = std::make_unique<RunHandle::RunState>(puzzle);

    auto engine = GeneticEngine::create(state->puzzle, config, state->tracker);
    if (engine.isError()) {
        return Result<RunHandle, ConfigError>::error(std::move(engine).errorValue());
    }
    state->engine = std::move(engine).value();

    RunHandle handle(std::move(state));
    RunHandle::RunState* runState = handle.state_.get();
    handle.thread_ = std::thread([runState]() {
        SolveResult result = runState->engine->run(&runState->cancelRequested);
        {
            std::lock_guard<std::mutex> lock(runState->resultMutex);
            runState->result = std::move(result);
        }
        runState->resultCv.notify_all();
    });

    return Result<RunHandle, ConfigError>::okay(std::move(handle));
}

Result<SolveResult, ConfigError> solve(const Puzzle& puzzle, const SolverConfig& config)
{
    auto engine = GeneticEngine::create(puzzle, config);
    if (engine.isError()) {
        return Result<SolveResult, ConfigError>::error(std::move(engine).errorValue());
    }
    return Result<SolveResult, ConfigError>::okay(engine.value()->run());
}

} // namespace NonoGen
