#pragma once

#include "Evaluator.h"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace NonoGen {

/**
 * Persistent worker pool for scoring a generation's grids.
 *
 * evaluate() scatters the grids over the workers and the calling thread, then
 * gathers when every score is written. Each score depends only on its own grid,
 * so results are identical for any thread count.
 */
class EvaluationPool {
public:
    // threadCount 0 = hardware concurrency, 1 = evaluate inline on the caller.
    explicit EvaluationPool(int threadCount);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    // Total threads taking part in a batch, the caller included.
    int getThreadCount() const { return static_cast<int>(workers_.size()) + 1; }

    /**
     * Write evaluator.score(grids[i]) to scores[i] for every i in [begin, grids.size()).
     * `scores` must already hold grids.size() entries. Blocks until all are written.
     */
    void evaluate(
        const Evaluator& evaluator,
        const std::vector<CandidateGrid>& grids,
        std::vector<FitnessScore>& scores,
        size_t begin = 0);

private:
    struct Batch;

    static size_t drain(Batch& batch);
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable taskCv_;
    std::condition_variable doneCv_;
    bool stopRequested_ = false;
    uint64_t batchId_ = 0;
    std::shared_ptr<Batch> batch_;
    std::vector<std::thread> workers_;
};

} // namespace NonoGen
