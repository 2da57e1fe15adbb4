#include "EvaluationPool.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <atomic>

namespace NonoGen {

struct EvaluationPool::Batch {
    const Evaluator* evaluator = nullptr;
    const std::vector<CandidateGrid>* grids = nullptr;
    std::vector<FitnessScore>* scores = nullptr;
    size_t end = 0;
    size_t total = 0;
    std::atomic<size_t> next{ 0 };
    size_t completed = 0; // Guarded by the pool mutex.
};

EvaluationPool::EvaluationPool(int threadCount)
{
    int resolved = threadCount;
    if (resolved <= 0) {
        resolved = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }

    const int backgroundWorkerCount = resolved - 1;
    workers_.reserve(backgroundWorkerCount);
    for (int i = 0; i < backgroundWorkerCount; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }

    LOG_DEBUG(Evaluation, "Evaluation pool started with {} threads", resolved);
}

EvaluationPool::~EvaluationPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    taskCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    LOG_DEBUG(Evaluation, "Evaluation pool stopped");
}

size_t EvaluationPool::drain(Batch& batch)
{
    size_t done = 0;
    while (true) {
        const size_t index = batch.next.fetch_add(1);
        if (index >= batch.end) {
            return done;
        }
        (*batch.scores)[index] = batch.evaluator->score((*batch.grids)[index]);
        ++done;
    }
}

void EvaluationPool::workerLoop()
{
    uint64_t seenBatch = 0;
    while (true) {
        std::shared_ptr<Batch> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            taskCv_.wait(lock, [&]() { return stopRequested_ || batchId_ != seenBatch; });
            if (stopRequested_) {
                return;
            }
            seenBatch = batchId_;
            batch = batch_;
        }

        // A late wakeup may see an already drained batch; drain() then touches nothing.
        const size_t done = drain(*batch);
        if (done == 0) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch->completed += done;
        }
        doneCv_.notify_all();
    }
}

void EvaluationPool::evaluate(
    const Evaluator& evaluator,
    const std::vector<CandidateGrid>& grids,
    std::vector<FitnessScore>& scores,
    size_t begin)
{
    NONOGEN_ASSERT(scores.size() == grids.size(), "score buffer must match the grid count");
    if (begin >= grids.size()) {
        return;
    }

    auto batch = std::make_shared<Batch>();
    batch->evaluator = &evaluator;
    batch->grids = &grids;
    batch->scores = &scores;
    batch->end = grids.size();
    batch->total = grids.size() - begin;
    batch->next.store(begin);

    if (workers_.empty()) {
        drain(*batch);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_ = batch;
        ++batchId_;
    }
    taskCv_.notify_all();

    const size_t done = drain(*batch);

    std::unique_lock<std::mutex> lock(mutex_);
    batch->completed += done;
    doneCv_.wait(lock, [&]() { return batch->completed == batch->total; });
}

} // namespace NonoGen
