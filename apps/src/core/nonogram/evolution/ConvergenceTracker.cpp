#include "ConvergenceTracker.h"
#include "core/Assert.h"

#include <mutex>
#include <utility>

namespace NonoGen {

void ConvergenceTracker::append(const GenerationStats& stats)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        NONOGEN_ASSERT(!closed_, "cannot append to a closed convergence log");
        history_.push_back(stats);
    }
    changed_.notify_all();
}

void ConvergenceTracker::close()
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

bool ConvergenceTracker::isClosed() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return closed_;
}

size_t ConvergenceTracker::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return history_.size();
}

GenerationStats ConvergenceTracker::at(size_t index) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return history_.at(index);
}

std::optional<GenerationStats> ConvergenceTracker::latest() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

std::vector<GenerationStats> ConvergenceTracker::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return history_;
}

size_t ConvergenceTracker::waitForSize(size_t count) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    changed_.wait(lock, [&]() { return closed_ || history_.size() >= count; });
    return history_.size();
}

size_t ConvergenceTracker::waitForSize(size_t count, std::chrono::milliseconds timeout) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    changed_.wait_for(lock, timeout, [&]() { return closed_ || history_.size() >= count; });
    return history_.size();
}

ProgressView::ProgressView(std::shared_ptr<const ConvergenceTracker> tracker)
    : tracker_(std::move(tracker))
{
    NONOGEN_ASSERT(tracker_ != nullptr, "progress view needs a tracker");
}

bool ProgressView::waitForGeneration(int generation, std::chrono::milliseconds timeout) const
{
    if (generation < 0) {
        return true;
    }
    const size_t needed = static_cast<size_t>(generation) + 1;
    return tracker_->waitForSize(needed, timeout) >= needed;
}

} // namespace NonoGen
