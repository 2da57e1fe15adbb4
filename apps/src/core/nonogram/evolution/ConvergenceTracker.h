#pragma once

#include "GenerationStats.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace NonoGen {

/**
 * Append-only log of generation statistics.
 *
 * One writer (the generation loop) appends; any number of readers may query or
 * wait concurrently. Entries never change once appended. close() marks the log
 * terminal and wakes every waiter.
 */
class ConvergenceTracker {
public:
    void append(const GenerationStats& stats);
    void close();

    bool isClosed() const;
    size_t size() const;
    GenerationStats at(size_t index) const;
    std::optional<GenerationStats> latest() const;
    std::vector<GenerationStats> snapshot() const;

    /**
     * Block until the log holds at least `count` entries or is closed.
     * @return The size at wakeup, which is below `count` only if the log was closed.
     */
    size_t waitForSize(size_t count) const;

    // As above, giving up after `timeout`.
    size_t waitForSize(size_t count, std::chrono::milliseconds timeout) const;

private:
    mutable std::shared_mutex mutex_;
    mutable std::condition_variable_any changed_;
    std::vector<GenerationStats> history_;
    bool closed_ = false;
};

/**
 * Read-only, restartable view of a run's statistics.
 *
 * Iterating yields every recorded generation in order. While the run is live the
 * iteration waits for the next generation, and it ends once the run is terminal,
 * so a range-for drives a live chart and a second range-for over the same view
 * replays the whole history.
 */
class ProgressView {
public:
    struct Sentinel {};

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = GenerationStats;
        using difference_type = std::ptrdiff_t;
        using pointer = const GenerationStats*;
        using reference = GenerationStats;

        Iterator(const ConvergenceTracker* tracker, size_t index)
            : tracker_(tracker), index_(index)
        {}

        GenerationStats operator*() const { return tracker_->at(index_); }
        Iterator& operator++()
        {
            ++index_;
            return *this;
        }

        bool operator==(Sentinel) const { return tracker_->waitForSize(index_ + 1) <= index_; }
        bool operator!=(Sentinel sentinel) const { return !(*this == sentinel); }

    private:
        const ConvergenceTracker* tracker_;
        size_t index_;
    };

    explicit ProgressView(std::shared_ptr<const ConvergenceTracker> tracker);

    Iterator begin() const { return Iterator(tracker_.get(), 0); }
    Sentinel end() const { return {}; }

    size_t size() const { return tracker_->size(); }
    GenerationStats at(size_t index) const { return tracker_->at(index); }
    bool isFinished() const { return tracker_->isClosed(); }
    std::optional<GenerationStats> latest() const { return tracker_->latest(); }
    std::vector<GenerationStats> snapshot() const { return tracker_->snapshot(); }

    /**
     * Wait until `generation` has been recorded.
     * @return false on timeout, or if the run ended before reaching it.
     */
    bool waitForGeneration(int generation, std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<const ConvergenceTracker> tracker_;
};

} // namespace NonoGen
