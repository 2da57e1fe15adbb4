#include "RunCoordinator.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <mutex>
#include <spdlog/fmt/fmt.h>
#include <thread>
#include <utility>

namespace NonoGen {

std::vector<ParameterSet> makeParameterGrid(
    const SolverConfig& base,
    const std::vector<double>& crossoverRates,
    const std::vector<double>& mutationRates,
    const std::vector<int>& slideTries)
{
    std::vector<ParameterSet> grid;
    grid.reserve(crossoverRates.size() * mutationRates.size() * slideTries.size());

    for (const double crossoverRate : crossoverRates) {
        for (const double mutationRate : mutationRates) {
            for (const int tries : slideTries) {
                SolverConfig config = base;
                config.crossoverRate = crossoverRate;
                config.slideRate = mutationRate;
                config.slideTries = tries;
                grid.push_back(ParameterSet{
                    .label = fmt::format(
                        "crossover={} mutation={} slides={}", crossoverRate, mutationRate, tries),
                    .config = config,
                });
            }
        }
    }

    return grid;
}

RunSample RunSample::fromResult(const SolveResult& result)
{
    return RunSample{
        .seed = result.seed,
        .status = result.status,
        .reason = result.reason,
        .bestFitness = result.bestFitness,
        .generations = result.generations(),
        .generationsToSolve = result.generationsToSolve(),
        .elapsedMs = result.history.empty() ? 0.0 : result.history.back().elapsedMs,
    };
}

int SweepCell::solvedCount() const
{
    return static_cast<int>(std::count_if(runs.begin(), runs.end(), [](const auto& run) {
        return run.has_value() && run->status == RunStatus::Solved;
    }));
}

std::optional<double> SweepCell::meanBestFitness() const
{
    double total = 0.0;
    int count = 0;
    for (const auto& run : runs) {
        if (run.has_value()) {
            total += static_cast<double>(run->bestFitness);
            count++;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return total / count;
}

std::vector<std::vector<double>> SweepResult::bestFitnessMatrix() const
{
    std::vector<std::vector<double>> matrix;
    matrix.reserve(cells.size());
    for (const auto& cell : cells) {
        std::vector<double> row;
        row.reserve(cell.runs.size());
        for (const auto& run : cell.runs) {
            row.push_back(
                run.has_value() ? static_cast<double>(run->bestFitness)
                                : std::numeric_limits<double>::quiet_NaN());
        }
        matrix.push_back(std::move(row));
    }
    return matrix;
}

std::vector<std::vector<std::optional<int>>> SweepResult::generationsToSolveMatrix() const
{
    std::vector<std::vector<std::optional<int>>> matrix;
    matrix.reserve(cells.size());
    for (const auto& cell : cells) {
        std::vector<std::optional<int>> row;
        row.reserve(cell.runs.size());
        for (const auto& run : cell.runs) {
            row.push_back(run.has_value() ? run->generationsToSolve : std::nullopt);
        }
        matrix.push_back(std::move(row));
    }
    return matrix;
}

std::optional<size_t> SweepResult::bestCell() const
{
    std::optional<size_t> best;
    double bestMean = 0.0;
    int bestSolved = 0;
    for (size_t i = 0; i < cells.size(); ++i) {
        const auto mean = cells[i].meanBestFitness();
        if (!mean.has_value()) {
            continue;
        }
        const int solved = cells[i].solvedCount();
        if (!best.has_value() || mean.value() < bestMean
            || (mean.value() == bestMean && solved > bestSolved)) {
            best = i;
            bestMean = mean.value();
            bestSolved = solved;
        }
    }
    return best;
}

nlohmann::json SweepResult::toJson() const
{
    nlohmann::json cellsJson = nlohmann::json::array();
    for (const auto& cell : cells) {
        nlohmann::json runsJson = nlohmann::json::array();
        for (const auto& run : cell.runs) {
            if (!run.has_value()) {
                runsJson.push_back(nullptr);
                continue;
            }
            nlohmann::json runJson = {
                { "seed", run->seed },
                { "status", toString(run->status) },
                { "reason", toString(run->reason) },
                { "bestFitness", run->bestFitness },
                { "generations", run->generations },
                { "elapsedMs", run->elapsedMs },
            };
            runJson["generationsToSolve"] = run->generationsToSolve.has_value()
                ? nlohmann::json(run->generationsToSolve.value())
                : nlohmann::json(nullptr);
            runsJson.push_back(std::move(runJson));
        }

        const auto mean = cell.meanBestFitness();
        const nlohmann::json meanJson =
            mean.has_value() ? nlohmann::json(mean.value()) : nlohmann::json(nullptr);
        cellsJson.push_back({
            { "label", cell.parameters.label },
            { "config", cell.parameters.config },
            { "solved", cell.solvedCount() },
            { "meanBestFitness", meanJson },
            { "runs", std::move(runsJson) },
        });
    }

    nlohmann::json j = {
        { "seeds", seeds },
        { "cancelled", cancelled },
        { "cells", std::move(cellsJson) },
    };
    const auto best = bestCell();
    j["bestCell"] = best.has_value() ? nlohmann::json(best.value()) : nlohmann::json(nullptr);
    return j;
}

Result<std::vector<SolveResult>, ConfigError> RunCoordinator::runRestarts(
    const Puzzle& puzzle, const SolverConfig& config, const std::vector<uint64_t>& seeds)
{
    auto validated = validateConfig(config);
    if (validated.isError()) {
        return Result<std::vector<SolveResult>, ConfigError>::error(
            std::move(validated).errorValue());
    }

    std::vector<SolveResult> results;
    results.reserve(seeds.size());
    for (size_t i = 0; i < seeds.size(); ++i) {
        if (isCancelled()) {
            LOG_INFO(Runner, "Restarts cancelled after {} of {} runs", i, seeds.size());
            break;
        }

        SolverConfig runConfig = validated.value();
        runConfig.randomSeed = seeds[i];
        auto engine = GeneticEngine::create(puzzle, runConfig);
        if (engine.isError()) {
            return Result<std::vector<SolveResult>, ConfigError>::error(
                std::move(engine).errorValue());
        }

        results.push_back(engine.value()->run(&cancelRequested_));
        LOG_INFO(
            Runner,
            "Restart {}/{} (seed {}): {} with best fitness {}",
            i + 1,
            seeds.size(),
            seeds[i],
            toString(results.back().status),
            results.back().bestFitness);
    }

    return Result<std::vector<SolveResult>, ConfigError>::okay(std::move(results));
}

Result<SweepResult, ConfigError> RunCoordinator::runSweep(
    const Puzzle& puzzle, const SweepSpec& spec)
{
    const auto parameterGrid =
        makeParameterGrid(spec.base, spec.crossoverRates, spec.mutationRates, spec.slideTries);
    for (const auto& parameters : parameterGrid) {
        auto validated = validateConfig(parameters.config);
        if (validated.isError()) {
            LOG_WARN(
                Runner,
                "Sweep cell '{}' rejected: {}",
                parameters.label,
                validated.errorValue().toString());
            return Result<SweepResult, ConfigError>::error(std::move(validated).errorValue());
        }
    }

    SweepResult sweep;
    sweep.seeds = spec.seeds;
    sweep.cells.reserve(parameterGrid.size());
    for (const auto& parameters : parameterGrid) {
        sweep.cells.push_back(SweepCell{
            .parameters = parameters,
            .runs = std::vector<std::optional<RunSample>>(spec.seeds.size()),
        });
    }

    struct Task {
        size_t cell;
        size_t seed;
    };
    std::deque<Task> taskQueue;
    for (size_t cell = 0; cell < sweep.cells.size(); ++cell) {
        for (size_t seed = 0; seed < spec.seeds.size(); ++seed) {
            taskQueue.push_back(Task{ cell, seed });
        }
    }

    const size_t totalRuns = taskQueue.size();
    int workerCount = spec.maxParallelRuns;
    if (workerCount <= 0) {
        workerCount = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }
    workerCount = static_cast<int>(std::min<size_t>(workerCount, std::max<size_t>(totalRuns, 1)));

    LOG_INFO(
        Runner,
        "Sweep: {} configurations x {} seeds on {} threads",
        sweep.cells.size(),
        spec.seeds.size(),
        workerCount);

    std::mutex taskMutex;
    std::mutex resultMutex;
    size_t finishedRuns = 0;

    const auto workerLoop = [&]() {
        while (true) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(taskMutex);
                if (taskQueue.empty() || isCancelled()) {
                    return;
                }
                task = taskQueue.front();
                taskQueue.pop_front();
            }

            SolverConfig config = sweep.cells[task.cell].parameters.config;
            config.randomSeed = spec.seeds[task.seed];

            // Every config was validated above.
            auto engine = GeneticEngine::create(puzzle, config);
            if (engine.isError()) {
                LOG_ERROR(Runner, "Sweep run failed: {}", engine.errorValue().toString());
                continue;
            }
            const RunSample sample = RunSample::fromResult(engine.value()->run(&cancelRequested_));

            std::lock_guard<std::mutex> lock(resultMutex);
            // A cut-short run would skew the cell statistics; its slot stays empty.
            if (sample.status == RunStatus::Cancelled) {
                LOG_INFO(
                    Runner,
                    "{} seed {}: cancelled at generation {}, not recorded",
                    sweep.cells[task.cell].parameters.label,
                    sample.seed,
                    sample.generations);
                continue;
            }
            sweep.cells[task.cell].runs[task.seed] = sample;
            finishedRuns++;
            LOG_INFO(
                Runner,
                "[{}/{}] {} seed {}: {} best {} in {} generations",
                finishedRuns,
                totalRuns,
                sweep.cells[task.cell].parameters.label,
                sample.seed,
                toString(sample.status),
                sample.bestFitness,
                sample.generations);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (int i = 0; i < workerCount; ++i) {
        workers.emplace_back(workerLoop);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    sweep.cancelled = isCancelled();
    if (sweep.cancelled) {
        LOG_INFO(Runner, "Sweep cancelled after {} of {} runs", finishedRuns, totalRuns);
    }

    return Result<SweepResult, ConfigError>::okay(std::move(sweep));
}

} // namespace NonoGen
