#include "SolveRunner.h"
#include "SweepRunner.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/nonogram/BuiltinPuzzles.h"
#include "core/nonogram/evolution/RunCoordinator.h"
#include "core/nonogram/evolution/SolverConfig.h"
#include "core/nonogram/evolution/SolverConfigFiles.h"

#include <args.hxx>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace NonoGen;

namespace {

std::string getCommandListHelp()
{
    return "Command: 'list', 'solve' or 'sweep'";
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  nonogen-cli list\n"
           "  nonogen-cli solve tree --seed 23\n"
           "  nonogen-cli solve boat --population 300 --mutation 0.02 --history boat.json\n"
           "  nonogen-cli sweep stripes --output stripes-sweep.json\n";
}

void printPuzzleList()
{
    for (const auto& name : BuiltinPuzzles::names()) {
        const auto puzzle = BuiltinPuzzles::find(name);
        if (!puzzle.has_value()) {
            continue;
        }
        std::cout << name << "  " << puzzle->description << "\n";
    }
}

std::optional<BuiltinPuzzle> requirePuzzle(args::Positional<std::string>& puzzleArg)
{
    if (!puzzleArg) {
        std::cerr << "Error: puzzle name is required (see 'nonogen-cli list')\n";
        return std::nullopt;
    }

    const std::string name = args::get(puzzleArg);
    auto puzzle = BuiltinPuzzles::find(name);
    if (!puzzle.has_value()) {
        std::cerr << "Error: unknown puzzle '" << name << "' (see 'nonogen-cli list')\n";
    }
    return puzzle;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "nonogen CLI", "Genetic solver for colored nonograms.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> logConfig(
        parser, "file", "Logging config JSON (created with defaults if missing)", { "log-config" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Channel levels, e.g. 'evolution:debug,*:warn'",
        { "log-channels" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for solver.json and sweep.json", { "config-dir" });

    args::ValueFlag<int> population(parser, "n", "Solve: population size", { "population" });
    args::ValueFlag<int> elite(parser, "n", "Solve: elite count", { "elite" });
    args::ValueFlag<int> tournament(parser, "k", "Solve: tournament size", { "tournament" });
    args::ValueFlag<double> crossover(parser, "p", "Solve: crossover rate", { "crossover" });
    args::ValueFlag<double> mutation(parser, "p", "Solve: per-cell mutation rate", { "mutation" });
    args::ValueFlag<int> generations(
        parser, "n", "Solve: maximum generations", { "generations" });
    args::ValueFlag<int> stagnation(
        parser, "n", "Solve: stop after n generations without improvement", { "stagnation" });
    args::ValueFlag<uint64_t> seed(parser, "seed", "Solve: random seed", { "seed" });
    args::ValueFlag<int> threads(
        parser, "n", "Solve: evaluation threads (0 = all cores)", { "threads" });
    args::ValueFlag<int> timeLimitMs(
        parser, "ms", "Solve: wall clock budget in milliseconds", { "time-limit-ms" });
    args::ValueFlag<std::string> historyFile(
        parser, "file", "Solve: write the convergence history as JSON", { "history" });
    args::ValueFlag<std::string> outputFile(
        parser, "file", "Sweep: write the results as JSON", { "output" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::Positional<std::string> puzzleName(parser, "puzzle", "Built-in puzzle name");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig), "nonogen");
    }
    else {
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "nonogen");
    }
    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }
    std::optional<std::filesystem::path> configOverride;
    if (configDir) {
        configOverride = args::get(configDir);
    }
    const SolverConfigFiles configFiles(configOverride);

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);

    if (commandName == "list") {
        printPuzzleList();
        return 0;
    }

    if (commandName == "solve") {
        const auto puzzle = requirePuzzle(puzzleName);
        if (!puzzle.has_value()) {
            return 1;
        }

        auto loaded = configFiles.loadSolverConfig();
        if (loaded.isError()) {
            std::cerr << "Error: " << loaded.errorValue().toString() << "\n";
            return 1;
        }
        SolverConfig config = loaded.value();

        // Command line flags win over the config file.
        if (population) {
            config.populationSize = args::get(population);
        }
        if (elite) {
            config.eliteCount = args::get(elite);
        }
        if (tournament) {
            config.tournamentSize = args::get(tournament);
        }
        if (crossover) {
            config.crossoverRate = args::get(crossover);
        }
        if (mutation) {
            config.mutationRate = args::get(mutation);
        }
        if (generations) {
            config.maxGenerations = args::get(generations);
        }
        if (stagnation) {
            config.stagnationLimit = args::get(stagnation);
        }
        if (seed) {
            config.randomSeed = args::get(seed);
        }
        if (threads) {
            config.evaluationThreads = args::get(threads);
        }
        if (timeLimitMs) {
            config.timeLimitMs = args::get(timeLimitMs);
        }

        std::optional<std::string> historyPath;
        if (historyFile) {
            historyPath = args::get(historyFile);
        }

        Client::SolveRunner runner;

        // Must be a plain function pointer, so the runner is reached through a static.
        static Client::SolveRunner* g_runner = nullptr;
        static auto sigintHandler = +[](int) -> void {
            if (g_runner) {
                g_runner->requestStop();
            }
        };

        g_runner = &runner;
        auto oldHandler = std::signal(SIGINT, sigintHandler);

        const Client::SolveSummary summary = runner.run(puzzle.value(), config, historyPath);

        std::signal(SIGINT, oldHandler);
        g_runner = nullptr;

        std::cout << ReflectSerializer::to_json(summary).dump(2) << std::endl;
        return summary.completed && summary.errorMessage.empty() ? 0 : 1;
    }

    if (commandName == "sweep") {
        const auto puzzle = requirePuzzle(puzzleName);
        if (!puzzle.has_value()) {
            return 1;
        }

        auto loaded = configFiles.loadSweepSpec();
        if (loaded.isError()) {
            std::cerr << "Error: " << loaded.errorValue().toString() << "\n";
            return 1;
        }

        std::optional<std::string> outputPath;
        if (outputFile) {
            outputPath = args::get(outputFile);
        }

        Client::SweepRunner runner;

        static Client::SweepRunner* g_sweepRunner = nullptr;
        static auto sigintHandler = +[](int) -> void {
            if (g_sweepRunner) {
                g_sweepRunner->requestStop();
            }
        };

        g_sweepRunner = &runner;
        auto oldHandler = std::signal(SIGINT, sigintHandler);

        const bool ok = runner.run(puzzle.value(), loaded.value(), outputPath);

        std::signal(SIGINT, oldHandler);
        g_sweepRunner = nullptr;

        return ok ? 0 : 1;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << parser;
    return 1;
}
