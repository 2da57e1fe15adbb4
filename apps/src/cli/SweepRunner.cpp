#include "SweepRunner.h"
#include "core/LoggingChannels.h"

#include <fstream>
#include <iomanip>
#include <iostream>

namespace NonoGen {
namespace Client {

namespace {

std::optional<double> meanGenerationsToSolve(const SweepCell& cell)
{
    double total = 0.0;
    int count = 0;
    for (const auto& run : cell.runs) {
        if (run.has_value() && run->generationsToSolve.has_value()) {
            total += run->generationsToSolve.value();
            count++;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return total / count;
}

} // namespace

bool SweepRunner::run(
    const BuiltinPuzzle& puzzle,
    const SweepSpec& spec,
    const std::optional<std::string>& outputPath)
{
    auto result = coordinator_.runSweep(puzzle.puzzle, spec);
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue().toString() << "\n";
        return false;
    }
    const SweepResult& sweep = result.value();

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& cell : sweep.cells) {
        const auto mean = cell.meanBestFitness();
        const auto generations = meanGenerationsToSolve(cell);
        std::cout << std::left << std::setw(44) << cell.parameters.label << " solved "
                  << cell.solvedCount() << "/" << sweep.seeds.size() << "  mean best ";
        if (mean.has_value()) {
            std::cout << mean.value();
        }
        else {
            std::cout << "-";
        }
        std::cout << "  mean gens to solve ";
        if (generations.has_value()) {
            std::cout << generations.value();
        }
        else {
            std::cout << "-";
        }
        std::cout << "\n";
    }

    if (const auto best = sweep.bestCell()) {
        std::cout << "best: " << sweep.cells[best.value()].parameters.label << "\n";
    }
    if (sweep.cancelled) {
        std::cout << "(sweep cancelled, partial results)\n";
    }

    if (outputPath.has_value()) {
        std::ofstream file(outputPath.value());
        if (!file) {
            LOG_ERROR(Cli, "Cannot write sweep results to {}", outputPath.value());
            return false;
        }
        file << sweep.toJson().dump(2) << "\n";
        LOG_INFO(Cli, "Wrote sweep results to {}", outputPath.value());
    }

    return true;
}

} // namespace Client
} // namespace NonoGen
