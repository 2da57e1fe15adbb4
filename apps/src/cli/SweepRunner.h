#pragma once

#include "core/nonogram/BuiltinPuzzles.h"
#include "core/nonogram/evolution/RunCoordinator.h"

#include <optional>
#include <string>

namespace NonoGen {
namespace Client {

/**
 * Runs a parameter sweep and prints one line per configuration: solved runs,
 * mean best fitness and mean generations to solve.
 */
class SweepRunner {
public:
    // Returns false if the sweep could not run or its output could not be written.
    bool run(
        const BuiltinPuzzle& puzzle,
        const SweepSpec& spec,
        const std::optional<std::string>& outputPath);

    // Async-signal-safe.
    void requestStop() { coordinator_.cancel(); }

private:
    RunCoordinator coordinator_;
};

} // namespace Client
} // namespace NonoGen
