#pragma once

#include "RunCoordinator.h"
#include "SolverConfig.h"
#include "core/Result.h"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace NonoGen {

struct ConfigFileError {
    enum class Kind : uint8_t {
        Unreadable, // Exists but can't be opened or sized.
        Malformed,  // Empty, not JSON, or a value of the wrong type or enum name.
        Rejected,   // Parsed, but validateConfig refused it.
    };

    Kind kind = Kind::Malformed;
    std::filesystem::path path;
    std::string message;

    std::string toString() const;
};

const char* toString(ConfigFileError::Kind kind);

/**
 * @brief Reads solver.json and sweep.json from the first directory that has them.
 *
 * Directories, in order: the override given at construction, ./config,
 * ~/.config/nonogen, /etc/nonogen. In each, "<file>.local" shadows "<file>"
 * completely. A file that exists nowhere means built-in defaults; a file that
 * exists but can't be used is an error, never a silent fallback.
 */
class SolverConfigFiles {
public:
    static constexpr const char* SOLVER_FILE = "solver.json";
    static constexpr const char* SWEEP_FILE = "sweep.json";

    explicit SolverConfigFiles(std::optional<std::filesystem::path> overrideDir = std::nullopt);

    std::vector<std::filesystem::path> searchPaths() const;
    std::optional<std::filesystem::path> locate(const std::string& filename) const;

    // Defaults when absent. The loaded config has passed validateConfig.
    Result<SolverConfig, ConfigFileError> loadSolverConfig() const;

    // Defaults when absent. The base config and every cell of its grid are validated.
    Result<SweepSpec, ConfigFileError> loadSweepSpec() const;

private:
    // nullopt when the file is in none of the search paths.
    Result<std::optional<nlohmann::json>, ConfigFileError> readJson(
        const std::string& filename, std::filesystem::path& foundAt) const;

    std::optional<std::filesystem::path> overrideDir_;
};

} // namespace NonoGen
