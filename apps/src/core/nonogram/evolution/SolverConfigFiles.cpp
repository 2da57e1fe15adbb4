#include "SolverConfigFiles.h"
#include "core/LoggingChannels.h"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace NonoGen {

namespace fs = std::filesystem;

namespace {

ConfigFileError fail(ConfigFileError::Kind kind, const fs::path& path, std::string message)
{
    ConfigFileError error{ kind, path, std::move(message) };
    LOG_ERROR(Config, "{}", error.toString());
    return error;
}

} // namespace

const char* toString(ConfigFileError::Kind kind)
{
    switch (kind) {
        case ConfigFileError::Kind::Unreadable:
            return "Unreadable";
        case ConfigFileError::Kind::Malformed:
            return "Malformed";
        case ConfigFileError::Kind::Rejected:
            return "Rejected";
    }
    return "Unknown";
}

std::string ConfigFileError::toString() const
{
    return path.string() + ": " + message;
}

SolverConfigFiles::SolverConfigFiles(std::optional<fs::path> overrideDir)
    : overrideDir_(std::move(overrideDir))
{}

std::vector<fs::path> SolverConfigFiles::searchPaths() const
{
    std::vector<fs::path> paths;
    if (overrideDir_.has_value()) {
        paths.push_back(overrideDir_.value());
    }
    paths.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "nonogen");
    }
    paths.push_back(fs::path("/etc/nonogen"));
    return paths;
}

std::optional<fs::path> SolverConfigFiles::locate(const std::string& filename) const
{
    for (const fs::path& dir : searchPaths()) {
        for (const fs::path candidate : { dir / (filename + ".local"), dir / filename }) {
            if (fs::is_regular_file(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<std::optional<nlohmann::json>, ConfigFileError> SolverConfigFiles::readJson(
    const std::string& filename, fs::path& foundAt) const
{
    using JsonResult = Result<std::optional<nlohmann::json>, ConfigFileError>;

    const auto path = locate(filename);
    if (!path.has_value()) {
        LOG_DEBUG(Config, "No {} found, using defaults", filename);
        return JsonResult::okay(std::nullopt);
    }
    foundAt = path.value();

    std::error_code ec;
    const auto size = fs::file_size(foundAt, ec);
    if (ec) {
        return JsonResult::error(fail(ConfigFileError::Kind::Unreadable, foundAt, ec.message()));
    }
    if (size == 0) {
        return JsonResult::error(fail(ConfigFileError::Kind::Malformed, foundAt, "file is empty"));
    }

    std::ifstream file(foundAt);
    if (!file.is_open()) {
        return JsonResult::error(
            fail(ConfigFileError::Kind::Unreadable, foundAt, "cannot open for reading"));
    }

    LOG_INFO(Config, "Loading {}", foundAt.string());
    try {
        return JsonResult::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        return JsonResult::error(fail(ConfigFileError::Kind::Malformed, foundAt, e.what()));
    }
}

Result<SolverConfig, ConfigFileError> SolverConfigFiles::loadSolverConfig() const
{
    fs::path path;
    auto json = readJson(SOLVER_FILE, path);
    if (json.isError()) {
        return Result<SolverConfig, ConfigFileError>::error(std::move(json).errorValue());
    }
    if (!json.value().has_value()) {
        return Result<SolverConfig, ConfigFileError>::okay(SolverConfig{});
    }

    SolverConfig config;
    try {
        config = json.value()->get<SolverConfig>();
    }
    catch (const std::exception& e) {
        return Result<SolverConfig, ConfigFileError>::error(
            fail(ConfigFileError::Kind::Malformed, path, e.what()));
    }

    auto validated = validateConfig(config);
    if (validated.isError()) {
        return Result<SolverConfig, ConfigFileError>::error(fail(
            ConfigFileError::Kind::Rejected, path, validated.errorValue().toString()));
    }
    return Result<SolverConfig, ConfigFileError>::okay(validated.value());
}

Result<SweepSpec, ConfigFileError> SolverConfigFiles::loadSweepSpec() const
{
    fs::path path;
    auto json = readJson(SWEEP_FILE, path);
    if (json.isError()) {
        return Result<SweepSpec, ConfigFileError>::error(std::move(json).errorValue());
    }
    if (!json.value().has_value()) {
        return Result<SweepSpec, ConfigFileError>::okay(SweepSpec{});
    }

    SweepSpec spec;
    try {
        spec = json.value()->get<SweepSpec>();
    }
    catch (const std::exception& e) {
        return Result<SweepSpec, ConfigFileError>::error(
            fail(ConfigFileError::Kind::Malformed, path, e.what()));
    }

    auto base = validateConfig(spec.base);
    if (base.isError()) {
        return Result<SweepSpec, ConfigFileError>::error(
            fail(ConfigFileError::Kind::Rejected, path, "base: " + base.errorValue().toString()));
    }
    for (const ParameterSet& cell :
         makeParameterGrid(spec.base, spec.crossoverRates, spec.mutationRates, spec.slideTries)) {
        auto validated = validateConfig(cell.config);
        if (validated.isError()) {
            return Result<SweepSpec, ConfigFileError>::error(fail(
                ConfigFileError::Kind::Rejected,
                path,
                cell.label + ": " + validated.errorValue().toString()));
        }
    }
    return Result<SweepSpec, ConfigFileError>::okay(spec);
}

} // namespace NonoGen
