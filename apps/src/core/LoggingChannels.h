#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace NonoGen {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Cli, Config, Evaluation, Evolution, Puzzle, Runner };

const char* toString(LogChannel channel);
std::optional<LogChannel> logChannelFromString(const std::string& name);

/**
 * @brief Named loggers per subsystem, all writing to the same console and file sinks.
 *
 * Lets a sweep be debugged at "evolution:debug" without the evaluator pool
 * flooding the console.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name injected into the pattern (e.g., "cli", "tests")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>.
     * Writes a default config if neither exists.
     * @return true if a config file was applied, false if built-in defaults were used.
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all.
     * Examples:
     *   "evolution:debug" - per-generation statistics
     *   "*:warn,runner:info" - quiet except for sweep progress
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    /**
     * @brief Set the level of a channel by name. Unknown names are logged and ignored.
     */
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    /**
     * @brief Built-in configuration written when no logging config exists yet.
     */
    static nlohmann::json defaultConfig();

private:
    static void createChannelLoggers(spdlog::level::level_enum level);
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);
    static void installDefaultLogger(
        const std::string& componentName,
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& filePath);

    static std::optional<nlohmann::json> loadConfigFile(const std::string& configPath);
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static std::atomic<bool> initialized_;
    static std::mutex initMutex_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros from other libraries.
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::NonoGen::LoggingChannels::get(::NonoGen::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::NonoGen::LoggingChannels::get(::NonoGen::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::NonoGen::LoggingChannels::get(::NonoGen::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::NonoGen::LoggingChannels::get(::NonoGen::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::NonoGen::LoggingChannels::get(::NonoGen::LogChannel::channel), __VA_ARGS__)

// Default logger (no channel name in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace NonoGen
