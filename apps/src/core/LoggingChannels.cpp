#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace NonoGen {

namespace {

constexpr std::array<LogChannel, 6> kAllChannels = {
    LogChannel::Cli,       LogChannel::Config, LogChannel::Evaluation,
    LogChannel::Evolution, LogChannel::Puzzle, LogChannel::Runner,
};

const char* const kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
const char* const kDefaultLogFile = "nonogen.log";

std::string injectComponent(const std::string& pattern, const std::string& componentName)
{
    if (componentName == "default") {
        return pattern;
    }

    // Insert the component name right after the timestamp.
    const size_t pos = pattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + pattern;
    }
    return pattern.substr(0, pos + 2) + "[" + componentName + "] " + pattern.substr(pos + 2);
}

std::string trim(const std::string& text)
{
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Cli:
            return "cli";
        case LogChannel::Config:
            return "config";
        case LogChannel::Evaluation:
            return "evaluation";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Puzzle:
            return "puzzle";
        case LogChannel::Runner:
            return "runner";
    }
    return "unknown";
}

std::optional<LogChannel> logChannelFromString(const std::string& name)
{
    for (LogChannel channel : kAllChannels) {
        if (name == toString(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

std::atomic<bool> LoggingChannels::initialized_{ false };
std::mutex LoggingChannels::initMutex_;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex_);
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = injectComponent(kBasePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    installDefaultLogger(componentName, consoleLevel, fileLevel, kDefaultLogFile);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests use gtest_main and never initialize explicitly.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) {
        return;
    }

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (LogChannel each : kAllChannels) {
                setChannelLevel(each, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
    spdlog::debug(
        "Set channel '{}' to level: {}", toString(channel), spdlog::level::to_string_view(level));
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    const auto parsed = logChannelFromString(channel);
    if (!parsed.has_value()) {
        spdlog::warn("Unknown log channel '{}', ignoring", channel);
        return;
    }
    setChannelLevel(parsed.value(), level);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "cli", "info" },
            { "config", "info" },
            { "evaluation", "info" },
            { "evolution", "info" },
            { "puzzle", "info" },
            { "runner", "info" } } },
    };
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex_);
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    const bool fromFile = config.has_value();
    applyConfig(fromFile ? config.value() : defaultConfig(), componentName);

    initialized_ = true;
    return fromFile;
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

std::optional<nlohmann::json> LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local logging config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create logging config, using built-in defaults");
            return std::nullopt;
        }
        pathToUse = configPath;
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
            return std::nullopt;
        }
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error(
            "Failed to parse logging config {}: {}, using built-in defaults", pathToUse, e.what());
        return std::nullopt;
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = kBasePattern;
    int flushIntervalMs = 1000;
    std::string filePath = kDefaultLogFile;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            pattern = defaults.value("pattern", std::string(kBasePattern));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }
    pattern = injectComponent(pattern, componentName);

    std::vector<spdlog::sink_ptr> sinks;
    try {
        const nlohmann::json sinksConfig =
            config.contains("sinks") ? config["sinks"] : defaultConfig()["sinks"];

        if (sinksConfig.contains("console") && sinksConfig["console"].value("enabled", true)) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            if (sinksConfig["console"].contains("level")) {
                consoleLevel =
                    parseLevelString(sinksConfig["console"]["level"].get<std::string>());
            }
            consoleSink->set_level(consoleLevel);
            sinks.push_back(consoleSink);
        }

        if (sinksConfig.contains("file") && sinksConfig["file"].value("enabled", true)) {
            const auto& fileCfg = sinksConfig["file"];
            filePath = fileCfg.value("path", std::string(kDefaultLogFile));
            if (fileCfg.contains("level")) {
                fileLevel = parseLevelString(fileCfg["level"].get<std::string>());
            }

            spdlog::sink_ptr fileSink;
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    filePath, maxSizeMB * 1024 * 1024, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    filePath, fileCfg.value("truncate", true));
            }
            fileSink->set_level(fileLevel);
            sinks.push_back(fileSink);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(consoleLevel);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
        filePath = kDefaultLogFile;
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                const auto parsed = logChannelFromString(channel);
                if (!parsed.has_value()) {
                    spdlog::warn("Unknown log channel '{}' in config, ignoring", channel);
                    continue;
                }
                spdlog::get(toString(parsed.value()))
                    ->set_level(parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(componentName, consoleLevel, fileLevel, filePath);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (LogChannel channel : kAllChannels) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::installDefaultLogger(
    const std::string& componentName,
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& filePath)
{
    // Separate sinks so the default pattern (no channel name) doesn't leak into channel loggers.
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    fileSink->set_level(fileLevel);

    const std::string defaultPattern =
        injectComponent("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName);
    consoleSink->set_pattern(defaultPattern);
    fileSink->set_pattern(defaultPattern);

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { consoleSink, fileSink };
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);

    spdlog::drop(loggerName);
    spdlog::set_default_logger(defaultLogger);
}

} // namespace NonoGen
