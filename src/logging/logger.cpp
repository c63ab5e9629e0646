/**
 * @file logger.cpp
 * @brief spdlog setup behind the relay's LOG_* macros
 */

#include "logging/logger.h"

#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace media_relay {
namespace logging {

namespace {

constexpr const char* kLoggerName = "media_relay";

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum native;
    std::string_view name;
};

constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> ready{false};
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

spdlog::level::level_enum toNative(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.native;
        }
    }
    return spdlog::level::info;
}

LogLevel fromNative(spdlog::level::level_enum native) {
    for (const auto& entry : kLevels) {
        if (entry.native == native) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

// Caller holds state().mutex and has checked that no logger exists yet.
bool createLocked(LoggerState& s, const LogConfig& config) {
    try {
        auto sinks = makeSinks(config);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(toNative(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::err);
        spdlog::set_default_logger(logger);
        s.logger = std::move(logger);
        s.ready.store(true, std::memory_order_release);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    SPDLOG_LOGGER_INFO(s.logger, "Logging initialized (level={}{}{})",
                       levelToString(config.level), config.filePath.empty() ? "" : ", file=",
                       config.filePath);
    return true;
}

}  // namespace

bool initialize(const LogConfig& config) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.ready.load(std::memory_order_acquire)) {
        s.logger->set_level(toNative(config.level));
        s.logger->set_pattern(config.pattern);
        return true;
    }
    return createLocked(s, config);
}

bool logConfigFromJson(const nlohmann::json& section, LogConfig& config, std::string& error) {
    if (!section.is_object()) {
        error = "logging section must be an object";
        return false;
    }

    LogConfig parsed = config;
    try {
        if (section.contains("level")) {
            parsed.level = stringToLevel(section.at("level").get<std::string>());
        }
        if (section.contains("filePath")) {
            parsed.filePath = section.at("filePath").get<std::string>();
        }
        if (section.contains("maxFileSize")) {
            parsed.maxFileSize = section.at("maxFileSize").get<size_t>();
        }
        if (section.contains("maxBackups")) {
            parsed.maxBackups = section.at("maxBackups").get<size_t>();
        }
        if (section.contains("consoleOutput")) {
            parsed.consoleOutput = section.at("consoleOutput").get<bool>();
        }
        if (section.contains("coloredOutput")) {
            parsed.coloredOutput = section.at("coloredOutput").get<bool>();
        }
        if (section.contains("pattern")) {
            parsed.pattern = section.at("pattern").get<std::string>();
        }
    } catch (const nlohmann::json::exception& ex) {
        error = std::string("Invalid logging parameters: ") + ex.what();
        return false;
    }

    config = parsed;
    return true;
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json j;
            file >> j;
            std::string error;
            if (j.is_object() && j.contains("logging") &&
                !logConfigFromJson(j["logging"], config, error)) {
                // The logger does not exist yet, so this goes to stderr
                std::cerr << "Logging config: " << error << ", using defaults" << std::endl;
                config = LogConfig{};
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "Logging config: failed to parse " << configPath << ": " << ex.what()
                      << std::endl;
        }
    }

    return initialize(config);
}

void setLevel(LogLevel level) {
    if (auto logger = getLogger()) {
        logger->set_level(toNative(level));
    }
}

LogLevel getLevel() {
    if (auto logger = getLogger()) {
        return fromNative(logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    LoggerState& s = state();
    if (s.ready.load(std::memory_order_acquire)) {
        s.logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    LoggerState& s = state();
    if (!s.ready.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.ready.load(std::memory_order_acquire)) {
            createLocked(s, LogConfig{});
        }
    }
    return s.logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace media_relay
