/**
 * @file logger.h
 * @brief Process-wide spdlog logger for the media relay
 *
 * The logger is created lazily with console defaults the first time a LOG_*
 * macro runs, so relay loops and tests can log before the host configures
 * anything. A later initialize() call adjusts level and pattern in place.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace media_relay {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // Empty = console only
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Install the relay logger, or retune level and pattern if one exists
 *
 * Sinks are fixed by the first call; later calls only change level and pattern.
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Read a "logging" JSON section into a LogConfig
 *
 * Keys that are absent keep their current value in @p config.
 *
 * @return false with @p error set when a key has the wrong type
 */
bool logConfigFromJson(const nlohmann::json& section, LogConfig& config, std::string& error);

/**
 * @brief Initialize from the "logging" section of a JSON config file
 *
 * A missing file or missing section means console defaults.
 */
bool initializeFromConfig(const std::string& configPath);

void setLevel(LogLevel level);
LogLevel getLevel();

// Flushes every sink; called when the relay shuts down.
void flush();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive, accepts "warning", "err", "fatal" and "none". Unknown names map to Info.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace media_relay

#include <spdlog/spdlog.h>

#define MEDIA_RELAY_LOG_AT(spdlogMacro, ...)             \
    do {                                                 \
        auto logger = media_relay::logging::getLogger(); \
        if (logger)                                      \
            spdlogMacro(logger, __VA_ARGS__);            \
    } while (0)

#define LOG_TRACE(...) MEDIA_RELAY_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) MEDIA_RELAY_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) MEDIA_RELAY_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) MEDIA_RELAY_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) MEDIA_RELAY_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)

// Skips argument formatting when the condition is false.
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

// Rate limit for per-packet paths: logs the 1st, (n+1)th, ... occurrence at this call site.
#define LOG_EVERY_N(level, n, ...)                             \
    do {                                                       \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {    \
            LOG_##level(__VA_ARGS__);                          \
        }                                                      \
    } while (0)
