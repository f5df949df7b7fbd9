/**
 * @file logger.h
 * @brief Structured logging API for the roomcast daemon and tools
 *
 * Thin facade over spdlog. Console output, rotating file output and the log
 * level are configured from the "logging" section of the JSON config.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace roomcast::logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    std::string name = "roomcastd";  // logger name shown in %n
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool consoleStderr = false;  // keep stdout free for command output
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * A second call on an already initialized logger only updates level and pattern.
 * Use reconfigure() to rebuild the sinks.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used before the config file has been read. Follow with reconfigure() once the
 * "logging" section is known. Messages go to stderr with the default pattern.
 */
bool initializeEarly();

/**
 * @brief Drop the current sinks and initialize again from @p config
 *
 * Used after config load and on SIGHUP reload.
 */
bool reconfigure(const LogConfig& config);

/**
 * @brief Flush pending messages and release the logger
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Get the underlying spdlog logger (lazily initialized with defaults)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace roomcast::logging

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                 \
    do {                                               \
        auto logger = roomcast::logging::getLogger();  \
        if (logger)                                    \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_DEBUG(...)                                 \
    do {                                               \
        auto logger = roomcast::logging::getLogger();  \
        if (logger)                                    \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_INFO(...)                                  \
    do {                                               \
        auto logger = roomcast::logging::getLogger();  \
        if (logger)                                    \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_WARN(...)                                  \
    do {                                               \
        auto logger = roomcast::logging::getLogger();  \
        if (logger)                                    \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_ERROR(...)                                 \
    do {                                               \
        auto logger = roomcast::logging::getLogger();  \
        if (logger)                                    \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = roomcast::logging::getLogger();    \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences
 *
 * Rate-limits logs in paths that fire per event (heartbeats, reconnect loops).
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

/**
 * @brief Log at most once per call site
 */
#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
