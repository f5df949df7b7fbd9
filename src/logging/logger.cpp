#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace roomcast::logging {

namespace {

struct LevelInfo {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    const char* name;
};

constexpr std::array<LevelInfo, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

// Accepted in config files and on the command line besides the canonical names
constexpr std::array<std::pair<const char*, LogLevel>, 4> kLevelAliases = {{
    {"warning", LogLevel::Warn},
    {"err", LogLevel::Error},
    {"fatal", LogLevel::Critical},
    {"none", LogLevel::Off},
}};

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

const LevelInfo& infoFor(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info;
        }
    }
    return kLevels[2];
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return infoFor(level).spdlogLevel;
}

template <typename ColorSink>
spdlog::sink_ptr makeColorSink(bool colored) {
    auto sink = std::make_shared<ColorSink>();
    if (!colored) {
        sink->set_color_mode(spdlog::color_mode::never);
    }
    return sink;
}

spdlog::sink_ptr makeConsoleSink(const LogConfig& config) {
    if (config.consoleStderr) {
        return makeColorSink<spdlog::sinks::stderr_color_sink_mt>(config.coloredOutput);
    }
    return makeColorSink<spdlog::sinks::stdout_color_sink_mt>(config.coloredOutput);
}

spdlog::sink_ptr makeFileSink(const LogConfig& config) {
    std::filesystem::path parent = std::filesystem::path(config.filePath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent << ": " << ec.message()
                      << std::endl;
        }
    }
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.filePath, config.maxFileSize, config.maxBackups);
}

// Caller holds g_init_mutex
void installLogger(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config) {
    for (auto& sink : sinks) {
        sink->set_level(toSpdlogLevel(config.level));
    }
    if (g_logger) {
        spdlog::drop(g_logger->name());
    }
    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(toSpdlogLevel(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(g_logger);
    g_initialized.store(true, std::memory_order_release);
}

bool initializeLocked(const LogConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.consoleOutput) {
            sinks.push_back(makeConsoleSink(config));
        }
        if (!config.filePath.empty()) {
            sinks.push_back(makeFileSink(config));
        }
        installLogger(std::move(sinks), config);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_initialized.load(std::memory_order_acquire)) {
            if (g_logger) {
                g_logger->set_level(toSpdlogLevel(config.level));
                g_logger->set_pattern(config.pattern);
            }
            return true;
        }
        if (!initializeLocked(config)) {
            return false;
        }
    }

    LOG_DEBUG("Logging initialized for {} (level={})", config.name, levelToString(config.level));
    return true;
}

bool initializeEarly() {
    LogConfig config;
    config.consoleStderr = true;
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    return initializeLocked(config);
}

bool reconfigure(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logger) {
            g_logger->flush();
        }
        if (!initializeLocked(config)) {
            return false;
        }
    }
    LOG_INFO("Logging configured (level={}{}{})", levelToString(config.level),
             config.filePath.empty() ? "" : ", file=", config.filePath);
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
        LOG_INFO("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (!g_logger) {
        return LogLevel::Info;
    }
    auto current = g_logger->level();
    for (const auto& info : kLevels) {
        if (info.spdlogLevel == current) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return infoFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& info : kLevels) {
        if (lower == info.name) {
            return info.level;
        }
    }
    for (const auto& alias : kLevelAliases) {
        if (lower == alias.first) {
            return alias.second;
        }
    }
    return LogLevel::Info;
}

}  // namespace roomcast::logging
