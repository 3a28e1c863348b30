#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace AdaptiveGovernor
{

enum class LogLevel : std::uint8_t
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

enum class LogOutput : std::uint8_t
{
    CONSOLE = 0,
    FILE = 1,
    BOTH = 2,
    DEBUG_OUTPUT = 3,
    DISABLED = 4
};

enum class LogCategory : std::uint32_t
{
    GENERAL = 1 << 0,     // 0x001 - Startup, demo driver
    CACHE = 1 << 1,       // 0x002 - Cache store admissions, evictions, janitor
    REQUEST = 1 << 2,     // 0x004 - Coordinator execution, retries, timeouts
    RATE_LIMIT = 1 << 3,  // 0x008 - Rate limiter refusals and pruning
    SCHEDULER = 1 << 4,   // 0x010 - Periodic task loop
    LIFECYCLE = 1 << 5,   // 0x020 - Phase and pressure transitions
    PERSISTENCE = 1 << 6, // 0x040 - Durable mirror
    CONFIG = 1 << 7,      // 0x080 - Configuration
    METRICS = 1 << 8,     // 0x100 - Metrics exposer
    ALL = 0xFFFFFFFF
};

class Logger
{
    public:
    static void initialize(LogLevel level = LogLevel::INFO, LogOutput output = LogOutput::CONSOLE);
    static void setLevel(LogLevel level);
    static void setOutput(LogOutput output);
    static void setLogFile(const std::string &filename);
    static void setCategories(LogCategory categories);
    static void setCategoriesFromString(const std::string &categories_str);
    static void shutdown();

    // Usable before initialize(), always to stderr
    static void error_fallback(const std::string &message);
    static void warn_fallback(const std::string &message);

    template <typename... Args>
    static void error_fallback(const std::string &format, Args &&...args);

    template <typename... Args>
    static void warn_fallback(const std::string &format, Args &&...args);

    template <typename... Args>
    static void trace(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void debug(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void info(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void warn(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void error(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void fatal(LogCategory category, const std::string &format, Args &&...args);

    static bool isEnabled(LogLevel level);
    static bool isEnabled(LogCategory category);
    static std::string levelToString(LogLevel level);
    static std::string categoryToString(LogCategory category);
    static std::string getCurrentTimestamp();

    private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    static Logger &getInstance();

    template <typename... Args>
    static void log(LogLevel level, LogCategory category, const std::string &format, Args &&...args);

    void writeLog(LogLevel level, LogCategory category, const std::string &message);
    void writeToConsole(const std::string &line, LogLevel level);
    void writeToFile(const std::string &line);
    void writeToDebugOutput(const std::string &line);

    template <typename... Args>
    static std::string formatString(const std::string &format, Args &&...args);

    LogLevel current_level{ LogLevel::INFO };
    LogOutput output_type{ LogOutput::CONSOLE };
    LogCategory enabled_categories{ LogCategory::ALL };
    std::string log_filename;
    std::unique_ptr<std::ofstream> log_file;
    mutable std::mutex log_mutex;
    bool initialized{ false };
};

template <typename... Args>
void Logger::log(LogLevel level, LogCategory category, const std::string &format, Args &&...args)
{
#ifndef GOVERNOR_NO_LOGGING
    if (isEnabled(level) && isEnabled(category))
    {
        getInstance().writeLog(level, category, formatString(format, std::forward<Args>(args)...));
    }
#endif
}

template <typename... Args>
void Logger::trace(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::TRACE, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::debug(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::DEBUG, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::info(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::INFO, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::warn(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::WARN, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::error(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::ERR, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::fatal(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::FATAL, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::error_fallback(const std::string &format, Args &&...args)
{
    error_fallback(formatString(format, std::forward<Args>(args)...));
}

template <typename... Args>
void Logger::warn_fallback(const std::string &format, Args &&...args)
{
    warn_fallback(formatString(format, std::forward<Args>(args)...));
}

template <typename... Args>
std::string Logger::formatString(const std::string &format, Args &&...args)
{
    if constexpr (sizeof...(args) == 0)
    {
        return format;
    }
    else
    {
        return fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    }
}

// Usage:
// AdaptiveGovernor::Logger::debug(LogCategory::CACHE, "Evicted {} ({} bytes)", key, size);
// AdaptiveGovernor::Logger::warn(LogCategory::REQUEST, "Attempt {} timed out for {}", attempt, key);

} // namespace AdaptiveGovernor
