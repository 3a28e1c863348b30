#include "../include/adaptive-governor/logger.hpp"
#include <array>
#include <cctype>
#include <chrono>
#include <fmt/chrono.h>
#include <iostream>
#include <utility>

namespace AdaptiveGovernor
{

namespace
{

const std::array<std::pair<const char *, LogCategory>, 12> category_names{ {
{ "general", LogCategory::GENERAL },
{ "cache", LogCategory::CACHE },
{ "request", LogCategory::REQUEST },
{ "requests", LogCategory::REQUEST },
{ "ratelimit", LogCategory::RATE_LIMIT },
{ "rate_limit", LogCategory::RATE_LIMIT },
{ "scheduler", LogCategory::SCHEDULER },
{ "lifecycle", LogCategory::LIFECYCLE },
{ "persistence", LogCategory::PERSISTENCE },
{ "config", LogCategory::CONFIG },
{ "metrics", LogCategory::METRICS },
{ "all", LogCategory::ALL },
} };

std::string trim(const std::string &value)
{
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
    {
        return {};
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

void Logger::initialize(LogLevel level, LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    instance.current_level = level;
    instance.output_type = output;
    instance.initialized = true;

    if (output == LogOutput::FILE || output == LogOutput::BOTH)
    {
        if (instance.log_filename.empty())
        {
            instance.log_filename = "adaptive-governor.log";
        }

        instance.log_file = std::make_unique<std::ofstream>(instance.log_filename, std::ios::app);

        if (!instance.log_file->is_open())
        {
            instance.output_type = LogOutput::CONSOLE;
            std::cerr << "[Logger] Warning: Could not open log file '" << instance.log_filename
                      << "', falling back to console output\n";
        }
    }
}

void Logger::setLevel(LogLevel level)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.current_level = level;
}

void Logger::setOutput(LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.output_type = output;
}

void Logger::setLogFile(const std::string &filename)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    instance.log_filename = filename;

    // Reopen if a file sink is already active
    if ((instance.output_type == LogOutput::FILE || instance.output_type == LogOutput::BOTH) && instance.initialized)
    {
        instance.log_file = std::make_unique<std::ofstream>(filename, std::ios::app);

        if (!instance.log_file->is_open())
        {
            std::cerr << "[Logger] Warning: Could not open log file '" << filename << "'\n";
        }
    }
}

void Logger::setCategories(LogCategory categories)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.enabled_categories = categories;
}

void Logger::setCategoriesFromString(const std::string &categories_str)
{
    uint32_t mask = 0;
    size_t begin = 0;

    while (begin <= categories_str.size())
    {
        size_t comma = categories_str.find(',', begin);
        std::string name = trim(categories_str.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin));

        for (char &c : name)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        bool known = name.empty();
        for (const auto &[candidate, category] : category_names)
        {
            if (name == candidate)
            {
                mask |= static_cast<uint32_t>(category);
                known = true;
                break;
            }
        }

        if (!known)
        {
            warn_fallback("Unknown log category '{}' ignored", name);
        }

        if (comma == std::string::npos)
        {
            break;
        }
        begin = comma + 1;
    }

    setCategories(static_cast<LogCategory>(mask));
}

void Logger::shutdown()
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    if (instance.log_file && instance.log_file->is_open())
    {
        instance.log_file->close();
    }
    instance.log_file.reset();
    instance.initialized = false;
}

bool Logger::isEnabled(LogLevel level)
{
    const Logger &instance = getInstance();
    return instance.initialized && instance.output_type != LogOutput::DISABLED && level >= instance.current_level;
}

bool Logger::isEnabled(LogCategory category)
{
    const Logger &instance = getInstance();
    return (static_cast<uint32_t>(instance.enabled_categories) & static_cast<uint32_t>(category)) != 0;
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO ";
    case LogLevel::WARN:
        return "WARN ";
    case LogLevel::ERR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    case LogLevel::OFF:
        return "OFF  ";
    default:
        return "UNKN ";
    }
}

std::string Logger::categoryToString(LogCategory category)
{
    switch (category)
    {
    case LogCategory::GENERAL:
        return "GEN";
    case LogCategory::CACHE:
        return "CAC";
    case LogCategory::REQUEST:
        return "REQ";
    case LogCategory::RATE_LIMIT:
        return "RTL";
    case LogCategory::SCHEDULER:
        return "SCH";
    case LogCategory::LIFECYCLE:
        return "LFC";
    case LogCategory::PERSISTENCE:
        return "PER";
    case LogCategory::CONFIG:
        return "CFG";
    case LogCategory::METRICS:
        return "MET";
    default:
        return "UNK";
    }
}

std::string Logger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local_tm, ms.count());
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

void Logger::writeLog(LogLevel level, LogCategory category, const std::string &message)
{
    std::lock_guard<std::mutex> lock(log_mutex);

    if (!initialized || output_type == LogOutput::DISABLED)
    {
        return;
    }

    const std::string line =
    fmt::format("[{}] [{}] [{}] {}\n", getCurrentTimestamp(), levelToString(level), categoryToString(category), message);

    switch (output_type)
    {
    case LogOutput::CONSOLE:
        writeToConsole(line, level);
        break;
    case LogOutput::FILE:
        writeToFile(line);
        break;
    case LogOutput::BOTH:
        writeToConsole(line, level);
        writeToFile(line);
        break;
    case LogOutput::DEBUG_OUTPUT:
        writeToDebugOutput(line);
        break;
    case LogOutput::DISABLED:
        break;
    }
}

void Logger::writeToConsole(const std::string &line, LogLevel level)
{
    std::ostream &output = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    output << line;
}

void Logger::writeToFile(const std::string &line)
{
    if (!log_file || !log_file->is_open())
    {
        return;
    }

    *log_file << line;
    log_file->flush();
}

void Logger::writeToDebugOutput(const std::string &line)
{
    // No debugger channel on this platform
    std::cerr << line;
}

void Logger::error_fallback(const std::string &message)
{
    std::cerr << fmt::format("[FALLBACK ERROR] {}\n", message);
}

void Logger::warn_fallback(const std::string &message)
{
    std::cerr << fmt::format("[FALLBACK WARN] {}\n", message);
}

} // namespace AdaptiveGovernor
