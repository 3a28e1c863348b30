#include "../include/adaptive-governor/config_parser.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <type_traits>

namespace AdaptiveGovernor
{

namespace
{

// Missing or wrongly typed keys leave the default in place
template <typename T> void readNumber(const nlohmann::json &section, const char *key, T &target)
{
    if (section.contains(key) && section[key].is_number())
    {
        if constexpr (std::is_unsigned_v<T>)
        {
            if (section[key].is_number_integer() && section[key].get<int64_t>() < 0)
            {
                Logger::warn(LogCategory::CONFIG, "Ignoring negative value for {}", key);
                return;
            }
        }
        target = section[key].get<T>();
    }
}

void readBool(const nlohmann::json &section, const char *key, bool &target)
{
    if (section.contains(key) && section[key].is_boolean())
    {
        target = section[key];
    }
}

void readString(const nlohmann::json &section, const char *key, std::string &target)
{
    if (section.contains(key) && section[key].is_string())
    {
        target = section[key];
    }
}

const nlohmann::json *section(const nlohmann::json &parent, const char *key)
{
    if (parent.contains(key) && parent[key].is_object())
    {
        return &parent[key];
    }
    return nullptr;
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

void parseMultipliers(const nlohmann::json &multipliers, MultiplierTable &table)
{
    static const char *const names[2][3] = {
        { "foreground_normal", "foreground_elevated", "foreground_critical" },
        { "background_normal", "background_elevated", "background_critical" },
    };

    for (size_t phase = 0; phase < 2; ++phase)
    {
        for (size_t pressure = 0; pressure < 3; ++pressure)
        {
            readNumber(multipliers, names[phase][pressure], table[phase][pressure]);
        }
    }
}

} // namespace

std::optional<GovernorConfig> ConfigParser::parseJsonFile(const std::string &file_path)
{
    Logger::debug(LogCategory::CONFIG, "Opening config file: {}", file_path);

    std::ifstream file(file_path, std::ios::in);
    if (!file.is_open())
    {
        if (std::filesystem::exists(file_path))
        {
            Logger::error(LogCategory::CONFIG, "Config file exists but cannot be opened: {}", file_path);
        }
        else
        {
            Logger::error(LogCategory::CONFIG, "Config file does not exist: {} (cwd {})", file_path,
                          std::filesystem::current_path().string());
        }
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Logger::debug(LogCategory::CONFIG, "Read {} bytes from {}", content.size(), file_path);

    return parseJsonString(content);
}

std::optional<GovernorConfig> ConfigParser::parseJsonString(std::string_view json_content)
{
    try
    {
        nlohmann::json j = nlohmann::json::parse(json_content);
        if (!j.is_object())
        {
            Logger::error(LogCategory::CONFIG, "Configuration root must be a JSON object");
            return std::nullopt;
        }

        GovernorConfig config;

        if (const auto *cache = section(j, "cache"))
        {
            readNumber(*cache, "capacity_bytes", config.cache.capacity_bytes);
            readNumber(*cache, "aggressive_idle_seconds", config.cache.aggressive_idle_seconds);
            readNumber(*cache, "aggressive_min_access_count", config.cache.aggressive_min_access_count);
            readNumber(*cache, "aggressive_shrink_ratio", config.cache.aggressive_shrink_ratio);
            readNumber(*cache, "min_capacity_bytes", config.cache.min_capacity_bytes);
            readNumber(*cache, "critical_capacity_ratio", config.cache.critical_capacity_ratio);
            readNumber(*cache, "top_entries_count", config.cache.top_entries_count);
        }

        if (const auto *requests = section(j, "requests"))
        {
            readNumber(*requests, "timeout_ms", config.requests.timeout_ms);
            readNumber(*requests, "max_attempts", config.requests.max_attempts);
            readNumber(*requests, "backoff_base_ms", config.requests.backoff_base_ms);
            readNumber(*requests, "max_concurrent", config.requests.max_concurrent);
            readNumber(*requests, "worker_threads", config.requests.worker_threads);
            readNumber(*requests, "default_cache_ttl_ms", config.requests.default_cache_ttl_ms);

            if (const auto *rate_limit = section(*requests, "rate_limit"))
            {
                readNumber(*rate_limit, "window_ms", config.requests.rate_limit.window_ms);
                readNumber(*rate_limit, "max_requests", config.requests.rate_limit.max_requests);

                if (const auto *classes = section(*rate_limit, "classes"))
                {
                    for (const auto &[name, limit] : classes->items())
                    {
                        if (limit.is_number_unsigned())
                        {
                            config.requests.rate_limit.classes[name] = limit.get<uint32_t>();
                        }
                        else
                        {
                            Logger::warn(LogCategory::CONFIG, "Ignoring rate limit class {}: not a count", name);
                        }
                    }
                }
            }
        }

        if (const auto *scheduler = section(j, "scheduler"))
        {
            readNumber(*scheduler, "sample_interval_ms", config.scheduler.sample_interval_ms);
            readNumber(*scheduler, "elevated_threshold", config.scheduler.elevated_threshold);
            readNumber(*scheduler, "critical_threshold", config.scheduler.critical_threshold);
            readNumber(*scheduler, "janitor_interval_ms", config.scheduler.janitor_interval_ms);
            readNumber(*scheduler, "rate_limit_prune_interval_ms", config.scheduler.rate_limit_prune_interval_ms);

            if (const auto *multipliers = section(*scheduler, "multipliers"))
            {
                parseMultipliers(*multipliers, config.scheduler.multipliers);
            }
        }

        if (const auto *persistence = section(j, "persistence"))
        {
            readBool(*persistence, "enabled", config.persistence.enabled);
            readString(*persistence, "path", config.persistence.path);
        }

        if (const auto *metrics = section(j, "metrics"))
        {
            readBool(*metrics, "enabled", config.metrics.enabled);
            readString(*metrics, "bind_address", config.metrics.bind_address);
            readNumber(*metrics, "port", config.metrics.port);
            readString(*metrics, "endpoint_path", config.metrics.endpoint_path);
        }

        if (const auto *logging = section(j, "logging"))
        {
            readString(*logging, "level", config.logging.level);
            readString(*logging, "output", config.logging.output);
            readString(*logging, "file", config.logging.file);
            readString(*logging, "categories", config.logging.categories);
        }

        validate(config);

        Logger::info(LogCategory::CONFIG, "Configuration loaded: capacity {} bytes, {} rate limit classes",
                     config.cache.capacity_bytes, config.requests.rate_limit.classes.size());
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "JSON parsing error: {}", e.what());
        return std::nullopt;
    }
}

size_t ConfigParser::validate(GovernorConfig &config)
{
    const GovernorConfig defaults;
    size_t fixes = 0;

    auto fix = [&fixes](const char *name, auto &value, const auto &fallback)
    {
        Logger::warn(LogCategory::CONFIG, "Invalid {} ({}), using {}", name, value, fallback);
        value = fallback;
        fixes++;
    };

    if (config.cache.capacity_bytes == 0)
    {
        fix("cache.capacity_bytes", config.cache.capacity_bytes, defaults.cache.capacity_bytes);
    }
    if (config.cache.aggressive_shrink_ratio <= 0.0 || config.cache.aggressive_shrink_ratio > 1.0)
    {
        fix("cache.aggressive_shrink_ratio", config.cache.aggressive_shrink_ratio, defaults.cache.aggressive_shrink_ratio);
    }
    if (config.cache.critical_capacity_ratio <= 0.0 || config.cache.critical_capacity_ratio > 1.0)
    {
        fix("cache.critical_capacity_ratio", config.cache.critical_capacity_ratio, defaults.cache.critical_capacity_ratio);
    }
    if (config.cache.min_capacity_bytes > config.cache.capacity_bytes)
    {
        fix("cache.min_capacity_bytes", config.cache.min_capacity_bytes, config.cache.capacity_bytes);
    }

    if (config.requests.timeout_ms == 0)
    {
        fix("requests.timeout_ms", config.requests.timeout_ms, defaults.requests.timeout_ms);
    }
    if (config.requests.max_attempts == 0)
    {
        fix("requests.max_attempts", config.requests.max_attempts, defaults.requests.max_attempts);
    }
    else if (config.requests.max_attempts > RequestConfig::MAX_ATTEMPTS_LIMIT)
    {
        fix("requests.max_attempts", config.requests.max_attempts, RequestConfig::MAX_ATTEMPTS_LIMIT);
    }
    if (config.requests.max_concurrent == 0)
    {
        fix("requests.max_concurrent", config.requests.max_concurrent, defaults.requests.max_concurrent);
    }
    if (config.requests.worker_threads == 0)
    {
        fix("requests.worker_threads", config.requests.worker_threads, defaults.requests.worker_threads);
    }
    if (config.requests.rate_limit.window_ms == 0)
    {
        fix("requests.rate_limit.window_ms", config.requests.rate_limit.window_ms, defaults.requests.rate_limit.window_ms);
    }

    auto &scheduler = config.scheduler;
    bool thresholds_valid = scheduler.elevated_threshold > 0.0 && scheduler.critical_threshold <= 1.0 &&
                            scheduler.elevated_threshold < scheduler.critical_threshold;
    if (!thresholds_valid)
    {
        fix("scheduler.elevated_threshold", scheduler.elevated_threshold, defaults.scheduler.elevated_threshold);
        fix("scheduler.critical_threshold", scheduler.critical_threshold, defaults.scheduler.critical_threshold);
    }
    if (scheduler.sample_interval_ms == 0)
    {
        fix("scheduler.sample_interval_ms", scheduler.sample_interval_ms, defaults.scheduler.sample_interval_ms);
    }
    if (scheduler.janitor_interval_ms == 0)
    {
        fix("scheduler.janitor_interval_ms", scheduler.janitor_interval_ms, defaults.scheduler.janitor_interval_ms);
    }
    if (scheduler.rate_limit_prune_interval_ms == 0)
    {
        fix("scheduler.rate_limit_prune_interval_ms", scheduler.rate_limit_prune_interval_ms,
            defaults.scheduler.rate_limit_prune_interval_ms);
    }

    for (size_t phase = 0; phase < 2; ++phase)
    {
        for (size_t pressure = 0; pressure < 3; ++pressure)
        {
            if (!(scheduler.multipliers[phase][pressure] > 0.0))
            {
                fix("scheduler.multipliers", scheduler.multipliers[phase][pressure],
                    defaults.scheduler.multipliers[phase][pressure]);
            }
        }
    }

    return fixes;
}

LogLevel ConfigParser::parseLogLevel(const std::string &level_str)
{
    std::string lower_level = toLower(level_str);

    if (lower_level == "trace")
        return LogLevel::TRACE;
    if (lower_level == "debug")
        return LogLevel::DEBUG;
    if (lower_level == "info")
        return LogLevel::INFO;
    if (lower_level == "warn")
        return LogLevel::WARN;
    if (lower_level == "error")
        return LogLevel::ERR;
    if (lower_level == "fatal")
        return LogLevel::FATAL;
    if (lower_level == "off")
        return LogLevel::OFF;

    Logger::warn_fallback("Unknown log level '{}', using INFO", level_str);
    return LogLevel::INFO;
}

LogOutput ConfigParser::parseLogOutput(const std::string &output_str)
{
    std::string lower_output = toLower(output_str);

    if (lower_output == "console")
        return LogOutput::CONSOLE;
    if (lower_output == "file")
        return LogOutput::FILE;
    if (lower_output == "both")
        return LogOutput::BOTH;
    if (lower_output == "debug")
        return LogOutput::DEBUG_OUTPUT;
    if (lower_output == "disabled")
        return LogOutput::DISABLED;

    Logger::warn_fallback("Unknown log output '{}', using CONSOLE", output_str);
    return LogOutput::CONSOLE;
}

} // namespace AdaptiveGovernor
