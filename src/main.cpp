#include <adaptive-governor/config_parser.hpp>
#include <adaptive-governor/governor.hpp>
#include <adaptive-governor/logger.hpp>
#include <adaptive-governor/metrics_collector.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace AdaptiveGovernor;

// Command line parsing structure
struct ProgramOptions
{
    std::string config_file = "governor.json";
    bool config_given = false;
    bool show_help = false;
    bool test_config_only = false;
    int requests = 24;

    // Application logging options, override the config file when given
    std::optional<LogLevel> log_level;
    std::optional<LogOutput> log_output;
    std::optional<std::string> log_file;
    std::optional<std::string> log_categories;
};

void printUsage()
{
    std::string usage =
    "Usage: AdaptiveGovernorDemo [OPTIONS]\n"
    "\n"
    "Options:\n"
    "  -c, --config FILE      Configuration file (default: governor.json)\n"
    "  -n, --requests COUNT   Simulated requests per phase (default: 24)\n"
    "      --test-config      Parse and print the configuration only\n"
    "  -h, --help             Show this help message\n"
    "\n"
    "Application Logging Options:\n"
    "  -l, --log-level LEVEL  Set log level: trace, debug, info, warn, error, fatal, off\n"
    "  -o, --log-output TYPE  Set output: console, file, both, debug, disabled\n"
    "  -f, --log-file FILE    Log file path\n"
    "      --log-categories   Comma separated: general,cache,request,ratelimit,scheduler,lifecycle,...\n"
    "\n"
    "Examples:\n"
    "  AdaptiveGovernorDemo --config governor.json\n"
    "  AdaptiveGovernorDemo --log-level debug --log-categories cache,lifecycle\n"
    "  AdaptiveGovernorDemo --test-config --config governor.json";

    Logger::info(LogCategory::GENERAL, usage);
}

const char *getNextArg(char **argv, int &i, int argc)
{
    if (i + 1 < argc)
    {
        return argv[++i];
    }
    return nullptr;
}

ProgramOptions parseCommandLine(int argc, char **argv)
{
    ProgramOptions options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg{ argv[i] };

        if (arg == "-c" || arg == "--config")
        {
            const char *config_path = getNextArg(argv, i, argc);
            if (config_path)
            {
                options.config_file = config_path;
                options.config_given = true;
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --config requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-n" || arg == "--requests")
        {
            const char *count = getNextArg(argv, i, argc);
            if (count && std::atoi(count) > 0)
            {
                options.requests = std::atoi(count);
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --requests requires a positive count");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "--test-config")
        {
            options.test_config_only = true;
        }
        else if (arg == "-l" || arg == "--log-level")
        {
            const char *log_level = getNextArg(argv, i, argc);
            if (log_level)
            {
                options.log_level = ConfigParser::parseLogLevel(log_level);
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --log-level requires a level (trace, debug, info, warn, error, fatal, off)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-o" || arg == "--log-output")
        {
            const char *log_output = getNextArg(argv, i, argc);
            if (log_output)
            {
                options.log_output = ConfigParser::parseLogOutput(log_output);
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --log-output requires a type (console, file, both, debug, disabled)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-f" || arg == "--log-file")
        {
            const char *log_file = getNextArg(argv, i, argc);
            if (log_file)
            {
                options.log_file = log_file;
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --log-file requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "--log-categories")
        {
            const char *categories = getNextArg(argv, i, argc);
            if (categories)
            {
                options.log_categories = categories;
            }
            else
            {
                Logger::error(LogCategory::GENERAL, "Error: --log-categories requires a list");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
            break;
        }
        else
        {
            Logger::error(LogCategory::GENERAL, "Unknown argument: {}", arg);
            options.show_help = true;
            break;
        }
    }

    return options;
}

void configureLogging(const LoggingConfig &logging, const ProgramOptions &options)
{
    LogLevel level = options.log_level.value_or(ConfigParser::parseLogLevel(logging.level));
    LogOutput output = options.log_output.value_or(ConfigParser::parseLogOutput(logging.output));

    Logger::initialize(level, output);
    if (output == LogOutput::FILE || output == LogOutput::BOTH)
    {
        Logger::setLogFile(options.log_file.value_or(logging.file));
    }
    Logger::setCategoriesFromString(options.log_categories.value_or(logging.categories));
}

int testConfigOnly(const GovernorConfig &config)
{
    Logger::info(LogCategory::CONFIG, "[CONFIG TEST] Cache capacity: {} bytes (critical ratio {})",
                 config.cache.capacity_bytes, config.cache.critical_capacity_ratio);
    Logger::info(LogCategory::CONFIG, "[CONFIG TEST] Requests: timeout {} ms, {} attempts, backoff {} ms, {} concurrent",
                 config.requests.timeout_ms, config.requests.max_attempts, config.requests.backoff_base_ms,
                 config.requests.max_concurrent);
    Logger::info(LogCategory::CONFIG, "[CONFIG TEST] Rate limit: {} per {} ms", config.requests.rate_limit.max_requests,
                 config.requests.rate_limit.window_ms);

    for (const auto &[name, limit] : config.requests.rate_limit.classes)
    {
        Logger::info(LogCategory::CONFIG, "[CONFIG TEST]     - {}: {}", name, limit);
    }

    Logger::info(LogCategory::CONFIG, "[CONFIG TEST] Pressure thresholds: elevated {}, critical {}",
                 config.scheduler.elevated_threshold, config.scheduler.critical_threshold);
    Logger::info(LogCategory::CONFIG, "[CONFIG TEST] Persistence: {} ({})", config.persistence.enabled ? "on" : "off",
                 config.persistence.path);
    return 0;
}

void logSnapshot(const Governor &governor, const std::string &label)
{
    GovernorSnapshot snapshot = governor.snapshot();

    Logger::info(LogCategory::GENERAL, "--- {} ---", label);
    Logger::info(LogCategory::GENERAL, "  State: {} (x{})", stateToString(snapshot.state), snapshot.interval_multiplier);
    Logger::info(LogCategory::GENERAL, "  Cache: {}/{} bytes in {} entries ({:.1f}%)", snapshot.cache.size_bytes,
                 snapshot.cache.capacity, snapshot.cache.entry_count, snapshot.cache.utilization_ratio * 100.0);
    Logger::info(LogCategory::GENERAL, "  Hits {} / misses {}, evictions {}, expirations {}", snapshot.cache.hits,
                 snapshot.cache.misses, snapshot.cache.evictions, snapshot.cache.expirations);
    Logger::info(LogCategory::GENERAL, "  Active requests: {}, scheduled tasks: {}", snapshot.active_requests,
                 snapshot.scheduled_tasks);

    for (const auto &entry : snapshot.cache.top_entries)
    {
        Logger::debug(LogCategory::GENERAL, "    {} {} bytes, {} reads", entry.key, entry.size_bytes, entry.access_count);
    }
}

// Simulated endpoint: payload size varies by page, every 7th page fails once
WorkFn simulatedFetch(const std::string &key, int page, std::atomic<int> &calls)
{
    return [key, page, &calls]
    {
        int call = ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(5 + page % 4 * 5));

        if (page % 7 == 6 && call % 2 == 1)
        {
            throw std::runtime_error("simulated upstream error for " + key);
        }

        return Payload(static_cast<size_t>(512 + page * 128), static_cast<uint8_t>(page));
    };
}

void runWorkload(Governor &governor, int requests, std::atomic<int> &calls)
{
    auto &coordinator = governor.coordinator();
    RequestOptions options = coordinator.defaultOptions();

    std::vector<std::future<RequestResult>> pending;
    for (int i = 0; i < requests; ++i)
    {
        // Half the keys repeat so cache hits and single-flight joins show up
        int page = i % (requests / 2 + 1);
        std::string key = (i % 3 == 0 ? "profile:" : "feed:page=") + std::to_string(page);

        pending.push_back(std::async(std::launch::async,
                                     [&coordinator, key, page, &calls, options]
                                     {
                                         return coordinator.execute(key, simulatedFetch(key, page, calls), options);
                                     }));
    }

    size_t failed = 0;
    for (auto &result : pending)
    {
        if (!result.get().ok())
        {
            failed++;
        }
    }

    Logger::info(LogCategory::GENERAL, "Workload finished: {} requests, {} executions, {} failed", requests,
                 calls.load(), failed);
}

int main(int argc, char **argv)
{
    // Initialize logger with basic settings for command line parsing
    Logger::initialize(LogLevel::INFO, LogOutput::CONSOLE);

    ProgramOptions options = parseCommandLine(argc, argv);
    if (options.show_help)
    {
        printUsage();
        return 0;
    }

    GovernorConfig config;
    if (options.config_given || std::filesystem::exists(options.config_file))
    {
        auto parsed = ConfigParser::parseJsonFile(options.config_file);
        if (!parsed)
        {
            Logger::error(LogCategory::CONFIG, "Failed to load configuration from {}", options.config_file);
            return 1;
        }
        config = *parsed;
    }
    else
    {
        Logger::info(LogCategory::CONFIG, "No {} found, using built-in defaults", options.config_file);
    }

    configureLogging(config.logging, options);

    if (options.test_config_only)
    {
        return testConfigOnly(config);
    }

    if (config.metrics.enabled)
    {
        GlobalMetrics::initialize(config.metrics);
        Logger::info(LogCategory::METRICS, "Metrics available at {}", GlobalMetrics::instance().getMetricsUrl());
    }

    // Simulated device: memory climbs while the workload runs
    std::atomic<double> memory_ratio{ 0.35 };
    std::atomic<bool> battery_saver{ false };

    {
        Governor governor(config,
                          [&memory_ratio, &battery_saver]() -> std::optional<PressureSample>
                          {
                              return PressureSample{ memory_ratio.load(), battery_saver.load() };
                          });
        governor.start();

        governor.cache().preload(
        []
        {
            return nlohmann::json{ { "feature_flags", { { "batch_prefetch", true } } },
                                   { "profile", { { "name", "demo" }, { "tier", "vip" } } } };
        });

        std::atomic<int> calls{ 0 };
        runWorkload(governor, options.requests, calls);
        logSnapshot(governor, "Foreground");

        std::vector<WorkFn> batch;
        for (int page = 0; page < 6; ++page)
        {
            batch.push_back(simulatedFetch("batch:" + std::to_string(page), page, calls));
        }
        auto results = governor.coordinator().executeBatch(std::move(batch));
        Logger::info(LogCategory::GENERAL, "Batch returned {} results in input order", results.size());

        governor.scheduler().onBackground();
        logSnapshot(governor, "Background");

        memory_ratio = 0.92;
        governor.scheduler().samplePressure();
        logSnapshot(governor, "Background under critical pressure");

        memory_ratio = 0.4;
        governor.scheduler().samplePressure();
        governor.scheduler().onForeground();
        runWorkload(governor, options.requests / 2, calls);
        logSnapshot(governor, "Foreground again");

        governor.shutdown();
    }

    GlobalMetrics::shutdown();
    Logger::shutdown();
    return 0;
}
