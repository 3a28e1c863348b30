#include <adaptive-governor/logger.hpp>
#include <adaptive-governor/metrics_collector.hpp>
#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace AdaptiveGovernor;

namespace
{

std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace

TEST_CASE("Logger - level and category filtering", "[logging]")
{
    auto path = std::filesystem::temp_directory_path() / "adaptive_governor_logger_test.log";
    std::filesystem::remove(path);

    Logger::setLogFile(path.string());
    Logger::initialize(LogLevel::DEBUG, LogOutput::FILE);
    Logger::setCategories(LogCategory::ALL);

    Logger::debug(LogCategory::CACHE, "Evicting {} ({} bytes)", "feed:1", 40);
    Logger::trace(LogCategory::CACHE, "below the level");

    Logger::setLevel(LogLevel::WARN);
    Logger::info(LogCategory::REQUEST, "also below the level");
    Logger::warn(LogCategory::REQUEST, "Attempt {} timed out", 2);

    Logger::setCategoriesFromString("cache, lifecycle");
    Logger::warn(LogCategory::REQUEST, "filtered by category");
    Logger::error(LogCategory::LIFECYCLE, "Listener failed");

    Logger::shutdown();
    Logger::setCategories(LogCategory::ALL);
    Logger::setLevel(LogLevel::INFO);
    Logger::setOutput(LogOutput::CONSOLE);

    std::string content = readFile(path);
    REQUIRE(content.find("[DEBUG] [CAC] Evicting feed:1 (40 bytes)") != std::string::npos);
    REQUIRE(content.find("[WARN ] [REQ] Attempt 2 timed out") != std::string::npos);
    REQUIRE(content.find("[ERROR] [LFC] Listener failed") != std::string::npos);
    REQUIRE(content.find("below the level") == std::string::npos);
    REQUIRE(content.find("filtered by category") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Logger - category names", "[logging]")
{
    REQUIRE(Logger::categoryToString(LogCategory::RATE_LIMIT) == "RTL");
    REQUIRE(Logger::categoryToString(LogCategory::PERSISTENCE) == "PER");
    REQUIRE(Logger::levelToString(LogLevel::ERR) == "ERROR");

    Logger::setCategoriesFromString("ratelimit");
    REQUIRE(Logger::isEnabled(LogCategory::RATE_LIMIT));
    REQUIRE_FALSE(Logger::isEnabled(LogCategory::CACHE));

    Logger::setCategoriesFromString("all");
    REQUIRE(Logger::isEnabled(LogCategory::CACHE));
}

TEST_CASE("GlobalMetrics - disabled collector accepts every call", "[metrics]")
{
    MetricsConfig config;
    config.enabled = false;
    GlobalMetrics::initialize(config);

    auto &metrics = GlobalMetrics::instance();
    metrics.recordCacheHit();
    metrics.recordCacheMiss();
    metrics.updateCacheSize(1024);
    metrics.recordCacheEviction("shrink");
    metrics.recordRequestStarted("high");
    metrics.recordRequestCompleted(0.25);
    metrics.recordRequestFailed("timeout");
    metrics.recordRateLimited("feed");
    metrics.recordLifecycleTransition("Background/Normal");
    metrics.updateIntervalMultiplier(3.0);
    metrics.recordTaskSkipped("analytics");
    metrics.recordPersistenceFailure("store");

    REQUIRE(metrics.getMetricsUrl() == "metrics disabled");
    GlobalMetrics::shutdown();
}
