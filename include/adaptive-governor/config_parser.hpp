#pragma once

#include "../types/config.hpp"
#include "logger.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace AdaptiveGovernor
{

class ConfigParser
{
    public:
    static std::optional<GovernorConfig> parseJsonFile(const std::string &file_path);
    static std::optional<GovernorConfig> parseJsonString(std::string_view json_content);

    // Replaces impossible values with defaults, returns the number of fixes
    static size_t validate(GovernorConfig &config);

    static LogLevel parseLogLevel(const std::string &level_str);
    static LogOutput parseLogOutput(const std::string &output_str);
};

} // namespace AdaptiveGovernor
