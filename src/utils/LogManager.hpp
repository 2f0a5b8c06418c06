#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false; // console output goes to stderr
    };

    struct Settings
    {
        std::string log_directory = "logs";
        bool append_logs = true;
        plog::Severity default_level = plog::info;
    };

    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);  // appenders live until exit

    // Maps 0..6 onto plog::none..plog::verbose, anything else to fallback
    static plog::Severity SeverityFromInt(long long level, plog::Severity fallback);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
