#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        std::filesystem::path path = std::filesystem::path(s_settings.log_directory) / config.filepath;

        bool append = config.append_override.value_or(s_settings.append_logs);
        if (!append)
        {
            std::ofstream(path, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.string().c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::Severity level = config.level_override.value_or(s_settings.default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

plog::Severity LogManager::SeverityFromInt(long long level, plog::Severity fallback)
{
    if (level >= plog::none && level <= plog::verbose)
        return static_cast<plog::Severity>(level);
    return fallback;
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_settings.log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_settings.log_directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
