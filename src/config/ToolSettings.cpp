#include "ToolSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <limits>

#include <plog/Log.h>

namespace
{

// Out-of-range integers keep the current value and are reported
void readInt(const toml::table& section, const char* table, const char* key, int& target)
{
    auto value = section[key].value<int64_t>();
    if (!value)
        return;

    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Ignoring out-of-range value for ") + table + "." + key,
                                            std::to_string(*value));
        return;
    }
    target = static_cast<int>(*value);
}

} // anonymous namespace

bool bindToolSettings(ConfigManager& config, ToolSettings& settings)
{
    bool ok = true;

    ok &= config.registerTable("log",
                               { [&settings](const toml::table& section)
                                 {
                                     auto& log = settings.log;
                                     if (auto level = section["level"].value<int64_t>())
                                     {
                                         log.manager.default_level =
                                             utils::LogManager::SeverityFromInt(*level, log.manager.default_level);
                                     }
                                     log.manager.log_directory =
                                         section["directory"].value_or(log.manager.log_directory);
                                     log.manager.append_logs = section["append"].value_or(log.manager.append_logs);
                                     log.file = section["file"].value_or(log.file);
                                     log.console = section["console"].value_or(log.console);
                                 } },
                               { "level", "directory", "append", "file", "console" });

    ok &= config.registerTable("diagnostics",
                               { [&settings](const toml::table& section)
                                 {
                                     auto& diag = settings.diagnostics;
                                     diag.verbose = section["verbose"].value_or(diag.verbose);
                                     if (auto preview = section["max_preview"].value<int64_t>(); preview && *preview > 0)
                                         diag.max_preview = static_cast<std::size_t>(*preview);
                                 } },
                               { "verbose", "max_preview" });

    ok &= config.registerTable("wrap",
                               { [&settings](const toml::table& section)
                                 {
                                     auto& wrap = settings.wrap;
                                     readInt(section, "wrap", "width", wrap.wrap_length);
                                     if (auto newline = section["newline"].value<std::string>())
                                         wrap.newline = *newline;
                                     wrap.wrap_long_words = section["wrap_long_words"].value_or(wrap.wrap_long_words);
                                     if (auto wrap_on = section["wrap_on"].value<std::string>())
                                         wrap.wrap_on = *wrap_on;
                                 } },
                               { "width", "newline", "wrap_long_words", "wrap_on" });

    ok &= config.registerTable("abbreviate",
                               { [&settings](const toml::table& section)
                                 {
                                     auto& abbr = settings.abbreviate;
                                     readInt(section, "abbreviate", "lower", abbr.lower);
                                     readInt(section, "abbreviate", "upper", abbr.upper);
                                     if (auto suffix = section["suffix"].value<std::string>())
                                         abbr.suffix = *suffix;
                                 } },
                               { "lower", "upper", "suffix" });

    ok &= config.registerTable("initials",
                               { [&settings](const toml::table& section)
                                 {
                                     if (auto delimiters = section["delimiters"].value<std::string>())
                                         settings.initials.delimiters = *delimiters;
                                 } },
                               { "delimiters" });

    if (!ok)
        PLOG_ERROR << "Failed to register configuration tables: " << config.lastError();
    return ok;
}
