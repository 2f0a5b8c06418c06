#pragma once

#include "../processing/LineWrapper.hpp"
#include "../utils/LogManager.hpp"

#include <cstddef>
#include <optional>
#include <string>

class ConfigManager;

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct LogSettings
{
    utils::LogManager::Settings manager;
    std::string file = "textkit.log";
    bool console = false;
};

struct AbbreviateSettings
{
    int lower = 0;
    int upper = -1;
    std::optional<std::string> suffix = std::string("...");
};

struct InitialsSettings
{
    std::optional<std::string> delimiters;
};

// Defaults for every command, overlaid by the config file and then the command line
struct ToolSettings
{
    LogSettings log;
    DiagnosticsSettings diagnostics;
    processing::WrapOptions wrap;
    AbbreviateSettings abbreviate;
    InitialsSettings initials;
};

// Registers the [log], [diagnostics], [wrap], [abbreviate] and [initials]
// tables. settings must outlive config.
bool bindToolSettings(ConfigManager& config, ToolSettings& settings);
