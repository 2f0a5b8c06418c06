#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ToolSettings;

enum class Command
{
    None,
    Wrap,
    Abbreviate,
    Initials,
    SwapCase,
    Help,
    Version
};

struct CommandLine
{
    Command command = Command::None;
    std::string config_path = "textkit.toml";
    bool verbose = false;

    // wrap
    std::optional<int> width;
    std::optional<std::string> newline;
    bool wrap_long_words = false;
    std::optional<std::string> wrap_on;

    // abbreviate
    std::optional<int> lower;
    std::optional<int> upper;
    std::optional<std::string> suffix;

    // initials
    std::optional<std::string> delimiters;
};

struct CommandLineResult
{
    std::optional<CommandLine> command_line;
    std::string error; // set when command_line is empty
};

// args excludes the program name
[[nodiscard]] CommandLineResult parseCommandLine(const std::vector<std::string>& args);

// Resolves \n, \r, \t and \\ in option values; other backslashes are kept
[[nodiscard]] std::string unescapeOption(std::string_view value);

// Command-line values win over configured ones
void applyOverrides(const CommandLine& command_line, ToolSettings& settings);

[[nodiscard]] const char* commandName(Command command);
[[nodiscard]] const char* usageText();
