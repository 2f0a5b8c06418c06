#include "CommandLine.hpp"
#include "../config/ToolSettings.hpp"

#include <charconv>

namespace
{

std::optional<int> parseInt(const std::string& text)
{
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty())
        return std::nullopt;
    return value;
}

Command commandFromName(const std::string& name)
{
    if (name == "wrap")
        return Command::Wrap;
    if (name == "abbreviate")
        return Command::Abbreviate;
    if (name == "initials")
        return Command::Initials;
    if (name == "swapcase")
        return Command::SwapCase;
    if (name == "help" || name == "--help" || name == "-h")
        return Command::Help;
    if (name == "--version")
        return Command::Version;
    return Command::None;
}

bool optionAllowed(Command command, const std::string& option)
{
    if (option == "--width" || option == "--newline" || option == "--wrap-long-words" || option == "--wrap-on")
        return command == Command::Wrap;
    if (option == "--lower" || option == "--upper" || option == "--suffix")
        return command == Command::Abbreviate;
    if (option == "--delimiters")
        return command == Command::Initials;
    return false;
}

} // anonymous namespace

CommandLineResult parseCommandLine(const std::vector<std::string>& args)
{
    CommandLine cl;
    CommandLineResult result;

    size_t i = 0;
    auto takeValue = [&](const std::string& option) -> std::optional<std::string>
    {
        if (i + 1 >= args.size())
        {
            result.error = "missing value for " + option;
            return std::nullopt;
        }
        return args[++i];
    };
    auto takeInt = [&](const std::string& option) -> std::optional<int>
    {
        auto value = takeValue(option);
        if (!value)
            return std::nullopt;
        auto number = parseInt(*value);
        if (!number)
            result.error = "invalid integer for " + option + ": '" + *value + "'";
        return number;
    };

    for (; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (cl.command == Command::None)
        {
            if (arg == "--config")
            {
                auto path = takeValue(arg);
                if (!path)
                    return result;
                cl.config_path = *path;
                continue;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                cl.verbose = true;
                continue;
            }

            cl.command = commandFromName(arg);
            if (cl.command == Command::None)
            {
                result.error = "unknown command '" + arg + "'";
                return result;
            }
            continue;
        }

        if (!optionAllowed(cl.command, arg))
        {
            result.error = "unexpected argument '" + arg + "' for " + commandName(cl.command);
            return result;
        }

        if (arg == "--wrap-long-words")
        {
            cl.wrap_long_words = true;
            continue;
        }

        if (arg == "--width" || arg == "--lower" || arg == "--upper")
        {
            auto number = takeInt(arg);
            if (!number)
                return result;
            (arg == "--width" ? cl.width : arg == "--lower" ? cl.lower : cl.upper) = *number;
            continue;
        }

        auto value = takeValue(arg);
        if (!value)
            return result;

        if (arg == "--newline")
            cl.newline = unescapeOption(*value);
        else if (arg == "--wrap-on")
            cl.wrap_on = *value;
        else if (arg == "--suffix")
            cl.suffix = unescapeOption(*value);
        else
            cl.delimiters = unescapeOption(*value);
    }

    if (cl.command == Command::None)
    {
        result.error = "no command given";
        return result;
    }

    result.command_line = std::move(cl);
    return result;
}

std::string unescapeOption(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] != '\\' || i + 1 == value.size())
        {
            out.push_back(value[i]);
            continue;
        }

        switch (value[i + 1])
        {
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case '\\':
            out.push_back('\\');
            break;
        default:
            out.push_back('\\');
            out.push_back(value[i + 1]);
            break;
        }
        ++i;
    }
    return out;
}

void applyOverrides(const CommandLine& command_line, ToolSettings& settings)
{
    if (command_line.verbose)
    {
        settings.diagnostics.verbose = true;
        settings.log.manager.default_level = plog::verbose;
    }

    if (command_line.width)
        settings.wrap.wrap_length = *command_line.width;
    if (command_line.newline)
        settings.wrap.newline = command_line.newline;
    if (command_line.wrap_long_words)
        settings.wrap.wrap_long_words = true;
    if (command_line.wrap_on)
        settings.wrap.wrap_on = command_line.wrap_on;

    if (command_line.lower)
        settings.abbreviate.lower = *command_line.lower;
    if (command_line.upper)
        settings.abbreviate.upper = *command_line.upper;
    if (command_line.suffix)
        settings.abbreviate.suffix = command_line.suffix;

    if (command_line.delimiters)
        settings.initials.delimiters = command_line.delimiters;
}

const char* commandName(Command command)
{
    switch (command)
    {
    case Command::Wrap:
        return "wrap";
    case Command::Abbreviate:
        return "abbreviate";
    case Command::Initials:
        return "initials";
    case Command::SwapCase:
        return "swapcase";
    case Command::Help:
        return "help";
    case Command::Version:
        return "--version";
    case Command::None:
    default:
        return "none";
    }
}

const char* usageText()
{
    return "usage: textkit [--config PATH] [--verbose] <command> [options] < input\n"
           "\n"
           "commands:\n"
           "  wrap        [--width N] [--newline STR] [--wrap-long-words] [--wrap-on REGEX]\n"
           "  abbreviate  [--lower N] [--upper N] [--suffix STR]\n"
           "  initials    [--delimiters STR]\n"
           "  swapcase\n"
           "  help\n"
           "\n"
           "Every input line is processed on its own. STR values accept \\n \\r \\t \\\\.\n";
}
