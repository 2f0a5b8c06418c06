#include "CommandRunner.hpp"
#include "../config/ToolSettings.hpp"
#include "../processing/LineWrapper.hpp"
#include "../processing/StringTransforms.hpp"
#include "../utils/ErrorReporter.hpp"

#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>

#include <plog/Log.h>

namespace
{

using LineTransform = std::function<std::string(const std::string&)>;

// Settings are validated here, before any input is consumed
LineTransform makeTransform(Command command, const ToolSettings& settings)
{
    switch (command)
    {
    case Command::Wrap:
    {
        auto wrapper = std::make_shared<processing::LineWrapper>(settings.wrap);
        return [wrapper](const std::string& line) { return wrapper->wrap(line); };
    }
    case Command::Abbreviate:
    {
        const auto abbr = settings.abbreviate;
        processing::validateAbbreviateBounds(abbr.lower, abbr.upper);
        return [abbr](const std::string& line)
        {
            return processing::abbreviate(line, abbr.lower, abbr.upper, abbr.suffix).value_or(std::string());
        };
    }
    case Command::Initials:
    {
        const auto delimiters = settings.initials.delimiters;
        return [delimiters](const std::string& line)
        {
            return processing::initials(line, delimiters).value_or(std::string());
        };
    }
    case Command::SwapCase:
        return [](const std::string& line) { return processing::swapCase(line).value_or(std::string()); };
    default:
        throw std::invalid_argument(std::string("command does not transform text: ") + commandName(command));
    }
}

} // anonymous namespace

int runCommand(Command command, const ToolSettings& settings, std::istream& in, std::ostream& out)
{
    LineTransform transform;
    try
    {
        transform = makeTransform(command, settings);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Processing,
                                          std::string("Cannot run ") + commandName(command), ex.what());
        return 1;
    }

    PLOG_INFO << "Running " << commandName(command);

    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        out << transform(line) << '\n';
        ++lines;
    }
    out.flush();

    PLOG_INFO << "Processed " << lines << " line(s) with " << commandName(command);
    return 0;
}
