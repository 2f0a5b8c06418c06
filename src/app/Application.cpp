#include "Application.hpp"
#include "CommandLine.hpp"
#include "CommandRunner.hpp"
#include "config/ConfigManager.hpp"
#include "config/ToolSettings.hpp"
#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <iostream>

#include <plog/Log.h>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#ifndef TEXTKIT_VERSION_STRING
#define TEXTKIT_VERSION_STRING "0.0.0"
#endif

Application::Application(int argc, char** argv)
    : settings_(std::make_unique<ToolSettings>())
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application() { cleanup(); }

int Application::run()
{
#ifdef _WIN32
    // Set Windows console to UTF-8 so non-ASCII text round-trips
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
    return runWithStreams(std::cin, std::cout, std::cerr);
}

int Application::runWithStreams(std::istream& in, std::ostream& out, std::ostream& err)
{
    auto parsed = parseCommandLine(args_);
    if (!parsed.command_line)
    {
        err << "textkit: " << parsed.error << "\n\n" << usageText();
        return 2;
    }

    const CommandLine& command_line = *parsed.command_line;
    if (command_line.command == Command::Help)
    {
        out << usageText();
        return 0;
    }
    if (command_line.command == Command::Version)
    {
        out << "textkit " << TEXTKIT_VERSION_STRING << '\n';
        return 0;
    }

    if (!initializeConfig(command_line))
        return reportPendingErrors(err, 1);

    applyOverrides(command_line, *settings_);

    if (!initializeLogging())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "continuing without log files");
    }
    initializeDiagnostics();

    PLOG_INFO << "textkit " << TEXTKIT_VERSION_STRING << " command=" << commandName(command_line.command)
              << " config=" << config_->configPath();

    int exit_code = runCommand(command_line.command, *settings_, in, out);
    return reportPendingErrors(err, exit_code);
}

bool Application::initializeConfig(const CommandLine& command_line)
{
    config_ = std::make_unique<ConfigManager>(command_line.config_path);
    if (!bindToolSettings(*config_, *settings_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Configuration tables clash",
                                          config_->lastError());
        return false;
    }

    // a broken file is queued as a warning and leaves the defaults in place
    config_->load();
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(settings_->log.manager))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = settings_->log.file,
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = 10 * 1024 * 1024,
                                                     .backup_count = 3,
                                                     .add_console_appender = settings_->log.console });

    ok &= utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
        { .name = "diagnostics",
          .filepath = "diagnostics.log",
          .append_override = std::nullopt,
          .level_override = plog::verbose,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });
    return ok;
}

void Application::initializeDiagnostics()
{
    processing::Diagnostics::SetVerbose(settings_->diagnostics.verbose);
    processing::Diagnostics::SetMaxPreview(settings_->diagnostics.max_preview);
}

int Application::reportPendingErrors(std::ostream& err, int exit_code)
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        err << "textkit: " << utils::ErrorReporter::FormatReport(report) << '\n';

        if (report.is_fatal && exit_code == 0)
            exit_code = 1;
    }
    return exit_code;
}

void Application::cleanup()
{
    config_.reset();
}
