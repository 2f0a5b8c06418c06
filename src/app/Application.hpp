#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

class ConfigManager;
struct CommandLine;
struct ToolSettings;

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    // Reads stdin, writes stdout; see runWithStreams for exit codes
    int run();

    // 0 success, 1 processing or configuration failure, 2 usage error
    int runWithStreams(std::istream& in, std::ostream& out, std::ostream& err);

private:
    bool initializeConfig(const CommandLine& command_line);
    bool initializeLogging();
    void initializeDiagnostics();
    int reportPendingErrors(std::ostream& err, int exit_code);
    void cleanup();

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<ToolSettings> settings_;
    std::vector<std::string> args_;
};
