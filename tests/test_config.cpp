#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "config/ToolSettings.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

TEST_CASE("ToolSettings defaults without a config file", "[config]")
{
    ConfigManager config("does-not-exist/textkit.toml");
    ToolSettings settings;
    REQUIRE(bindToolSettings(config, settings));
    REQUIRE(config.load());

    REQUIRE(settings.wrap.wrap_length == 80);
    REQUIRE_FALSE(settings.wrap.newline.has_value());
    REQUIRE_FALSE(settings.wrap.wrap_long_words);
    REQUIRE(settings.abbreviate.lower == 0);
    REQUIRE(settings.abbreviate.upper == -1);
    REQUIRE(settings.abbreviate.suffix == "...");
    REQUIRE_FALSE(settings.initials.delimiters.has_value());
    REQUIRE(settings.log.manager.default_level == plog::info);
}

TEST_CASE("ToolSettings reads every table", "[config]")
{
    ConfigManager config;
    ToolSettings settings;
    REQUIRE(bindToolSettings(config, settings));

    REQUIRE(config.loadFromString(R"(
[log]
level = 5
directory = "out/logs"
append = false
file = "run.log"
console = true

[diagnostics]
verbose = true
max_preview = 40

[wrap]
width = 20
newline = "<br>"
wrap_long_words = true
wrap_on = "[ ,]"

[abbreviate]
lower = 2
upper = 10
suffix = "~"

[initials]
delimiters = "_-"
)"));

    REQUIRE(settings.log.manager.default_level == plog::debug);
    REQUIRE(settings.log.manager.log_directory == "out/logs");
    REQUIRE_FALSE(settings.log.manager.append_logs);
    REQUIRE(settings.log.file == "run.log");
    REQUIRE(settings.log.console);

    REQUIRE(settings.diagnostics.verbose);
    REQUIRE(settings.diagnostics.max_preview == 40);

    REQUIRE(settings.wrap.wrap_length == 20);
    REQUIRE(settings.wrap.newline == "<br>");
    REQUIRE(settings.wrap.wrap_long_words);
    REQUIRE(settings.wrap.wrap_on == "[ ,]");

    REQUIRE(settings.abbreviate.lower == 2);
    REQUIRE(settings.abbreviate.upper == 10);
    REQUIRE(settings.abbreviate.suffix == "~");

    REQUIRE(settings.initials.delimiters == "_-");
}

TEST_CASE("ToolSettings ignores out-of-range values", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    ConfigManager config;
    ToolSettings settings;
    REQUIRE(bindToolSettings(config, settings));
    REQUIRE(config.loadFromString("[wrap]\nwidth = 99999999999\n[log]\nlevel = 42\n"));

    REQUIRE(settings.wrap.wrap_length == 80);
    REQUIRE(settings.log.manager.default_level == plog::info);

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().category == utils::ErrorCategory::Configuration);
}

TEST_CASE("ConfigManager reports parse errors and keeps defaults", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    ConfigManager config;
    ToolSettings settings;
    REQUIRE(bindToolSettings(config, settings));

    REQUIRE_FALSE(config.loadFromString("[wrap\nwidth = 3\n"));
    REQUIRE(std::string(config.lastError()).find("config parse error") == 0);
    REQUIRE(settings.wrap.wrap_length == 80);

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().severity == utils::ErrorSeverity::Warning);
    REQUIRE(errors.front().technical_details.find("Error at line") == 0);
}

TEST_CASE("ConfigManager rejects duplicate key ownership", "[config]")
{
    ConfigManager config;
    auto noop = [](const toml::table&) {};
    REQUIRE(config.registerTable("wrap", { noop }, { "width" }));
    REQUIRE(config.registerTable("abbreviate", { noop }, { "width" }));
    REQUIRE_FALSE(config.registerTable("wrap", { noop }, { "newline", "width" }));
    REQUIRE(std::string(config.lastError()).find("Duplicate ownership") == 0);
}

TEST_CASE("ConfigManager resolves nested table paths", "[config]")
{
    ConfigManager config;
    std::string seen;
    REQUIRE(config.registerTable("tool.wrap", { [&](const toml::table& section)
                                                { seen = section["newline"].value_or(std::string("none")); } },
                                 { "newline" }));

    REQUIRE(config.loadFromString("[tool.wrap]\nnewline = \"|\"\n"));
    REQUIRE(seen == "|");

    REQUIRE(config.loadFromString("[tool]\nwrap = 3\n"));
    REQUIRE(seen == "none");
}

TEST_CASE("ConfigManager loads from a file on disk", "[config]")
{
    const auto path = std::filesystem::temp_directory_path() / "textkit_config_test.toml";
    {
        std::ofstream out(path);
        out << "[abbreviate]\nsuffix = \"!\"\n";
    }

    ConfigManager config(path.string());
    ToolSettings settings;
    REQUIRE(bindToolSettings(config, settings));
    REQUIRE(config.load());
    REQUIRE(settings.abbreviate.suffix == "!");

    std::filesystem::remove(path);
}
