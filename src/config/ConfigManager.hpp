#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "textkit.toml");
    ~ConfigManager();

    // Routes the table at a dotted path ("wrap", "log") to cb on every load.
    // Fails if one of ownedKeys is already owned by a handler on the same path.
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file: empty root, handlers see empty tables, returns true.
    // Parse error: lastError() is set, handlers are not called, returns false.
    bool load();

    // Same as load() on an in-memory document; source_name appears in errors
    bool loadFromString(std::string_view document, const std::string& source_name = "<memory>");

    const std::string& configPath() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(const toml::table& parsed);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
};
