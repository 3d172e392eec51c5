#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

namespace provlens::config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads a TOML configuration file and hands each registered section to its owner.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "provlens.toml");
    ~ConfigManager();

    // Registers a loader for the table at a dotted path ("" is the root table).
    bool registerTable(const std::string& path, TableCallbacks cb);

    // A missing file is not an error: every handler receives an empty table.
    bool load();

    // Parses TOML text instead of the file (used by tests and piped configuration).
    bool loadFromString(std::string_view text, std::string_view source_name = "string");

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    void dispatch();
    bool handleParseError(const toml::parse_error& pe, const std::string& source_name);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};

} // namespace provlens::config
