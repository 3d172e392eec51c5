#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>

namespace provlens::config
{

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb)
{
    if (!cb.load)
    {
        last_error_ = "Missing load callback for table '" + path + "'";
        PLOG_ERROR << last_error_;
        return false;
    }

    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            last_error_ = "Duplicate ownership: table '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatch();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        dispatch();
        PLOG_INFO << "Loaded config from " << config_path_;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        return handleParseError(pe, config_path_);
    }
}

bool ConfigManager::loadFromString(std::string_view text, std::string_view source_name)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(text, source_name));
        dispatch();
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        return handleParseError(pe, std::string(source_name));
    }
}

void ConfigManager::dispatch()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::handleParseError(const toml::parse_error& pe, const std::string& source_name)
{
    const auto& begin = pe.source().begin;
    last_error_ = "config parse error: " + std::string(pe.description());

    std::string location = source_name;
    if (begin.line > 0)
        location += ":" + std::to_string(begin.line) + ":" + std::to_string(begin.column);
    PLOG_WARNING << last_error_ << " at " << location;

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Configuration file has errors. Using defaults.",
                                        location + ": " + std::string(pe.description()));

    root_ = std::make_unique<toml::table>();
    dispatch();
    return false;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

// Dotted path ("worker.retry") to a nested table; nullptr when missing or not a table.
const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    const toml::table* section = root.at_path(path).as_table();
    if (!section && root.at_path(path))
        PLOG_WARNING << "Config entry '" << path << "' is not a table, ignoring it";
    return section;
}

} // namespace provlens::config
