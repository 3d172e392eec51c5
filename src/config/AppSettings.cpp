#include "AppSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

namespace provlens::config
{

namespace
{

void warnInvalid(const char* key, const std::string& detail)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        std::string("Ignoring invalid value for ") + key, detail);
}

} // anonymous namespace

bool AppSettings::bind(ConfigManager& manager)
{
    bool ok = true;

    ok &= manager.registerTable("logging", { [this](const toml::table& section)
    {
        logging = utils::LogManager::Settings{};
        if (auto level = section["level"].value<int64_t>())
        {
            if (auto severity = utils::LogManager::SeverityFromInt(*level))
                logging.level = *severity;
            else
                warnInvalid("logging.level", "expected 0-6, got " + std::to_string(*level));
        }
        logging.append = section["append"].value_or(true);
        logging.directory = section["directory"].value_or(std::string("logs"));
        log_file = section["file"].value_or(std::string("provlens.log"));
        log_to_console = section["console"].value_or(false);
    } });

    ok &= manager.registerTable("diagnostics", { [this](const toml::table& section)
    {
        diagnostics = DiagnosticsSettings{};
        diagnostics.verbose = section["verbose"].value_or(false);
        if (auto preview = section["max_preview"].value<int64_t>())
        {
            if (*preview > 0)
                diagnostics.max_preview = static_cast<std::size_t>(*preview);
            else
                warnInvalid("diagnostics.max_preview", "must be positive");
        }
    } });

    ok &= manager.registerTable("formatter", { [this](const toml::table& section)
    {
        formatter = processing::FormatOptions{};
        formatter.omit_logs_key = section["omit_logs_key"].value_or(false);
        if (auto depth = section["max_depth"].value<int64_t>())
        {
            if (*depth > 0)
                formatter.max_depth = static_cast<std::size_t>(*depth);
            else
                warnInvalid("formatter.max_depth", "must be positive");
        }
    } });

    ok &= manager.registerTable("extractor", { [this](const toml::table& section)
    {
        extractor = ExtractorSettings{};
        extractor.fallback = section["fallback"].value_or(extractor.fallback);
    } });

    if (!ok)
        PLOG_ERROR << "Failed to bind settings: " << manager.lastError();
    return ok;
}

} // namespace provlens::config
