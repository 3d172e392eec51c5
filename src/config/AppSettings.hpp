#pragma once

#include "../processing/PipelineTypes.hpp"
#include "../utils/LogManager.hpp"

#include <cstddef>
#include <string>

namespace provlens::config
{

class ConfigManager;

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct ExtractorSettings
{
    std::string fallback = "Request failed.";
};

// Everything the command-line tool reads from provlens.toml
struct AppSettings
{
    utils::LogManager::Settings logging;
    std::string log_file = "provlens.log";
    bool log_to_console = false;
    DiagnosticsSettings diagnostics;
    processing::FormatOptions formatter;
    ExtractorSettings extractor;

    // Registers the [logging], [diagnostics], [formatter] and [extractor] loaders.
    // The settings object must outlive the manager's load() calls.
    bool bind(ConfigManager& manager);
};

} // namespace provlens::config
