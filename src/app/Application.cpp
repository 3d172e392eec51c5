#include "Application.hpp"
#include "Commands.hpp"
#include "../config/ConfigManager.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <plog/Log.h>

namespace provlens::app
{

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    auto parsed = parseCommandLine(args_);
    if (!parsed.options)
    {
        std::cerr << "provlens: " << parsed.error << "\n\n" << usageText();
        return kExitUsage;
    }
    options_ = std::move(*parsed.options);

    if (options_.command == Command::Help)
    {
        std::cout << usageText();
        return kExitOk;
    }

    initializeConfig();
    if (!initializeLogging())
        std::cerr << "provlens: logging disabled, continuing without log files\n";

    PROFILE_SCOPE_FUNCTION();

    auto input = readInput();
    if (!input)
    {
        reportPendingErrors();
        return kExitIoError;
    }

    const int code = executeCommand(options_, settings_, *input, std::cout);
    reportPendingErrors();
    return code;
}

// Configuration problems are queued in ErrorReporter and printed once the command finished;
// the affected settings keep their defaults.
void Application::initializeConfig()
{
    config_ = std::make_unique<config::ConfigManager>(options_.config_path.value_or("provlens.toml"));
    if (!settings_.bind(*config_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to register configuration tables",
                                          config_->lastError());
        return;
    }

    if (options_.config_path && !std::filesystem::exists(*options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Configuration file not found",
                                            *options_.config_path);
    }

    if (config_->load())
    {
        processing::Diagnostics::SetVerbose(settings_.diagnostics.verbose || options_.verbose);
        processing::Diagnostics::SetMaxPreview(settings_.diagnostics.max_preview);
    }
    else
    {
        processing::Diagnostics::SetVerbose(options_.verbose);
    }
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(settings_.logging))
        return false;

    bool ok = utils::LogManager::RegisterChannel<0>(
        { .name = "main", .file_name = settings_.log_file, .mirror_to_stderr = settings_.log_to_console });
    ok &= utils::LogManager::RegisterChannel<processing::Diagnostics::kLogInstance>(
        { .name = "diagnostics", .file_name = "pipeline.log" });

#if PROVLENS_PROFILING_LEVEL >= 1
    ok &= utils::LogManager::RegisterChannel<profiling::kProfilingLogInstance>(
        { .name = "profiling", .file_name = "profiling.log", .level = plog::debug });
#endif

    PLOG_INFO << "provlens started, input=" << options_.input_path;
    return ok;
}

std::optional<std::string> Application::readInput()
{
    if (options_.input_path == "-")
    {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Parsing, "Failed to read standard input");
            return std::nullopt;
        }
        return buffer.str();
    }

    std::ifstream ifs(options_.input_path, std::ios::binary);
    if (!ifs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Parsing, "Cannot open input file", options_.input_path);
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

void Application::reportPendingErrors()
{
    const auto worst = utils::ErrorReporter::HighestPendingSeverity();
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << "provlens: " << report.describe() << '\n';

    if (worst && *worst >= utils::ErrorSeverity::Warning && utils::LogManager::IsInitialized())
        std::cerr << "provlens: details in " << utils::LogManager::GetLogDirectory().string() << '\n';
}

} // namespace provlens::app
