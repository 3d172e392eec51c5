#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../processing/Diagnostics.hpp"

#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace provlens::utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::filesystem::path LogManager::s_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<std::function<void()>> LogManager::s_silencers;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    s_directory = settings.directory.empty() ? std::filesystem::path("logs") : std::filesystem::path(settings.directory);

    std::error_code ec;
    std::filesystem::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_directory.string() + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterChannel(const ChannelConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Log channel registered before initialization",
                                   config.name);
        return false;
    }

    const std::string path = ResolveLogPath(config.file_name).string();
    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(path.c_str(), config.max_file_size,
                                                                                    config.backup_count);
        auto& logger = plog::init<InstanceId>(config.level.value_or(s_settings.level), file.get());
        s_appenders.push_back(std::move(file));

        if (config.mirror_to_stderr)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }

        s_silencers.emplace_back([]()
        {
            if (auto* registered = plog::get<InstanceId>())
                registered->setMaxSeverity(plog::none);
        });
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log channel " + config.name,
                                   path + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterChannel<0>(const ChannelConfig&);
template bool LogManager::RegisterChannel<processing::Diagnostics::kLogInstance>(const ChannelConfig&);

#if PROVLENS_PROFILING_LEVEL >= 1
template bool LogManager::RegisterChannel<profiling::kProfilingLogInstance>(const ChannelConfig&);
#endif

void LogManager::Shutdown()
{
    // plog loggers are static and keep raw appender pointers
    for (const auto& silence : s_silencers)
        silence();
    s_silencers.clear();
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const std::filesystem::path& LogManager::GetLogDirectory() { return s_directory; }

std::filesystem::path LogManager::ResolveLogPath(const std::string& file_name)
{
    std::filesystem::path path(file_name);
    return path.is_absolute() ? path : s_directory / path;
}

std::optional<plog::Severity> LogManager::SeverityFromInt(long long value)
{
    if (value < plog::none || value > plog::verbose)
        return std::nullopt;
    return static_cast<plog::Severity>(value);
}

} // namespace provlens::utils
