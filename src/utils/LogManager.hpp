#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace provlens::utils
{

// Owns the plog appenders of the command-line tool. Each plog instance is one channel:
// 0 for the application log, Diagnostics::kLogInstance for the pipeline trace and, when
// profiling is compiled in, profiling::kProfilingLogInstance for scope timers.
class LogManager
{
public:
    // Values of the [logging] configuration table
    struct Settings
    {
        plog::Severity level = plog::info;
        bool append = true;
        std::string directory = "logs";
    };

    struct ChannelConfig
    {
        std::string name;                     // Used in error reports only
        std::string file_name;                // Relative names land in the log directory
        std::optional<plog::Severity> level;  // Defaults to Settings::level
        bool mirror_to_stderr = false;
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
    };

    // Creates the log directory. Channels can only be registered afterwards.
    static bool Initialize(const Settings& settings);

    template <int InstanceId = 0>
    static bool RegisterChannel(const ChannelConfig& config);

    // Silences every registered channel and releases the appenders.
    static void Shutdown();

    static bool IsInitialized();
    static const std::filesystem::path& GetLogDirectory();
    static std::filesystem::path ResolveLogPath(const std::string& file_name);

    // Maps the 0-6 integer used in the config file onto plog severities.
    static std::optional<plog::Severity> SeverityFromInt(long long value);

private:
    LogManager() = default;

    static bool s_initialized;
    static Settings s_settings;
    static std::filesystem::path s_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<std::function<void()>> s_silencers;
};

} // namespace provlens::utils
