#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace provlens::utils
{

enum class ErrorCategory
{
    Initialization, // Logging setup
    Configuration,  // TOML parsing, invalid config values
    Parsing,        // Input could not be read or decoded
    Formatting,     // Sanitize/serialize stages
    Extraction,     // Error summary extraction
    Unknown
};

// Ordered from least to most severe
enum class ErrorSeverity
{
    Info,
    Warning, // Output degraded to a placeholder or a default was used
    Error    // The command could not do its work
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short message suitable for the terminal
    std::string technical_details; // Stage name, exception text, file position...
    std::string timestamp;

    // "warning: <message> (<details>)"
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Thread-safe collector for recoverable failures
 *
 * The pipeline never throws at its public boundaries; stages that fail degrade to a
 * placeholder and leave a report here. Every report is also logged through plog.
 * The command-line front end drains the queue after each command and prints it to stderr.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Configuration file has errors. Using defaults.",
 *                                "Error at line 3: expected '='");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << report.describe() << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Most severe pending report, if any
    static std::optional<ErrorSeverity> HighestPendingSeverity();

    // Drains the queue, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    // Default-constructed report when the queue is empty
    static ErrorReport GetLastError();

    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static std::string CurrentTimestamp();

    static constexpr std::size_t kMaxQueueSize = 100;

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace provlens::utils
