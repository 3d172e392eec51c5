#include "ErrorReporter.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

#include <plog/Log.h>

namespace provlens::utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    }
    return plog::error;
}

} // anonymous namespace

std::string ErrorReport::describe() const
{
    std::string line = ErrorReporter::SeverityToString(severity);
    line += ": ";
    line += user_message;
    if (!technical_details.empty())
        line += " (" + technical_details + ")";
    return line;
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.user_message = user_message;
    report.technical_details = technical_details;
    report.timestamp = CurrentTimestamp();

    PLOG(toPlogSeverity(severity)) << "[" << CategoryToString(category) << "] " << user_message
                                   << (technical_details.empty() ? "" : " | ") << technical_details;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.size() >= kMaxQueueSize)
        s_queue.pop_front();
    s_queue.push_back(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::optional<ErrorSeverity> ErrorReporter::HighestPendingSeverity()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.empty())
        return std::nullopt;
    auto worst = std::max_element(s_queue.begin(), s_queue.end(), [](const ErrorReport& a, const ErrorReport& b)
                                  { return a.severity < b.severity; });
    return worst->severity;
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return drained;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.empty() ? ErrorReport{} : s_queue.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Parsing:
        return "Parsing";
    case ErrorCategory::Formatting:
        return "Formatting";
    case ErrorCategory::Extraction:
        return "Extraction";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "info";
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    }
    return "error";
}

std::string ErrorReporter::CurrentTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

} // namespace provlens::utils
