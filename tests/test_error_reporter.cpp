#include <catch2/catch_test_macros.hpp>
#include <string>

#include "utils/ErrorReporter.hpp"

using namespace provlens::utils;

TEST_CASE("ErrorReporter - Queue", "[errors]")
{
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE_FALSE(ErrorReporter::HighestPendingSeverity().has_value());
    REQUIRE(ErrorReporter::GetLastError().user_message.empty());

    ErrorReporter::ReportWarning(ErrorCategory::Formatting, "Pipeline stage failed", "format_structured: bad byte");
    ErrorReporter::ReportError(ErrorCategory::Parsing, "Cannot open input file", "missing.json");
    ErrorReporter::ReportError(ErrorCategory::Configuration, ErrorSeverity::Info, "Using defaults");

    REQUIRE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::HighestPendingSeverity() == ErrorSeverity::Error);
    REQUIRE(ErrorReporter::GetLastError().user_message == "Using defaults");

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[0].category == ErrorCategory::Formatting);
    REQUIRE(reports[1].severity == ErrorSeverity::Error);
    REQUIRE_FALSE(reports[2].timestamp.empty());
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - Oldest reports are dropped", "[errors]")
{
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 105; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Unknown, "report " + std::to_string(i));

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 100);
    REQUIRE(reports.front().user_message == "report 5");
    REQUIRE(reports.back().user_message == "report 104");
}

TEST_CASE("ErrorReporter - Console description", "[errors]")
{
    ErrorReport report;
    report.severity = ErrorSeverity::Warning;
    report.user_message = "Configuration file has errors. Using defaults.";
    REQUIRE(report.describe() == "warning: Configuration file has errors. Using defaults.");

    report.technical_details = "provlens.toml:3:7: expected '='";
    REQUIRE(report.describe() == "warning: Configuration file has errors. Using defaults. (provlens.toml:3:7: expected '=')");

    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Extraction)) == "Extraction");
}
