#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace provlens::processing
{

// One entry of the prioritized error-line table. Lower rank wins.
struct ErrorPatternDefinition
{
    std::size_t rank = 0;
    std::string name;            // e.g. "error_colon"
    std::string expression;      // ECMAScript source, matched case-insensitively
    std::regex compiled_pattern; // Pre-compiled regex
};

// Ordered table of log-line patterns used to pick the most useful line out of raw run logs.
class ErrorPatternTable
{
public:
    // Shared immutable default table
    static const ErrorPatternTable& defaults();

    ErrorPatternTable();

    const std::vector<ErrorPatternDefinition>& definitions() const { return definitions_; }

    const ErrorPatternDefinition* find(const std::string& name) const;

    // Rank of the highest-priority pattern matching the line
    std::optional<std::size_t> matchRank(const std::string& line) const;

    // Most recent line matching the highest-priority pattern that matches anything;
    // the last line when nothing matches; empty when there are no non-empty lines.
    std::string findLikelyErrorLine(const std::string& raw_logs) const;

private:
    void registerPattern(std::string name, std::string expression);
    void initializeDefaultPatterns();

    std::vector<ErrorPatternDefinition> definitions_;
};

// Convenience wrapper over ErrorPatternTable::defaults().
[[nodiscard]] std::string find_likely_error_line(const std::string& raw_logs);

} // namespace provlens::processing
