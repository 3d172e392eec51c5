#include "ErrorPatterns.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>

namespace provlens::processing
{

namespace
{

// Normalized, trimmed, non-empty lines in log order.
std::vector<std::string> candidate_lines(const std::string& raw_logs)
{
    std::vector<std::string> lines;
    for (auto& line : split_log_lines(raw_logs))
    {
        std::string trimmed = trim_copy(line);
        if (!trimmed.empty())
            lines.push_back(std::move(trimmed));
    }
    return lines;
}

} // anonymous namespace

const ErrorPatternTable& ErrorPatternTable::defaults()
{
    static const ErrorPatternTable table;
    return table;
}

ErrorPatternTable::ErrorPatternTable()
{
    initializeDefaultPatterns();
}

void ErrorPatternTable::registerPattern(std::string name, std::string expression)
{
    ErrorPatternDefinition def;
    def.rank = definitions_.size();
    def.name = std::move(name);
    def.expression = std::move(expression);
    def.compiled_pattern = std::regex(def.expression, std::regex_constants::ECMAScript | std::regex_constants::icase);
    definitions_.push_back(std::move(def));
}

void ErrorPatternTable::initializeDefaultPatterns()
{
    // Provider-specific validation failures first: they name the offending argument.
    registerPattern("invalid_parameter_combination", "invalidparametercombination");
    registerPattern("vpc_id_not_specified", "vpcidnotspecified");

    // "error:" is anchored at the word start only, so "Error: timeout" qualifies.
    registerPattern("error_colon", R"(\berror:)");
    registerPattern("api_error", R"(\bapi error\b)");
    registerPattern("failed", R"(\bfailed\b)");
    registerPattern("exception", R"(\bexception\b)");
    registerPattern("forbidden", R"(\bforbidden\b)");
    registerPattern("unauthorized", R"(\bunauthorized\b)");
    registerPattern("not_found", R"(\bnot found\b)");
}

const ErrorPatternDefinition* ErrorPatternTable::find(const std::string& name) const
{
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const ErrorPatternDefinition& def) { return def.name == name; });
    return it == definitions_.end() ? nullptr : &*it;
}

std::optional<std::size_t> ErrorPatternTable::matchRank(const std::string& line) const
{
    for (const auto& def : definitions_)
    {
        if (std::regex_search(line, def.compiled_pattern))
            return def.rank;
    }
    return std::nullopt;
}

std::string ErrorPatternTable::findLikelyErrorLine(const std::string& raw_logs) const
{
    const auto lines = candidate_lines(raw_logs);
    if (lines.empty())
        return std::string();

    for (const auto& def : definitions_)
    {
        auto hit = std::find_if(lines.rbegin(), lines.rend(),
                                [&](const std::string& line) { return std::regex_search(line, def.compiled_pattern); });
        if (hit != lines.rend())
            return *hit;
    }

    return lines.back();
}

std::string find_likely_error_line(const std::string& raw_logs)
{
    return ErrorPatternTable::defaults().findLikelyErrorLine(raw_logs);
}

} // namespace provlens::processing
