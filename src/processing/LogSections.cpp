#include "LogSections.hpp"
#include "TextNormalizer.hpp"

#include <optional>
#include <string_view>

namespace provlens::processing
{

namespace
{

constexpr std::string_view kHeaderFence = "---";

std::string rtrim_copy(const std::string& line)
{
    std::size_t end = line.find_last_not_of(" \t\v\f");
    return end == std::string::npos ? std::string() : line.substr(0, end + 1);
}

// "--- NAME ---" -> "NAME"
std::optional<std::string> header_name(const std::string& line)
{
    const std::string trimmed = trim_copy(line);
    const std::size_t fence = kHeaderFence.size();
    if (trimmed.size() <= fence * 2)
        return std::nullopt;
    if (trimmed.compare(0, fence, kHeaderFence) != 0 ||
        trimmed.compare(trimmed.size() - fence, fence, kHeaderFence) != 0)
        return std::nullopt;

    std::string name = trim_copy(std::string_view(trimmed).substr(fence, trimmed.size() - fence * 2));
    if (name.empty() || name.find_first_not_of('-') == std::string::npos)
        return std::nullopt;
    return name;
}

void drop_blank_edges(std::vector<std::string>& lines)
{
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    std::size_t first = 0;
    while (first < lines.size() && lines[first].empty())
        ++first;
    lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));
}

} // anonymous namespace

std::vector<LogSection> split_log_sections(const std::string& raw_logs)
{
    std::vector<LogSection> sections;
    LogSection current;

    auto flush = [&]()
    {
        drop_blank_edges(current.lines);
        if (!current.name.empty() || !current.lines.empty())
            sections.push_back(std::move(current));
        current = LogSection{};
    };

    for (const auto& line : split_log_lines(raw_logs))
    {
        if (auto name = header_name(line))
        {
            flush();
            current.name = std::move(*name);
            continue;
        }
        current.lines.push_back(rtrim_copy(line));
    }
    flush();

    return sections;
}

bool logs_indicate_failure(const std::string& raw_logs)
{
    return normalize_log_text(raw_logs).find("Error") != std::string::npos;
}

} // namespace provlens::processing
