#include "ErrorExtractor.hpp"
#include "Diagnostics.hpp"
#include "ErrorPatterns.hpp"
#include "OutputFormatter.hpp"
#include "StageRunner.hpp"
#include "TextNormalizer.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace provlens::processing
{

namespace
{

std::string clean(const StructuredValue& value)
{
    return trim_copy(normalize_log_text(value));
}

std::string from_list(const StructuredValue& items)
{
    std::string joined;
    for (const auto& item : items)
    {
        std::string message;
        if (item.is_object())
        {
            auto msg = item.find("msg");
            if (msg != item.end() && msg->is_string())
                message = clean(*msg);
        }
        else if (item.is_string())
        {
            message = clean(item);
        }

        if (message.empty())
            continue;
        if (!joined.empty())
            joined += ", ";
        joined += message;
    }
    return joined;
}

std::string from_candidate_keys(const StructuredValue& data)
{
    for (const auto key : kCandidateKeys)
    {
        auto it = data.find(std::string(key));
        if (it == data.end() || !it->is_string())
            continue;
        std::string cleaned = clean(*it);
        if (!cleaned.empty())
            return cleaned;
    }
    return std::string();
}

std::string from_logs(const StructuredValue& data)
{
    auto logs = data.find("logs");
    if (logs == data.end() || !logs->is_string())
        return std::string();
    return find_likely_error_line(logs->get_ref<const std::string&>());
}

bool is_no_output_placeholder(const std::string& text)
{
    // Prefix without the trailing period
    constexpr auto prefix = placeholders::kNoOutputYet.substr(0, placeholders::kNoOutputYet.size() - 1);
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string resolve(const StructuredValue& value, const std::string& normalized_fallback)
{
    if (value.is_string())
    {
        std::string text = clean(value);
        return text.empty() ? normalized_fallback : text;
    }

    if (value.is_array())
    {
        std::string joined = from_list(value);
        return joined.empty() ? normalized_fallback : joined;
    }

    if (!value.is_object() || value.empty())
        return normalized_fallback;

    if (std::string candidate = from_candidate_keys(value); !candidate.empty())
        return candidate;

    if (std::string line = from_logs(value); !line.empty())
    {
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << "[ErrorExtractor] picked log line: " << Diagnostics::Preview(line);
        return line;
    }

    FormatOptions options;
    options.omit_logs_key = true;
    std::string formatted = trim_copy(format_output(value, options));
    if (!formatted.empty() && !is_no_output_placeholder(formatted))
        return formatted;

    return normalized_fallback;
}

} // anonymous namespace

std::string extract_error_message(const StructuredValue& value, const std::string& fallback)
{
    PROFILE_SCOPE_FUNCTION();

    std::string normalized_fallback =
        run_stage<std::string>("normalize_fallback", [&]() { return trim_copy(normalize_log_text(fallback)); },
                               utils::ErrorCategory::Extraction)
            .valueOr(std::string());
    if (normalized_fallback.empty())
        normalized_fallback = std::string(kGenericFailure);

    auto stage = run_stage<std::string>("extract_error_message", [&]() { return resolve(value, normalized_fallback); },
                                        utils::ErrorCategory::Extraction);
    return stage.valueOr(normalized_fallback);
}

} // namespace provlens::processing
