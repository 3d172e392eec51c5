#include "OutputFormatter.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "StructuralSanitizer.hpp"
#include "TextNormalizer.hpp"

#include <cmath>
#include <cstdint>
#include <plog/Log.h>
#include <stdexcept>

namespace provlens::processing
{

namespace
{

constexpr int kIndent = 2;

// Largest magnitude printed as an integer; beyond it floats keep the exponent form.
constexpr double kIntegralFloatBound = 9.0e18;

// Integral floats print without a fractional part ("100" rather than "100.0").
void collapse_integral_floats(StructuredValue& value)
{
    if (value.is_number_float())
    {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < kIntegralFloatBound)
            value = static_cast<std::int64_t>(number);
        return;
    }

    if (value.is_structured())
    {
        for (auto& item : value)
            collapse_integral_floats(item);
    }
}

// Sanitize + pretty-print. Throws when the value is too deep or holds invalid UTF-8.
std::string render(const StructuredValue& value, const FormatOptions& options)
{
    auto sanitized = sanitize(value, options);
    if (!sanitized)
        throw std::length_error("value nests deeper than " + std::to_string(options.max_depth) + " levels");
    collapse_integral_floats(*sanitized);
    return sanitized->dump(kIndent);
}

std::string format_text(const std::string& text, const FormatOptions& options)
{
    const std::string normalized = trim_copy(normalize_log_text(text));
    if (normalized.empty())
        return std::string(placeholders::kNoOutputYet);

    if (!looks_like_json(normalized))
        return normalized;

    auto parsed = StructuredValue::parse(normalized, nullptr, false);
    if (parsed.is_discarded())
    {
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance)
                << "[OutputFormatter] json-like text did not parse, returning as-is: " << Diagnostics::Preview(normalized);
        return normalized;
    }

    // A document that parses but cannot be rendered is shown as the text it arrived as.
    return run_stage<std::string>("render_embedded_json", [&]() { return render(parsed, options); })
        .valueOr(normalized);
}

} // anonymous namespace

bool looks_like_json(std::string_view trimmed)
{
    if (trimmed.empty())
        return false;
    const char first = trimmed.front();
    const char last = trimmed.back();
    return (first == '{' && last == '}') || (first == '[' && last == ']');
}

std::string format_output(const StructuredValue& value, const FormatOptions& options)
{
    PROFILE_SCOPE_FUNCTION();

    if (is_absent(value))
        return std::string(placeholders::kNoOutputYet);

    if (value.is_string())
    {
        auto stage = run_stage<std::string>("format_text",
                                            [&]() { return format_text(value.get_ref<const std::string&>(), options); });
        return stage.valueOr(std::string(placeholders::kUnformattable));
    }

    auto stage = run_stage<std::string>("format_structured", [&]() { return render(value, options); });
    if (!stage.ok())
        return std::string(placeholders::kUnformattable);

    if (options.omit_logs_key && *stage.value == "{}")
        return std::string(placeholders::kOnlyLogs);
    return std::move(*stage.value);
}

} // namespace provlens::processing
