#include "StructuralSanitizer.hpp"
#include "TextNormalizer.hpp"

namespace provlens::processing
{

namespace
{

bool sanitize_into(const StructuredValue& value, const FormatOptions& options, std::size_t depth,
                   StructuredValue& out)
{
    if (depth > options.max_depth)
        return false;

    if (value.is_string())
    {
        out = normalize_log_text(value.get_ref<const std::string&>());
        return true;
    }

    if (value.is_array())
    {
        out = StructuredValue::array();
        auto& items = out.get_ref<StructuredValue::array_t&>();
        items.reserve(value.size());
        for (const auto& item : value)
        {
            StructuredValue sanitized;
            if (!sanitize_into(item, options, depth + 1, sanitized))
                return false;
            items.push_back(std::move(sanitized));
        }
        return true;
    }

    if (value.is_object())
    {
        out = StructuredValue::object();
        for (const auto& [key, raw] : value.items())
        {
            if (options.omit_logs_key && key == kLogsKey)
                continue;

            StructuredValue sanitized;
            if (!sanitize_into(raw, options, depth + 1, sanitized))
                return false;
            out.emplace(key, std::move(sanitized));
        }
        return true;
    }

    out = value;
    return true;
}

} // anonymous namespace

std::optional<StructuredValue> sanitize(const StructuredValue& value, const FormatOptions& options)
{
    StructuredValue out;
    if (!sanitize_into(value, options, 0, out))
        return std::nullopt;
    return out;
}

} // namespace provlens::processing
