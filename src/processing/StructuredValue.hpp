#pragma once

#include <nlohmann/json.hpp>

namespace provlens::processing
{

// Dynamic value flowing through the pipeline: null, text, list, keyed map
// (insertion ordered) or another JSON scalar.
using StructuredValue = nlohmann::ordered_json;

// Absence of data: JSON null or the marker left by a failed non-throwing parse.
[[nodiscard]] inline bool is_absent(const StructuredValue& value) noexcept
{
    return value.is_null() || value.is_discarded();
}

} // namespace provlens::processing
