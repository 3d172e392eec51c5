#pragma once

#include "PipelineTypes.hpp"
#include "StructuredValue.hpp"

#include <optional>

namespace provlens::processing
{

// Key carrying raw run logs; dropped at every map level when FormatOptions::omit_logs_key is set.
inline constexpr const char* kLogsKey = "logs";

// Returns a new value with every string leaf normalized (see normalize_log_text) and, when
// requested, every "logs" entry removed. Lists keep their order, maps keep their key order,
// other scalars are copied unchanged. The input is never modified.
// Empty when the value nests deeper than options.max_depth.
[[nodiscard]] std::optional<StructuredValue> sanitize(const StructuredValue& value, const FormatOptions& options = {});

} // namespace provlens::processing
