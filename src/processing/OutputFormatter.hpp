#pragma once

#include "PipelineTypes.hpp"
#include "StructuredValue.hpp"

#include <string>
#include <string_view>

namespace provlens::processing
{

namespace placeholders
{
inline constexpr std::string_view kNoOutputYet = "No Terraform output available yet.";
inline constexpr std::string_view kOnlyLogs = "No structured Terraform output (logs shown below).";
inline constexpr std::string_view kUnformattable = "Unable to format Terraform output.";
} // namespace placeholders

// Coarse JSON detection on already-trimmed text: {...} or [...].
[[nodiscard]] bool looks_like_json(std::string_view trimmed);

// Display string for provisioning output. Text is normalized and trimmed; bracket-delimited
// text that parses as JSON is re-serialized (sanitized, 2-space indent). Structured values are
// sanitized and serialized. Never throws: failures degrade to the placeholders above.
[[nodiscard]] std::string format_output(const StructuredValue& value, const FormatOptions& options = {});

} // namespace provlens::processing
