#pragma once

#include "StructuredValue.hpp"

#include <array>
#include <string>
#include <string_view>

namespace provlens::processing
{

inline constexpr std::string_view kGenericFailure = "Request failed.";

// Keys conventionally carrying a human-readable error, in lookup order.
inline constexpr std::array<std::string_view, 4> kCandidateKeys = { "detail", "error", "message", "reason" };

// Single human-readable message for an arbitrary failure payload.
//
// Resolution order:
//   text             -> normalized, trimmed text
//   list             -> "msg" of map items / text items, joined with ", "
//   empty map        -> fallback
//   map              -> first non-empty text under detail, error, message, reason
//                    -> likely error line of a text "logs" field
//                    -> formatted remainder of the map (logs omitted)
//   anything else    -> fallback
// The fallback is normalized and trimmed; "Request failed." replaces an empty one.
// Always returns a non-empty string and never throws.
[[nodiscard]] std::string extract_error_message(const StructuredValue& value, const std::string& fallback);

} // namespace provlens::processing
