#pragma once

#include "StructuredValue.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace provlens::processing
{

// Removes ANSI/terminal escape sequences (ESC or C1 CSI introducer).
[[nodiscard]] std::string strip_ansi_sequences(const std::string& text);

// Converts \r\n and \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Full normalization: escape sequences stripped, then line endings canonicalized.
// Idempotent. No trimming.
[[nodiscard]] std::string normalize_log_text(const std::string& text);
[[nodiscard]] std::string normalize_log_text(const char* text);

// Dynamic variant: anything that is not text normalizes to an empty string.
[[nodiscard]] std::string normalize_log_text(const StructuredValue& value);

// Strips whitespace from both ends: ASCII whitespace plus the Unicode space separators,
// line/paragraph separators and the byte order mark (UTF-8 encoded).
[[nodiscard]] std::string trim_copy(std::string_view text);

// Normalized display lines of a raw log. A trailing newline does not produce an empty last line.
[[nodiscard]] std::vector<std::string> split_log_lines(const std::string& text);

} // namespace provlens::processing
