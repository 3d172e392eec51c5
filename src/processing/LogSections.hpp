#pragma once

#include <string>
#include <vector>

namespace provlens::processing
{

// One phase block of a provisioning run log ("--- INIT ---", "--- APPLY ---", ...).
struct LogSection
{
    std::string name;               // Header text between the dashes; empty for a preamble
    std::vector<std::string> lines; // Body lines, trailing whitespace removed
};

// Splits normalized run logs into phase sections in log order. Leading and trailing
// blank lines of each section are dropped; a preamble without content is omitted.
[[nodiscard]] std::vector<LogSection> split_log_sections(const std::string& raw_logs);

// The provisioning worker marks a phase as failed when its output mentions "Error".
[[nodiscard]] bool logs_indicate_failure(const std::string& raw_logs);

} // namespace provlens::processing
