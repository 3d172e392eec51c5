#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace provlens::processing
{

// Options shared by the sanitizer and the output formatter.
struct FormatOptions
{
    static constexpr std::size_t kDefaultMaxDepth = 256;

    bool omit_logs_key = false; // Drop "logs" at every map level (raw logs are shown separately)
    std::size_t max_depth = kDefaultMaxDepth; // Nesting bound for the recursive walk
};

// Outcome of one guarded pipeline stage (see run_stage)
template <typename T>
struct StageResult
{
    std::optional<T> value; // Set when the stage returned normally
    std::string error;      // Exception text otherwise
    std::string stage_name;
    std::chrono::microseconds duration{ 0 };

    bool ok() const { return value.has_value(); }

    T valueOr(T placeholder) const { return value ? *value : std::move(placeholder); }
};

} // namespace provlens::processing
