#pragma once

#include "StructuredValue.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace provlens::processing
{

// Process-wide switches for the pipeline trace written to plog instance kLogInstance.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kDefaultMaxPreview = 160;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Clamped to at least one byte
    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line excerpt of raw text for a log record. Line breaks and tabs are shown as
    // \n \r \t, ESC as \e, other control bytes as \xNN. Input longer than MaxPreview()
    // is cut and suffixed with its total size.
    [[nodiscard]] static std::string Preview(std::string_view text);

    // Compact serialization of a payload, previewed like text. Invalid UTF-8 is replaced.
    [[nodiscard]] static std::string PreviewValue(const StructuredValue& value);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace provlens::processing
