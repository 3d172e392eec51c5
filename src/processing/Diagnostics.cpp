#include "Diagnostics.hpp"

#include <cstdio>

namespace provlens::processing
{

namespace
{

void append_escaped(std::string& out, unsigned char byte)
{
    switch (byte)
    {
    case '\n':
        out += "\\n";
        return;
    case '\r':
        out += "\\r";
        return;
    case '\t':
        out += "\\t";
        return;
    case 0x1B:
        out += "\\e";
        return;
    default:
        break;
    }

    if (byte < 0x20 || byte == 0x7F)
    {
        char buf[5];
        std::snprintf(buf, sizeof(buf), "\\x%02X", byte);
        out += buf;
        return;
    }
    out.push_back(static_cast<char>(byte));
}

} // anonymous namespace

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ Diagnostics::kDefaultMaxPreview };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    const std::string_view shown = text.substr(0, limit);

    std::string out;
    out.reserve(shown.size() + 24);
    for (char ch : shown)
        append_escaped(out, static_cast<unsigned char>(ch));

    if (shown.size() < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

std::string Diagnostics::PreviewValue(const StructuredValue& value)
{
    if (value.is_discarded())
        return "<discarded>";
    return Preview(value.dump(-1, ' ', false, StructuredValue::error_handler_t::replace));
}

} // namespace provlens::processing
