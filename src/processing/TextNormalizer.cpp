#include "TextNormalizer.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace provlens::processing
{

namespace
{

// Introducer (ESC or C1 CSI), optional private/intermediate prefix, optional numeric
// parameters, single final byte used by cursor, colour and mode-setting sequences.
const std::regex& ansi_pattern()
{
    static const std::regex pattern(R"((?:\x1b|\x9b)[\[\]()#;?]*(?:(?:\d{1,4}(?:;\d{0,4})*)?[\dA-ORZcf-nqry=><]))",
                                    std::regex_constants::ECMAScript | std::regex_constants::optimize);
    return pattern;
}

constexpr unsigned char kEsc = 0x1B;
constexpr unsigned char kCsi = 0x9B;
constexpr unsigned char kUtf8C1Lead = 0xC2;

std::string strip_once(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t copied_until = 0;
    const auto& pattern = ansi_pattern();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it)
    {
        const auto pos = static_cast<std::size_t>(it->position());
        const auto len = static_cast<std::size_t>(it->length());

        out.append(text, copied_until, pos - copied_until);
        copied_until = pos + len;

        if (static_cast<unsigned char>(text[pos]) == kEsc || pos == 0)
            continue;

        // 0x9B is also a UTF-8 continuation byte. It only introduces a sequence when it
        // stands alone or forms U+009B together with a 0xC2 lead byte.
        const auto prev = static_cast<unsigned char>(text[pos - 1]);
        if (prev == kUtf8C1Lead)
        {
            out.pop_back();
        }
        else if (prev >= 0x80)
        {
            out.append(text, pos, len);
        }
    }

    out.append(text, copied_until, std::string::npos);
    return out;
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// UTF-8 encodings of the non-ASCII whitespace and line terminators:
// U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F, U+3000, U+FEFF.
constexpr std::string_view kUnicodeSpaces[] = {
    "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82",
    "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8", "\xE2\x80\xA9",
    "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80", "\xEF\xBB\xBF",
};

// Byte length of the whitespace character text starts with, 0 if none.
std::size_t leading_space_length(std::string_view text)
{
    if (is_space(text.front()))
        return 1;
    for (const auto space : kUnicodeSpaces)
    {
        if (text.starts_with(space))
            return space.size();
    }
    return 0;
}

// Byte length of the whitespace character text ends with, 0 if none.
std::size_t trailing_space_length(std::string_view text)
{
    if (is_space(text.back()))
        return 1;
    for (const auto space : kUnicodeSpaces)
    {
        if (text.ends_with(space))
            return space.size();
    }
    return 0;
}

} // anonymous namespace

std::string strip_ansi_sequences(const std::string& text)
{
    static const std::string introducers{ static_cast<char>(kEsc), static_cast<char>(kCsi) };
    if (text.find_first_of(introducers) == std::string::npos)
        return text;

    // Removing one sequence can splice another together; repeat until nothing changes.
    std::string current = strip_once(text);
    while (true)
    {
        std::string next = strip_once(current);
        if (next.size() == current.size())
            return current;
        current = std::move(next);
    }
}

std::string normalize_line_endings(const std::string& text)
{
    if (text.empty())
        return text;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // a \r\n pair collapses to a single \n
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string normalize_log_text(const std::string& text)
{
    return normalize_line_endings(strip_ansi_sequences(text));
}

std::string normalize_log_text(const char* text)
{
    return text ? normalize_log_text(std::string(text)) : std::string();
}

std::string normalize_log_text(const StructuredValue& value)
{
    if (!value.is_string())
        return std::string();
    return normalize_log_text(value.get_ref<const std::string&>());
}

std::string trim_copy(std::string_view text)
{
    while (!text.empty())
    {
        const std::size_t n = leading_space_length(text);
        if (n == 0)
            break;
        text.remove_prefix(n);
    }
    while (!text.empty())
    {
        const std::size_t n = trailing_space_length(text);
        if (n == 0)
            break;
        text.remove_suffix(n);
    }
    return std::string(text);
}

std::vector<std::string> split_log_lines(const std::string& text)
{
    std::vector<std::string> lines;
    const std::string normalized = normalize_log_text(text);
    if (normalized.empty())
        return lines;

    std::size_t start = 0;
    while (start < normalized.size())
    {
        std::size_t nl = normalized.find('\n', start);
        if (nl == std::string::npos)
        {
            lines.push_back(normalized.substr(start));
            break;
        }
        lines.push_back(normalized.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace provlens::processing
