#include "Commands.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/ErrorExtractor.hpp"
#include "../processing/LogSections.hpp"
#include "../processing/OutputFormatter.hpp"
#include "../processing/StructuredValue.hpp"
#include "../processing/TextNormalizer.hpp"

#include <plog/Log.h>

namespace provlens::app
{

namespace
{

using processing::StructuredValue;

// JSON when the whole input parses, otherwise the input as text.
StructuredValue decodePayload(const std::string& input)
{
    auto parsed = StructuredValue::parse(input, nullptr, false);
    if (parsed.is_discarded())
    {
        PLOG_DEBUG << "Input is not JSON, treating it as text: " << processing::Diagnostics::Preview(input);
        return StructuredValue(input);
    }
    PLOG_DEBUG << "Decoded JSON payload: " << processing::Diagnostics::PreviewValue(parsed);
    return parsed;
}

void writeLine(std::ostream& out, const std::string& text)
{
    out << text;
    if (text.empty() || text.back() != '\n')
        out << '\n';
}

int runNormalize(const std::string& input, std::ostream& out)
{
    writeLine(out, processing::normalize_log_text(input));
    return kExitOk;
}

int runFormat(const CommandLineOptions& options, const config::AppSettings& settings, const std::string& input,
              std::ostream& out)
{
    processing::FormatOptions format_options = settings.formatter;
    format_options.omit_logs_key = format_options.omit_logs_key || options.omit_logs;

    const StructuredValue value = options.raw ? decodePayload(input) : StructuredValue(input);
    writeLine(out, processing::format_output(value, format_options));
    return kExitOk;
}

int runExtract(const CommandLineOptions& options, const config::AppSettings& settings, const std::string& input,
               std::ostream& out)
{
    const std::string& fallback = options.fallback ? *options.fallback : settings.extractor.fallback;
    writeLine(out, processing::extract_error_message(decodePayload(input), fallback));
    return kExitOk;
}

int runSections(const std::string& input, std::ostream& out)
{
    for (const auto& section : processing::split_log_sections(input))
    {
        out << (section.name.empty() ? std::string("(preamble)") : section.name) << ": " << section.lines.size()
            << (section.lines.size() == 1 ? " line" : " lines") << '\n';
    }
    out << "failure: " << (processing::logs_indicate_failure(input) ? "yes" : "no") << '\n';
    return kExitOk;
}

} // anonymous namespace

int executeCommand(const CommandLineOptions& options, const config::AppSettings& settings, const std::string& input,
                   std::ostream& out)
{
    switch (options.command)
    {
    case Command::Normalize:
        return runNormalize(input, out);
    case Command::Format:
        return runFormat(options, settings, input, out);
    case Command::Extract:
        return runExtract(options, settings, input, out);
    case Command::Sections:
        return runSections(input, out);
    case Command::Help:
        out << usageText();
        return kExitOk;
    }
    return kExitUsage;
}

} // namespace provlens::app
