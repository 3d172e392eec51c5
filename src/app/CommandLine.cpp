#include "CommandLine.hpp"

#include <sstream>

namespace provlens::app
{

namespace
{

std::optional<Command> commandFromName(const std::string& name)
{
    if (name == "normalize")
        return Command::Normalize;
    if (name == "format")
        return Command::Format;
    if (name == "extract")
        return Command::Extract;
    if (name == "sections")
        return Command::Sections;
    if (name == "help" || name == "--help" || name == "-h")
        return Command::Help;
    return std::nullopt;
}

CommandLineParseResult fail(std::string message)
{
    CommandLineParseResult result;
    result.error = std::move(message);
    return result;
}

} // anonymous namespace

CommandLineParseResult parseCommandLine(const std::vector<std::string>& args)
{
    CommandLineOptions options;
    if (args.empty())
        return fail("missing command");

    auto command = commandFromName(args.front());
    if (!command)
        return fail("unknown command '" + args.front() + "'");
    options.command = *command;

    bool have_input = false;
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        auto nextValue = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= args.size())
                return std::nullopt;
            return args[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            options.command = Command::Help;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--config")
        {
            auto value = nextValue();
            if (!value)
                return fail("--config requires a path");
            options.config_path = std::move(*value);
        }
        else if (arg == "--omit-logs")
        {
            if (options.command != Command::Format)
                return fail("--omit-logs only applies to 'format'");
            options.omit_logs = true;
        }
        else if (arg == "--raw")
        {
            if (options.command != Command::Format)
                return fail("--raw only applies to 'format'");
            options.raw = true;
        }
        else if (arg == "--fallback")
        {
            if (options.command != Command::Extract)
                return fail("--fallback only applies to 'extract'");
            auto value = nextValue();
            if (!value)
                return fail("--fallback requires a message");
            options.fallback = std::move(*value);
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-")
        {
            return fail("unknown option '" + arg + "'");
        }
        else
        {
            if (have_input)
                return fail("only one input file may be given");
            options.input_path = arg;
            have_input = true;
        }
    }

    CommandLineParseResult result;
    result.options = std::move(options);
    return result;
}

std::string usageText()
{
    std::ostringstream oss;
    oss << "Usage: provlens <command> [options] [FILE]\n"
        << "\n"
        << "Reads FILE, or standard input when FILE is missing or '-'.\n"
        << "\n"
        << "Commands:\n"
        << "  normalize              strip terminal escape sequences and canonicalize line endings\n"
        << "  format                 render provisioning output for display\n"
        << "      --omit-logs        drop \"logs\" fields from structured output\n"
        << "      --raw              parse the input as JSON before formatting\n"
        << "  extract                print the most useful error message of a failure payload\n"
        << "      --fallback TEXT    message used when nothing better is found\n"
        << "  sections               list the phase sections of a run log\n"
        << "\n"
        << "Options:\n"
        << "  --config PATH          configuration file (default: provlens.toml)\n"
        << "  -v, --verbose          trace pipeline stages in the diagnostics log\n"
        << "  -h, --help             show this help\n";
    return oss.str();
}

} // namespace provlens::app
