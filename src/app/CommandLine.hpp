#pragma once

#include <optional>
#include <string>
#include <vector>

namespace provlens::app
{

enum class Command
{
    Normalize,
    Format,
    Extract,
    Sections,
    Help
};

constexpr int kExitOk = 0;
constexpr int kExitIoError = 1;
constexpr int kExitUsage = 2;

struct CommandLineOptions
{
    Command command = Command::Help;
    std::string input_path = "-"; // "-" reads stdin
    std::optional<std::string> config_path;
    std::optional<std::string> fallback;
    bool verbose = false;
    bool omit_logs = false;
    bool raw = false;
};

struct CommandLineParseResult
{
    std::optional<CommandLineOptions> options;
    std::string error; // Set when options is empty
};

// args excludes the program name
[[nodiscard]] CommandLineParseResult parseCommandLine(const std::vector<std::string>& args);

[[nodiscard]] std::string usageText();

} // namespace provlens::app
