#pragma once

#include "CommandLine.hpp"
#include "../config/AppSettings.hpp"

#include <ostream>
#include <string>

namespace provlens::app
{

// Runs one pipeline command over already-read input and writes the result to out.
// Returns a process exit code.
int executeCommand(const CommandLineOptions& options, const config::AppSettings& settings, const std::string& input,
                   std::ostream& out);

} // namespace provlens::app
