#pragma once

#include "CommandLine.hpp"
#include "../config/AppSettings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace provlens::config
{
class ConfigManager;
}

namespace provlens::app
{

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    void initializeConfig();
    bool initializeLogging();
    std::optional<std::string> readInput();
    void reportPendingErrors();

    std::vector<std::string> args_;
    CommandLineOptions options_;
    config::AppSettings settings_;
    std::unique_ptr<config::ConfigManager> config_;
};

} // namespace provlens::app
