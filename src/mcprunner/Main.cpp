// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcprunner/App.hpp>
#include <mcprunner/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcp-runner: starts, caches and supervises MCP servers on behalf of callers" };

    auto configPath = std::string {};
    auto logFile = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;
    auto noCache = false;
    auto noCleanup = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--log-file", logFile, "Append log output to this file");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--no-cache", noCache, "Disable the tool list cache");
    app.add_flag("--no-cleanup", noCleanup, "Disable idle session cleanup");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult =
        configPath.empty() ? mcprunner::loadConfig() : mcprunner::loadConfigFromFile(configPath);

    if (!configResult)
    {
        mcprunner::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (auto envResult = mcprunner::applyEnvironment(config, mcprunner::processEnvironment()); !envResult)
    {
        mcprunner::log::error("Invalid environment: {}", envResult.error().message);
        return 1;
    }

    // Apply CLI overrides
    if (!logFile.empty())
        config.log.file = logFile;
    if (!logLevel.empty())
        config.log.level = logLevel;
    if (verbose)
        config.log.level = "DEBUG";
    if (noCache)
        config.session.cacheEnabled = false;
    if (noCleanup)
        config.session.autoCleanup = false;

    auto application = mcprunner::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcprunner::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
