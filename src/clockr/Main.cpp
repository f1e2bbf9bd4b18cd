// SPDX-License-Identifier: Apache-2.0
#include <clockr/App.hpp>
#include <clockr/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>
#include <print>

int main(int argc, char** argv)
{
    auto cli = CLI::App { "clockr - AI-assisted time tracking for Clockify" };
    cli.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    cli.add_option("-c,--config", configPath, "Path to config file");
    cli.add_flag("-v,--verbose", verbose, "Enable verbose debug logging");

    auto logOptions = clockr::LogOptions {};
    auto* logCommand = cli.add_subcommand("log", "Log time for the last interval or a date range");
    logCommand->add_flag("--same", logOptions.same, "Log the same project/description as the last entry");
    logCommand->add_flag("--repeat", logOptions.repeat, "Pre-fill the input with the last description");
    logCommand->add_option("--from", logOptions.from, "Start date (YYYY-MM-DD, 'yesterday', 'last friday', ...)");
    logCommand->add_option("--to", logOptions.to, "End date (YYYY-MM-DD, 'today', 'monday', ...)");
    logCommand->add_option("--text", logOptions.text, "Pre-fill the input with this description");

    auto* statusCommand = cli.add_subcommand("status", "Show today's logged entries");
    auto* projectsCommand = cli.add_subcommand("projects", "List Clockify projects");
    auto* retryCommand = cli.add_subcommand("retry", "Resubmit entries that failed to sync");

    auto initConfig = false;
    auto* configCommand = cli.add_subcommand("config", "Show the config file location");
    configCommand->add_flag("--init", initConfig, "Write a default config file if none exists");

    CLI11_PARSE(cli, argc, argv);

    std::signal(SIGPIPE, SIG_IGN);

    if (verbose)
        clockr::log::setLevel(clockr::log::Level::Debug);

    if (configPath.empty())
        configPath = clockr::defaultConfigPath();

    auto config = clockr::loadConfigFromFile(configPath);
    if (!config)
    {
        std::println(stderr, "Error: loading config: {}", config.error().message);
        return 1;
    }

    auto app = clockr::App(std::move(*config), configPath);

    auto result = clockr::VoidResult {};
    if (*logCommand)
        result = app.log(logOptions);
    else if (*statusCommand)
        result = app.status();
    else if (*projectsCommand)
        result = app.projects();
    else if (*retryCommand)
        result = app.retry();
    else if (*configCommand)
        result = app.config(initConfig);

    if (!result)
    {
        clockr::log::debug("Command failed: {}", result.error());
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    return 0;
}
