// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Bindings.hpp>
#include <mcprt/App.hpp>
#include <mcprt/Config.hpp>
#include <store/ConfigStore.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
    #include <signal.h>
#endif

namespace
{

std::atomic<bool> stopRequested { false };

void onStopSignal(int /*signal*/)
{
    stopRequested.store(true);
}

/// Installs SIGINT/SIGTERM handlers. Without SA_RESTART a blocking read of stdin
/// is interrupted, so the serve loop gets to shut down its children.
void installStopHandlers()
{
#ifdef _WIN32
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
#else
    struct sigaction action {};
    action.sa_handler = onStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

auto commandLineOf(const mcprt::ServerRuntimeState& state) -> std::string
{
    auto line = state.command;
    for (const auto& arg: state.args)
        line += " " + arg;
    return line;
}

auto printOutcome(const mcprt::Result<mcprt::ActionOutcome>& outcome) -> int
{
    if (!outcome)
    {
        std::println(stderr, "Error: {}", outcome.error().message);
        return 1;
    }
    std::println("{}", outcome->message);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcprt - supervisor and message dispatcher for MCP servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto serverId = std::string {};
    auto command = std::string {};
    auto args = std::vector<std::string> {};
    auto envPairs = std::vector<std::string> {};
    auto file = std::string {};
    auto overwrite = false;
    auto functionName = std::string {};
    auto functionArgs = std::string { "{}" };

    auto* listCmd = app.add_subcommand("list", "List configured servers");

    auto* statusCmd = app.add_subcommand("status", "Show the state of one server");
    statusCmd->add_option("id", serverId, "Server id")->required();

    auto* addCmd = app.add_subcommand("add", "Add or replace a server definition (use -- before arguments)");
    addCmd->add_option("id", serverId, "Server id")->required();
    addCmd->add_option("command", command, "Executable to launch")->required();
    addCmd->add_option("args", args, "Arguments passed to the executable");
    addCmd->add_option("-e,--env", envPairs, "Environment variable KEY=VALUE")->take_all();

    auto* removeCmd = app.add_subcommand("remove", "Remove a server definition");
    removeCmd->add_option("id", serverId, "Server id")->required();

    auto* runCmd = app.add_subcommand("run", "Run one server in the foreground until interrupted");
    runCmd->add_option("id", serverId, "Server id")->required();

    auto* exportCmd = app.add_subcommand("export", "Export contexts, function groups and schemas");
    exportCmd->add_option("file", file, "Output file")->required();

    auto* importCmd = app.add_subcommand("import", "Import contexts, function groups and schemas");
    importCmd->add_option("file", file, "Input file")->required()->check(CLI::ExistingFile);
    importCmd->add_flag("--overwrite", overwrite, "Replace existing entries");

    auto* configCmd = app.add_subcommand("config", "Print the manifest with secrets masked");

    auto* callCmd = app.add_subcommand("call", "Invoke a registered function");
    callCmd->add_option("function", functionName, "Function name")->required();
    callCmd->add_option("arguments", functionArgs, "Arguments as a JSON object");

    auto* functionsCmd = app.add_subcommand("functions", "List registered functions with their descriptors");

    auto* serveCmd = app.add_subcommand("serve", "Start all servers and serve JSON lines on stdin/stdout");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        mcprt::log::setLevel(mcprt::log::Level::Debug);

    auto configResult = configPath.empty() ? mcprt::loadConfig() : mcprt::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcprt::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (verbose)
        config.logLevel = "debug";

    installStopHandlers();

    auto application = mcprt::App(std::move(config));
    auto& supervisor = application.supervisor();

    if (*listCmd)
    {
        for (const auto& state: supervisor.list())
        {
            std::println("{:<24} {:<8} {:>8}  {}",
                         state.id,
                         state.running ? "running" : "stopped",
                         state.pid ? std::to_string(*state.pid) : std::string("-"),
                         commandLineOf(state));
        }
        return 0;
    }

    if (*statusCmd)
    {
        auto const state = supervisor.status(serverId);
        std::println("{}", mcprt::toJson(state).dump(2));
        return state.exists ? 0 : 1;
    }

    if (*addCmd)
    {
        auto definition = mcprt::ServerDefinition { .id = serverId, .command = command, .args = args, .env = {} };
        for (const auto& pair: envPairs)
        {
            auto const eq = pair.find('=');
            if (eq == std::string::npos || eq == 0)
            {
                std::println(stderr, "Error: invalid environment entry '{}', expected KEY=VALUE", pair);
                return 1;
            }
            definition.env[pair.substr(0, eq)] = pair.substr(eq + 1);
        }

        if (auto saved = supervisor.upsertDefinition(std::move(definition)); !saved)
        {
            std::println(stderr, "Error: {}", saved.error().message);
            return 1;
        }
        std::println("Server '{}' saved", serverId);
        return 0;
    }

    if (*removeCmd)
    {
        if (!supervisor.removeDefinition(serverId))
        {
            std::println(stderr, "Error: server '{}' not found", serverId);
            return 1;
        }
        std::println("Server '{}' removed", serverId);
        return 0;
    }

    if (*runCmd)
    {
        if (auto const rc = printOutcome(supervisor.start(serverId)); rc != 0)
            return rc;

        while (!stopRequested.load() && supervisor.status(serverId).running)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        return printOutcome(supervisor.stop(serverId));
    }

    if (*exportCmd)
        return application.contexts().exportAll(file) ? 0 : 1;

    if (*importCmd)
        return application.contexts().importAll(file, overwrite) ? 0 : 1;

    if (*configCmd)
    {
        std::println("{}", mcprt::manifestToJson(supervisor.redactedManifest()).dump(2));
        return 0;
    }

    if (*callCmd)
    {
        auto arguments = mcprt::json::parse(functionArgs);
        if (!arguments)
        {
            std::println(stderr, "Error: {}", arguments.error().message);
            return 1;
        }

        auto result = application.dispatcher().call(functionName, *arguments);
        if (!result)
        {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        std::println("{}", result->dump(2));
        return 0;
    }

    if (*functionsCmd)
    {
        std::println("{}", application.dispatcher().descriptors().dump(2));
        return 0;
    }

    if (*serveCmd)
        return application.serve(std::cin, std::cout, stopRequested);

    return 0;
}
