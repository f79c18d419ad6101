// SPDX-License-Identifier: Apache-2.0
#include <agentloop/App.hpp>
#include <agentloop/Config.hpp>
#include <core/Env.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>

int main(int argc, char** argv)
{
    auto app = CLI::App { "agentloop - Local-first agent runtime with a WebSocket session protocol" };

    auto configPath = std::string {};
    auto host = std::string {};
    auto port = std::optional<std::uint16_t> {};
    auto randomPort = false;
    auto stateFile = std::string {};
    auto root = std::string {};
    auto kokomoLocal = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--host", host, "Interface to listen on");
    app.add_option("-p,--port", port, "Port to listen on");
    app.add_flag("--random-port", randomPort, "Listen on an ephemeral port");
    app.add_option("--state-file", stateFile, "Write {host, port, pid, startedAt} JSON to this path");
    app.add_option("--root", root, "Workspace root (defaults to the current directory)");
    app.add_flag("--kokomo-local", kokomoLocal, "Use the local kokomo TTS backend");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (auto level = agentloop::env::getString("AGENTLOOP_LOG_LEVEL"))
        agentloop::log::setLevel(agentloop::log::levelFromString(*level, agentloop::log::Level::Info));
    if (verbose)
        agentloop::log::setLevel(agentloop::log::Level::Debug);

    // Load config
    auto configResult =
        configPath.empty() ? agentloop::loadConfig() : agentloop::loadConfigFromFile(configPath);

    if (!configResult)
    {
        agentloop::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (!root.empty())
        config.workspaceRoot = root;

    // Variables from the workspace env file never override the real environment.
    auto const envRoot = config.workspaceRoot.empty() ? std::filesystem::current_path() : config.workspaceRoot;
    if (auto loaded = agentloop::loadEnvFile(agentloop::envFilePath(envRoot)); !loaded)
        agentloop::log::warning("Failed to load env file: {}", loaded.error().message);

    if (kokomoLocal)
        agentloop::env::set("AGENTLOOP_KOKOMO_LOCAL", "1");

    agentloop::applyEnvironment(config);

    // Apply CLI overrides
    if (!root.empty())
        config.workspaceRoot = root;
    if (!host.empty())
        config.server.host = host;
    if (port)
        config.server.port = *port;
    if (randomPort)
        config.server.port = 0;
    if (!stateFile.empty())
        config.server.stateFile = stateFile;

    auto application = agentloop::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        agentloop::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
