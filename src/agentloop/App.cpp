// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/AgentCatalog.hpp>
#include <agent/Toolbox.hpp>
#include <core/Log.hpp>
#include <engine/EventBus.hpp>
#include <engine/Protocol.hpp>
#include <engine/SessionEngine.hpp>
#include <llm/HttpChatClient.hpp>
#include <server/WebSocketServer.hpp>
#include <service/HealthProbe.hpp>
#include <service/ServiceRegistry.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <filesystem>
#include <optional>
#include <thread>
#include <vector>

namespace agentloop
{

namespace
{
    constexpr auto IoThreads = 2u;

    auto resolveRoot(const std::filesystem::path& configured) -> std::filesystem::path
    {
        auto ec = std::error_code {};
        auto root = configured.empty() ? std::filesystem::current_path(ec) : configured;
        auto canonical = std::filesystem::weakly_canonical(root, ec);
        return ec ? root : canonical;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::filesystem::path root;

    boost::asio::io_context ioc;
    EventBus events;
    HttpHealthProbe probe;
    ServiceRegistry services;
    AgentCatalog agents;
    Toolbox toolbox;
    HttpChatClient llm { "MLX" };
    HttpChatClient vlm { "VLM" };
    SessionEngine engine;
    WebSocketServer server;

    EventBus::ListenerId bridgeId = 0;
    std::uint16_t boundPort = 0;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        root(resolveRoot(config.workspaceRoot)),
        services(
            [this](const ServiceDescriptor& descriptor) -> Result<ServiceConfig> {
                auto const it = config.services.find(std::string(descriptor.name));
                auto const settings = it != config.services.end() ? it->second : ServiceSettings {};
                return resolveServiceConfig(descriptor, settings, root);
            },
            probe),
        agents(root, config.agents),
        toolbox(root, &services),
        engine(ioc,
               SessionEngineContext {
                   .agents = agents,
                   .services = services,
                   .toolbox = toolbox,
                   .llm = llm,
                   .vlm = vlm,
                   .events = events,
               },
               config.engine),
        server(ioc,
               ServerHandlers {
                   .onOpen = [this](ClientId client) { engine.clientConnected(client); },
                   .onMessage = [this](ClientId client, std::string_view text) { engine.handleMessage(client, text); },
                   .onClose = [](ClientId client) { log::debug("Client {} disconnected", client); },
               })
    {
        bridgeId = events.subscribe([this](const Event& event, std::optional<ClientId> target) {
            auto text = serializeEvent(event);
            if (target)
                server.send(*target, std::move(text));
            else
                server.broadcast(std::move(text));
        });
    }

    ~Impl() { events.unsubscribe(bridgeId); }

    void removeStateFile() const
    {
        if (config.server.stateFile.empty())
            return;
        auto ec = std::error_code {};
        std::filesystem::remove(config.server.stateFile, ec);
        if (ec)
            log::debug("Could not remove state file {}: {}", config.server.stateFile, ec.message());
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    log::info("Workspace root: {}", _impl->root.string());

    auto const& server = _impl->config.server;
    auto listenResult = _impl->server.listen(server.host, server.port);
    if (!listenResult)
        return std::unexpected(listenResult.error());
    _impl->boundPort = *listenResult;

    log::info("AgentLoop engine listening on ws://{}:{}", server.host, _impl->boundPort);

    if (!server.stateFile.empty())
    {
        if (auto written = writeStateFile(server.stateFile, server.host, _impl->boundPort); !written)
            log::warning("Failed to write state file: {}", written.error().message);
    }

    return {};
}

auto App::run() -> int
{
    auto signals = boost::asio::signal_set(_impl->ioc, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec)
            return;
        log::info("Received signal {}, shutting down", signal);
        _impl->server.stop();
        _impl->ioc.stop();
    });

    // Readiness waits can take a while; keep them off the accept loop.
    auto autoStart = std::jthread([this] { _impl->services.autoStartIfConfigured(); });

    auto ioThreads = std::vector<std::jthread> {};
    for (auto i = 1u; i < IoThreads; ++i)
        ioThreads.emplace_back([this] { _impl->ioc.run(); });
    _impl->ioc.run();
    ioThreads.clear();

    _impl->engine.shutdown();
    autoStart.join();
    _impl->services.shutdown();
    _impl->removeStateFile();

    log::info("AgentLoop engine stopped");
    return 0;
}

} // namespace agentloop
