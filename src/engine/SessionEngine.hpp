// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/EngineSettings.hpp>
#include <engine/EventBus.hpp>
#include <engine/Protocol.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

namespace boost::asio
{
class io_context;
}

namespace agentloop
{

class AgentCatalog;
class ChatClient;
class ServiceRegistry;
class Toolbox;

/// @brief Collaborators of the session engine. All must outlive it.
struct SessionEngineContext
{
    AgentCatalog& agents;
    ServiceRegistry& services;
    const Toolbox& toolbox;
    ChatClient& llm;
    ChatClient& vlm;
    EventBus& events;
};

/// @brief Turns protocol commands into session transitions and event streams.
///
/// The session table is owned by a strand on the given io_context; commands
/// may be submitted from any thread. Model requests and the tool loop run on
/// an internal worker pool and post their session mutations back to the
/// strand, so events of one session are published in order. Service start and
/// stop calls and workbench runs use a separate background pool and never
/// occupy a pipeline worker.
class SessionEngine
{
  public:
    SessionEngine(boost::asio::io_context& ioc,
                  SessionEngineContext context,
                  EngineSettings settings,
                  std::size_t workerThreads = 4);
    ~SessionEngine();

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    /// @brief Decodes a text frame from @p client and submits it.
    ///
    /// Undecodable or invalid frames yield one `error` event to @p client.
    void handleMessage(ClientId client, std::string_view text);

    /// @brief Queues a validated command from @p client.
    void submit(ClientId client, Command command);

    /// @brief Sends the default service status snapshot to a newly connected client.
    void clientConnected(ClientId client);

    [[nodiscard]] auto settings() const noexcept -> const EngineSettings&;

    /// @brief Stops accepting work and waits for running pipelines and background tasks to finish.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentloop
