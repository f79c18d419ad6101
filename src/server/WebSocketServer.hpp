// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/EventBus.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace boost::asio
{
class io_context;
}

namespace agentloop
{

/// @brief Callbacks from the WebSocket server. Invoked on io_context threads.
struct ServerHandlers
{
    std::function<void(ClientId client)> onOpen;
    std::function<void(ClientId client, std::string_view text)> onMessage;
    std::function<void(ClientId client)> onClose;
};

/// @brief Text banner returned to plain HTTP requests.
inline constexpr auto HttpBanner = std::string_view { "AgentLoop Engine - WebSocket server" };

/// @brief WebSocket endpoint for engine clients.
///
/// Each connection has its own read loop and an outbound queue, so frames to
/// one client are written in order and never interleave. Plain HTTP requests
/// receive a 200 text banner.
class WebSocketServer
{
  public:
    WebSocketServer(boost::asio::io_context& ioc, ServerHandlers handlers);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// @brief Binds and starts accepting.
    /// @param port 0 picks an ephemeral port.
    /// @return The bound port, or a TransportError.
    [[nodiscard]] auto listen(std::string_view host, std::uint16_t port) -> Result<std::uint16_t>;

    /// @brief Queues a text frame for one client. Thread-safe; unknown clients are ignored.
    void send(ClientId client, std::string text);

    /// @brief Queues a text frame for every connected client. Thread-safe.
    void broadcast(std::string text);

    /// @brief Stops accepting and closes all connections.
    void stop();

    [[nodiscard]] auto clientCount() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentloop
