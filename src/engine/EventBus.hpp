// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Protocol.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace agentloop
{

/// @brief Identifies one connected client.
using ClientId = std::uint64_t;

/// @brief Fan-out of engine events to connected clients.
///
/// Events published with a target are meant for that client only; all
/// others are broadcast. Listeners run on the publishing thread.
class EventBus
{
  public:
    using ListenerId = std::uint64_t;
    using Listener = std::function<void(const Event& event, std::optional<ClientId> target)>;

    [[nodiscard]] auto subscribe(Listener listener) -> ListenerId;
    void unsubscribe(ListenerId id);

    /// @brief Delivers @p event to all listeners.
    void publish(const Event& event, std::optional<ClientId> target = std::nullopt);

    /// @brief Delivers @p event to the listener of @p target only.
    void sendTo(ClientId target, const Event& event) { publish(event, target); }

  private:
    std::mutex _mutex;
    std::map<ListenerId, Listener> _listeners;
    ListenerId _nextId = 1;
};

} // namespace agentloop
