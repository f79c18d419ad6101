// SPDX-License-Identifier: Apache-2.0
#include "EventBus.hpp"

#include <vector>

namespace agentloop
{

auto EventBus::subscribe(Listener listener) -> ListenerId
{
    auto lock = std::lock_guard(_mutex);
    auto const id = _nextId++;
    _listeners.emplace(id, std::move(listener));
    return id;
}

void EventBus::unsubscribe(ListenerId id)
{
    auto lock = std::lock_guard(_mutex);
    _listeners.erase(id);
}

void EventBus::publish(const Event& event, std::optional<ClientId> target)
{
    auto listeners = std::vector<Listener> {};
    {
        auto lock = std::lock_guard(_mutex);
        listeners.reserve(_listeners.size());
        for (auto const& [id, listener]: _listeners)
            listeners.push_back(listener);
    }

    for (auto const& listener: listeners)
        listener(event, target);
}

} // namespace agentloop
