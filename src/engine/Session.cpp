// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <core/Ids.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace agentloop
{

Session::Session(std::string id): _id(std::move(id)), _createdAt(nowMillis())
{
}

auto Session::append(Role role, std::string content) -> const Message&
{
    return _messages.emplace_back(Message {
        .id = createId(),
        .role = role,
        .content = std::move(content),
        .timestamp = nowMillis(),
    });
}

auto Session::addUserMessage(std::string content) -> const Message&
{
    return append(Role::User, std::move(content));
}

auto Session::addAssistantMessage(std::string content) -> const Message&
{
    return append(Role::Assistant, std::move(content));
}

void Session::addToolCall(ToolCall call)
{
    _toolCalls.push_back(std::move(call));
}

auto Session::completeToolCall(std::string_view toolId, ToolCallStatus status, nlohmann::json result) -> bool
{
    auto const it = std::ranges::find_if(_toolCalls, [&](const ToolCall& call) { return call.id == toolId; });
    if (it == _toolCalls.end())
        return false;
    it->status = status;
    it->result = std::move(result);
    return true;
}

auto Session::configurationSummary() const -> std::string
{
    if (_pinnedAgent && !_pinnedAgent->empty())
        return std::format("Configured ({}: {})", routingModeToString(_routingMode), *_pinnedAgent);
    return std::format("Configured ({})", routingModeToString(_routingMode));
}

} // namespace agentloop
