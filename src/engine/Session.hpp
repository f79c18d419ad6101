// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <engine/Protocol.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief Conversation state of one client session.
///
/// Owned by the SessionEngine and only touched on its strand. Messages and
/// tool calls are append-only.
class Session
{
  public:
    explicit Session(std::string id);

    [[nodiscard]] auto id() const noexcept -> const std::string& { return _id; }
    [[nodiscard]] auto createdAt() const noexcept -> std::int64_t { return _createdAt; }

    [[nodiscard]] auto status() const noexcept -> SessionStatus { return _status; }
    void setStatus(SessionStatus status) noexcept { _status = status; }

    /// @brief Appends a user message and returns it.
    auto addUserMessage(std::string content) -> const Message&;

    /// @brief Appends an assistant message and returns it.
    auto addAssistantMessage(std::string content) -> const Message&;

    [[nodiscard]] auto messages() const noexcept -> const std::vector<Message>& { return _messages; }

    void addToolCall(ToolCall call);

    /// @brief Records the outcome of a previously added tool call.
    /// @return False when no call with @p toolId exists.
    auto completeToolCall(std::string_view toolId, ToolCallStatus status, nlohmann::json result) -> bool;

    [[nodiscard]] auto toolCalls() const noexcept -> const std::vector<ToolCall>& { return _toolCalls; }

    [[nodiscard]] auto routingMode() const noexcept -> RoutingMode { return _routingMode; }
    void setRoutingMode(RoutingMode mode) noexcept { _routingMode = mode; }

    [[nodiscard]] auto pinnedAgent() const -> const std::optional<std::string>& { return _pinnedAgent; }
    void setPinnedAgent(std::optional<std::string> agent) { _pinnedAgent = std::move(agent); }

    [[nodiscard]] auto sessionPrompt() const -> const std::optional<std::string>& { return _sessionPrompt; }
    void setSessionPrompt(std::optional<std::string> prompt) { _sessionPrompt = std::move(prompt); }

    /// @brief The "Configured (<mode>[: <agent>])" detail text.
    [[nodiscard]] auto configurationSummary() const -> std::string;

  private:
    auto append(Role role, std::string content) -> const Message&;

    std::string _id;
    std::int64_t _createdAt;
    SessionStatus _status = SessionStatus::Idle;
    std::vector<Message> _messages;
    std::vector<ToolCall> _toolCalls;
    RoutingMode _routingMode = RoutingMode::Auto;
    std::optional<std::string> _pinnedAgent;
    std::optional<std::string> _sessionPrompt;
};

} // namespace agentloop
