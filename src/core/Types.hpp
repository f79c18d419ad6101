// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    return Role::User;
}

/// @brief A single message sent to a chat-completion backend.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
    std::vector<std::string> imageUrls; // data: URLs, sent as image_url content blocks
};

/// @brief A message in a session transcript. Immutable once appended.
struct Message
{
    std::string id;
    Role role = Role::User;
    std::string content;
    std::int64_t timestamp = 0; // milliseconds since epoch
};

/// @brief Lifecycle of a single tool invocation.
enum class ToolCallStatus
{
    Pending,
    Running,
    Completed,
    Failed,
};

[[nodiscard]] constexpr auto toolCallStatusToString(ToolCallStatus status) -> std::string_view
{
    switch (status)
    {
        case ToolCallStatus::Pending: return "pending";
        case ToolCallStatus::Running: return "running";
        case ToolCallStatus::Completed: return "completed";
        case ToolCallStatus::Failed: return "failed";
    }
    return "pending";
}

/// @brief Represents a tool call requested by the model.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    ToolCallStatus status = ToolCallStatus::Pending;
    std::optional<nlohmann::json> result;
};

/// @brief Status of a session as seen by clients.
enum class SessionStatus
{
    Idle,
    Thinking,
    Streaming,
    ToolUse,
    Error,
};

[[nodiscard]] constexpr auto sessionStatusToString(SessionStatus status) -> std::string_view
{
    switch (status)
    {
        case SessionStatus::Idle: return "idle";
        case SessionStatus::Thinking: return "thinking";
        case SessionStatus::Streaming: return "streaming";
        case SessionStatus::ToolUse: return "tool_use";
        case SessionStatus::Error: return "error";
    }
    return "idle";
}

/// @brief Returns true while a model request is in flight for the session.
[[nodiscard]] constexpr auto isBusy(SessionStatus status) -> bool
{
    return status == SessionStatus::Thinking || status == SessionStatus::Streaming
           || status == SessionStatus::ToolUse;
}

/// @brief Serializes a tool call for the wire protocol.
[[nodiscard]] inline auto toJson(const ToolCall& call) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "id", call.id },
        { "name", call.name },
        { "args", call.arguments },
        { "status", toolCallStatusToString(call.status) },
    };
    if (call.result)
        out["result"] = *call.result;
    return out;
}

} // namespace agentloop
