// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <service/ServiceTypes.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentloop
{

/// @brief How a session picks the agent for each message.
enum class RoutingMode
{
    Auto,
    Pinned,
};

[[nodiscard]] constexpr auto routingModeToString(RoutingMode mode) -> std::string_view
{
    return mode == RoutingMode::Pinned ? "pinned" : "auto";
}

// Commands (client -> engine)

struct SessionCreateCommand
{
    std::optional<std::string> sessionId;
};

struct SessionSendCommand
{
    std::string sessionId;
    std::string content;
    std::vector<std::string> images; // file paths
};

/// @brief Changes routing of a session. An engaged outer optional means the
///        field was present; an empty inner optional means it was `null`.
struct SessionConfigureCommand
{
    std::string sessionId;
    std::optional<RoutingMode> routingMode;
    std::optional<std::optional<std::string>> agent;
    std::optional<std::optional<std::string>> sessionPrompt;
};

struct SessionCancelCommand
{
    std::string sessionId;
};

struct AgentListCommand
{
};

struct ServiceStartCommand
{
    std::string name;
};

struct ServiceStopCommand
{
    std::string name;
};

struct ServiceStatusCommand
{
    std::optional<std::string> name;
};

using Command = std::variant<SessionCreateCommand,
                             SessionSendCommand,
                             SessionConfigureCommand,
                             SessionCancelCommand,
                             AgentListCommand,
                             ServiceStartCommand,
                             ServiceStopCommand,
                             ServiceStatusCommand>;

/// @brief Validates a decoded `{"type": ..., "payload": {...}}` object.
/// @return The command, or a ProtocolError describing the first violation.
[[nodiscard]] auto parseCommand(const nlohmann::json& message) -> Result<Command>;

/// @brief Decodes and validates a text frame.
/// @return The command, or a ProtocolError ("Failed to parse message: ..." for
///         non-JSON input, "Invalid command: ..." for schema violations).
[[nodiscard]] auto parseCommand(std::string_view text) -> Result<Command>;

// Events (engine -> clients)

struct SessionCreatedEvent
{
    std::string sessionId;
};

struct SessionStatusEvent
{
    std::string sessionId;
    SessionStatus status = SessionStatus::Idle;
    std::optional<std::string> detail;
};

struct AssistantTokenEvent
{
    std::string sessionId;
    std::string token;
};

struct AssistantMessageEvent
{
    std::string sessionId;
    std::string messageId;
    std::string content;
};

struct ToolCallEvent
{
    std::string sessionId;
    ToolCall tool;
};

struct ToolResultEvent
{
    std::string sessionId;
    std::string toolId;
    nlohmann::json result;
};

struct RouterDecisionEvent
{
    std::string sessionId;
    RoutingMode routingMode = RoutingMode::Auto;
    std::string agent;
    std::vector<std::string> toolsAllowed;
    std::string reason;
    std::int64_t durationMs = 0;
};

struct AgentSummary
{
    std::string name;
    std::string description;
    std::vector<std::string> tools;
};

struct AgentListEvent
{
    std::vector<AgentSummary> agents;
};

struct ServiceStatusEvent
{
    ServiceState service;
};

struct ServiceLogEvent
{
    std::string name;
    OutputStream stream = OutputStream::Stdout;
    std::string line;
};

struct PerfMetricEvent
{
    std::optional<std::string> sessionId;
    std::string name;
    std::int64_t durationMs = 0;
    nlohmann::json meta = nlohmann::json::object();
};

struct ErrorEvent
{
    std::optional<std::string> sessionId;
    std::string error;
};

using Event = std::variant<SessionCreatedEvent,
                           SessionStatusEvent,
                           AssistantTokenEvent,
                           AssistantMessageEvent,
                           ToolCallEvent,
                           ToolResultEvent,
                           RouterDecisionEvent,
                           AgentListEvent,
                           ServiceStatusEvent,
                           ServiceLogEvent,
                           PerfMetricEvent,
                           ErrorEvent>;

/// @brief Returns the wire name of an event ("session.status", "assistant.token", ...).
[[nodiscard]] auto eventType(const Event& event) -> std::string_view;

/// @brief Serializes an event as `{"type": ..., ...fields}`.
[[nodiscard]] auto toJson(const Event& event) -> nlohmann::json;

/// @brief Serializes an event to a text frame. Invalid UTF-8 is replaced.
[[nodiscard]] auto serializeEvent(const Event& event) -> std::string;

} // namespace agentloop
