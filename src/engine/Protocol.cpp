// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <core/JsonUtils.hpp>
#include <core/Overloaded.hpp>

#include <format>
#include <utility>

namespace agentloop
{

namespace
{
    auto invalid(std::string_view detail) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ProtocolError, std::format("Invalid command: {}", detail));
    }

    /// @brief Reads a required string field.
    auto requireString(const nlohmann::json& payload, const char* key) -> Result<std::string>
    {
        if (!payload.contains(key))
            return invalid(std::format("payload.{} is required", key));
        if (!payload[key].is_string())
            return invalid(std::format("payload.{} must be a string", key));
        return payload[key].get<std::string>();
    }

    /// @brief Reads an optional string field; present but non-string is an error.
    auto optionalString(const nlohmann::json& payload, const char* key) -> Result<std::optional<std::string>>
    {
        if (!payload.contains(key))
            return std::optional<std::string> {};
        if (!payload[key].is_string())
            return invalid(std::format("payload.{} must be a string", key));
        return std::optional<std::string> { payload[key].get<std::string>() };
    }

    /// @brief Reads a field that may be absent, a string, or null.
    auto nullableString(const nlohmann::json& payload, const char* key)
        -> Result<std::optional<std::optional<std::string>>>
    {
        using Field = std::optional<std::optional<std::string>>;
        if (!payload.contains(key))
            return Field {};
        if (payload[key].is_null())
            return Field { std::in_place };
        if (!payload[key].is_string())
            return invalid(std::format("payload.{} must be a string or null", key));
        return Field { payload[key].get<std::string>() };
    }

    auto requireServiceName(const nlohmann::json& payload) -> Result<std::string>
    {
        auto name = requireString(payload, "name");
        if (!name)
            return name;
        if (!findService(*name))
            return invalid(std::format("unknown service: {}", *name));
        return name;
    }

    auto parseSend(const nlohmann::json& payload) -> Result<Command>
    {
        auto sessionId = requireString(payload, "sessionId");
        if (!sessionId)
            return std::unexpected(sessionId.error());
        auto content = requireString(payload, "content");
        if (!content)
            return std::unexpected(content.error());

        auto command = SessionSendCommand { .sessionId = std::move(*sessionId), .content = std::move(*content) };
        if (payload.contains("images"))
        {
            auto const& images = payload["images"];
            if (!images.is_array())
                return invalid("payload.images must be an array of strings");
            for (auto const& image: images)
            {
                if (!image.is_string())
                    return invalid("payload.images must be an array of strings");
                if (auto path = image.get<std::string>(); !path.empty())
                    command.images.push_back(std::move(path));
            }
        }
        return command;
    }

    auto parseConfigure(const nlohmann::json& payload) -> Result<Command>
    {
        auto sessionId = requireString(payload, "sessionId");
        if (!sessionId)
            return std::unexpected(sessionId.error());

        auto command = SessionConfigureCommand { .sessionId = std::move(*sessionId) };

        auto mode = optionalString(payload, "routingMode");
        if (!mode)
            return std::unexpected(mode.error());
        if (*mode)
        {
            if (**mode == "auto")
                command.routingMode = RoutingMode::Auto;
            else if (**mode == "pinned")
                command.routingMode = RoutingMode::Pinned;
            else
                return invalid(std::format("unknown routing mode: {}", **mode));
        }

        auto agent = nullableString(payload, "agent");
        if (!agent)
            return std::unexpected(agent.error());
        command.agent = std::move(*agent);

        auto prompt = nullableString(payload, "sessionPrompt");
        if (!prompt)
            return std::unexpected(prompt.error());
        command.sessionPrompt = std::move(*prompt);

        return command;
    }

    auto parsePayload(std::string_view type, const nlohmann::json& payload) -> Result<Command>
    {
        if (type == "session.create")
        {
            auto sessionId = optionalString(payload, "sessionId");
            if (!sessionId)
                return std::unexpected(sessionId.error());
            return SessionCreateCommand { .sessionId = std::move(*sessionId) };
        }
        if (type == "session.send")
            return parseSend(payload);
        if (type == "session.configure")
            return parseConfigure(payload);
        if (type == "session.cancel")
        {
            auto sessionId = requireString(payload, "sessionId");
            if (!sessionId)
                return std::unexpected(sessionId.error());
            return SessionCancelCommand { .sessionId = std::move(*sessionId) };
        }
        if (type == "agent.list")
            return AgentListCommand {};
        if (type == "service.start" || type == "service.stop")
        {
            auto name = requireServiceName(payload);
            if (!name)
                return std::unexpected(name.error());
            if (type == "service.start")
                return ServiceStartCommand { .name = std::move(*name) };
            return ServiceStopCommand { .name = std::move(*name) };
        }
        if (type == "service.status")
        {
            if (!payload.contains("name"))
                return ServiceStatusCommand {};
            auto name = requireServiceName(payload);
            if (!name)
                return std::unexpected(name.error());
            return ServiceStatusCommand { .name = std::move(*name) };
        }
        return invalid(std::format("unknown command type: {}", type));
    }
} // namespace

auto parseCommand(const nlohmann::json& message) -> Result<Command>
{
    if (!message.is_object())
        return invalid("message must be a JSON object");
    if (!message.contains("type") || !message["type"].is_string())
        return invalid("type must be a string");

    auto const type = message["type"].get<std::string>();

    // A missing payload reads as `{}`; anything else must be an object.
    static auto const emptyPayload = nlohmann::json::object();
    if (message.contains("payload") && !message["payload"].is_object())
        return invalid("payload must be an object");
    auto const& payload = message.contains("payload") ? message["payload"] : emptyPayload;

    return parsePayload(type, payload);
}

auto parseCommand(std::string_view text) -> Result<Command>
{
    auto message = nlohmann::json {};
    try
    {
        message = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("Failed to parse message: {}", e.what()));
    }
    return parseCommand(message);
}

auto eventType(const Event& event) -> std::string_view
{
    return std::visit(overloaded {
                          [](const SessionCreatedEvent&) { return std::string_view { "session.created" }; },
                          [](const SessionStatusEvent&) { return std::string_view { "session.status" }; },
                          [](const AssistantTokenEvent&) { return std::string_view { "assistant.token" }; },
                          [](const AssistantMessageEvent&) { return std::string_view { "assistant.message" }; },
                          [](const ToolCallEvent&) { return std::string_view { "tool.call" }; },
                          [](const ToolResultEvent&) { return std::string_view { "tool.result" }; },
                          [](const RouterDecisionEvent&) { return std::string_view { "router.decision" }; },
                          [](const AgentListEvent&) { return std::string_view { "agent.list" }; },
                          [](const ServiceStatusEvent&) { return std::string_view { "service.status" }; },
                          [](const ServiceLogEvent&) { return std::string_view { "service.log" }; },
                          [](const PerfMetricEvent&) { return std::string_view { "perf.metric" }; },
                          [](const ErrorEvent&) { return std::string_view { "error" }; },
                      },
                      event);
}

auto toJson(const Event& event) -> nlohmann::json
{
    auto out = nlohmann::json { { "type", eventType(event) } };

    std::visit(overloaded {
                   [&](const SessionCreatedEvent& e) { out["sessionId"] = e.sessionId; },
                   [&](const SessionStatusEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["status"] = sessionStatusToString(e.status);
                       if (e.detail)
                           out["detail"] = *e.detail;
                   },
                   [&](const AssistantTokenEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["token"] = e.token;
                   },
                   [&](const AssistantMessageEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["messageId"] = e.messageId;
                       out["content"] = e.content;
                   },
                   [&](const ToolCallEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["tool"] = agentloop::toJson(e.tool);
                   },
                   [&](const ToolResultEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["toolId"] = e.toolId;
                       out["result"] = e.result;
                   },
                   [&](const RouterDecisionEvent& e) {
                       out["sessionId"] = e.sessionId;
                       out["routingMode"] = routingModeToString(e.routingMode);
                       out["agent"] = e.agent;
                       out["toolsAllowed"] = e.toolsAllowed;
                       out["reason"] = e.reason;
                       out["durationMs"] = e.durationMs;
                   },
                   [&](const AgentListEvent& e) {
                       auto agents = nlohmann::json::array();
                       for (auto const& agent: e.agents)
                       {
                           agents.push_back({
                               { "name", agent.name },
                               { "description", agent.description },
                               { "tools", agent.tools },
                           });
                       }
                       out["agents"] = std::move(agents);
                   },
                   [&](const ServiceStatusEvent& e) { out["service"] = agentloop::toJson(e.service); },
                   [&](const ServiceLogEvent& e) {
                       out["name"] = e.name;
                       out["stream"] = outputStreamToString(e.stream);
                       out["line"] = e.line;
                   },
                   [&](const PerfMetricEvent& e) {
                       if (e.sessionId)
                           out["sessionId"] = *e.sessionId;
                       out["name"] = e.name;
                       out["durationMs"] = e.durationMs;
                       out["meta"] = e.meta;
                   },
                   [&](const ErrorEvent& e) {
                       if (e.sessionId)
                           out["sessionId"] = *e.sessionId;
                       out["error"] = e.error;
                   },
               },
               event);

    return out;
}

auto serializeEvent(const Event& event) -> std::string
{
    return json::dump(toJson(event));
}

} // namespace agentloop
