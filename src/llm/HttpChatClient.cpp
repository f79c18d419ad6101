// SPDX-License-Identifier: Apache-2.0
#include "HttpChatClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <llm/EventStreamDecoder.hpp>
#include <net/HttpClient.hpp>

#include <format>

namespace agentloop
{

namespace
{
    auto toJson(const ChatMessage& message) -> nlohmann::json
    {
        if (message.imageUrls.empty())
            return { { "role", roleToString(message.role) }, { "content", message.content } };

        auto blocks = nlohmann::json::array();
        blocks.push_back({ { "type", "text" }, { "text", message.content } });
        for (auto const& url: message.imageUrls)
            blocks.push_back({ { "type", "image_url" }, { "image_url", { { "url", url } } } });
        return { { "role", roleToString(message.role) }, { "content", std::move(blocks) } };
    }

    auto makeRequest(std::span<const ChatMessage> messages, const ChatOptions& options, bool stream)
        -> http::Request
    {
        return http::Request {
            .method = "POST",
            .url = http::joinUrl(options.baseUrl, "/v1/chat/completions"),
            .body = json::dump(buildRequestBody(messages, options, stream)),
            .contentType = "application/json",
            .accept = stream ? "text/event-stream, application/json" : "application/json",
            .timeout = options.timeout,
        };
    }

    auto isEventStream(std::string_view contentType) -> bool
    {
        return text::toLower(contentType).find("text/event-stream") != std::string::npos;
    }
} // namespace

auto buildRequestBody(std::span<const ChatMessage> messages, const ChatOptions& options, bool stream)
    -> nlohmann::json
{
    auto list = nlohmann::json::array();
    for (auto const& message: messages)
        list.push_back(toJson(message));

    return {
        { "model", options.model },
        { "messages", std::move(list) },
        { "max_tokens", options.maxTokens },
        { "temperature", options.temperature },
        { "top_p", options.topP },
        { "stream", stream },
    };
}

HttpChatClient::HttpChatClient(std::string label): _label(std::move(label))
{
}

auto HttpChatClient::complete(std::span<const ChatMessage> messages, const ChatOptions& options)
    -> Result<Completion>
{
    auto response = http::fetch(makeRequest(messages, options, false));
    if (!response)
        return std::unexpected(response.error());

    if (!response->ok())
        return makeError(ErrorCode::BackendError,
                         std::format("{} chat failed: {}{}",
                                     _label,
                                     response->status,
                                     response->body.empty() ? std::string {} : "\n" + response->body));

    auto body = json::parse(response->body);
    if (!body)
        return makeError(ErrorCode::BackendError, std::format("{} chat returned invalid JSON", _label));

    auto content = extractContent(*body);
    if (text::trim(content).empty())
        return makeError(ErrorCode::EmptyCompletion, std::format("{} chat returned empty content.", _label));

    return Completion { .model = json::getStringOr(*body, "model", options.model), .content = std::move(content) };
}

auto HttpChatClient::completeStreaming(std::span<const ChatMessage> messages,
                                       TokenCallback onToken,
                                       const ChatOptions& options) -> Result<Completion>
{
    auto content = std::string {};
    auto raw = std::string {};
    auto streamed = false;

    auto decoder = EventStreamDecoder([&](std::string_view delta) {
        content.append(delta);
        if (onToken)
            onToken(delta);
    });

    auto response = http::fetchStreaming(
        makeRequest(messages, options, true),
        [&](const http::Response& head) { streamed = head.ok() && isEventStream(head.contentType); },
        [&](std::string_view chunk) {
            if (streamed)
                decoder.feed(chunk);
            else
                raw.append(chunk);
        });
    if (!response)
        return std::unexpected(response.error());

    if (!response->ok())
        return makeError(ErrorCode::BackendError,
                         std::format("{} chat failed: {}{}", _label, response->status, raw.empty() ? raw : "\n" + raw));

    if (streamed)
    {
        decoder.finish();
        if (text::trim(content).empty())
            return makeError(ErrorCode::EmptyCompletion, std::format("{} chat returned empty content.", _label));
        return Completion { .model = options.model, .content = std::move(content) };
    }

    // Backend ignored `stream: true` and answered with a buffered JSON body.
    log::debug("{} answered without an event stream ({}), replaying buffered content", _label, response->contentType);

    auto body = json::parse(raw);
    if (!body)
        return makeError(ErrorCode::BackendError, std::format("{} chat returned invalid JSON", _label));

    content = extractContent(*body);
    if (text::trim(content).empty())
        return makeError(ErrorCode::EmptyCompletion, std::format("{} chat returned empty content.", _label));

    if (onToken)
    {
        for (auto const& token: text::splitKeepingWhitespace(content))
            onToken(token);
    }

    return Completion { .model = json::getStringOr(*body, "model", options.model), .content = std::move(content) };
}

} // namespace agentloop
