// SPDX-License-Identifier: Apache-2.0
#include "EventStreamDecoder.hpp"

#include <core/Log.hpp>
#include <core/TextUtils.hpp>

namespace agentloop
{

namespace
{
    auto stringAt(const nlohmann::json& obj, const char* key) -> std::optional<std::string>
    {
        if (obj.is_object() && obj.contains(key) && obj[key].is_string())
            return obj[key].get<std::string>();
        return std::nullopt;
    }

    auto firstChoice(const nlohmann::json& body) -> const nlohmann::json*
    {
        if (!body.is_object() || !body.contains("choices") || !body["choices"].is_array() || body["choices"].empty())
            return nullptr;
        return &body["choices"][0];
    }
} // namespace

EventStreamDecoder::EventStreamDecoder(DeltaCallback onDelta): _onDelta(std::move(onDelta))
{
}

void EventStreamDecoder::feed(std::string_view bytes)
{
    _buffer.append(bytes);

    auto start = std::size_t { 0 };
    for (auto nl = _buffer.find('\n'); nl != std::string::npos; nl = _buffer.find('\n', start))
    {
        processLine(std::string_view(_buffer).substr(start, nl - start));
        start = nl + 1;
    }
    _buffer.erase(0, start);
}

void EventStreamDecoder::finish()
{
    if (_buffer.empty())
        return;
    auto const line = std::move(_buffer);
    _buffer.clear();
    processLine(line);
}

void EventStreamDecoder::processLine(std::string_view line)
{
    if (line.ends_with('\r'))
        line.remove_suffix(1);
    line = text::trim(line);
    if (!line.starts_with("data:"))
        return;

    auto const payload = text::trim(line.substr(5));
    if (payload.empty() || payload == "[DONE]")
        return;

    auto chunk = nlohmann::json::parse(payload, nullptr, false);
    if (chunk.is_discarded())
    {
        log::trace("Skipping malformed event-stream payload: {}", payload);
        return;
    }

    auto delta = extractDelta(chunk);
    if (delta && !delta->empty() && _onDelta)
        _onDelta(*delta);
}

auto extractDelta(const nlohmann::json& chunk) -> std::optional<std::string>
{
    auto const* choice = firstChoice(chunk);
    if (!choice || !choice->is_object())
        return std::nullopt;

    if (choice->contains("delta"))
        if (auto text = stringAt((*choice)["delta"], "content"))
            return text;
    if (choice->contains("message"))
        if (auto text = stringAt((*choice)["message"], "content"))
            return text;
    return stringAt(*choice, "text");
}

auto extractContent(const nlohmann::json& response) -> std::string
{
    auto const* choice = firstChoice(response);
    if (!choice || !choice->is_object())
        return {};

    if (choice->contains("message"))
        if (auto text = stringAt((*choice)["message"], "content"))
            return *text;
    return stringAt(*choice, "text").value_or(std::string {});
}

} // namespace agentloop
