// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace agentloop::http
{

/// @brief Components of an http:// or https:// URL.
struct Url
{
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;
    std::string target; // path plus query, always starting with '/'
};

/// @brief Parses an absolute http(s) URL.
/// @param url The URL text, e.g. "http://127.0.0.1:12345/v1/chat/completions".
/// @return The URL components or an InvalidArgument error.
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<Url>;

/// @brief Joins a base URL and a path, normalizing the slash between them.
[[nodiscard]] auto joinUrl(std::string_view baseUrl, std::string_view path) -> std::string;

/// @brief A single HTTP request.
struct Request
{
    std::string method = "GET";
    std::string url;
    std::string body;
    std::string contentType;
    std::string accept;

    /// @brief Deadline for the whole exchange, from resolve to the last body byte.
    std::chrono::milliseconds timeout { 30'000 };
};

/// @brief Status line, content type and (for buffered requests) body of a response.
struct Response
{
    int status = 0;
    std::string contentType;
    std::string body;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Invoked once when the response header has been read.
using HeadCallback = std::function<void(const Response& head)>;

/// @brief Invoked for every body chunk as it arrives.
using ChunkCallback = std::function<void(std::string_view chunk)>;

/// @brief Performs a request and buffers the full response body.
///
/// Exceeding the request timeout yields ErrorCode::TimeoutError; connection
/// and protocol failures yield ErrorCode::TransportError. Non-2xx responses
/// are returned as values.
[[nodiscard]] auto fetch(const Request& request) -> Result<Response>;

/// @brief Performs a request and hands the body to @p onChunk incrementally.
///
/// The returned Response carries the status and content type; its body is
/// left empty.
[[nodiscard]] auto fetchStreaming(const Request& request, HeadCallback onHead, ChunkCallback onChunk)
    -> Result<Response>;

} // namespace agentloop::http
