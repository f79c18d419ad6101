// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <array>
#include <format>
#include <limits>

namespace agentloop::http
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace
{

    constexpr auto UserAgent = std::string_view { "agentloop/0.1" };

    /// @brief Runs the io_context until the operation started by @p start completes.
    template <typename Start>
    auto runOperation(asio::io_context& ioc, Start&& start) -> beast::error_code
    {
        auto ec = beast::error_code {};
        start([&ec](beast::error_code result, auto&&...) { ec = result; });
        ioc.restart();
        ioc.run();
        return ec;
    }

    auto transportError(std::string_view what, const Url& url, const beast::error_code& ec) -> Error
    {
        if (ec == beast::error::timeout || ec == asio::error::operation_aborted)
            return Error { ErrorCode::TimeoutError, std::format("{} {}:{} timed out", what, url.host, url.port) };
        return Error { ErrorCode::TransportError,
                       std::format("{} {}:{} failed: {}", what, url.host, url.port, ec.message()) };
    }

    auto resolve(asio::io_context& ioc, const Url& url, std::chrono::steady_clock::time_point deadline)
        -> Result<tcp::resolver::results_type>
    {
        auto resolver = tcp::resolver(ioc);
        auto timer = asio::steady_timer(ioc, deadline);
        auto results = tcp::resolver::results_type {};
        auto timedOut = false;

        timer.async_wait([&](beast::error_code ec) {
            if (!ec)
            {
                timedOut = true;
                resolver.cancel();
            }
        });

        auto const ec = runOperation(ioc, [&](auto handler) {
            resolver.async_resolve(url.host,
                                   url.port,
                                   [&, handler](beast::error_code result, tcp::resolver::results_type found) mutable {
                                       timer.cancel();
                                       results = std::move(found);
                                       handler(result);
                                   });
        });

        if (timedOut)
            return std::unexpected(transportError("resolve", url, beast::error::timeout));
        if (ec)
            return std::unexpected(transportError("resolve", url, ec));
        return results;
    }

    /// @brief Sends the request on a connected stream and reads the response.
    template <typename Stream>
    auto exchange(asio::io_context& ioc,
                  Stream& stream,
                  const Url& url,
                  const Request& request,
                  const HeadCallback& onHead,
                  const ChunkCallback& onChunk) -> Result<Response>
    {
        auto req = bhttp::request<bhttp::string_body> {};
        req.method_string(request.method);
        req.target(url.target);
        req.version(11);
        req.set(bhttp::field::host, url.host);
        req.set(bhttp::field::user_agent, UserAgent);
        if (!request.accept.empty())
            req.set(bhttp::field::accept, request.accept);
        if (!request.body.empty() || request.method == "POST")
        {
            req.set(bhttp::field::content_type,
                    request.contentType.empty() ? std::string("application/json") : request.contentType);
            req.body() = request.body;
            req.prepare_payload();
        }

        auto ec = runOperation(ioc, [&](auto handler) { bhttp::async_write(stream, req, handler); });
        if (ec)
            return std::unexpected(transportError("write to", url, ec));

        auto buffer = beast::flat_buffer {};
        auto parser = bhttp::response_parser<bhttp::buffer_body> {};
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());

        ec = runOperation(ioc, [&](auto handler) { bhttp::async_read_header(stream, buffer, parser, handler); });
        if (ec)
            return std::unexpected(transportError("read header from", url, ec));

        auto response = Response {
            .status = static_cast<int>(parser.get().result_int()),
            .contentType = std::string(parser.get()[bhttp::field::content_type]),
            .body = {},
        };
        if (onHead)
            onHead(response);

        auto chunk = std::array<char, 8192> {};
        while (!parser.is_done())
        {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();

            ec = runOperation(ioc, [&](auto handler) { bhttp::async_read(stream, buffer, parser, handler); });
            if (ec == bhttp::error::need_buffer)
                ec = {};
            if (ec)
                return std::unexpected(transportError("read body from", url, ec));

            auto const received = chunk.size() - parser.get().body().size;
            if (received == 0)
                continue;

            auto const piece = std::string_view(chunk.data(), received);
            if (onChunk)
                onChunk(piece);
            else
                response.body.append(piece);
        }

        return response;
    }

    auto perform(const Request& request, const HeadCallback& onHead, const ChunkCallback& onChunk)
        -> Result<Response>
    {
        auto url = parseUrl(request.url);
        if (!url)
            return std::unexpected(url.error());

        auto const deadline = std::chrono::steady_clock::now() + request.timeout;
        auto ioc = asio::io_context {};

        auto endpoints = resolve(ioc, *url, deadline);
        if (!endpoints)
            return std::unexpected(endpoints.error());

        try
        {
            if (url->scheme == "https")
            {
                auto ctx = asio::ssl::context(asio::ssl::context::tls_client);
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(asio::ssl::verify_peer);

                auto stream = beast::ssl_stream<beast::tcp_stream>(ioc, ctx);
                stream.set_verify_callback(asio::ssl::host_name_verification(url->host));
                if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str()))
                    return makeError(ErrorCode::TransportError, std::format("Failed to set SNI for {}", url->host));

                beast::get_lowest_layer(stream).expires_at(deadline);

                auto ec = runOperation(
                    ioc, [&](auto handler) { beast::get_lowest_layer(stream).async_connect(*endpoints, handler); });
                if (ec)
                    return std::unexpected(transportError("connect to", *url, ec));

                ec = runOperation(
                    ioc, [&](auto handler) { stream.async_handshake(asio::ssl::stream_base::client, handler); });
                if (ec)
                    return std::unexpected(transportError("TLS handshake with", *url, ec));

                auto result = exchange(ioc, stream, *url, request, onHead, onChunk);
                beast::get_lowest_layer(stream).close();
                return result;
            }

            auto stream = beast::tcp_stream(ioc);
            stream.expires_at(deadline);

            auto ec = runOperation(ioc, [&](auto handler) { stream.async_connect(*endpoints, handler); });
            if (ec)
                return std::unexpected(transportError("connect to", *url, ec));

            auto result = exchange(ioc, stream, *url, request, onHead, onChunk);

            auto shutdownError = beast::error_code {};
            stream.socket().shutdown(tcp::socket::shutdown_both, shutdownError);
            if (shutdownError && shutdownError != beast::errc::not_connected)
                log::trace("HTTP shutdown of {}:{}: {}", url->host, url->port, shutdownError.message());
            return result;
        }
        catch (const boost::system::system_error& e)
        {
            return makeError(ErrorCode::TransportError, std::format("HTTP {} {} failed: {}", request.method, request.url, e.what()));
        }
    }

} // namespace

auto parseUrl(std::string_view url) -> Result<Url>
{
    auto result = Url {};
    auto rest = url;

    if (rest.starts_with("http://"))
    {
        result.scheme = "http";
        rest.remove_prefix(7);
    }
    else if (rest.starts_with("https://"))
    {
        result.scheme = "https";
        rest.remove_prefix(8);
    }
    else
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL: {}", url));

    auto const slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    result.target = slash == std::string_view::npos ? std::string("/") : std::string(rest.substr(slash));

    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, std::format("Malformed host in URL: {}", url));
        result.host = std::string(authority.substr(1, close - 1));
        authority.remove_prefix(close + 1);
        if (authority.starts_with(':'))
            result.port = std::string(authority.substr(1));
    }
    else
    {
        auto const colon = authority.rfind(':');
        result.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            result.port = std::string(authority.substr(colon + 1));
    }

    if (result.host.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Missing host in URL: {}", url));
    if (result.port.empty())
        result.port = result.scheme == "https" ? "443" : "80";

    return result;
}

auto joinUrl(std::string_view baseUrl, std::string_view path) -> std::string
{
    while (baseUrl.ends_with('/'))
        baseUrl.remove_suffix(1);
    if (path.starts_with('/'))
        return std::format("{}{}", baseUrl, path);
    return std::format("{}/{}", baseUrl, path);
}

auto fetch(const Request& request) -> Result<Response>
{
    return perform(request, {}, {});
}

auto fetchStreaming(const Request& request, HeadCallback onHead, ChunkCallback onChunk) -> Result<Response>
{
    if (!onChunk)
        return makeError(ErrorCode::InvalidArgument, "fetchStreaming requires a chunk callback");
    return perform(request, onHead, onChunk);
}

} // namespace agentloop::http
