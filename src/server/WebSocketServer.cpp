// SPDX-License-Identifier: Apache-2.0
#include "WebSocketServer.hpp"

#include <core/Log.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace agentloop
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace
{
    class Connection;

    /// @brief Acceptor plus the table of open WebSocket connections.
    struct ServerCore: std::enable_shared_from_this<ServerCore>
    {
        ServerCore(asio::io_context& context, ServerHandlers serverHandlers):
            ioc(context), acceptor(asio::make_strand(context)), handlers(std::move(serverHandlers))
        {
        }

        asio::io_context& ioc;
        tcp::acceptor acceptor;
        ServerHandlers handlers;
        std::atomic<ClientId> nextClientId = 1;
        std::atomic<bool> stopped = false;

        mutable std::mutex mutex;
        std::map<ClientId, std::weak_ptr<Connection>> connections;

        void accept();

        void attach(ClientId id, const std::shared_ptr<Connection>& connection)
        {
            auto lock = std::lock_guard(mutex);
            connections[id] = connection;
        }

        void detach(ClientId id)
        {
            auto lock = std::lock_guard(mutex);
            connections.erase(id);
        }

        [[nodiscard]] auto lookup(ClientId id) const -> std::shared_ptr<Connection>
        {
            auto lock = std::lock_guard(mutex);
            auto const it = connections.find(id);
            return it == connections.end() ? nullptr : it->second.lock();
        }

        [[nodiscard]] auto all() const -> std::vector<std::shared_ptr<Connection>>
        {
            auto lock = std::lock_guard(mutex);
            auto result = std::vector<std::shared_ptr<Connection>> {};
            for (auto const& [id, weak]: connections)
            {
                if (auto connection = weak.lock())
                    result.push_back(std::move(connection));
            }
            return result;
        }
    };

    /// @brief One accepted TCP connection: an HTTP exchange, then possibly a WebSocket.
    ///
    /// All members are touched only on the connection's strand.
    class Connection: public std::enable_shared_from_this<Connection>
    {
      public:
        Connection(tcp::socket socket, std::shared_ptr<ServerCore> server, ClientId id):
            _executor(socket.get_executor()), _stream(std::move(socket)), _server(std::move(server)), _id(id)
        {
        }

        void start()
        {
            asio::dispatch(_executor, [self = shared_from_this()] { self->readRequest(); });
        }

        void send(std::shared_ptr<const std::string> frame)
        {
            asio::post(_executor, [self = shared_from_this(), frame = std::move(frame)] {
                if (!self->_open)
                    return;
                self->_outbox.push_back(frame);
                if (self->_outbox.size() == 1)
                    self->writeNext();
            });
        }

        void close()
        {
            asio::post(_executor, [self = shared_from_this()] {
                if (self->_ws && self->_ws->is_open())
                {
                    self->_ws->async_close(websocket::close_code::going_away,
                                           [self](beast::error_code) { self->closed(); });
                }
                else if (!self->_ws)
                {
                    auto ec = beast::error_code {};
                    self->_stream.socket().shutdown(tcp::socket::shutdown_both, ec);
                }
            });
        }

      private:
        void readRequest()
        {
            _request = {};
            _stream.expires_after(std::chrono::seconds(30));
            bhttp::async_read(_stream,
                              _buffer,
                              _request,
                              [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRequest(ec); });
        }

        void onRequest(beast::error_code ec)
        {
            if (ec == bhttp::error::end_of_stream)
                return;
            if (ec)
            {
                log::debug("HTTP read from client {} failed: {}", _id, ec.message());
                return;
            }

            if (websocket::is_upgrade(_request))
            {
                upgrade();
                return;
            }

            auto response =
                std::make_shared<bhttp::response<bhttp::string_body>>(bhttp::status::ok, _request.version());
            response->set(bhttp::field::content_type, "text/plain; charset=utf-8");
            response->keep_alive(false);
            response->body() = std::string(HttpBanner);
            response->prepare_payload();

            bhttp::async_write(_stream,
                               *response,
                               [self = shared_from_this(), response](beast::error_code, std::size_t) {
                                   auto ignored = beast::error_code {};
                                   self->_stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
                               });
        }

        void upgrade()
        {
            _stream.expires_never();
            _ws.emplace(std::move(_stream));
            _ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            _ws->async_accept(_request, [self = shared_from_this()](beast::error_code ec) { self->onAccept(ec); });
        }

        void onAccept(beast::error_code ec)
        {
            if (ec)
            {
                log::debug("WebSocket handshake with client {} failed: {}", _id, ec.message());
                return;
            }

            log::info("Client {} connected", _id);
            _open = true;
            _server->attach(_id, shared_from_this());
            if (_server->handlers.onOpen)
                _server->handlers.onOpen(_id);
            readFrame();
        }

        void readFrame()
        {
            _ws->async_read(_frame,
                            [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onFrame(ec); });
        }

        void onFrame(beast::error_code ec)
        {
            if (ec)
            {
                if (ec != websocket::error::closed)
                    log::debug("WebSocket read from client {} failed: {}", _id, ec.message());
                closed();
                return;
            }

            auto const text = beast::buffers_to_string(_frame.data());
            _frame.consume(_frame.size());
            if (_server->handlers.onMessage)
                _server->handlers.onMessage(_id, text);
            readFrame();
        }

        void writeNext()
        {
            _ws->text(true);
            _ws->async_write(asio::buffer(*_outbox.front()),
                             [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onWrite(ec); });
        }

        void onWrite(beast::error_code ec)
        {
            if (ec)
            {
                log::debug("WebSocket write to client {} failed: {}", _id, ec.message());
                _outbox.clear();
                closed();
                return;
            }
            _outbox.pop_front();
            if (!_outbox.empty() && _open)
                writeNext();
        }

        void closed()
        {
            if (!_open)
                return;
            _open = false;
            _outbox.clear();
            log::info("Client {} disconnected", _id);
            _server->detach(_id);
            if (_server->handlers.onClose)
                _server->handlers.onClose(_id);
        }

        asio::any_io_executor _executor;
        beast::tcp_stream _stream;
        std::optional<websocket::stream<beast::tcp_stream>> _ws;
        std::shared_ptr<ServerCore> _server;
        ClientId _id;
        bool _open = false;

        beast::flat_buffer _buffer;
        bhttp::request<bhttp::string_body> _request;
        beast::flat_buffer _frame;
        std::deque<std::shared_ptr<const std::string>> _outbox;
    };

    void ServerCore::accept()
    {
        acceptor.async_accept(asio::make_strand(ioc),
                              [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                                  if (self->stopped)
                                      return;
                                  if (ec)
                                      log::warning("Accept failed: {}", ec.message());
                                  else
                                      std::make_shared<Connection>(std::move(socket), self, self->nextClientId++)
                                          ->start();
                                  self->accept();
                              });
    }
} // namespace

struct WebSocketServer::Impl
{
    std::shared_ptr<ServerCore> core;
};

WebSocketServer::WebSocketServer(asio::io_context& ioc, ServerHandlers handlers):
    _impl(std::make_unique<Impl>(Impl { std::make_shared<ServerCore>(ioc, std::move(handlers)) }))
{
}

WebSocketServer::~WebSocketServer()
{
    stop();
}

auto WebSocketServer::listen(std::string_view host, std::uint16_t port) -> Result<std::uint16_t>
{
    auto ec = beast::error_code {};
    auto const address = asio::ip::make_address(std::string(host), ec);
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Invalid bind address {}: {}", host, ec.message()));

    auto const endpoint = tcp::endpoint(address, port);
    auto& acceptor = _impl->core->acceptor;

    acceptor.open(endpoint.protocol(), ec);
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Cannot open socket: {}", ec.message()));
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Cannot set SO_REUSEADDR: {}", ec.message()));
    acceptor.bind(endpoint, ec);
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Cannot bind {}:{}: {}", host, port, ec.message()));
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Cannot listen on {}:{}: {}", host, port, ec.message()));

    auto const bound = acceptor.local_endpoint(ec).port();
    if (ec)
        return makeError(ErrorCode::TransportError, std::format("Cannot read bound port: {}", ec.message()));

    _impl->core->accept();
    return bound;
}

void WebSocketServer::send(ClientId client, std::string text)
{
    if (auto connection = _impl->core->lookup(client))
        connection->send(std::make_shared<const std::string>(std::move(text)));
}

void WebSocketServer::broadcast(std::string text)
{
    auto const frame = std::make_shared<const std::string>(std::move(text));
    for (auto const& connection: _impl->core->all())
        connection->send(frame);
}

void WebSocketServer::stop()
{
    auto const& core = _impl->core;
    if (core->stopped.exchange(true))
        return;

    asio::post(core->acceptor.get_executor(), [core] {
        auto ec = beast::error_code {};
        core->acceptor.close(ec);
    });
    for (auto const& connection: core->all())
        connection->close();
}

auto WebSocketServer::clientCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->core->mutex);
    return _impl->core->connections.size();
}

} // namespace agentloop
