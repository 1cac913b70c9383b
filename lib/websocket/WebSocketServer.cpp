#include "WebSocketServer.h"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <Log.h>

#include <chrono>
#include <deque>
#include <exception>
#include <optional>
#include <vector>

namespace BLEBridge {
namespace WS {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using error_code = boost::system::error_code;

namespace {

    std::string detail(const std::string& message) {
        return "{\"detail\":\"" + message + "\"}";
    }

    std::chrono::milliseconds seconds(double value) {
        return std::chrono::milliseconds(static_cast<int64_t>(value * 1000.0));
    }

    std::string endpointString(const tcp::socket& socket) {
        error_code ec;
        tcp::endpoint remote = socket.remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return remote.address().to_string() + ":" + std::to_string(remote.port());
    }

}

HttpResponse jsonResponse(int status, const std::string& body, unsigned version) {
    HttpResponse response(static_cast<http::status>(status), version);
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

std::string targetPath(const HttpRequest& request) {
    std::string target(request.target());
    size_t question = target.find('?');
    if (question != std::string::npos) {
        target.resize(question);
    }
    return target;
}

//=============================================================================
// HTTP connection: one request, one response
//=============================================================================

class WebSocketServer::HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(WebSocketServer& server, tcp::socket socket)
        : _server(server), _peer(endpointString(socket)), _stream(std::move(socket)) {
    }

    void start() {
        _parser.emplace();
        _parser->body_limit(_server._limits.max_body);
        _stream.expires_after(seconds(_server._limits.request_timeout));
        auto self = shared_from_this();
        http::async_read(_stream, _buffer, *_parser, [self](error_code ec, size_t) {
            self->onRead(ec);
        });
    }

    void respond(HttpResponse response) {
        if (_responded) {
            return;
        }
        _responded = true;
        auto message = std::make_shared<HttpResponse>(std::move(response));
        message->keep_alive(false);
        message->prepare_payload();
        _stream.expires_after(seconds(_server._limits.send_timeout));
        auto self = shared_from_this();
        http::async_write(_stream, *message, [self, message](error_code ec, size_t) {
            if (ec && ec != net::error::operation_aborted) {
                DEBUG(self->_server.toString() + ": send error " + ec.message() + " to " + self->_peer);
            }
            error_code ignored;
            self->_stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        });
    }

    beast::tcp_stream& stream() { return _stream; }
    const std::string& peer() const { return _peer; }

private:
    void onRead(error_code ec) {
        if (ec == http::error::body_limit) {
            respond(jsonResponse(413, detail("Request too large"), _parser->get().version()));
            return;
        }
        if (ec == http::error::end_of_stream || ec == net::error::operation_aborted) {
            return;
        }
        if (ec == beast::error::timeout) {
            DEBUG(_server.toString() + ": Request timeout from " + _peer);
            return;
        }
        if (ec.category() == http::make_error_code(http::error::bad_method).category()) {
            respond(jsonResponse(400, detail("Bad Request")));
            return;
        }
        if (ec) {
            DEBUG(_server.toString() + ": recv error " + ec.message() + " from " + _peer);
            return;
        }
        _server.dispatch(shared_from_this(), _parser->release());
    }

    WebSocketServer& _server;
    std::string _peer;
    beast::tcp_stream _stream;
    beast::flat_buffer _buffer;
    std::optional<http::request_parser<http::string_body>> _parser;
    bool _responded = false;
};

//=============================================================================
// WebSocket connection
//=============================================================================

class WebSocketServer::SocketConnection : public std::enable_shared_from_this<SocketConnection> {
public:
    SocketConnection(WebSocketServer& server, uint64_t id, const std::string& peer, beast::tcp_stream&& stream)
        : _server(server), _id(id), _peer(peer), _ws(std::move(stream)) {
    }

    void accept(HttpRequest request) {
        beast::get_lowest_layer(_ws).expires_never();
        _ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        _ws.read_message_max(_server._limits.max_message);
        auto upgrade = std::make_shared<HttpRequest>(std::move(request));
        auto self = shared_from_this();
        _ws.async_accept(*upgrade, [self, upgrade](error_code ec) {
            self->onAccept(ec);
        });
    }

    bool send(const std::string& text) {
        if (!_open || _closing) {
            return false;
        }
        if (_queued + text.size() > _server._limits.max_tx_buffer) {
            WARNING(_server.toString() + ": Send buffer full for " + _peer + ", dropping connection");
            abort();
            return false;
        }
        _outbox.push_back(text);
        _queued += text.size();
        if (!_writing) {
            writeNext();
        }
        return true;
    }

    void loop() {
        if (!_open || _closing || !_session) {
            return;
        }
        _session->loop();
        if (!_session->isRunning()) {
            close(websocket::close_code::normal, std::string());
        }
    }

    /**
     * @brief Server is going away: drop the socket and notify the session
     */
    void shutdown() {
        abort();
        finish();
    }

private:
    void onAccept(error_code ec) {
        if (ec) {
            DEBUG(_server.toString() + ": WebSocket handshake failed from " + _peer + ": " + ec.message());
            finish();
            return;
        }
        _open = true;
        std::weak_ptr<SocketConnection> weak = shared_from_this();
        if (_server._session_factory) {
            _session = _server._session_factory([weak](const std::string& text) {
                auto conn = weak.lock();
                return conn && conn->send(text);
            });
        }
        if (!_session) {
            readNext();
            close(websocket::close_code::internal_error, "session unavailable");
            return;
        }
        INFO(_server.toString() + ": WebSocket opened from " + _peer);
        _session->onOpen();
        readNext();
    }

    void readNext() {
        auto self = shared_from_this();
        _ws.async_read(_buffer, [self](error_code ec, size_t) {
            self->onRead(ec);
        });
    }

    void onRead(error_code ec) {
        if (ec) {
            if (ec == websocket::error::closed) {
                DEBUG(_server.toString() + ": Close frame from " + _peer);
            } else if (ec == websocket::error::message_too_big) {
                WARNING(_server.toString() + ": Closing WebSocket from " + _peer + " (message too big)");
            } else if (ec != net::error::operation_aborted) {
                DEBUG(_server.toString() + ": recv error " + ec.message() + " from " + _peer);
            }
            finish();
            return;
        }
        if (!_ws.got_text()) {
            _buffer.consume(_buffer.size());
            readNext();
            close(websocket::close_code::unknown_data, "text frames only");
            return;
        }
        std::string text = beast::buffers_to_string(_buffer.data());
        _buffer.consume(_buffer.size());
        if (_session && !_closing) {
            _session->onText(text);
        }
        if (!_closed) {
            readNext();
        }
    }

    void writeNext() {
        if (_outbox.empty()) {
            _writing = false;
            if (_closing) {
                startClose();
            }
            return;
        }
        _writing = true;
        _ws.text(true);
        auto self = shared_from_this();
        _ws.async_write(net::buffer(_outbox.front()), [self](error_code ec, size_t) {
            if (!self->_outbox.empty()) {
                self->_queued -= self->_outbox.front().size();
                self->_outbox.pop_front();
            }
            if (ec) {
                self->_writing = false;
                if (ec != net::error::operation_aborted) {
                    DEBUG(self->_server.toString() + ": send error " + ec.message() + " to " + self->_peer);
                }
                self->abort();
                return;
            }
            self->writeNext();
        });
    }

    void close(websocket::close_code code, const std::string& reason) {
        if (_closing || _closed) {
            return;
        }
        if (code != websocket::close_code::normal) {
            WARNING(_server.toString() + ": Closing WebSocket from " + _peer + " (" +
                std::to_string(static_cast<int>(code)) + " " + reason + ")");
        }
        _closing = true;
        _close_reason = websocket::close_reason(code, reason);
        if (!_writing) {
            startClose();
        }
    }

    void startClose() {
        if (_close_started) {
            return;
        }
        _close_started = true;
        auto self = shared_from_this();
        _ws.async_close(_close_reason, [self](error_code ec) {
            if (ec) {
                self->abort();
            }
        });
    }

    void abort() {
        error_code ignored;
        beast::get_lowest_layer(_ws).socket().close(ignored);
    }

    void finish() {
        if (_closed) {
            return;
        }
        _closed = true;
        bool was_open = _open;
        _open = false;
        _outbox.clear();
        _queued = 0;
        if (_session) {
            _session->onClose();
        }
        if (was_open) {
            INFO(_server.toString() + ": WebSocket closed from " + _peer);
        }
        _server.detach(_id);
    }

    WebSocketServer& _server;
    uint64_t _id;
    std::string _peer;
    websocket::stream<beast::tcp_stream> _ws;
    beast::flat_buffer _buffer;
    IWebSocketSession::Ptr _session;

    std::deque<std::string> _outbox;
    size_t _queued = 0;
    bool _writing = false;

    bool _open = false;
    bool _closing = false;
    bool _close_started = false;
    bool _closed = false;
    websocket::close_reason _close_reason;
};

//=============================================================================
// Server
//=============================================================================

WebSocketServer::WebSocketServer(const std::string& host, uint16_t port, const ServerLimits& limits)
    : _host(host), _port(port), _limits(limits), _acceptor(_ioc) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::addRoute(const std::string& method, const std::string& path, HttpHandler handler) {
    _routes[std::make_pair(method, path)] = handler;
}

void WebSocketServer::setWebSocketPath(const std::string& path, SessionFactory factory) {
    _ws_path = path;
    _session_factory = factory;
}

bool WebSocketServer::start() {
    if (_acceptor.is_open()) {
        return true;
    }

    error_code ec;
    tcp::endpoint endpoint;
    if (_host.empty()) {
        endpoint = tcp::endpoint(tcp::v4(), _port);
    } else {
        net::ip::address address = net::ip::make_address(_host, ec);
        if (!ec) {
            endpoint = tcp::endpoint(address, _port);
        } else {
            tcp::resolver resolver(_ioc);
            auto results = resolver.resolve(_host, std::to_string(_port), ec);
            if (ec || results.empty()) {
                ERROR(toString() + ": Failed to resolve listen host " + _host);
                return false;
            }
            endpoint = results.begin()->endpoint();
        }
    }

    _acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        ERROR(toString() + ": Unable to create socket: " + ec.message());
        return false;
    }
    _acceptor.set_option(net::socket_base::reuse_address(true), ec);
    _acceptor.bind(endpoint, ec);
    if (ec) {
        ERROR(toString() + ": bind failed: " + ec.message());
        _acceptor.close(ec);
        return false;
    }
    _acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        ERROR(toString() + ": listen failed: " + ec.message());
        _acceptor.close(ec);
        return false;
    }
    _port = _acceptor.local_endpoint(ec).port();

    INFO(toString() + ": Listening");
    doAccept();
    return true;
}

void WebSocketServer::stop() {
    if (_acceptor.is_open()) {
        error_code ignored;
        _acceptor.close(ignored);
        INFO(toString() + ": Stopped");
    }

    std::map<uint64_t, std::shared_ptr<SocketConnection>> sockets;
    sockets.swap(_sockets);
    for (auto& entry : sockets) {
        entry.second->shutdown();
    }

    // Let the aborted operations complete while the server is alive
    _ioc.restart();
    _ioc.poll();
}

void WebSocketServer::loop() {
    if (_ioc.stopped()) {
        _ioc.restart();
    }
    try {
        _ioc.poll();
    } catch (const std::exception& e) {
        ERROR(toString() + ": I/O handler failed: " + e.what());
    }

    std::vector<std::shared_ptr<SocketConnection>> sockets;
    sockets.reserve(_sockets.size());
    for (auto& entry : _sockets) {
        sockets.push_back(entry.second);
    }
    for (auto& socket : sockets) {
        socket->loop();
    }
}

void WebSocketServer::doAccept() {
    _acceptor.async_accept([this](error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            WARNING(toString() + ": accept error " + ec.message());
        } else {
            error_code ignored;
            socket.set_option(tcp::no_delay(true), ignored);
            auto conn = std::make_shared<HttpConnection>(*this, std::move(socket));
            DEBUG(toString() + ": Accepted connection from " + conn->peer());
            conn->start();
        }
        if (_acceptor.is_open()) {
            doAccept();
        }
    });
}

void WebSocketServer::dispatch(const std::shared_ptr<HttpConnection>& conn, HttpRequest request) {
    std::string method(request.method_string());
    std::string path = targetPath(request);
    DEBUG(toString() + ": " + method + " " + std::string(request.target()) + " from " + conn->peer());

    if (!_ws_path.empty() && path == _ws_path) {
        if (!websocket::is_upgrade(request)) {
            conn->respond(jsonResponse(426, detail("WebSocket upgrade required"), request.version()));
            return;
        }
        upgrade(conn, std::move(request));
        return;
    }

    auto route = _routes.find(std::make_pair(method, path));
    if (route == _routes.end()) {
        bool path_known = false;
        for (auto& entry : _routes) {
            if (entry.first.second == path) {
                path_known = true;
                break;
            }
        }
        if (path_known) {
            conn->respond(jsonResponse(405, detail("Method Not Allowed"), request.version()));
        } else {
            conn->respond(jsonResponse(404, detail("Not Found"), request.version()));
        }
        return;
    }

    try {
        route->second(request, [conn](HttpResponse response) {
            conn->respond(std::move(response));
        });
    } catch (const std::exception& e) {
        ERROR(toString() + ": Handler for " + method + " " + path + " failed: " + e.what());
        conn->respond(jsonResponse(500, detail("Internal Server Error"), request.version()));
    }
}

void WebSocketServer::upgrade(const std::shared_ptr<HttpConnection>& conn, HttpRequest request) {
    uint64_t id = _next_id++;
    auto socket = std::make_shared<SocketConnection>(*this, id, conn->peer(), std::move(conn->stream()));
    _sockets[id] = socket;
    socket->accept(std::move(request));
}

void WebSocketServer::detach(uint64_t id) {
    _sockets.erase(id);
}

}} // namespace BLEBridge::WS
