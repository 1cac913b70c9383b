/**
 * @file WebSocketServer.h
 * @brief HTTP and WebSocket listener on Boost.Beast
 *
 * Serves a small set of HTTP routes and one WebSocket path from a single
 * asio io_context that is polled from loop(), so every callback runs on
 * the caller's thread. Each upgraded connection gets its own
 * IWebSocketSession created by the session factory; text messages are
 * delivered to it and it writes back through the send function it was
 * created with.
 *
 * HTTP handlers answer through a responder that may be called later
 * (from a completion callback). HTTP connections are closed after the
 * response is written.
 */
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace BLEBridge {
namespace WS {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief application/json response with the given status code
 */
HttpResponse jsonResponse(int status, const std::string& body, unsigned version = 11);

/**
 * @brief Path component of a request target (query string removed)
 */
std::string targetPath(const HttpRequest& request);

/**
 * @brief Application side of one WebSocket connection
 */
class IWebSocketSession {
public:
    using Ptr = std::shared_ptr<IWebSocketSession>;

    virtual ~IWebSocketSession() = default;

    virtual void onOpen() = 0;
    virtual void onText(const std::string& text) = 0;
    virtual void loop() = 0;

    /**
     * @brief Connection is gone - called exactly once
     */
    virtual void onClose() = 0;

    /**
     * @brief false asks the server to close the connection
     */
    virtual bool isRunning() const = 0;
};

struct ServerLimits {
    size_t max_message = 1024 * 1024;       // assembled WebSocket message
    size_t max_body = 64 * 1024;            // HTTP request body
    size_t max_tx_buffer = 4 * 1024 * 1024; // queued outbound bytes per connection
    double request_timeout = 30.0;          // seconds to receive an HTTP request
    double send_timeout = 10.0;             // seconds to write an HTTP response
};

class WebSocketServer {
public:
    using SendText = std::function<bool(const std::string& text)>;
    using SessionFactory = std::function<IWebSocketSession::Ptr(SendText send)>;
    using Responder = std::function<void(HttpResponse response)>;
    using HttpHandler = std::function<void(const HttpRequest& request, Responder respond)>;

    WebSocketServer(const std::string& host, uint16_t port, const ServerLimits& limits = ServerLimits());
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void addRoute(const std::string& method, const std::string& path, HttpHandler handler);
    void setWebSocketPath(const std::string& path, SessionFactory factory);

    bool start();
    void stop();

    /**
     * @brief Run ready I/O handlers and service sessions - call periodically
     */
    void loop();

    bool isRunning() const { return _acceptor.is_open(); }

    /**
     * @brief Bound port once started (resolves a requested port of 0)
     */
    uint16_t port() const { return _port; }

    /**
     * @brief Open WebSocket connections
     */
    size_t connectionCount() const { return _sockets.size(); }

    std::string toString() const {
        return "WebSocketServer[" + _host + ":" + std::to_string(_port) + "]";
    }

private:
    class HttpConnection;
    class SocketConnection;
    friend class HttpConnection;
    friend class SocketConnection;

    void doAccept();
    void dispatch(const std::shared_ptr<HttpConnection>& conn, HttpRequest request);
    void upgrade(const std::shared_ptr<HttpConnection>& conn, HttpRequest request);
    void detach(uint64_t id);

    std::string _host;
    uint16_t _port;
    ServerLimits _limits;

    boost::asio::io_context _ioc;
    boost::asio::ip::tcp::acceptor _acceptor;

    std::map<std::pair<std::string, std::string>, HttpHandler> _routes;
    std::string _ws_path;
    SessionFactory _session_factory;

    std::map<uint64_t, std::shared_ptr<SocketConnection>> _sockets;
    uint64_t _next_id = 1;
};

}} // namespace BLEBridge::WS
