/**
 * @file test_websocket_server.cpp
 * @brief Loopback tests for the HTTP routes and WebSocket sessions
 *
 * A blocking Beast client runs on a worker thread while the test thread
 * drives WebSocketServer::loop().
 */

#include <unity.h>
#include "WebSocketServer.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <unistd.h>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace BLEBridge::WS;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

class RecordingSession : public IWebSocketSession {
public:
    explicit RecordingSession(WebSocketServer::SendText send_text) : send(send_text) {}

    void onOpen() override {
        ++opens;
        send("ready");
    }

    void onText(const std::string& text) override {
        received.push_back(text);
        if (text == "stop") {
            running = false;
        } else {
            send("echo:" + text);
        }
    }

    void loop() override { ++loops; }
    void onClose() override { ++closes; }
    bool isRunning() const override { return running; }

    WebSocketServer::SendText send;
    std::vector<std::string> received;
    int opens = 0;
    int closes = 0;
    int loops = 0;
    bool running = true;
};

struct Reply {
    int status = 0;
    std::string content_type;
    std::string body;
};

static std::unique_ptr<WebSocketServer> server;
static std::vector<std::shared_ptr<RecordingSession>> sessions;
static WebSocketServer::Responder pending;
static std::string client_error;

static tcp::endpoint local(uint16_t port) {
    return tcp::endpoint(net::ip::make_address("127.0.0.1"), port);
}

static void runClient(std::function<void()> client, std::function<void()> each = nullptr) {
    std::atomic<bool> done(false);
    std::thread worker([&]() {
        try {
            client();
        } catch (const std::exception& e) {
            client_error = e.what();
        }
        done = true;
    });
    for (int i = 0; i < 5000 && !done; ++i) {
        server->loop();
        if (each) {
            each();
        }
        usleep(1000);
    }
    worker.join();
    for (int i = 0; i < 50; ++i) {
        server->loop();
        usleep(1000);
    }
}

static Reply httpCall(uint16_t port, http::verb method, const std::string& target, const std::string& body = "") {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(local(port));

    HttpRequest request(method, target, 11);
    request.set(http::field::host, "127.0.0.1");
    request.body() = body;
    request.prepare_payload();
    http::write(stream, request);

    beast::flat_buffer buffer;
    HttpResponse response;
    http::read(stream, buffer, response);

    Reply reply;
    reply.status = response.result_int();
    reply.content_type = std::string(response[http::field::content_type]);
    reply.body = response.body();
    return reply;
}

static std::string readText(websocket::stream<tcp::socket>& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    return beast::buffers_to_string(buffer.data());
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    sessions.clear();
    pending = nullptr;
    client_error.clear();

    server.reset(new WebSocketServer("127.0.0.1", 0));
    server->addRoute("GET", "/api/status", [](const HttpRequest& request, WebSocketServer::Responder respond) {
        (void)request;
        respond(jsonResponse(200, "{\"ok\":true}"));
    });
    server->addRoute("POST", "/api/echo", [](const HttpRequest& request, WebSocketServer::Responder respond) {
        respond(jsonResponse(200, request.body()));
    });
    server->addRoute("GET", "/api/deferred", [](const HttpRequest& request, WebSocketServer::Responder respond) {
        (void)request;
        pending = respond;
    });
    server->addRoute("GET", "/api/fails", [](const HttpRequest& request, WebSocketServer::Responder respond) -> void {
        (void)request;
        (void)respond;
        throw std::runtime_error("handler failed");
    });
    server->setWebSocketPath("/ws", [](WebSocketServer::SendText send) -> IWebSocketSession::Ptr {
        auto session = std::make_shared<RecordingSession>(send);
        sessions.push_back(session);
        return session;
    });
    TEST_ASSERT_TRUE(server->start());
}

void tearDown(void) {
    server.reset();
    sessions.clear();
    pending = nullptr;
}

// =============================================================================
// HTTP
// =============================================================================

void test_start_binds_ephemeral_port(void) {
    TEST_ASSERT_TRUE(server->isRunning());
    TEST_ASSERT_NOT_EQUAL(0, server->port());
}

void test_http_route_returns_json(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient([&]() { reply = httpCall(port, http::verb::get, "/api/status?verbose=1"); });

    TEST_ASSERT_EQUAL_STRING("", client_error.c_str());
    TEST_ASSERT_EQUAL_INT(200, reply.status);
    TEST_ASSERT_EQUAL_STRING("application/json", reply.content_type.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true}", reply.body.c_str());
}

void test_http_request_body_reaches_handler(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient([&]() { reply = httpCall(port, http::verb::post, "/api/echo", "{\"mac_address\":\"AA:BB\"}"); });

    TEST_ASSERT_EQUAL_INT(200, reply.status);
    TEST_ASSERT_EQUAL_STRING("{\"mac_address\":\"AA:BB\"}", reply.body.c_str());
}

void test_http_unknown_path_and_wrong_method(void) {
    uint16_t port = server->port();
    Reply missing;
    Reply wrong_method;
    runClient([&]() {
        missing = httpCall(port, http::verb::get, "/api/nothing");
        wrong_method = httpCall(port, http::verb::post, "/api/status");
    });

    TEST_ASSERT_EQUAL_STRING("", client_error.c_str());
    TEST_ASSERT_EQUAL_INT(404, missing.status);
    TEST_ASSERT_EQUAL_STRING("{\"detail\":\"Not Found\"}", missing.body.c_str());
    TEST_ASSERT_EQUAL_INT(405, wrong_method.status);
}

void test_http_deferred_response(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient(
        [&]() { reply = httpCall(port, http::verb::get, "/api/deferred"); },
        []() {
            if (pending) {
                WebSocketServer::Responder respond = pending;
                pending = nullptr;
                respond(jsonResponse(504, "{\"detail\":\"late\"}"));
            }
        });

    TEST_ASSERT_EQUAL_STRING("", client_error.c_str());
    TEST_ASSERT_EQUAL_INT(504, reply.status);
    TEST_ASSERT_EQUAL_STRING("{\"detail\":\"late\"}", reply.body.c_str());
}

void test_http_handler_exception_is_500(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient([&]() { reply = httpCall(port, http::verb::get, "/api/fails"); });

    TEST_ASSERT_EQUAL_INT(500, reply.status);
}

void test_http_malformed_request_is_400(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient([&]() {
        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(local(port));
        std::string garbage = "NOT A REQUEST\r\n\r\n";
        net::write(stream, net::buffer(garbage));

        beast::flat_buffer buffer;
        HttpResponse response;
        http::read(stream, buffer, response);
        reply.status = response.result_int();
    });

    TEST_ASSERT_EQUAL_INT(400, reply.status);
}

void test_websocket_path_without_upgrade_is_426(void) {
    uint16_t port = server->port();
    Reply reply;
    runClient([&]() { reply = httpCall(port, http::verb::get, "/ws"); });

    TEST_ASSERT_EQUAL_INT(426, reply.status);
    TEST_ASSERT_EQUAL_size_t(0, sessions.size());
}

// =============================================================================
// WebSocket
// =============================================================================

void test_websocket_text_round_trip(void) {
    uint16_t port = server->port();
    std::string greeting;
    std::string echoed;
    runClient([&]() {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        ws.next_layer().connect(local(port));
        ws.handshake("127.0.0.1", "/ws?client=test");
        greeting = readText(ws);
        ws.text(true);
        ws.write(net::buffer(std::string("hello")));
        echoed = readText(ws);
        ws.close(websocket::close_code::normal);
    });

    TEST_ASSERT_EQUAL_STRING("", client_error.c_str());
    TEST_ASSERT_EQUAL_STRING("ready", greeting.c_str());
    TEST_ASSERT_EQUAL_STRING("echo:hello", echoed.c_str());

    TEST_ASSERT_EQUAL_size_t(1, sessions.size());
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->opens);
    TEST_ASSERT_EQUAL_size_t(1, sessions[0]->received.size());
    TEST_ASSERT_EQUAL_STRING("hello", sessions[0]->received[0].c_str());
    TEST_ASSERT_TRUE(sessions[0]->loops > 0);
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->closes);
    TEST_ASSERT_EQUAL_size_t(0, server->connectionCount());
}

void test_websocket_send_after_close_fails(void) {
    uint16_t port = server->port();
    runClient([&]() {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        ws.next_layer().connect(local(port));
        ws.handshake("127.0.0.1", "/ws");
        readText(ws);
        ws.close(websocket::close_code::normal);
    });

    TEST_ASSERT_EQUAL_size_t(1, sessions.size());
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->closes);
    TEST_ASSERT_FALSE(sessions[0]->send("too late"));
}

void test_websocket_binary_frame_closes_connection(void) {
    uint16_t port = server->port();
    int close_code = 0;
    bool closed = false;
    runClient([&]() {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        ws.next_layer().connect(local(port));
        ws.handshake("127.0.0.1", "/ws");
        readText(ws);
        ws.binary(true);
        const uint8_t data[] = {0x01, 0x02, 0x03};
        ws.write(net::buffer(data, sizeof(data)));

        beast::flat_buffer buffer;
        beast::error_code ec;
        ws.read(buffer, ec);
        closed = (ec == websocket::error::closed);
        close_code = ws.reason().code;
    });

    TEST_ASSERT_TRUE(closed);
    TEST_ASSERT_EQUAL_INT(websocket::close_code::unknown_data, close_code);
    TEST_ASSERT_EQUAL_size_t(1, sessions.size());
    TEST_ASSERT_EQUAL_size_t(0, sessions[0]->received.size());
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->closes);
}

void test_websocket_session_stop_closes_normally(void) {
    uint16_t port = server->port();
    int close_code = 0;
    bool closed = false;
    runClient([&]() {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        ws.next_layer().connect(local(port));
        ws.handshake("127.0.0.1", "/ws");
        readText(ws);
        ws.text(true);
        ws.write(net::buffer(std::string("stop")));

        beast::flat_buffer buffer;
        beast::error_code ec;
        ws.read(buffer, ec);
        closed = (ec == websocket::error::closed);
        close_code = ws.reason().code;
    });

    TEST_ASSERT_TRUE(closed);
    TEST_ASSERT_EQUAL_INT(websocket::close_code::normal, close_code);
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->closes);
    TEST_ASSERT_EQUAL_size_t(0, server->connectionCount());
}

void test_stop_closes_open_sessions(void) {
    uint16_t port = server->port();
    std::atomic<bool> release(false);
    bool stopped = false;
    runClient(
        [&]() {
            net::io_context ioc;
            websocket::stream<tcp::socket> ws(ioc);
            ws.next_layer().connect(local(port));
            ws.handshake("127.0.0.1", "/ws");
            while (!release) {
                usleep(1000);
            }
        },
        [&]() {
            if (!stopped && sessions.size() == 1 && sessions[0]->opens == 1) {
                server->stop();
                stopped = true;
                release = true;
            }
        });

    TEST_ASSERT_TRUE(stopped);
    TEST_ASSERT_FALSE(server->isRunning());
    TEST_ASSERT_EQUAL_INT(1, sessions[0]->closes);
    TEST_ASSERT_EQUAL_size_t(0, server->connectionCount());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    // HTTP
    RUN_TEST(test_start_binds_ephemeral_port);
    RUN_TEST(test_http_route_returns_json);
    RUN_TEST(test_http_request_body_reaches_handler);
    RUN_TEST(test_http_unknown_path_and_wrong_method);
    RUN_TEST(test_http_deferred_response);
    RUN_TEST(test_http_handler_exception_is_500);
    RUN_TEST(test_http_malformed_request_is_400);
    RUN_TEST(test_websocket_path_without_upgrade_is_426);

    // WebSocket
    RUN_TEST(test_websocket_text_round_trip);
    RUN_TEST(test_websocket_send_after_close_fails);
    RUN_TEST(test_websocket_binary_frame_closes_connection);
    RUN_TEST(test_websocket_session_stop_closes_normally);
    RUN_TEST(test_stop_closes_open_sessions);

    return UNITY_END();
}
