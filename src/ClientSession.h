#pragma once

#include "WebSocketServer.h"
#include "ClientHandler.h"

namespace BLEBridge {

/**
 * Binds one WebSocket connection to its client handler
 */
class ClientSession : public WS::IWebSocketSession {
public:
    explicit ClientSession(ClientHandler::Ptr handler) : _handler(handler) {}

    virtual void onOpen() override { _handler->open(); }
    virtual void onText(const std::string& text) override { _handler->handleText(text); }
    virtual void loop() override { _handler->loop(); }
    virtual void onClose() override { _handler->close(); }
    virtual bool isRunning() const override { return _handler->isRunning(); }

    const ClientHandler::Ptr& handler() const { return _handler; }

private:
    ClientHandler::Ptr _handler;
};

} // namespace BLEBridge
