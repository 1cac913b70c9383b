/**
 * @file SessionChannel.h
 * @brief Per-client queue of session events
 *
 * The session manager pushes events as the proxy delivers them; the
 * client handler drains the queue from its own loop and forwards each
 * event to the WebSocket. Events keep their push order. When the queue
 * is full the oldest event is discarded and counted.
 */
#pragma once

#include "Bytes.h"

#include <stdint.h>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace BLEBridge {

struct SessionEvent {
    enum class Kind : uint8_t {
        NOTIFICATION,       // characteristic_uuid + data
        DISCONNECTED        // reason
    };

    Kind kind = Kind::NOTIFICATION;
    std::string characteristic_uuid;
    RNS::Bytes data;
    std::string reason;

    static SessionEvent notification(const std::string& uuid, const RNS::Bytes& data) {
        SessionEvent event;
        event.kind = Kind::NOTIFICATION;
        event.characteristic_uuid = uuid;
        event.data = data;
        return event;
    }

    static SessionEvent disconnected(const std::string& reason) {
        SessionEvent event;
        event.kind = Kind::DISCONNECTED;
        event.reason = reason;
        return event;
    }
};

class SessionChannel {
public:
    using Ptr = std::shared_ptr<SessionChannel>;

    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit SessionChannel(size_t capacity = DEFAULT_CAPACITY) : _capacity(capacity) {}

    /**
     * @brief Queue an event
     * @return false if the channel has been closed
     */
    bool push(SessionEvent event) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_closed) {
            return false;
        }
        if (_events.size() >= _capacity) {
            _events.pop_front();
            ++_dropped;
        }
        _events.push_back(std::move(event));
        return true;
    }

    /**
     * @brief Take the oldest event
     * @return false if the queue is empty
     */
    bool pop(SessionEvent& event) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_events.empty()) {
            return false;
        }
        event = std::move(_events.front());
        _events.pop_front();
        return true;
    }

    /**
     * @brief Refuse further events and discard queued ones
     */
    void close() {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
        _events.clear();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _dropped;
    }

private:
    mutable std::mutex _mutex;
    std::deque<SessionEvent> _events;
    size_t _capacity;
    size_t _dropped = 0;
    bool _closed = false;
};

} // namespace BLEBridge
