#include "APIClient.h"
#include "APIFrame.h"
#include "APIMessages.h"

#include <Log.h>
#include <Utilities/OS.h>

#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <time.h>

using namespace RNS;

namespace BLEBridge { namespace ESPHome {

APIClient::APIClient(const std::string& name, const std::string& host, uint16_t port,
                     const std::string& password)
    : _name(name), _host(host), _port(port), _password(password) {
}

/*virtual*/ APIClient::~APIClient() {
    // Owners stop() transports they are done with; a transport destroyed
    // while open only releases its socket and drops its callbacks
    closeSocket();
}

/*virtual*/ bool APIClient::start(double timeout, Callbacks::OnResult on_ready) {
    if (_state != LinkState::IDLE) {
        WARNING(toString() + ": start() called in state " + linkStateToString(_state));
        return false;
    }

    TRACE("APIClient: target host: " + _host);
    TRACE("APIClient: target port: " + std::to_string(_port));

    if (_host.empty()) {
        ERROR("APIClient: No target host configured");
        _state = LinkState::CLOSED;
        return false;
    }

    _on_ready = on_ready;
    _deadline = Utilities::OS::time() + timeout;

    if (!openSocket()) {
        _on_ready = nullptr;
        _state = LinkState::CLOSED;
        return false;
    }
    return true;
}

bool APIClient::openSocket() {
    TRACE("APIClient: Connecting to " + _host + ":" + std::to_string(_port));

    // Resolve target host
    struct in_addr target_addr;
    if (inet_aton(_host.c_str(), &target_addr) == 0) {
        struct hostent* host_ent = gethostbyname(_host.c_str());
        if (host_ent == nullptr || host_ent->h_addr_list[0] == nullptr) {
            ERROR("APIClient: Unable to resolve host " + _host);
            return false;
        }
        _target_address = *((in_addr_t*)(host_ent->h_addr_list[0]));
    } else {
        _target_address = target_addr.s_addr;
    }

    _socket = socket(PF_INET, SOCK_STREAM, 0);
    if (_socket < 0) {
        ERROR("APIClient: Unable to create socket, error " + std::to_string(errno));
        return false;
    }

    // The socket stays non-blocking for its whole life; loop() polls it
    int flags = fcntl(_socket, F_GETFL, 0);
    fcntl(_socket, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = _target_address;
    server_addr.sin_port = htons(_port);

    int result = ::connect(_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
    if (result < 0 && errno != EINPROGRESS) {
        ERROR("APIClient: Connect to " + _host + " failed, error " + std::to_string(errno));
        closeSocket();
        return false;
    }

    _state = LinkState::CONNECTING;
    if (result == 0) {
        configure_socket();
        _state = LinkState::HANDSHAKING;
        sendHandshake();
    }
    return true;
}

void APIClient::configure_socket() {
    // TCP_NODELAY
    int flag = 1;
    setsockopt(_socket, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    // Enable TCP keepalive
    setsockopt(_socket, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

    int keepidle = TCP_KEEPIDLE_SEC;
    int keepintvl = TCP_KEEPINTVL_SEC;
    int keepcnt = TCP_KEEPCNT_PROBES;
    setsockopt(_socket, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
    setsockopt(_socket, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
    setsockopt(_socket, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));

    TRACE("APIClient: Socket configured with TCP_NODELAY and keepalive");
}

void APIClient::checkConnectProgress() {
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(_socket, &write_fds);
    struct timeval timeout;
    timeout.tv_sec = 0;
    timeout.tv_usec = 0;

    int result = select(_socket + 1, nullptr, &write_fds, nullptr, &timeout);
    if (result == 0) {
        return;  // still connecting
    }
    if (result < 0) {
        close(OperationResult::ERROR, "select error " + std::to_string(errno));
        return;
    }

    int sock_error = 0;
    socklen_t len = sizeof(sock_error);
    getsockopt(_socket, SOL_SOCKET, SO_ERROR, &sock_error, &len);
    if (sock_error != 0) {
        close(OperationResult::ERROR, std::string("connect failed: ") + strerror(sock_error));
        return;
    }

    configure_socket();
    INFO("APIClient: Connected to " + _name + " at " + _host + ":" + std::to_string(_port));
    _state = LinkState::HANDSHAKING;
    sendHandshake();
}

void APIClient::closeSocket() {
    if (_socket >= 0) {
        ::close(_socket);
        _socket = -1;
    }
    _frame_buffer.clear();
    _tx_buffer.clear();
}

void APIClient::close(OperationResult result, const std::string& reason) {
    if (_state == LinkState::CLOSED) {
        return;
    }

    LinkState previous = _state;
    closeSocket();
    _state = LinkState::CLOSED;

    if (previous == LinkState::READY) {
        WARNING(toString() + ": Link lost: " + reason);
    } else {
        DEBUG(toString() + ": Link closed in state " + linkStateToString(previous) + ": " + reason);
    }

    Callbacks::OnResult on_ready = _on_ready;
    _on_ready = nullptr;
    if (previous != LinkState::READY && on_ready) {
        on_ready(result, reason);
    }

    _pending.clear(OperationResult::DISCONNECTED, reason);

    std::set<uint64_t> devices;
    devices.swap(_connected_devices);
    for (uint64_t address : devices) {
        if (_on_device_disconnected) {
            _on_device_disconnected(address, 0);
        }
    }
}

/*virtual*/ void APIClient::stop() {
    if (_state == LinkState::CLOSED) {
        return;
    }
    if (_state == LinkState::READY) {
        // Polite close; not waiting for the DisconnectResponse
        sendMessage(MessageType::DISCONNECT_REQUEST, Bytes());
    }
    close(OperationResult::DISCONNECTED, "stopped");
}

//=============================================================================
// Handshake
//=============================================================================

void APIClient::sendHandshake() {
    _last_rx = Utilities::OS::time();

    // Requests are processed in order, so the ConnectResponse (from servers
    // that still implement it) always precedes the DeviceInfoResponse
    if (!sendMessage(MessageType::HELLO_REQUEST, Messages::encodeHelloRequest(CLIENT_INFO))) {
        return;
    }
    if (!sendMessage(MessageType::CONNECT_REQUEST, Messages::encodeConnectRequest(_password))) {
        return;
    }
    sendMessage(MessageType::DEVICE_INFO_REQUEST, Bytes());
}

void APIClient::becomeReady() {
    _state = LinkState::READY;
    _last_ping = Utilities::OS::time();

    INFO(toString() + ": Ready (" + _device_info.name + ", ESPHome " + _device_info.esphome_version +
         ", proxy flags 0x" + std::to_string(_device_info.proxy_feature_flags) + ")");

    Callbacks::OnResult on_ready = _on_ready;
    _on_ready = nullptr;
    if (on_ready) {
        on_ready(OperationResult::SUCCESS, std::string());
    }

    if (_state == LinkState::READY && _on_advertisement && !_advertisements_subscribed) {
        subscribeAdvertisements(_on_advertisement);
    }
}

uint32_t APIClient::connectRequestType() const {
    if (_device_info.proxy_feature_flags & FeatureFlags::REMOTE_CACHING) {
        return DeviceRequest::CONNECT_V3_WITH_CACHE;
    }
    if (_device_info.proxy_feature_flags & FeatureFlags::ACTIVE_CONNECTIONS) {
        return DeviceRequest::CONNECT_V3_WITHOUT_CACHE;
    }
    return DeviceRequest::CONNECT;
}

//=============================================================================
// Main loop
//=============================================================================

/*virtual*/ void APIClient::loop() {
    if (_state == LinkState::IDLE || _state == LinkState::CLOSED) {
        return;
    }

    double now = Utilities::OS::time();

    if (_state == LinkState::CONNECTING || _state == LinkState::HANDSHAKING) {
        if (now > _deadline) {
            close(OperationResult::TIMEOUT, "timed out connecting to proxy");
            return;
        }
    }

    if (_state == LinkState::CONNECTING) {
        checkConnectProgress();
        if (_state != LinkState::HANDSHAKING) {
            return;
        }
    }

    if (!flushOutgoing()) {
        return;
    }

    process_incoming();
    if (_state == LinkState::CLOSED) {
        return;
    }

    if (_state == LinkState::READY) {
        if (now - _last_rx > Timing::KEEPALIVE_TIMEOUT) {
            close(OperationResult::DISCONNECTED, "keepalive timeout");
            return;
        }
        if (now - _last_ping >= Timing::KEEPALIVE_INTERVAL) {
            _last_ping = now;
            sendMessage(MessageType::PING_REQUEST, Bytes());
        }
    }

    _pending.checkTimeouts(now);
}

void APIClient::process_incoming() {
    // Drain what the socket has, bounded so one busy proxy cannot starve the loop
    for (int i = 0; i < 16; ++i) {
        uint8_t buf[Limits::RECV_CHUNK];
        ssize_t len = recv(_socket, buf, sizeof(buf), MSG_DONTWAIT);
        if (len > 0) {
            _frame_buffer.append(buf, len);
            _last_rx = Utilities::OS::time();
            if (static_cast<size_t>(len) < sizeof(buf)) {
                break;
            }
        } else if (len == 0) {
            DEBUG(toString() + ": recv returned 0 - connection closed");
            extract_and_process_frames();
            close(OperationResult::DISCONNECTED, "connection closed by proxy");
            return;
        } else {
            int err = errno;
            if (err != EAGAIN && err != EWOULDBLOCK) {
                close(OperationResult::ERROR, "recv error " + std::to_string(err));
                return;
            }
            break;
        }
    }

    extract_and_process_frames();
}

void APIClient::extract_and_process_frames() {
    while (_state == LinkState::HANDSHAKING || _state == LinkState::READY) {
        uint32_t type = 0;
        Bytes payload;
        APIFrame::Extract result = APIFrame::extract(_frame_buffer, type, payload);

        if (result == APIFrame::Extract::INCOMPLETE) {
            break;
        }
        if (result == APIFrame::Extract::ENCRYPTED) {
            close(OperationResult::REJECTED,
                  "proxy requires API encryption, which is not supported");
            break;
        }
        if (result == APIFrame::Extract::INVALID) {
            close(OperationResult::ERROR, "invalid frame from proxy");
            break;
        }

        handleMessage(type, payload);
    }
}

//=============================================================================
// Message dispatch
//=============================================================================

void APIClient::handleMessage(uint32_t type, const Bytes& payload) {
    TRACE(toString() + ": Received message type " + std::to_string(type) + ", " +
          std::to_string(payload.size()) + " bytes");

    switch (type) {
        case MessageType::HELLO_RESPONSE:
            if (Messages::decodeHelloResponse(payload, _hello)) {
                DEBUG(toString() + ": Hello from " + _hello.server_info + " (API " +
                      std::to_string(_hello.api_major) + "." + std::to_string(_hello.api_minor) + ")");
            }
            break;

        case MessageType::CONNECT_RESPONSE: {
            bool invalid_password = false;
            if (Messages::decodeConnectResponse(payload, invalid_password) && invalid_password) {
                close(OperationResult::REJECTED, "Invalid password");
            }
            break;
        }

        case MessageType::DEVICE_INFO_RESPONSE:
            if (!Messages::decodeDeviceInfoResponse(payload, _device_info)) {
                close(OperationResult::ERROR, "malformed DeviceInfoResponse");
                break;
            }
            if (_state == LinkState::HANDSHAKING) {
                becomeReady();
            }
            break;

        case MessageType::DISCONNECT_REQUEST:
            sendMessage(MessageType::DISCONNECT_RESPONSE, Bytes());
            close(OperationResult::DISCONNECTED, "proxy requested disconnect");
            break;

        case MessageType::PING_REQUEST:
            sendMessage(MessageType::PING_RESPONSE, Bytes());
            break;

        case MessageType::PING_RESPONSE:
        case MessageType::DISCONNECT_RESPONSE:
            break;

        case MessageType::GET_TIME_REQUEST:
            sendMessage(MessageType::GET_TIME_RESPONSE,
                        Messages::encodeGetTimeResponse(static_cast<uint32_t>(::time(nullptr))));
            break;

        case MessageType::BLE_ADVERTISEMENT_RESPONSE:
        case MessageType::BLE_RAW_ADVERTISEMENTS_RESPONSE:
            handleAdvertisements(type, payload);
            break;

        case MessageType::BLUETOOTH_DEVICE_CONNECTION_RESPONSE: {
            DeviceConnectionEvent event;
            if (Messages::decodeConnectionResponse(payload, event)) {
                handleConnectionEvent(event);
            } else {
                WARNING(toString() + ": Malformed BluetoothDeviceConnectionResponse");
            }
            break;
        }

        case MessageType::GATT_GET_SERVICES_RESPONSE: {
            uint64_t address = 0;
            std::vector<GATTService> services;
            if (!Messages::decodeServicesResponse(payload, address, services)) {
                WARNING(toString() + ": Malformed GATTGetServicesResponse");
                break;
            }
            if (!_pending.appendServices(address, services)) {
                DEBUG(toString() + ": Services for " + addressToString(address) + " with no request pending");
            }
            break;
        }

        case MessageType::GATT_GET_SERVICES_DONE: {
            uint64_t address = 0;
            if (Messages::decodeServicesDone(payload, address)) {
                _pending.completeServices(address, OperationResult::SUCCESS);
            }
            break;
        }

        case MessageType::GATT_WRITE_RESPONSE:
        case MessageType::GATT_NOTIFY_RESPONSE: {
            GATTHandleEvent event;
            if (Messages::decodeHandleEvent(payload, type, event)) {
                RequestType request = (type == MessageType::GATT_WRITE_RESPONSE)
                    ? RequestType::WRITE : RequestType::NOTIFY;
                _pending.complete(request, event.address, event.handle, OperationResult::SUCCESS);
            }
            break;
        }

        case MessageType::GATT_NOTIFY_DATA: {
            GATTHandleEvent event;
            if (!Messages::decodeHandleEvent(payload, type, event)) {
                WARNING(toString() + ": Malformed GATTNotifyDataResponse");
                break;
            }
            if (_on_notification) {
                _on_notification(event.address, event.handle, event.data);
            }
            break;
        }

        case MessageType::GATT_ERROR_RESPONSE: {
            GATTHandleEvent event;
            if (Messages::decodeHandleEvent(payload, type, event)) {
                WARNING(toString() + ": GATT error " + std::to_string(event.error) + " for " +
                        addressToString(event.address) + " handle " + std::to_string(event.handle));
                _pending.failForHandle(event.address, event.handle,
                                       "GATT error " + std::to_string(event.error));
            }
            break;
        }

        default:
            TRACE(toString() + ": Ignoring message type " + std::to_string(type));
            break;
    }
}

void APIClient::handleAdvertisements(uint32_t type, const Bytes& payload) {
    if (!_on_advertisement) {
        return;
    }

    if (type == MessageType::BLE_ADVERTISEMENT_RESPONSE) {
        Advertisement advertisement;
        if (Messages::decodeAdvertisement(payload, advertisement)) {
            _on_advertisement(advertisement);
        }
        return;
    }

    std::vector<Advertisement> advertisements;
    if (!Messages::decodeRawAdvertisements(payload, advertisements)) {
        WARNING(toString() + ": Malformed raw advertisement batch");
        return;
    }
    for (const auto& advertisement : advertisements) {
        _on_advertisement(advertisement);
    }
}

void APIClient::handleConnectionEvent(const DeviceConnectionEvent& event) {
    uint64_t address = event.address;

    if (event.connected) {
        _connected_devices.insert(address);
        DEBUG(toString() + ": Device " + addressToString(address) + " connected, MTU " +
              std::to_string(event.mtu));
        if (!_pending.complete(RequestType::DEVICE_CONNECT, address, 0, OperationResult::SUCCESS)) {
            DEBUG(toString() + ": Unsolicited connect event for " + addressToString(address));
        }
        return;
    }

    bool was_connected = _connected_devices.erase(address) > 0;

    if (_pending.has(RequestType::DEVICE_DISCONNECT, address)) {
        _pending.complete(RequestType::DEVICE_DISCONNECT, address, 0, OperationResult::SUCCESS);
        // A connect queued behind the disconnect belongs to a newer session
        _pending.clearType(RequestType::GET_SERVICES, address, OperationResult::DISCONNECTED, "device disconnected");
        _pending.clearType(RequestType::WRITE, address, OperationResult::DISCONNECTED, "device disconnected");
        _pending.clearType(RequestType::NOTIFY, address, OperationResult::DISCONNECTED, "device disconnected");
        return;
    }

    std::string detail = "proxy reported error " + std::to_string(event.error);
    if (_pending.complete(RequestType::DEVICE_CONNECT, address, 0, OperationResult::ERROR, detail)) {
        _pending.clearForAddress(address, OperationResult::DISCONNECTED, "device disconnected");
        return;
    }

    _pending.clearForAddress(address, OperationResult::DISCONNECTED, "device disconnected");

    if (was_connected) {
        INFO(toString() + ": Device " + addressToString(address) + " disconnected, reason " +
             std::to_string(event.error));
        if (_on_device_disconnected) {
            _on_device_disconnected(address, event.error);
        }
    }
}

//=============================================================================
// Requests
//=============================================================================

/*virtual*/ void APIClient::subscribeAdvertisements(Callbacks::OnAdvertisement callback) {
    _on_advertisement = callback;
    if (_state != LinkState::READY || _advertisements_subscribed) {
        return;  // sent by becomeReady()
    }

    uint32_t flags = (_device_info.proxy_feature_flags & FeatureFlags::RAW_ADVERTISEMENTS)
        ? ADVERTISEMENT_FLAG_RAW : 0;
    if (sendMessage(MessageType::SUBSCRIBE_BLE_ADVERTISEMENTS, Messages::encodeSubscribeAdvertisements(flags))) {
        _advertisements_subscribed = true;
        DEBUG(toString() + ": Subscribed to advertisements" + (flags ? " (raw)" : ""));
    }
}

/*virtual*/ void APIClient::connectDevice(uint64_t address, uint32_t address_type, double timeout,
                                          Callbacks::OnResult callback) {
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::NOT_READY, "proxy link is not ready");
        return;
    }
    if (_pending.has(RequestType::DEVICE_CONNECT, address)) {
        if (callback) callback(OperationResult::REJECTED, "connection already in progress");
        return;
    }

    PendingRequest request;
    request.type = RequestType::DEVICE_CONNECT;
    request.address = address;
    request.timeout = timeout;
    request.on_result = callback;
    _pending.add(std::move(request));

    sendMessage(MessageType::BLUETOOTH_DEVICE_REQUEST,
                Messages::encodeDeviceRequest(address, connectRequestType(), true, address_type));
}

/*virtual*/ void APIClient::disconnectDevice(uint64_t address, Callbacks::OnResult callback) {
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::DISCONNECTED, "proxy link is not ready");
        return;
    }

    // A connect still in flight is superseded by this request
    _pending.clearType(RequestType::DEVICE_CONNECT, address, OperationResult::DISCONNECTED, "cancelled");
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::DISCONNECTED, "proxy link is not ready");
        return;
    }

    PendingRequest request;
    request.type = RequestType::DEVICE_DISCONNECT;
    request.address = address;
    request.on_result = callback;
    _pending.add(std::move(request));

    sendMessage(MessageType::BLUETOOTH_DEVICE_REQUEST,
                Messages::encodeDeviceRequest(address, DeviceRequest::DISCONNECT, false, 0));
}

/*virtual*/ void APIClient::getServices(uint64_t address, double timeout, Callbacks::OnServices callback) {
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::NOT_READY, "proxy link is not ready", std::vector<GATTService>());
        return;
    }
    if (_pending.has(RequestType::GET_SERVICES, address)) {
        if (callback) callback(OperationResult::REJECTED, "service discovery already in progress",
                               std::vector<GATTService>());
        return;
    }

    PendingRequest request;
    request.type = RequestType::GET_SERVICES;
    request.address = address;
    request.timeout = timeout;
    request.on_services = callback;
    _pending.add(std::move(request));

    sendMessage(MessageType::GATT_GET_SERVICES_REQUEST, Messages::encodeGetServicesRequest(address));
}

/*virtual*/ void APIClient::writeCharacteristic(uint64_t address, uint16_t handle, const Bytes& data,
                                                bool response, double timeout,
                                                Callbacks::OnResult callback) {
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::NOT_READY, "proxy link is not ready");
        return;
    }

    Bytes payload = Messages::encodeWriteRequest(address, handle, response, data);

    if (!response) {
        // The proxy does not confirm unacknowledged writes
        bool sent = sendMessage(MessageType::GATT_WRITE_REQUEST, payload);
        if (callback) {
            callback(sent ? OperationResult::SUCCESS : OperationResult::DISCONNECTED,
                     sent ? std::string() : std::string("proxy link lost"));
        }
        return;
    }

    PendingRequest request;
    request.type = RequestType::WRITE;
    request.address = address;
    request.handle = handle;
    request.timeout = timeout;
    request.on_result = callback;
    _pending.add(std::move(request));

    sendMessage(MessageType::GATT_WRITE_REQUEST, payload);
}

/*virtual*/ void APIClient::setNotify(uint64_t address, uint16_t handle, bool enable, double timeout,
                                      Callbacks::OnResult callback) {
    if (_state != LinkState::READY) {
        if (callback) callback(OperationResult::NOT_READY, "proxy link is not ready");
        return;
    }

    PendingRequest request;
    request.type = RequestType::NOTIFY;
    request.address = address;
    request.handle = handle;
    request.timeout = timeout;
    request.on_result = callback;
    _pending.add(std::move(request));

    sendMessage(MessageType::GATT_NOTIFY_REQUEST, Messages::encodeNotifyRequest(address, handle, enable));
}

//=============================================================================
// Transmit path
//=============================================================================

bool APIClient::sendMessage(uint32_t type, const Bytes& payload) {
    if (_socket < 0) {
        return false;
    }

    _tx_buffer.append(APIFrame::frame(type, payload));
    if (_tx_buffer.size() > Limits::MAX_TX_BUFFER) {
        close(OperationResult::ERROR, "transmit buffer overflow");
        return false;
    }
    return flushOutgoing();
}

bool APIClient::flushOutgoing() {
    while (_tx_buffer.size() > 0 && _socket >= 0) {
        ssize_t written = send(_socket, _tx_buffer.data(), _tx_buffer.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (written < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                return true;  // socket full, retry from loop()
            }
            close(OperationResult::ERROR, "send error " + std::to_string(err));
            return false;
        }
        if (static_cast<size_t>(written) == _tx_buffer.size()) {
            _tx_buffer.clear();
        } else {
            _tx_buffer = _tx_buffer.mid(static_cast<size_t>(written));
        }
    }
    return _socket >= 0;
}

}} // namespace BLEBridge::ESPHome
