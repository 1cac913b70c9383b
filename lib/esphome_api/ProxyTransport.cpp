#include "ProxyTransport.h"
#include "APIClient.h"

namespace BLEBridge { namespace ESPHome {

/*static*/ IProxyTransport::Ptr ProxyTransportFactory::create(const std::string& name, const std::string& host,
                                                             uint16_t port, const std::string& password) {
    return std::make_shared<APIClient>(name, host, port, password);
}

}} // namespace BLEBridge::ESPHome
