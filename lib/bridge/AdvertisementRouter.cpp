/**
 * @file AdvertisementRouter.cpp
 * @brief Advertisement dedup and name filter implementation
 */

#include "AdvertisementRouter.h"
#include "BridgeTypes.h"
#include "Log.h"

#include <ctype.h>

namespace BLEBridge {

using namespace RNS;

static std::string toLower(const std::string& text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

AdvertisementRouter::AdvertisementRouter(DeviceTracker& tracker, double window, const std::string& name_filter)
    : _tracker(tracker), _window(window), _name_filter(toLower(name_filter)) {
}

void AdvertisementRouter::ingest(const std::string& proxy_name, const ESPHome::Advertisement& advertisement) {
    handle(proxy_name, advertisement, Utilities::OS::time());
}

bool AdvertisementRouter::handle(const std::string& proxy_name, const ESPHome::Advertisement& advertisement,
                                 double now) {
    if (advertisement.address == 0) {
        return false;
    }

    std::pair<uint64_t, int32_t> key(advertisement.address, advertisement.rssi);
    auto it = _cache.find(key);
    if (it != _cache.end() && now - it->second < _window) {
        return false;
    }
    // Stamped before filtering so rejected devices are not re-examined every burst
    _cache[key] = now;

    std::string mac = macFromUint64(advertisement.address);
    if (!admits(advertisement.name)) {
        TRACE("AdvertisementRouter: Ignoring " + advertisement.name + " (" + mac + ")");
        return false;
    }

    TRACE("AdvertisementRouter: Processing " + advertisement.name + " (" + mac + ") RSSI " +
          std::to_string(advertisement.rssi) + " via " + proxy_name);

    _tracker.update(mac, advertisement.name, advertisement.rssi, proxy_name,
                    advertisement.data, advertisement.address_type, now);
    return true;
}

bool AdvertisementRouter::admits(const std::string& name) const {
    if (_name_filter.empty()) {
        return true;
    }
    return toLower(name).find(_name_filter) != std::string::npos;
}

size_t AdvertisementRouter::pruneCache() {
    return pruneCache(Utilities::OS::time());
}

size_t AdvertisementRouter::pruneCache(double now) {
    size_t removed = 0;
    for (auto it = _cache.begin(); it != _cache.end();) {
        if (now - it->second > _window * 10) {
            it = _cache.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        DEBUG("AdvertisementRouter: Pruned " + std::to_string(removed) + " cache entries");
    }
    return removed;
}

} // namespace BLEBridge
