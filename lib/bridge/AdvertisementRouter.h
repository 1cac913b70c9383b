/**
 * @file AdvertisementRouter.h
 * @brief Filters and deduplicates proxy advertisements before tracking
 *
 * Proxies relay every advertisement they hear, and a device commonly
 * repeats the same advertisement at the same RSSI many times a second.
 * The router drops repeats of an identical (mac, rssi) pair within the
 * dedup window, then admits only devices whose advertised name contains
 * the configured marker (case-insensitive). Survivors update the
 * DeviceTracker.
 */
#pragma once

#include "DeviceTracker.h"
#include "APITypes.h"

#include <map>
#include <string>
#include <utility>

namespace BLEBridge {

class AdvertisementRouter {
public:
    /**
     * @param tracker Device catalog fed by this router
     * @param window Dedup window in seconds
     * @param name_filter Name marker; empty admits every device
     */
    AdvertisementRouter(DeviceTracker& tracker, double window, const std::string& name_filter);

    /**
     * @brief Advertisement callback target for one proxy
     */
    void ingest(const std::string& proxy_name, const ESPHome::Advertisement& advertisement);

    /**
     * @brief Process one advertisement
     * @return true if it was forwarded to the tracker
     */
    bool handle(const std::string& proxy_name, const ESPHome::Advertisement& advertisement, double now);

    /**
     * @brief Remove dedup entries older than ten windows
     * @return Number of entries removed
     */
    size_t pruneCache();
    size_t pruneCache(double now);

    size_t cacheSize() const { return _cache.size(); }

private:
    bool admits(const std::string& name) const;

    DeviceTracker& _tracker;
    double _window;
    std::string _name_filter;     // lower case

    std::map<std::pair<uint64_t, int32_t>, double> _cache;
};

} // namespace BLEBridge
