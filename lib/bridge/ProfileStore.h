/**
 * @file ProfileStore.h
 * @brief Remembered GATT profiles per device
 *
 * A connect request without UUIDs consults the store before probing the
 * device. Probed profiles are remembered for the life of the process.
 */
#pragma once

#include <map>
#include <memory>
#include <string>

namespace BLEBridge {

struct DeviceProfile {
    std::string mac_address;
    std::string service_uuid;
    std::string notify_uuid;
    std::string write_uuid;
    std::string device_name;

    bool complete() const {
        return !service_uuid.empty() && !notify_uuid.empty() && !write_uuid.empty();
    }
};

class IProfileStore {
public:
    virtual ~IProfileStore() = default;

    /**
     * @return false if no profile is known for the device
     */
    virtual bool lookup(const std::string& mac_address, DeviceProfile& profile) const = 0;
    virtual void remember(const DeviceProfile& profile) = 0;
};

/**
 * @brief In-memory profile store with an optional fallback profile
 *
 * The fallback (from configuration) applies to any device without an
 * entry of its own, for deployments where every device shares one profile.
 */
class ProfileCache : public IProfileStore {
public:
    explicit ProfileCache(const DeviceProfile& fallback = DeviceProfile());

    virtual bool lookup(const std::string& mac_address, DeviceProfile& profile) const override;
    virtual void remember(const DeviceProfile& profile) override;

    size_t size() const { return _profiles.size(); }

private:
    DeviceProfile _fallback;
    std::map<std::string, DeviceProfile> _profiles;
};

} // namespace BLEBridge
