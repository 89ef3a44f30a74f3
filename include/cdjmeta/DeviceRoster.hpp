#pragma once

#include "DeviceAnnouncement.hpp"
#include "DeviceAnnouncementListener.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace cdjmeta {

/**
 * The set of devices currently visible on the network.
 *
 * The discovery transport calls deviceFound() for every keep-alive it
 * receives and deviceLost() when a device stops announcing itself. Listeners
 * hear about a device once when it first appears and once when it goes away.
 */
class DeviceRoster {
public:
    DeviceRoster() = default;
    DeviceRoster(const DeviceRoster&) = delete;
    DeviceRoster& operator=(const DeviceRoster&) = delete;

    /**
     * Record an announcement. Returns true if the device was not already known.
     */
    bool deviceFound(const DeviceAnnouncement& announcement);

    /**
     * Forget a device. Returns true if it was known.
     */
    bool deviceLost(int deviceNumber);

    /**
     * Forget every device, reporting each one as lost.
     */
    void clear();

    std::vector<DeviceAnnouncement> getCurrentDevices() const;
    std::optional<DeviceAnnouncement> getLatestAnnouncementFrom(int deviceNumber) const;

    void addDeviceAnnouncementListener(const DeviceAnnouncementListenerPtr& listener);
    void removeDeviceAnnouncementListener(const DeviceAnnouncementListenerPtr& listener);
    std::vector<DeviceAnnouncementListenerPtr> getDeviceAnnouncementListeners() const;

private:
    void deliverFoundAnnouncement(const DeviceAnnouncement& announcement);
    void deliverLostAnnouncement(const DeviceAnnouncement& announcement);

    mutable std::mutex devicesMutex_;
    std::map<int, DeviceAnnouncement> devices_;

    mutable std::mutex listenersMutex_;
    std::vector<DeviceAnnouncementListenerPtr> announcementListeners_;
};

} // namespace cdjmeta
