#include "cdjmeta/DeviceRoster.hpp"

#include "cdjmeta/Log.hpp"

#include <algorithm>

namespace cdjmeta {

bool DeviceRoster::deviceFound(const DeviceAnnouncement& announcement) {
    bool isNew = false;
    {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        isNew = devices_.find(announcement.getDeviceNumber()) == devices_.end();
        devices_.insert_or_assign(announcement.getDeviceNumber(), announcement);
    }
    if (isNew) {
        Log::debug("DeviceRoster", "Found {}", announcement.toString());
        deliverFoundAnnouncement(announcement);
    }
    return isNew;
}

bool DeviceRoster::deviceLost(int deviceNumber) {
    std::optional<DeviceAnnouncement> lost;
    {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceNumber);
        if (it == devices_.end()) {
            return false;
        }
        lost = it->second;
        devices_.erase(it);
    }
    Log::debug("DeviceRoster", "Lost {}", lost->toString());
    deliverLostAnnouncement(*lost);
    return true;
}

void DeviceRoster::clear() {
    std::map<int, DeviceAnnouncement> lost;
    {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        lost.swap(devices_);
    }
    for (const auto& entry : lost) {
        deliverLostAnnouncement(entry.second);
    }
}

std::vector<DeviceAnnouncement> DeviceRoster::getCurrentDevices() const {
    std::lock_guard<std::mutex> lock(devicesMutex_);
    std::vector<DeviceAnnouncement> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<DeviceAnnouncement> DeviceRoster::getLatestAnnouncementFrom(int deviceNumber) const {
    std::lock_guard<std::mutex> lock(devicesMutex_);
    auto it = devices_.find(deviceNumber);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceRoster::addDeviceAnnouncementListener(const DeviceAnnouncementListenerPtr& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    if (std::find(announcementListeners_.begin(), announcementListeners_.end(), listener) == announcementListeners_.end()) {
        announcementListeners_.push_back(listener);
    }
}

void DeviceRoster::removeDeviceAnnouncementListener(const DeviceAnnouncementListenerPtr& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    announcementListeners_.erase(
        std::remove(announcementListeners_.begin(), announcementListeners_.end(), listener),
        announcementListeners_.end());
}

std::vector<DeviceAnnouncementListenerPtr> DeviceRoster::getDeviceAnnouncementListeners() const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return announcementListeners_;
}

void DeviceRoster::deliverFoundAnnouncement(const DeviceAnnouncement& announcement) {
    for (const auto& listener : getDeviceAnnouncementListeners()) {
        try {
            listener->deviceFound(announcement);
        } catch (const std::exception& e) {
            Log::warn("DeviceRoster", "Problem delivering device found announcement to listener: {}", e.what());
        } catch (...) {
            Log::warn("DeviceRoster", "Problem delivering device found announcement to listener: unknown exception");
        }
    }
}

void DeviceRoster::deliverLostAnnouncement(const DeviceAnnouncement& announcement) {
    for (const auto& listener : getDeviceAnnouncementListeners()) {
        try {
            listener->deviceLost(announcement);
        } catch (const std::exception& e) {
            Log::warn("DeviceRoster", "Problem delivering device lost announcement to listener: {}", e.what());
        } catch (...) {
            Log::warn("DeviceRoster", "Problem delivering device lost announcement to listener: unknown exception");
        }
    }
}

} // namespace cdjmeta
