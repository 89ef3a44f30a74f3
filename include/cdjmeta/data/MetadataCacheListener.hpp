#pragma once

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace cdjmeta::data {

/**
 * Told whenever a metadata cache is attached or detached, or media is
 * mounted or removed from a player's SD or USB slot. The cache maps go from
 * player number to the path of the attached cache file.
 */
class MetadataCacheListener {
public:
    virtual ~MetadataCacheListener() = default;
    virtual void cacheStateChanged(const std::map<int, std::string>& sdCaches,
                                   const std::map<int, std::string>& usbCaches,
                                   const std::set<int>& sdMounts,
                                   const std::set<int>& usbMounts) = 0;
};

using MetadataCacheListenerPtr = std::shared_ptr<MetadataCacheListener>;
using MetadataCacheCallback = std::function<void(const std::map<int, std::string>&,
                                                 const std::map<int, std::string>&,
                                                 const std::set<int>&,
                                                 const std::set<int>&)>;

class MetadataCacheCallbacks final : public MetadataCacheListener {
public:
    explicit MetadataCacheCallbacks(MetadataCacheCallback callback)
        : callback_(std::move(callback))
    {
    }

    void cacheStateChanged(const std::map<int, std::string>& sdCaches,
                           const std::map<int, std::string>& usbCaches,
                           const std::set<int>& sdMounts,
                           const std::set<int>& usbMounts) override {
        if (callback_) {
            callback_(sdCaches, usbCaches, sdMounts, usbMounts);
        }
    }

private:
    MetadataCacheCallback callback_;
};

} // namespace cdjmeta::data
