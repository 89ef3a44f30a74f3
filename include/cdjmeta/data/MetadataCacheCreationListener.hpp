#pragma once

#include <functional>
#include <memory>

#include "TrackMetadata.hpp"

namespace cdjmeta::data {

/**
 * Follows the progress of a metadata cache being built, and can cancel it.
 */
class MetadataCacheCreationListener {
public:
    virtual ~MetadataCacheCreationListener() = default;

    /**
     * Called after each track has been copied into the cache.
     *
     * @param lastTrackAdded the metadata just added, or null if the player had none for that entry
     * @param tracksAdded how many tracks have been processed so far
     * @param totalTracksToAdd how many tracks the cache will hold when finished
     *
     * @return false to stop building the cache and delete the partial file
     */
    virtual bool cacheCreationContinuing(const TrackMetadataPtr& lastTrackAdded, int tracksAdded,
                                         int totalTracksToAdd) = 0;
};

using MetadataCacheCreationListenerPtr = std::shared_ptr<MetadataCacheCreationListener>;
using MetadataCacheCreationCallback = std::function<bool(const TrackMetadataPtr&, int, int)>;

class MetadataCacheCreationCallbacks final : public MetadataCacheCreationListener {
public:
    explicit MetadataCacheCreationCallbacks(MetadataCacheCreationCallback callback)
        : callback_(std::move(callback))
    {
    }

    bool cacheCreationContinuing(const TrackMetadataPtr& lastTrackAdded, int tracksAdded,
                                 int totalTracksToAdd) override {
        return callback_ ? callback_(lastTrackAdded, tracksAdded, totalTracksToAdd) : true;
    }

private:
    MetadataCacheCreationCallback callback_;
};

} // namespace cdjmeta::data
