#pragma once

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "BeatGrid.hpp"
#include "DataReference.hpp"
#include "MetadataCache.hpp"
#include "MetadataCacheCreationListener.hpp"
#include "MetadataCacheListener.hpp"
#include "TrackMetadata.hpp"
#include "TrackMetadataListener.hpp"
#include "TrackMetadataUpdate.hpp"
#include "cdjmeta/CdjStatus.hpp"
#include "cdjmeta/DeviceAnnouncementListener.hpp"
#include "cdjmeta/DeviceRoster.hpp"
#include "cdjmeta/DeviceUpdateListener.hpp"
#include "cdjmeta/LifecycleParticipant.hpp"
#include "cdjmeta/dbserver/SessionProvider.hpp"

namespace cdjmeta::data {

/**
 * Watches the status updates of the players on the network and keeps track
 * of the metadata of the track each one has loaded.
 *
 * Metadata comes from a metadata cache when one is attached to the media
 * slot the track was loaded from, and otherwise from the dbserver of the
 * player holding the media. In passive mode the players are never asked:
 * only caches are used for tracks loaded while watching, although explicit
 * requests still go to the players.
 *
 * Status updates are handed over through getUpdateListener(); they are
 * queued and processed on a worker thread, and each metadata fetch runs on
 * a thread of its own.
 */
class MetadataFinder : public LifecycleParticipant {
public:
    /**
     * How many status updates may wait for processing before new ones are dropped.
     */
    static constexpr size_t MAX_PENDING_UPDATES = 100;

    /**
     * How long to wait for a player's menu lock before giving up.
     */
    static constexpr int MENU_TIMEOUT_SECONDS = 20;

    MetadataFinder(DeviceRoster& roster, dbserver::SessionProvider& sessions);
    ~MetadataFinder() override;

    MetadataFinder(const MetadataFinder&) = delete;
    MetadataFinder& operator=(const MetadataFinder&) = delete;

    bool isRunning() const override { return running_.load(); }

    /**
     * Start watching status updates and device losses.
     */
    void start();

    /**
     * Stop watching, wait for metadata fetches in progress to finish, and
     * forget all metadata. Attached caches stay attached.
     */
    void stop();

    bool isPassive() const { return passive_.load(); }
    void setPassive(bool passive) { passive_.store(passive); }

    /**
     * The listener to register with whatever delivers player status updates.
     * Updates received while we are not running are ignored.
     */
    DeviceUpdateListenerPtr getUpdateListener() const { return updateListener_; }

    /**
     * Process one status update on the calling thread. The queue worker
     * calls this for every update it receives.
     */
    void handleUpdate(const CdjStatus& update);

    /**
     * Metadata for the track a status update says is loaded, or null if no
     * track is loaded or the metadata could not be found.
     */
    TrackMetadataPtr requestMetadataFrom(const CdjStatus& status);

    /**
     * Metadata for a track, from an attached cache if there is one and
     * otherwise from the player. Problems talking to the player are logged
     * and give a null result.
     */
    TrackMetadataPtr requestMetadataFrom(int player, TrackSourceSlot slot, int rekordboxId);

    /**
     * @throws std::exception subclasses if the player cannot be asked
     */
    BeatGridPtr requestBeatGridFrom(int player, TrackSourceSlot slot, int rekordboxId);

    /**
     * The tracks of a playlist, or the playlists and folders in a folder.
     *
     * @param sortOrder 0 for the player's default order
     * @throws std::exception subclasses if the player cannot be asked
     */
    std::vector<dbserver::Message> requestPlaylistItemsFrom(int player, TrackSourceSlot slot, int sortOrder,
                                                            int playlistOrFolderId, bool folder);

    /**
     * Build a metadata cache file for every track in a media slot, or every
     * track in one playlist. Anything already at the path is replaced. The
     * listener, if any, hears about each track as it is copied and can cancel
     * the process, in which case the partial file is deleted.
     *
     * @param playlistId the playlist to cache, or 0 for all tracks
     * @throws CacheFormatError if the track list holds something other than tracks
     * @throws std::exception subclasses if the player cannot be asked or the file written
     */
    void createMetadataCache(int player, TrackSourceSlot slot, int playlistId, const std::string& path,
                             const MetadataCacheCreationListenerPtr& listener = nullptr);

    /**
     * @throws IllegalStateError if we are not running
     */
    std::map<int, TrackMetadataPtr> getLatestMetadata() const;

    /**
     * @throws IllegalStateError if we are not running
     */
    TrackMetadataPtr getLatestMetadataFor(int player) const;
    TrackMetadataPtr getLatestMetadataFor(const DeviceUpdate& update) const;

    /**
     * Use a cache file for the media in a player's SD or USB slot instead of
     * asking the player. The cache is detached when the media is removed or
     * the player disappears. Attaching over an existing cache replaces it.
     *
     * @throws IllegalStateError if we are not running
     * @throws std::invalid_argument if the player is not a player we can see, or the slot is not SD or USB
     * @throws CacheFormatError if the file is not a metadata cache
     */
    void attachMetadataCache(int player, TrackSourceSlot slot, const std::string& path);

    void detachMetadataCache(int player, TrackSourceSlot slot);

    /**
     * The path of the cache attached to a media slot, if any.
     */
    std::optional<std::string> getMetadataCache(int player, TrackSourceSlot slot) const;

    /**
     * The cache attached to a media slot itself, or null.
     */
    MetadataCachePtr findCache(int player, TrackSourceSlot slot) const;

    /**
     * @throws std::invalid_argument unless the slot is SD or USB
     */
    std::set<int> getPlayersWithMediaIn(TrackSourceSlot slot) const;

    /**
     * The source players whose tracks are being fetched right now.
     */
    std::set<int> getActiveRequests() const;

    void addMetadataCacheListener(const MetadataCacheListenerPtr& listener);
    void removeMetadataCacheListener(const MetadataCacheListenerPtr& listener);
    std::vector<MetadataCacheListenerPtr> getMetadataCacheListeners() const;

    void addTrackMetadataListener(const TrackMetadataListenerPtr& listener);
    void removeTrackMetadataListener(const TrackMetadataListenerPtr& listener);
    std::vector<TrackMetadataListenerPtr> getTrackMetadataListeners() const;

protected:
    std::string participantName() const override { return "MetadataFinder"; }

private:
    class ActiveRequestGuard;

    TrackMetadataPtr requestMetadataInternal(const DataReference& track, bool failIfPassive);
    TrackMetadataPtr queryMetadata(const DataReference& track, dbserver::Session& session);
    std::vector<uint8_t> requestArtwork(int artworkId, TrackSourceSlot slot, dbserver::Session& session);
    BeatGridPtr getBeatGrid(const DataReference& track, dbserver::Session& session);
    std::vector<dbserver::Message> getFullTrackList(TrackSourceSlot slot, dbserver::Session& session, int sortOrder);
    std::vector<dbserver::Message> getPlaylistItems(TrackSourceSlot slot, int sortOrder, int playlistOrFolderId,
                                                    bool folder, dbserver::Session& session);
    void copyTracksToCache(const std::vector<dbserver::Message>& trackListEntries, dbserver::Session& session,
                           TrackSourceSlot slot, const std::string& path,
                           const MetadataCacheCreationListenerPtr& listener);

    void enqueueUpdate(const CdjStatus& update);
    void startFetch(const CdjStatus& update);

    void clearMetadata(const CdjStatus& update);
    void clearMetadata(const DeviceAnnouncement& announcement);
    void updateMetadata(const CdjStatus& update, const TrackMetadataPtr& data);

    void recordMount(int player, TrackSourceSlot slot);
    void removeMount(int player, TrackSourceSlot slot);

    void deliverCacheUpdate();
    void deliverTrackMetadataUpdate(int player, const TrackMetadataPtr& metadata);

    DeviceRoster& roster_;
    dbserver::SessionProvider& sessions_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> passive_{false};

    mutable std::mutex metadataMutex_;
    std::map<int, TrackMetadataPtr> metadata_;

    mutable std::mutex lastUpdatesMutex_;
    std::map<asio::ip::address_v4, CdjStatus> lastUpdates_;

    mutable std::mutex activeRequestsMutex_;
    std::set<int> activeRequests_;

    std::mutex fetchMutex_;
    std::condition_variable fetchesFinished_;
    int fetchesInFlight_{0};

    mutable std::mutex cachesMutex_;
    std::map<int, MetadataCachePtr> sdCaches_;
    std::map<int, MetadataCachePtr> usbCaches_;

    mutable std::mutex mountsMutex_;
    std::set<int> sdMounts_;
    std::set<int> usbMounts_;

    std::mutex pendingMutex_;
    std::condition_variable pendingCv_;
    std::deque<CdjStatus> pendingUpdates_;
    std::thread queueHandler_;

    mutable std::mutex cacheListenersMutex_;
    std::vector<MetadataCacheListenerPtr> cacheListeners_;

    mutable std::mutex trackListenersMutex_;
    std::vector<TrackMetadataListenerPtr> trackListeners_;

    DeviceUpdateListenerPtr updateListener_;
    DeviceAnnouncementListenerPtr announcementListener_;
    LifecycleListenerPtr lifecycleListener_;
};

} // namespace cdjmeta::data
