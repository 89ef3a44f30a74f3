#include "cdjmeta/data/MetadataFinder.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/Log.hpp"
#include "cdjmeta/Util.hpp"
#include "cdjmeta/dbserver/Message.hpp"
#include "cdjmeta/dbserver/NumberField.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace cdjmeta::data {

using dbserver::Message;
using dbserver::NumberField;
using dbserver::Session;

namespace {

constexpr const char* kLogSource = "MetadataFinder";

template <typename Listener>
void addUnique(std::mutex& mutex, std::vector<std::shared_ptr<Listener>>& listeners,
               const std::shared_ptr<Listener>& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
    }
}

template <typename Listener>
void removeListener(std::mutex& mutex, std::vector<std::shared_ptr<Listener>>& listeners,
                    const std::shared_ptr<Listener>& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

std::map<int, std::string> cachePaths(const std::map<int, MetadataCachePtr>& caches) {
    std::map<int, std::string> paths;
    for (const auto& [player, cache] : caches) {
        paths.emplace(player, cache->getPath());
    }
    return paths;
}

} // namespace

/**
 * Releases a source player's place in the active request set, and counts
 * the fetch as finished, when the fetch thread is done with it.
 */
class MetadataFinder::ActiveRequestGuard {
public:
    ActiveRequestGuard(MetadataFinder& owner, int player)
        : owner_(owner)
        , player_(player)
    {
    }

    ~ActiveRequestGuard() {
        {
            std::lock_guard<std::mutex> lock(owner_.activeRequestsMutex_);
            owner_.activeRequests_.erase(player_);
        }
        // Notify while locked; once the count reaches zero, stop() may destroy the owner.
        std::lock_guard<std::mutex> lock(owner_.fetchMutex_);
        --owner_.fetchesInFlight_;
        owner_.fetchesFinished_.notify_all();
    }

    ActiveRequestGuard(const ActiveRequestGuard&) = delete;
    ActiveRequestGuard& operator=(const ActiveRequestGuard&) = delete;

private:
    MetadataFinder& owner_;
    int player_;
};

MetadataFinder::MetadataFinder(DeviceRoster& roster, dbserver::SessionProvider& sessions)
    : roster_(roster)
    , sessions_(sessions)
{
    updateListener_ = std::make_shared<DeviceUpdateCallbacks>(
        [this](const DeviceUpdate& update) {
            if (Log::isEnabled(LogLevel::Debug)) {
                Log::debug(kLogSource, "Received device update {}", update.toString());
            }
            auto cdj = dynamic_cast<const CdjStatus*>(&update);
            if (!cdj) {
                return;
            }
            enqueueUpdate(*cdj);
        });

    announcementListener_ = std::make_shared<DeviceAnnouncementCallbacks>(
        [](const DeviceAnnouncement&) {},
        [this](const DeviceAnnouncement& announcement) {
            clearMetadata(announcement);
            detachMetadataCache(announcement.getDeviceNumber(), TrackSourceSlot::SD_SLOT);
            detachMetadataCache(announcement.getDeviceNumber(), TrackSourceSlot::USB_SLOT);
        });

    lifecycleListener_ = std::make_shared<LifecycleCallbacks>(
        [](LifecycleParticipant&) {},
        [this](LifecycleParticipant&) {
            if (isRunning()) {
                Log::info(kLogSource, "Stopping because the connection manager has stopped");
                stop();
            }
        });
}

MetadataFinder::~MetadataFinder() {
    stop();
}

// =============================================================================
// Metadata requests
// =============================================================================

TrackMetadataPtr MetadataFinder::requestMetadataFrom(const CdjStatus& status) {
    if (status.getTrackSourceSlot() == TrackSourceSlot::NO_TRACK || status.getRekordboxId() == 0) {
        return nullptr;
    }
    return requestMetadataFrom(status.getTrackSourcePlayer(), status.getTrackSourceSlot(), status.getRekordboxId());
}

TrackMetadataPtr MetadataFinder::requestMetadataFrom(int player, TrackSourceSlot slot, int rekordboxId) {
    return requestMetadataInternal(DataReference(player, slot, rekordboxId), false);
}

TrackMetadataPtr MetadataFinder::requestMetadataInternal(const DataReference& track, bool failIfPassive) {
    auto cache = findCache(track.getPlayer(), track.getSlot());
    if (cache) {
        return cache->getCachedMetadata(track);
    }

    if (passive_.load() && failIfPassive) {
        return nullptr;
    }

    try {
        return sessions_.invokeWithClientSession(
            track.getPlayer(),
            [this, &track](Session& session) {
                return queryMetadata(track, session);
            },
            "requesting metadata");
    } catch (const std::exception& e) {
        Log::error(kLogSource, "Problem requesting metadata for {}, returning null: {}", track.toString(), e.what());
    }
    return nullptr;
}

TrackMetadataPtr MetadataFinder::queryMetadata(const DataReference& track, Session& session) {
    dbserver::MenuLockGuard guard(session, std::chrono::seconds(MENU_TIMEOUT_SECONDS));

    auto response = session.menuRequest(Message::KnownType::REKORDBOX_METADATA_REQ,
                                        Message::MenuIdentifier::MAIN_MENU,
                                        track.getSlot(),
                                        {std::make_shared<NumberField>(track.getRekordboxId())});
    if (response.getMenuResultsCount() == Message::NO_MENU_RESULTS_AVAILABLE) {
        return nullptr;
    }

    auto items = session.renderMenuItems(Message::MenuIdentifier::MAIN_MENU, track.getSlot(),
                                         TrackType::REKORDBOX, response);
    TrackMetadataPtr result = std::make_shared<const TrackMetadata>(track, std::move(items));
    if (result->getArtworkId() != 0) {
        result = result->withArtwork(requestArtwork(result->getArtworkId(), track.getSlot(), session));
    }
    return result;
}

std::vector<uint8_t> MetadataFinder::requestArtwork(int artworkId, TrackSourceSlot slot, Session& session) {
    auto response = session.simpleRequest(
        Message::KnownType::ALBUM_ART_REQ,
        Message::KnownType::ALBUM_ART,
        {std::make_shared<NumberField>(session.buildRMST(Message::MenuIdentifier::DATA, slot)),
         std::make_shared<NumberField>(artworkId)});
    return response.getBinaryArgument(3);
}

BeatGridPtr MetadataFinder::getBeatGrid(const DataReference& track, Session& session) {
    auto response = session.simpleRequest(
        Message::KnownType::BEAT_GRID_REQ,
        std::nullopt,
        {std::make_shared<NumberField>(session.buildRMST(Message::MenuIdentifier::DATA, track.getSlot())),
         std::make_shared<NumberField>(track.getRekordboxId())});

    if (response.isType(Message::KnownType::BEAT_GRID)) {
        return std::make_shared<const BeatGrid>(track, response);
    }
    Log::error(kLogSource, "Unexpected response type when requesting beat grid: {}", response.toString());
    return nullptr;
}

BeatGridPtr MetadataFinder::requestBeatGridFrom(int player, TrackSourceSlot slot, int rekordboxId) {
    const DataReference track(player, slot, rekordboxId);
    auto cache = findCache(player, slot);
    if (cache) {
        return cache->getCachedBeatGrid(track);
    }

    return sessions_.invokeWithClientSession(
        player,
        [this, &track](Session& session) {
            return getBeatGrid(track, session);
        },
        "requesting beat grid");
}

std::vector<Message> MetadataFinder::getFullTrackList(TrackSourceSlot slot, Session& session, int sortOrder) {
    dbserver::MenuLockGuard guard(session, std::chrono::seconds(MENU_TIMEOUT_SECONDS));

    auto response = session.menuRequest(Message::KnownType::TRACK_MENU_REQ,
                                        Message::MenuIdentifier::MAIN_MENU,
                                        slot,
                                        {std::make_shared<NumberField>(sortOrder)});

    const auto count = response.getMenuResultsCount();
    if (count == Message::NO_MENU_RESULTS_AVAILABLE || count == 0) {
        return {};
    }

    return session.renderMenuItems(Message::MenuIdentifier::MAIN_MENU, slot, TrackType::REKORDBOX, response);
}

std::vector<Message> MetadataFinder::getPlaylistItems(TrackSourceSlot slot, int sortOrder, int playlistOrFolderId,
                                                      bool folder, Session& session) {
    dbserver::MenuLockGuard guard(session, std::chrono::seconds(MENU_TIMEOUT_SECONDS));

    auto response = session.menuRequest(Message::KnownType::PLAYLIST_REQ,
                                        Message::MenuIdentifier::MAIN_MENU,
                                        slot,
                                        {std::make_shared<NumberField>(sortOrder),
                                         std::make_shared<NumberField>(playlistOrFolderId),
                                         std::make_shared<NumberField>(folder ? 1 : 0)});

    const auto count = response.getMenuResultsCount();
    if (count == Message::NO_MENU_RESULTS_AVAILABLE || count == 0) {
        return {};
    }

    return session.renderMenuItems(Message::MenuIdentifier::MAIN_MENU, slot, TrackType::REKORDBOX, response);
}

std::vector<Message> MetadataFinder::requestPlaylistItemsFrom(int player, TrackSourceSlot slot, int sortOrder,
                                                              int playlistOrFolderId, bool folder) {
    return sessions_.invokeWithClientSession(
        player,
        [this, slot, sortOrder, playlistOrFolderId, folder](Session& session) {
            return getPlaylistItems(slot, sortOrder, playlistOrFolderId, folder, session);
        },
        "requesting playlist information");
}

// =============================================================================
// Cache creation
// =============================================================================

void MetadataFinder::createMetadataCache(int player, TrackSourceSlot slot, int playlistId, const std::string& path,
                                         const MetadataCacheCreationListenerPtr& listener) {
    std::error_code error;
    std::filesystem::remove(path, error);
    if (error) {
        Log::warn(kLogSource, "Unable to delete cache file {}: {}", path, error.message());
    }

    sessions_.withSession(
        player,
        [this, slot, playlistId, &path, &listener](Session& session) {
            const auto trackList = (playlistId == 0) ? getFullTrackList(slot, session, 0)
                                                     : getPlaylistItems(slot, 0, playlistId, false, session);
            copyTracksToCache(trackList, session, slot, path, listener);
        },
        "building metadata cache");
}

void MetadataFinder::copyTracksToCache(const std::vector<Message>& trackListEntries, Session& session,
                                       TrackSourceSlot slot, const std::string& path,
                                       const MetadataCacheCreationListenerPtr& listener) {
    MetadataCacheWriter writer(path);
    const int totalToCopy = static_cast<int>(trackListEntries.size());
    int tracksCopied = 0;

    for (const auto& entry : trackListEntries) {
        if (!entry.isTrackListEntry()) {
            throw CacheFormatError("Received unexpected item type. Needed a track list entry, got: " +
                                   entry.toString());
        }
        const DataReference reference(session.targetPlayer(), slot,
                                      static_cast<int>(entry.getNumberArgument(1)));

        auto track = queryMetadata(reference, session);
        if (track) {
            writer.addMetadata(*track);
            if (track->getRawArtwork()) {
                writer.addArtwork(track->getArtworkId(), *track->getRawArtwork());
            }
        } else {
            Log::warn(kLogSource, "Unable to retrieve metadata with ID {}", reference.getRekordboxId());
        }

        auto beatGrid = getBeatGrid(reference, session);
        if (beatGrid) {
            writer.addBeatGrid(*beatGrid);
        }

        ++tracksCopied;
        if (listener && !listener->cacheCreationContinuing(track, tracksCopied, totalToCopy)) {
            Log::info(kLogSource, "Track metadata cache creation canceled by listener");
            writer.close();
            std::error_code error;
            if (!std::filesystem::remove(path, error)) {
                Log::warn(kLogSource, "Unable to delete cache metadata file {}", path);
            }
            return;
        }
    }
    writer.close();
}

// =============================================================================
// Attached caches and mounted media
// =============================================================================

void MetadataFinder::attachMetadataCache(int player, TrackSourceSlot slot, const std::string& path) {
    if (!isRunning()) {
        throw IllegalStateError("attachMetadataCache() can't be used if MetadataFinder is not running");
    }
    if (!Util::isPlayerNumber(player) || !roster_.getLatestAnnouncementFrom(player)) {
        throw std::invalid_argument("unable to attach metadata cache for player " + std::to_string(player));
    }

    auto newCache = MetadataCache::open(path);

    MetadataCachePtr oldCache;
    {
        std::lock_guard<std::mutex> lock(cachesMutex_);
        switch (slot) {
            case TrackSourceSlot::USB_SLOT:
                oldCache = std::exchange(usbCaches_[player], newCache);
                break;

            case TrackSourceSlot::SD_SLOT:
                oldCache = std::exchange(sdCaches_[player], newCache);
                break;

            default:
                newCache->close();
                throw std::invalid_argument(std::string("Cannot cache media for slot ") + toString(slot));
        }
    }

    if (oldCache) {
        oldCache->close();
    }

    Log::info(kLogSource, "Attached metadata cache {} for player {} slot {}", path, player, toString(slot));
    deliverCacheUpdate();
}

void MetadataFinder::detachMetadataCache(int player, TrackSourceSlot slot) {
    MetadataCachePtr oldCache;
    {
        std::lock_guard<std::mutex> lock(cachesMutex_);
        std::map<int, MetadataCachePtr>* caches = nullptr;
        switch (slot) {
            case TrackSourceSlot::USB_SLOT:
                caches = &usbCaches_;
                break;

            case TrackSourceSlot::SD_SLOT:
                caches = &sdCaches_;
                break;

            default:
                Log::warn(kLogSource, "Ignoring request to remove metadata cache for slot {}", toString(slot));
                return;
        }
        auto it = caches->find(player);
        if (it != caches->end()) {
            oldCache = it->second;
            caches->erase(it);
        }
    }

    if (oldCache) {
        oldCache->close();
        deliverCacheUpdate();
    }
}

MetadataCachePtr MetadataFinder::findCache(int player, TrackSourceSlot slot) const {
    std::lock_guard<std::mutex> lock(cachesMutex_);
    const std::map<int, MetadataCachePtr>* caches = nullptr;
    switch (slot) {
        case TrackSourceSlot::USB_SLOT:
            caches = &usbCaches_;
            break;
        case TrackSourceSlot::SD_SLOT:
            caches = &sdCaches_;
            break;
        default:
            return nullptr;
    }
    auto it = caches->find(player);
    return (it == caches->end()) ? nullptr : it->second;
}

std::optional<std::string> MetadataFinder::getMetadataCache(int player, TrackSourceSlot slot) const {
    auto cache = findCache(player, slot);
    if (!cache) {
        return std::nullopt;
    }
    return cache->getPath();
}

void MetadataFinder::recordMount(int player, TrackSourceSlot slot) {
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mountsMutex_);
        switch (slot) {
            case TrackSourceSlot::USB_SLOT:
                inserted = usbMounts_.insert(player).second;
                break;
            case TrackSourceSlot::SD_SLOT:
                inserted = sdMounts_.insert(player).second;
                break;
            default:
                throw std::invalid_argument(std::string("Cannot record mounted media in slot ") + toString(slot));
        }
    }
    if (inserted) {
        deliverCacheUpdate();
    }
}

void MetadataFinder::removeMount(int player, TrackSourceSlot slot) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mountsMutex_);
        switch (slot) {
            case TrackSourceSlot::USB_SLOT:
                removed = usbMounts_.erase(player) > 0;
                break;
            case TrackSourceSlot::SD_SLOT:
                removed = sdMounts_.erase(player) > 0;
                break;
            default:
                Log::warn(kLogSource, "Ignoring request to record unmounted media in slot {}", toString(slot));
                return;
        }
    }
    if (removed) {
        deliverCacheUpdate();
    }
}

std::set<int> MetadataFinder::getPlayersWithMediaIn(TrackSourceSlot slot) const {
    std::lock_guard<std::mutex> lock(mountsMutex_);
    switch (slot) {
        case TrackSourceSlot::USB_SLOT:
            return usbMounts_;
        case TrackSourceSlot::SD_SLOT:
            return sdMounts_;
        default:
            throw std::invalid_argument(std::string("Cannot report mounted media in slot ") + toString(slot));
    }
}

// =============================================================================
// Latest metadata
// =============================================================================

std::map<int, TrackMetadataPtr> MetadataFinder::getLatestMetadata() const {
    ensureRunning();
    std::lock_guard<std::mutex> lock(metadataMutex_);
    return metadata_;
}

TrackMetadataPtr MetadataFinder::getLatestMetadataFor(int player) const {
    ensureRunning();
    std::lock_guard<std::mutex> lock(metadataMutex_);
    auto it = metadata_.find(player);
    return (it == metadata_.end()) ? nullptr : it->second;
}

TrackMetadataPtr MetadataFinder::getLatestMetadataFor(const DeviceUpdate& update) const {
    return getLatestMetadataFor(update.getDeviceNumber());
}

std::set<int> MetadataFinder::getActiveRequests() const {
    std::lock_guard<std::mutex> lock(activeRequestsMutex_);
    return activeRequests_;
}

void MetadataFinder::clearMetadata(const CdjStatus& update) {
    {
        std::lock_guard<std::mutex> lock(metadataMutex_);
        metadata_.erase(update.getDeviceNumber());
    }
    {
        std::lock_guard<std::mutex> lock(lastUpdatesMutex_);
        lastUpdates_.erase(update.getAddress());
    }
    deliverTrackMetadataUpdate(update.getDeviceNumber(), nullptr);
}

void MetadataFinder::clearMetadata(const DeviceAnnouncement& announcement) {
    bool hadMetadata = false;
    {
        std::lock_guard<std::mutex> lock(metadataMutex_);
        hadMetadata = metadata_.erase(announcement.getDeviceNumber()) > 0;
    }
    {
        std::lock_guard<std::mutex> lock(lastUpdatesMutex_);
        lastUpdates_.erase(announcement.getAddress());
    }
    if (hadMetadata) {
        deliverTrackMetadataUpdate(announcement.getDeviceNumber(), nullptr);
    }
}

void MetadataFinder::updateMetadata(const CdjStatus& update, const TrackMetadataPtr& data) {
    {
        std::lock_guard<std::mutex> lock(metadataMutex_);
        metadata_[update.getDeviceNumber()] = data;
    }
    {
        std::lock_guard<std::mutex> lock(lastUpdatesMutex_);
        lastUpdates_.insert_or_assign(update.getAddress(), update);
    }
    deliverTrackMetadataUpdate(update.getDeviceNumber(), data);
}

// =============================================================================
// Status update processing
// =============================================================================

void MetadataFinder::handleUpdate(const CdjStatus& update) {
    const int player = update.getDeviceNumber();

    if (update.isLocalUsbEmpty()) {
        detachMetadataCache(player, TrackSourceSlot::USB_SLOT);
        removeMount(player, TrackSourceSlot::USB_SLOT);
    } else if (update.isLocalUsbLoaded()) {
        recordMount(player, TrackSourceSlot::USB_SLOT);
    }
    if (update.isLocalSdEmpty()) {
        detachMetadataCache(player, TrackSourceSlot::SD_SLOT);
        removeMount(player, TrackSourceSlot::SD_SLOT);
    } else if (update.isLocalSdLoaded()) {
        recordMount(player, TrackSourceSlot::SD_SLOT);
    }

    if (update.getTrackType() != TrackType::REKORDBOX ||
        update.getTrackSourceSlot() == TrackSourceSlot::NO_TRACK ||
        update.getTrackSourceSlot() == TrackSourceSlot::UNKNOWN ||
        update.getRekordboxId() == 0) {
        clearMetadata(update);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(lastUpdatesMutex_);
        auto it = lastUpdates_.find(update.getAddress());
        if (it != lastUpdates_.end() &&
            it->second.getTrackSourceSlot() == update.getTrackSourceSlot() &&
            it->second.getTrackSourcePlayer() == update.getTrackSourcePlayer() &&
            it->second.getRekordboxId() == update.getRekordboxId()) {
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(activeRequestsMutex_);
        if (!activeRequests_.insert(update.getTrackSourcePlayer()).second) {
            return;
        }
    }

    // We won't know what the new track is until the fetch completes.
    clearMetadata(update);
    startFetch(update);
}

void MetadataFinder::startFetch(const CdjStatus& update) {
    {
        std::lock_guard<std::mutex> lock(fetchMutex_);
        ++fetchesInFlight_;
    }

    try {
        std::thread([this, update]() {
            ActiveRequestGuard guard(*this, update.getTrackSourcePlayer());
            try {
                auto data = requestMetadataInternal(
                    DataReference(update.getTrackSourcePlayer(), update.getTrackSourceSlot(), update.getRekordboxId()),
                    true);
                if (data) {
                    updateMetadata(update, data);
                }
            } catch (const std::exception& e) {
                Log::warn(kLogSource, "Problem requesting track metadata from update {}: {}",
                          update.toString(), e.what());
            } catch (...) {
                Log::warn(kLogSource, "Problem requesting track metadata from update {}: unknown exception",
                          update.toString());
            }
        }).detach();
    } catch (const std::system_error& e) {
        ActiveRequestGuard release(*this, update.getTrackSourcePlayer());
        Log::error(kLogSource, "Unable to start metadata request thread: {}", e.what());
    }
}

void MetadataFinder::enqueueUpdate(const CdjStatus& update) {
    if (!isRunning()) {
        return;
    }
    std::unique_lock<std::mutex> lock(pendingMutex_);
    if (pendingUpdates_.size() >= MAX_PENDING_UPDATES) {
        lock.unlock();
        Log::warn(kLogSource, "Discarding CDJ update because our queue is backed up.");
        return;
    }
    pendingUpdates_.push_back(update);
    lock.unlock();
    pendingCv_.notify_one();
}

// =============================================================================
// Listeners
// =============================================================================

void MetadataFinder::addMetadataCacheListener(const MetadataCacheListenerPtr& listener) {
    addUnique(cacheListenersMutex_, cacheListeners_, listener);
}

void MetadataFinder::removeMetadataCacheListener(const MetadataCacheListenerPtr& listener) {
    removeListener(cacheListenersMutex_, cacheListeners_, listener);
}

std::vector<MetadataCacheListenerPtr> MetadataFinder::getMetadataCacheListeners() const {
    std::lock_guard<std::mutex> lock(cacheListenersMutex_);
    return cacheListeners_;
}

void MetadataFinder::addTrackMetadataListener(const TrackMetadataListenerPtr& listener) {
    addUnique(trackListenersMutex_, trackListeners_, listener);
}

void MetadataFinder::removeTrackMetadataListener(const TrackMetadataListenerPtr& listener) {
    removeListener(trackListenersMutex_, trackListeners_, listener);
}

std::vector<TrackMetadataListenerPtr> MetadataFinder::getTrackMetadataListeners() const {
    std::lock_guard<std::mutex> lock(trackListenersMutex_);
    return trackListeners_;
}

void MetadataFinder::deliverCacheUpdate() {
    std::map<int, std::string> sdCaches;
    std::map<int, std::string> usbCaches;
    {
        std::lock_guard<std::mutex> lock(cachesMutex_);
        sdCaches = cachePaths(sdCaches_);
        usbCaches = cachePaths(usbCaches_);
    }
    std::set<int> sdMounts;
    std::set<int> usbMounts;
    {
        std::lock_guard<std::mutex> lock(mountsMutex_);
        sdMounts = sdMounts_;
        usbMounts = usbMounts_;
    }

    for (const auto& listener : getMetadataCacheListeners()) {
        try {
            listener->cacheStateChanged(sdCaches, usbCaches, sdMounts, usbMounts);
        } catch (const std::exception& e) {
            Log::warn(kLogSource, "Problem delivering metadata cache update to listener: {}", e.what());
        } catch (...) {
            Log::warn(kLogSource, "Problem delivering metadata cache update to listener: unknown exception");
        }
    }
}

void MetadataFinder::deliverTrackMetadataUpdate(int player, const TrackMetadataPtr& metadata) {
    const TrackMetadataUpdate update(player, metadata);
    for (const auto& listener : getTrackMetadataListeners()) {
        try {
            listener->metadataChanged(update);
        } catch (const std::exception& e) {
            Log::warn(kLogSource, "Problem delivering track metadata update to listener: {}", e.what());
        } catch (...) {
            Log::warn(kLogSource, "Problem delivering track metadata update to listener: unknown exception");
        }
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void MetadataFinder::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (isRunning()) {
            return;
        }

        if (auto participant = dynamic_cast<LifecycleParticipant*>(&sessions_)) {
            participant->addLifecycleListener(lifecycleListener_);
        }
        roster_.addDeviceAnnouncementListener(announcementListener_);

        running_.store(true);
        queueHandler_ = std::thread([this]() {
            while (true) {
                std::optional<CdjStatus> update;
                {
                    std::unique_lock<std::mutex> lock(pendingMutex_);
                    pendingCv_.wait(lock, [this]() { return !isRunning() || !pendingUpdates_.empty(); });
                    if (!isRunning()) {
                        break;
                    }
                    update = pendingUpdates_.front();
                    pendingUpdates_.pop_front();
                }

                try {
                    handleUpdate(*update);
                } catch (const std::exception& e) {
                    Log::error(kLogSource, "Problem handling CDJ status update: {}", e.what());
                } catch (...) {
                    Log::error(kLogSource, "Problem handling CDJ status update: unknown exception");
                }
            }
        });
    }

    Log::info(kLogSource, "Started");
    deliverLifecycleAnnouncement(true);
}

void MetadataFinder::stop() {
    std::vector<int> playersWithMetadata;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (!isRunning()) {
            return;
        }

        roster_.removeDeviceAnnouncementListener(announcementListener_);
        if (auto participant = dynamic_cast<LifecycleParticipant*>(&sessions_)) {
            participant->removeLifecycleListener(lifecycleListener_);
        }

        {
            std::lock_guard<std::mutex> pendingLock(pendingMutex_);
            running_.store(false);
            pendingUpdates_.clear();
        }
        pendingCv_.notify_all();
        if (queueHandler_.joinable()) {
            queueHandler_.join();
        }

        {
            std::unique_lock<std::mutex> fetchLock(fetchMutex_);
            fetchesFinished_.wait(fetchLock, [this]() { return fetchesInFlight_ == 0; });
        }

        {
            std::lock_guard<std::mutex> lastLock(lastUpdatesMutex_);
            lastUpdates_.clear();
        }
        {
            std::lock_guard<std::mutex> metadataLock(metadataMutex_);
            for (const auto& [player, metadata] : metadata_) {
                playersWithMetadata.push_back(player);
            }
            metadata_.clear();
        }
    }

    for (const int player : playersWithMetadata) {
        deliverTrackMetadataUpdate(player, nullptr);
    }

    Log::info(kLogSource, "Stopped");
    deliverLifecycleAnnouncement(false);
}

} // namespace cdjmeta::data
