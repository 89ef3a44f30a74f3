#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "BeatGrid.hpp"
#include "DataReference.hpp"
#include "TrackMetadata.hpp"
#include "ZipArchive.hpp"

namespace cdjmeta::data {

/**
 * A metadata cache archive: a ZIP file holding the dbserver responses for
 * every track on a piece of media, so metadata can be found without asking
 * the player for it.
 *
 * Entries:
 *   BLTMetaCache/version                 the format identifier
 *   BLTMetaCache/metadata/<rekordboxId>  MENU_ITEM messages, ending with a MENU_FOOTER
 *   BLTMetaCache/artwork/<artworkId>.jpg album art
 *   BLTMetaCache/beatgrid/<rekordboxId>  the raw beat grid blob
 *
 * Lookups may come from several threads at once; they take turns on the
 * underlying reader.
 */
class MetadataCache {
public:
    static constexpr const char* CACHE_PREFIX = "BLTMetaCache/";
    static constexpr const char* FORMAT_ENTRY = "BLTMetaCache/version";
    static constexpr const char* FORMAT_IDENTIFIER = "BeatLink Metadata Cache version 1";

    static std::string metadataEntryName(int rekordboxId);
    static std::string artworkEntryName(int artworkId);
    static std::string beatGridEntryName(int rekordboxId);

    /**
     * Open a cache file and check that it really is one.
     *
     * @throws CacheFormatError if the file cannot be read as a ZIP archive, or
     *         its version entry is missing or does not hold the format identifier
     */
    static std::shared_ptr<MetadataCache> open(const std::string& path);

    ~MetadataCache();

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    /**
     * Release the archive. Lookups after this find nothing. Safe to call more than once.
     */
    void close();

    bool isOpen() const;

    const std::string& getPath() const { return path_; }

    /**
     * Metadata for a track, with its album art when the cache has it.
     * Returns null if the track is not in the cache or its entry is damaged.
     */
    TrackMetadataPtr getCachedMetadata(const DataReference& track) const;

    /**
     * Returns null if the track has no beat grid in the cache.
     */
    BeatGridPtr getCachedBeatGrid(const DataReference& track) const;

    std::optional<std::vector<uint8_t>> getCachedArtwork(int artworkId) const;

private:
    explicit MetadataCache(std::string path);

    std::string path_;
    mutable std::mutex archiveMutex_;
    ZipArchive archive_;
};

using MetadataCachePtr = std::shared_ptr<MetadataCache>;

/**
 * Builds a metadata cache file. The version entry is written on
 * construction; the archive is completed by close() or, failing that, by the
 * destructor, so the file is always released.
 */
class MetadataCacheWriter {
public:
    /**
     * @throws std::runtime_error if the file cannot be created
     */
    explicit MetadataCacheWriter(std::string path);

    ~MetadataCacheWriter();

    MetadataCacheWriter(const MetadataCacheWriter&) = delete;
    MetadataCacheWriter& operator=(const MetadataCacheWriter&) = delete;

    /**
     * Store a track's metadata items, followed by a MENU_FOOTER so readers know where they end.
     *
     * @throws std::runtime_error if the entry cannot be written
     */
    void addMetadata(const TrackMetadata& track);

    /**
     * Store album art unless art with the same id was already stored.
     * Returns whether anything was written.
     *
     * @throws std::runtime_error if the entry cannot be written
     */
    bool addArtwork(int artworkId, std::span<const uint8_t> artwork);

    /**
     * @throws std::runtime_error if the entry cannot be written
     */
    void addBeatGrid(const BeatGrid& beatGrid);

    /**
     * Finish the archive. Problems are logged rather than thrown. Safe to call more than once.
     */
    void close();

    const std::string& getPath() const { return path_; }

private:
    void addEntry(const std::string& name, std::span<const uint8_t> data);

    std::string path_;
    ZipWriter writer_;
    std::set<int> artworkAdded_;
};

} // namespace cdjmeta::data
