#include "cdjmeta/data/MetadataCache.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/Log.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

#include <cstring>
#include <stdexcept>

namespace cdjmeta::data {

using dbserver::Message;

namespace {
constexpr const char* kLogSource = "MetadataCache";
}

std::string MetadataCache::metadataEntryName(int rekordboxId) {
    return fmt::format("{}metadata/{}", CACHE_PREFIX, rekordboxId);
}

std::string MetadataCache::artworkEntryName(int artworkId) {
    return fmt::format("{}artwork/{}.jpg", CACHE_PREFIX, artworkId);
}

std::string MetadataCache::beatGridEntryName(int rekordboxId) {
    return fmt::format("{}beatgrid/{}", CACHE_PREFIX, rekordboxId);
}

// =============================================================================
// Reading
// =============================================================================

MetadataCache::MetadataCache(std::string path)
    : path_(std::move(path))
{
}

MetadataCache::~MetadataCache() {
    close();
}

std::shared_ptr<MetadataCache> MetadataCache::open(const std::string& path) {
    std::shared_ptr<MetadataCache> cache(new MetadataCache(path));
    if (!cache->archive_.open(path)) {
        throw CacheFormatError(fmt::format("Unable to open metadata cache {}: {}", path, cache->archive_.lastError()));
    }

    std::optional<std::vector<uint8_t>> tag;
    try {
        tag = cache->archive_.extractToMemory(FORMAT_ENTRY);
    } catch (const std::exception& e) {
        cache->close();
        throw CacheFormatError(fmt::format("Unable to read the format entry of metadata cache {}: {}", path, e.what()));
    }
    const std::string found = tag ? std::string(tag->begin(), tag->end()) : std::string();
    if (found != FORMAT_IDENTIFIER) {
        cache->close();
        throw CacheFormatError(fmt::format(
            "File does not contain a metadata cache: {} (looking for format identifier \"{}\", found: \"{}\")",
            path, FORMAT_IDENTIFIER, found));
    }
    return cache;
}

void MetadataCache::close() {
    std::lock_guard<std::mutex> lock(archiveMutex_);
    if (archive_.isOpen()) {
        archive_.close();
        Log::debug(kLogSource, "Closed metadata cache {}", path_);
    }
}

bool MetadataCache::isOpen() const {
    std::lock_guard<std::mutex> lock(archiveMutex_);
    return archive_.isOpen();
}

TrackMetadataPtr MetadataCache::getCachedMetadata(const DataReference& track) const {
    try {
        std::optional<std::vector<uint8_t>> entry;
        {
            std::lock_guard<std::mutex> lock(archiveMutex_);
            entry = archive_.extractToMemory(metadataEntryName(track.getRekordboxId()));
        }
        if (!entry) {
            return nullptr;
        }

        dbserver::ByteArrayDataReader reader(std::move(*entry));
        std::vector<Message> items;
        Message current = Message::read(reader);
        while (current.isType(Message::KnownType::MENU_ITEM)) {
            items.push_back(current);
            current = Message::read(reader);
        }

        auto result = std::make_shared<const TrackMetadata>(track, std::move(items));
        if (result->getArtworkId() != 0) {
            auto artwork = getCachedArtwork(result->getArtworkId());
            if (artwork) {
                return result->withArtwork(std::move(*artwork));
            }
        }
        return result;
    } catch (const std::exception& e) {
        Log::error(kLogSource, "Problem reading metadata for {} from cache file {}, returning null: {}",
                   track.toString(), path_, e.what());
    }
    return nullptr;
}

BeatGridPtr MetadataCache::getCachedBeatGrid(const DataReference& track) const {
    try {
        std::optional<std::vector<uint8_t>> entry;
        {
            std::lock_guard<std::mutex> lock(archiveMutex_);
            entry = archive_.extractToMemory(beatGridEntryName(track.getRekordboxId()));
        }
        if (!entry) {
            return nullptr;
        }
        return std::make_shared<const BeatGrid>(track, *entry);
    } catch (const std::exception& e) {
        Log::error(kLogSource, "Problem reading beat grid for {} from cache file {}, returning null: {}",
                   track.toString(), path_, e.what());
    }
    return nullptr;
}

std::optional<std::vector<uint8_t>> MetadataCache::getCachedArtwork(int artworkId) const {
    try {
        std::lock_guard<std::mutex> lock(archiveMutex_);
        return archive_.extractToMemory(artworkEntryName(artworkId));
    } catch (const std::exception& e) {
        Log::error(kLogSource, "Problem reading artwork {} from cache file {}, returning nothing: {}",
                   artworkId, path_, e.what());
    }
    return std::nullopt;
}

// =============================================================================
// Writing
// =============================================================================

MetadataCacheWriter::MetadataCacheWriter(std::string path)
    : path_(std::move(path))
{
    if (!writer_.open(path_)) {
        throw std::runtime_error(fmt::format("Unable to create metadata cache {}: {}", path_, writer_.lastError()));
    }
    const char* identifier = MetadataCache::FORMAT_IDENTIFIER;
    addEntry(MetadataCache::FORMAT_ENTRY,
             std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(identifier), std::strlen(identifier)));
}

MetadataCacheWriter::~MetadataCacheWriter() {
    close();
}

void MetadataCacheWriter::addEntry(const std::string& name, std::span<const uint8_t> data) {
    if (!writer_.addEntry(name, data)) {
        throw std::runtime_error(fmt::format("Unable to add {} to metadata cache {}: {}",
                                             name, path_, writer_.lastError()));
    }
}

void MetadataCacheWriter::addMetadata(const TrackMetadata& track) {
    static const Message footer(0, Message::KnownType::MENU_FOOTER);

    std::vector<uint8_t> bytes;
    for (const auto& item : track.getRawItems()) {
        const auto itemBytes = item.toBytes();
        bytes.insert(bytes.end(), itemBytes.begin(), itemBytes.end());
    }
    const auto footerBytes = footer.toBytes();
    bytes.insert(bytes.end(), footerBytes.begin(), footerBytes.end());

    Log::debug(kLogSource, "Adding metadata with ID {}", track.getRekordboxId());
    addEntry(MetadataCache::metadataEntryName(track.getRekordboxId()), bytes);
}

bool MetadataCacheWriter::addArtwork(int artworkId, std::span<const uint8_t> artwork) {
    if (artworkAdded_.count(artworkId) > 0) {
        return false;
    }
    Log::debug(kLogSource, "Adding artwork with ID {}", artworkId);
    addEntry(MetadataCache::artworkEntryName(artworkId), artwork);
    artworkAdded_.insert(artworkId);
    return true;
}

void MetadataCacheWriter::addBeatGrid(const BeatGrid& beatGrid) {
    const int rekordboxId = beatGrid.getDataReference().getRekordboxId();
    Log::debug(kLogSource, "Adding beat grid with ID {}", rekordboxId);
    addEntry(MetadataCache::beatGridEntryName(rekordboxId), beatGrid.getRawData());
}

void MetadataCacheWriter::close() {
    if (!writer_.isOpen()) {
        return;
    }
    if (!writer_.finish()) {
        Log::error(kLogSource, "Problem closing metadata cache {}: {}", path_, writer_.lastError());
    }
}

} // namespace cdjmeta::data
