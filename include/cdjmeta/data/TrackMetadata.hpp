#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ColorItem.hpp"
#include "DataReference.hpp"
#include "SearchableItem.hpp"
#include "cdjmeta/dbserver/Message.hpp"

namespace cdjmeta::data {

class TrackMetadata;

using TrackMetadataPtr = std::shared_ptr<const TrackMetadata>;

/**
 * Everything the player's database told us about a track: the MENU_ITEM
 * responses to a metadata request, the values parsed out of them, and the
 * album art if the track has any. Instances are never modified; withArtwork()
 * builds a new one.
 */
class TrackMetadata {
public:
    /**
     * Parse the metadata menu items returned for a track. Items that are not
     * MENU_ITEM responses, or whose item type we do not use, are kept in the
     * raw list but otherwise ignored.
     */
    TrackMetadata(DataReference reference, std::vector<dbserver::Message> items);

    /**
     * A copy of this metadata with the album art attached.
     */
    TrackMetadataPtr withArtwork(std::vector<uint8_t> artwork) const;

    const DataReference& getTrackReference() const { return trackReference_; }
    int getRekordboxId() const { return trackReference_.getRekordboxId(); }

    const std::vector<dbserver::Message>& getRawItems() const { return rawItems_; }

    /**
     * The JPEG bytes of the album art, if it was retrieved.
     */
    const std::optional<std::vector<uint8_t>>& getRawArtwork() const { return rawArtwork_; }

    const std::optional<SearchableItem>& getAlbum() const { return album_; }
    const std::optional<SearchableItem>& getArtist() const { return artist_; }
    const std::optional<ColorItem>& getColor() const { return color_; }
    const std::string& getComment() const { return comment_; }
    const std::string& getDateAdded() const { return dateAdded_; }
    int getDuration() const { return duration_; }
    const std::optional<SearchableItem>& getGenre() const { return genre_; }
    const std::optional<SearchableItem>& getKey() const { return key_; }
    const std::optional<SearchableItem>& getLabel() const { return label_; }
    const std::optional<SearchableItem>& getOriginalArtist() const { return originalArtist_; }
    int getRating() const { return rating_; }
    const std::optional<SearchableItem>& getRemixer() const { return remixer_; }
    /** Tempo in beats per minute times 100. */
    int getTempo() const { return tempo_; }
    int getYear() const { return year_; }
    int getBitRate() const { return bitRate_; }
    const std::string& getTitle() const { return title_; }
    int getArtworkId() const { return artworkId_; }

    bool operator==(const TrackMetadata& other) const;
    bool operator!=(const TrackMetadata& other) const { return !(*this == other); }

    std::string toString() const;

private:
    void parseMetadataItem(const dbserver::Message& item);
    static SearchableItem buildSearchableItem(const dbserver::Message& menuItem);
    static std::string extractStringField(const dbserver::Message& menuItem, size_t index);
    static int extractNumberField(const dbserver::Message& menuItem, size_t index);

    DataReference trackReference_;
    std::vector<dbserver::Message> rawItems_;
    std::optional<std::vector<uint8_t>> rawArtwork_;

    std::optional<SearchableItem> album_;
    std::optional<SearchableItem> artist_;
    std::optional<ColorItem> color_;
    std::string comment_;
    std::string dateAdded_;
    int duration_{0};
    std::optional<SearchableItem> genre_;
    std::optional<SearchableItem> key_;
    std::optional<SearchableItem> label_;
    std::optional<SearchableItem> originalArtist_;
    int rating_{0};
    std::optional<SearchableItem> remixer_;
    int tempo_{0};
    int year_{0};
    int bitRate_{0};
    std::string title_;
    int artworkId_{0};
};

} // namespace cdjmeta::data
