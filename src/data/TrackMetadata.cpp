#include "cdjmeta/data/TrackMetadata.hpp"

#include "cdjmeta/dbserver/NumberField.hpp"
#include "cdjmeta/dbserver/StringField.hpp"

#include <fmt/format.h>

namespace cdjmeta::data {

using dbserver::Message;

TrackMetadata::TrackMetadata(DataReference reference, std::vector<Message> items)
    : trackReference_(std::move(reference))
    , rawItems_(std::move(items))
{
    for (const auto& item : rawItems_) {
        if (item.isType(Message::KnownType::MENU_ITEM)) {
            parseMetadataItem(item);
        }
    }
}

TrackMetadataPtr TrackMetadata::withArtwork(std::vector<uint8_t> artwork) const {
    auto copy = std::make_shared<TrackMetadata>(*this);
    copy->rawArtwork_ = std::move(artwork);
    return copy;
}

SearchableItem TrackMetadata::buildSearchableItem(const Message& menuItem) {
    return SearchableItem(extractNumberField(menuItem, 1), extractStringField(menuItem, 3));
}

std::string TrackMetadata::extractStringField(const Message& menuItem, size_t index) {
    if (index >= menuItem.arguments.size()) {
        return {};
    }
    auto stringField = std::dynamic_pointer_cast<dbserver::StringField>(menuItem.arguments[index]);
    if (!stringField) {
        return {};
    }
    return stringField->getValue();
}

int TrackMetadata::extractNumberField(const Message& menuItem, size_t index) {
    if (index >= menuItem.arguments.size()) {
        return 0;
    }
    auto numberField = std::dynamic_pointer_cast<dbserver::NumberField>(menuItem.arguments[index]);
    if (!numberField) {
        return 0;
    }
    return static_cast<int>(numberField->getValue());
}

void TrackMetadata::parseMetadataItem(const Message& item) {
    switch (item.getMenuItemType()) {
        case Message::MenuItemType::TRACK_TITLE:
            title_ = extractStringField(item, 3);
            artworkId_ = extractNumberField(item, 8);
            break;

        case Message::MenuItemType::ARTIST:
            artist_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::ORIGINAL_ARTIST:
            originalArtist_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::REMIXER:
            remixer_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::ALBUM_TITLE:
            album_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::LABEL:
            label_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::DURATION:
            duration_ = extractNumberField(item, 1);
            break;

        case Message::MenuItemType::TEMPO:
            tempo_ = extractNumberField(item, 1);
            break;

        case Message::MenuItemType::COMMENT:
            comment_ = extractStringField(item, 3);
            break;

        case Message::MenuItemType::KEY:
            key_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::RATING:
            rating_ = extractNumberField(item, 1);
            break;

        case Message::MenuItemType::COLOR_NONE:
        case Message::MenuItemType::COLOR_AQUA:
        case Message::MenuItemType::COLOR_BLUE:
        case Message::MenuItemType::COLOR_GREEN:
        case Message::MenuItemType::COLOR_ORANGE:
        case Message::MenuItemType::COLOR_PINK:
        case Message::MenuItemType::COLOR_PURPLE:
        case Message::MenuItemType::COLOR_RED:
        case Message::MenuItemType::COLOR_YELLOW:
            color_ = ColorItem(extractNumberField(item, 1), extractStringField(item, 3));
            break;

        case Message::MenuItemType::GENRE:
            genre_ = buildSearchableItem(item);
            break;

        case Message::MenuItemType::DATE_ADDED:
            dateAdded_ = extractStringField(item, 3);
            break;

        case Message::MenuItemType::YEAR:
            year_ = extractNumberField(item, 1);
            break;

        case Message::MenuItemType::BIT_RATE:
            bitRate_ = extractNumberField(item, 1);
            break;

        default:
            break;
    }
}

bool TrackMetadata::operator==(const TrackMetadata& other) const {
    return trackReference_ == other.trackReference_ &&
           album_ == other.album_ &&
           artist_ == other.artist_ &&
           color_ == other.color_ &&
           comment_ == other.comment_ &&
           dateAdded_ == other.dateAdded_ &&
           duration_ == other.duration_ &&
           genre_ == other.genre_ &&
           key_ == other.key_ &&
           label_ == other.label_ &&
           originalArtist_ == other.originalArtist_ &&
           rating_ == other.rating_ &&
           remixer_ == other.remixer_ &&
           tempo_ == other.tempo_ &&
           year_ == other.year_ &&
           bitRate_ == other.bitRate_ &&
           title_ == other.title_ &&
           artworkId_ == other.artworkId_;
}

std::string TrackMetadata::toString() const {
    return fmt::format("TrackMetadata[reference:{}, title:{}, artworkId:{}, artwork:{}]",
                       trackReference_.toString(), title_, artworkId_,
                       rawArtwork_ ? fmt::format("{} bytes", rawArtwork_->size()) : std::string("none"));
}

} // namespace cdjmeta::data
