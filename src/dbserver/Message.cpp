#include "cdjmeta/dbserver/Message.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace cdjmeta::dbserver {

using KnownType = Message::KnownType;
using MenuItemType = Message::MenuItemType;

const NumberField Message::MESSAGE_START = NumberField(0x872349ae, 4);

namespace {

const std::vector<Message::KnownTypeInfo> KNOWN_TYPES = {
    {KnownType::SETUP_REQ, "setup request", {"requesting player"}},
    {KnownType::INVALID_DATA, "invalid data", {}},
    {KnownType::TEARDOWN_REQ, "teardown request", {}},
    {KnownType::ROOT_MENU_REQ, "root menu request", {"r:m:s:t", "sort order", "magic constant?"}},
    {KnownType::GENRE_MENU_REQ, "genre menu request", {"r:m:s:t", "sort order"}},
    {KnownType::ARTIST_MENU_REQ, "artist menu request", {"r:m:s:t", "sort order"}},
    {KnownType::ALBUM_MENU_REQ, "album menu request", {"r:m:s:t", "sort order"}},
    {KnownType::TRACK_MENU_REQ, "track menu request", {"r:m:s:t", "sort order"}},
    {KnownType::BPM_MENU_REQ, "bpm menu request", {"r:m:s:t", "sort order"}},
    {KnownType::RATING_MENU_REQ, "rating menu request", {"r:m:s:t", "sort order"}},
    {KnownType::YEAR_MENU_REQ, "year menu request", {"r:m:s:t", "sort order"}},
    {KnownType::LABEL_MENU_REQ, "label menu request", {"r:m:s:t", "sort order"}},
    {KnownType::COLOR_MENU_REQ, "color menu request", {"r:m:s:t", "sort order"}},
    {KnownType::TIME_MENU_REQ, "time menu request", {"r:m:s:t", "sort order"}},
    {KnownType::BIT_RATE_MENU_REQ, "bit rate menu request", {"r:m:s:t", "sort order"}},
    {KnownType::HISTORY_MENU_REQ, "history menu request", {"r:m:s:t", "sort order"}},
    {KnownType::FILENAME_MENU_REQ, "filename menu request", {"r:m:s:t", "sort order"}},
    {KnownType::KEY_MENU_REQ, "key menu request", {"r:m:s:t", "sort order"}},
    {KnownType::ARTIST_MENU_FOR_GENRE_REQ, "artist menu for genre request", {"r:m:s:t", "sort", "genre ID"}},
    {KnownType::ALBUM_MENU_FOR_ARTIST_REQ, "album menu for artist request", {"r:m:s:t", "sort", "artist ID"}},
    {KnownType::TRACK_MENU_FOR_ALBUM_REQ, "track menu for album request", {"r:m:s:t", "sort", "album ID"}},
    {KnownType::PLAYLIST_REQ, "playlist/folder request", {"r:m:s:t", "sort order", "playlist/folder ID", "0=playlist, 1=folder"}},
    {KnownType::BPM_RANGE_REQ, "bpm range request", {"r:m:s:t", "sort order", "tempo"}},
    {KnownType::TRACK_MENU_FOR_RATING_REQ, "track menu for rating request", {"r:m:s:t", "sort", "rating ID"}},
    {KnownType::YEAR_MENU_FOR_DECADE_REQ, "year menu for decade request", {"r:m:s:t", "sort", "decade"}},
    {KnownType::ARTIST_MENU_FOR_LABEL_REQ, "artist menu for label request", {"r:m:s:t", "sort", "label ID, or -1 for ALL"}},
    {KnownType::TRACK_MENU_FOR_COLOR_REQ, "track menu for color request", {"r:m:s:t", "sort", "color ID"}},
    {KnownType::TRACK_MENU_FOR_TIME_REQ, "track menu for time request", {"r:m:s:t", "sort", "minutes"}},
    {KnownType::TRACK_MENU_FOR_BIT_RATE_REQ, "track menu for bit rate request", {"r:m:s:t", "sort", "bit rate"}},
    {KnownType::TRACK_MENU_FOR_HISTORY_REQ, "track menu for history entry request", {"r:m:s:t", "sort", "history ID"}},
    {KnownType::NEIGHBOR_MENU_FOR_KEY, "neighbor menu for key request", {"r:m:s:t", "sort", "key ID"}},
    {KnownType::ALBUM_MENU_FOR_GENRE_AND_ARTIST, "album menu for genre and artist request", {"r:m:s:t", "sort", "genre ID", "artist ID, or -1 for ALL"}},
    {KnownType::TRACK_MENU_FOR_ARTIST_AND_ALBUM, "track menu for artist and album request", {"r:m:s:t", "sort", "artist ID", "album ID, or -1 for ALL"}},
    {KnownType::TRACK_MENU_FOR_BPM_AND_DISTANCE, "track menu for BPM and distance request", {"r:m:s:t", "sort", "bpm ID", "distance (+/- %, can range from 0-6)"}},
    {KnownType::TRACK_MENU_FOR_DECADE_YEAR_REQ, "track menu for decade and year request", {"r:m:s:t", "sort", "decade", "year, or -1 for ALL"}},
    {KnownType::ALBUM_MENU_FOR_LABEL_AND_ARTIST, "album menu for label and artist request", {"r:m:s:t", "sort", "label ID", "artist ID, or -1 for ALL"}},
    {KnownType::TRACK_MENU_FOR_KEY_AND_DISTANCE, "track menu for key and distance request", {"r:m:s:t", "sort", "key ID", "distance (around circle of fifths)"}},
    {KnownType::SEARCH_MENU, "search by substring request", {"r:m:s:t", "sort", "search string byte size", "search string (must be uppercase)", "unknown (0)"}},
    {KnownType::TRACK_MENU_FOR_GENRE_ARTIST_AND_ALBUM, "track menu for genre, artist and album request", {"r:m:s:t", "sort", "genre ID", "artist ID, or -1 for ALL", "album ID, or -1 for ALL"}},
    {KnownType::ORIGINAL_ARTIST_MENU_REQ, "original artist menu request", {"r:m:s:t", "sort order"}},
    {KnownType::TRACK_MENU_FOR_LABEL_ARTIST_AND_ALBUM, "track menu for label, artist and album request", {"r:m:s:t", "sort", "label ID", "artist ID, or -1 for ALL", "album ID, or -1 for ALL"}},
    {KnownType::ALBUM_MENU_FOR_ORIGINAL_ARTIST_REQ, "album menu for original artist request", {"r:m:s:t", "sort", "artist ID"}},
    {KnownType::TRACK_MENU_FOR_ORIGINAL_ARTIST_AND_ALBUM, "track menu for original artist and album request", {"r:m:s:t", "sort", "artist ID", "album ID, or -1 for ALL"}},
    {KnownType::REMIXER_MENU_REQ, "remixer menu request", {"r:m:s:t", "sort order"}},
    {KnownType::ALBUM_MENU_FOR_REMIXER_REQ, "album menu for remixer request", {"r:m:s:t", "sort", "artist ID"}},
    {KnownType::TRACK_MENU_FOR_REMIXER_AND_ALBUM, "track menu for remixer and album request", {"r:m:s:t", "sort", "artist ID", "album ID, or -1 for ALL"}},
    {KnownType::REKORDBOX_METADATA_REQ, "rekordbox track metadata request", {"r:m:s:t", "rekordbox id"}},
    {KnownType::ALBUM_ART_REQ, "album art request", {"r:m:s:t", "artwork id"}},
    {KnownType::WAVE_PREVIEW_REQ, "track waveform preview request", {"r:m:s:t", "unknown (4)", "rekordbox id", "unknown (0)"}},
    {KnownType::FOLDER_MENU_REQ, "folder menu request", {"r:m:s:t", "sort order?", "folder id (-1 for root)", "unknown (0)"}},
    {KnownType::CUE_LIST_REQ, "track cue list request", {"r:m:s:t", "rekordbox id"}},
    {KnownType::UNANALYZED_METADATA_REQ, "unanalyzed track metadata request", {"r:m:s:t", "track number"}},
    {KnownType::BEAT_GRID_REQ, "beat grid request", {"r:m:s:t", "rekordbox id"}},
    {KnownType::WAVE_DETAIL_REQ, "track waveform detail request", {"r:m:s:t", "rekordbox id"}},
    {KnownType::CUE_LIST_EXT_REQ, "track extended cue list request", {"r:m:s:t", "rekordbox id", "unknown (0)"}},
    {KnownType::ANLZ_TAG_REQ, "anlz file tag content request", {"r:m:s:t", "rekordbox id", "tag type", "file extension"}},
    {KnownType::RENDER_MENU_REQ, "render items from last requested menu", {"r:m:s:t", "offset", "limit", "unknown (0)", "len_a (=limit)?", "unknown (0)"}},
    {KnownType::MENU_AVAILABLE, "requested menu is available", {"request type", "# items available"}},
    {KnownType::MENU_HEADER, "rendered menu header", {}},
    {KnownType::ALBUM_ART, "album art", {"request type", "unknown (0)", "image length", "image bytes"}},
    {KnownType::UNAVAILABLE, "requested media unavailable", {"request type"}},
    {KnownType::MENU_ITEM, "rendered menu item", {"numeric 1 (parent id, e.g. artist for track)", "numeric 2 (this id)", "label 1 byte size", "label 1", "label 2 byte size", "label 2", "item type", "flags? byte 3 is 1 when track played", "album art id", "playlist position"}},
    {KnownType::MENU_FOOTER, "rendered menu footer", {}},
    {KnownType::WAVE_PREVIEW, "track waveform preview", {"request type", "unknown (0)", "waveform length", "waveform bytes"}},
    {KnownType::BEAT_GRID, "beat grid", {"request type", "unknown (0)", "beat grid length", "beat grid bytes", "unknown (0)"}},
    {KnownType::CUE_LIST, "memory points, loops, and hot cues", {"request type", "unknown", "blob 1 length", "blob 1", "unknown (0x24)", "unknown", "unknown", "blob 2 length", "blob 2"}},
    {KnownType::WAVE_DETAIL, "track waveform detail", {"request type", "unknown (0)", "waveform length", "waveform bytes"}},
    {KnownType::CUE_LIST_EXT, "extended memory points, loops, and hot cues", {"request type", "unknown (0)", "blob length", "blob", "entry count"}},
    {KnownType::ANLZ_TAG, "anlz file tag content", {"request type", "unknown (0)", "tag length", "tag bytes", "unknown (1)"}}
};

const std::vector<Message::MenuItemTypeInfo> MENU_ITEM_TYPES = {
    {MenuItemType::FOLDER, "FOLDER"},
    {MenuItemType::ALBUM_TITLE, "ALBUM_TITLE"},
    {MenuItemType::DISC, "DISC"},
    {MenuItemType::TRACK_TITLE, "TRACK_TITLE"},
    {MenuItemType::GENRE, "GENRE"},
    {MenuItemType::ARTIST, "ARTIST"},
    {MenuItemType::PLAYLIST, "PLAYLIST"},
    {MenuItemType::RATING, "RATING"},
    {MenuItemType::DURATION, "DURATION"},
    {MenuItemType::TEMPO, "TEMPO"},
    {MenuItemType::LABEL, "LABEL"},
    {MenuItemType::KEY, "KEY"},
    {MenuItemType::BIT_RATE, "BIT_RATE"},
    {MenuItemType::YEAR, "YEAR"},
    {MenuItemType::COLOR_NONE, "COLOR_NONE"},
    {MenuItemType::COLOR_PINK, "COLOR_PINK"},
    {MenuItemType::COLOR_RED, "COLOR_RED"},
    {MenuItemType::COLOR_ORANGE, "COLOR_ORANGE"},
    {MenuItemType::COLOR_YELLOW, "COLOR_YELLOW"},
    {MenuItemType::COLOR_GREEN, "COLOR_GREEN"},
    {MenuItemType::COLOR_AQUA, "COLOR_AQUA"},
    {MenuItemType::COLOR_BLUE, "COLOR_BLUE"},
    {MenuItemType::COLOR_PURPLE, "COLOR_PURPLE"},
    {MenuItemType::COMMENT, "COMMENT"},
    {MenuItemType::HISTORY_PLAYLIST, "HISTORY_PLAYLIST"},
    {MenuItemType::ORIGINAL_ARTIST, "ORIGINAL_ARTIST"},
    {MenuItemType::REMIXER, "REMIXER"},
    {MenuItemType::DATE_ADDED, "DATE_ADDED"},
    {MenuItemType::GENRE_MENU, "GENRE_MENU"},
    {MenuItemType::ARTIST_MENU, "ARTIST_MENU"},
    {MenuItemType::ALBUM_MENU, "ALBUM_MENU"},
    {MenuItemType::TRACK_MENU, "TRACK_MENU"},
    {MenuItemType::PLAYLIST_MENU, "PLAYLIST_MENU"},
    {MenuItemType::BPM_MENU, "BPM_MENU"},
    {MenuItemType::RATING_MENU, "RATING_MENU"},
    {MenuItemType::YEAR_MENU, "YEAR_MENU"},
    {MenuItemType::REMIXER_MENU, "REMIXER_MENU"},
    {MenuItemType::LABEL_MENU, "LABEL_MENU"},
    {MenuItemType::ORIGINAL_ARTIST_MENU, "ORIGINAL_ARTIST_MENU"},
    {MenuItemType::KEY_MENU, "KEY_MENU"},
    {MenuItemType::DATE_ADDED_MENU, "DATE_ADDED_MENU"},
    {MenuItemType::COLOR_MENU, "COLOR_MENU"},
    {MenuItemType::FOLDER_MENU, "FOLDER_MENU"},
    {MenuItemType::SEARCH_MENU, "SEARCH_MENU"},
    {MenuItemType::TIME_MENU, "TIME_MENU"},
    {MenuItemType::BIT_RATE_MENU, "BIT_RATE_MENU"},
    {MenuItemType::FILENAME_MENU, "FILENAME_MENU"},
    {MenuItemType::HISTORY_MENU, "HISTORY_MENU"},
    {MenuItemType::HOT_CUE_BANK_MENU, "HOT_CUE_BANK_MENU"},
    {MenuItemType::ALL, "ALL"},
    {MenuItemType::TRACK_TITLE_AND_ALBUM, "TRACK_TITLE_AND_ALBUM"},
    {MenuItemType::TRACK_TITLE_AND_GENRE, "TRACK_TITLE_AND_GENRE"},
    {MenuItemType::TRACK_TITLE_AND_ARTIST, "TRACK_TITLE_AND_ARTIST"},
    {MenuItemType::TRACK_TITLE_AND_RATING, "TRACK_TITLE_AND_RATING"},
    {MenuItemType::TRACK_TITLE_AND_TIME, "TRACK_TITLE_AND_TIME"},
    {MenuItemType::TRACK_TITLE_AND_BPM, "TRACK_TITLE_AND_BPM"},
    {MenuItemType::TRACK_TITLE_AND_LABEL, "TRACK_TITLE_AND_LABEL"},
    {MenuItemType::TRACK_TITLE_AND_KEY, "TRACK_TITLE_AND_KEY"},
    {MenuItemType::TRACK_TITLE_AND_RATE, "TRACK_TITLE_AND_RATE"},
    {MenuItemType::TRACK_LIST_ENTRY_BY_COLOR, "TRACK_LIST_ENTRY_BY_COLOR"},
    {MenuItemType::TRACK_TITLE_AND_COMMENT, "TRACK_TITLE_AND_COMMENT"},
    {MenuItemType::TRACK_TITLE_AND_ORIGINAL_ARTIST, "TRACK_TITLE_AND_ORIGINAL_ARTIST"},
    {MenuItemType::TRACK_TITLE_AND_REMIXER, "TRACK_TITLE_AND_REMIXER"},
    {MenuItemType::TRACK_TITLE_AND_DJ_PLAY_COUNT, "TRACK_TITLE_AND_DJ_PLAY_COUNT"},
    {MenuItemType::TRACK_TITLE_AND_DATE_ADDED, "TRACK_TITLE_AND_DATE_ADDED"}
};

template <typename T>
std::shared_ptr<T> readExpected(DataReader& reader, const char* what) {
    auto field = std::dynamic_pointer_cast<T>(Field::read(reader));
    if (!field) {
        throw ProtocolError(fmt::format("Did not find expected field type reading {} of message", what));
    }
    return field;
}

} // namespace

const std::unordered_map<uint16_t, KnownType> Message::KNOWN_TYPE_MAP = []() {
    std::unordered_map<uint16_t, KnownType> map;
    for (const auto& entry : KNOWN_TYPES) {
        map.emplace(entry.protocolValue(), entry.type);
    }
    return map;
}();

const std::unordered_map<uint32_t, MenuItemType> Message::MENU_ITEM_TYPE_MAP = []() {
    std::unordered_map<uint32_t, MenuItemType> map;
    for (const auto& entry : MENU_ITEM_TYPES) {
        map.emplace(static_cast<uint32_t>(entry.type), entry.type);
    }
    return map;
}();

Message::Message(int64_t transactionValue, int64_t messageTypeValue, std::vector<FieldPtr> args)
    : Message(NumberField(transactionValue, 4), NumberField(messageTypeValue, 2), std::move(args))
{
}

Message::Message(int64_t transactionValue, KnownType type, std::vector<FieldPtr> args)
    : Message(transactionValue, static_cast<int64_t>(type), std::move(args))
{
}

Message::Message(const NumberField& transactionField, const NumberField& messageTypeField,
                 std::vector<FieldPtr> args)
    : transaction(transactionField)
    , messageType(messageTypeField)
    , argumentCount(NumberField(static_cast<int64_t>(args.size()), 1))
    , arguments(std::move(args))
{
    if (transaction.getSize() != 4) {
        throw std::invalid_argument("Message transaction sequence number must be 4 bytes long");
    }
    if (messageType.getSize() != 2) {
        throw std::invalid_argument("Message type must be 2 bytes long");
    }
    if (arguments.size() > MAX_ARGUMENTS) {
        throw std::invalid_argument("Messages cannot have more than 12 arguments");
    }
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (!arguments[i]) {
            throw std::invalid_argument("Message arguments cannot be null");
        }
        if (followsZeroNumber(arguments, i) && arguments[i]->getSize() != 0) {
            throw std::invalid_argument(fmt::format(
                "Blob argument {} follows a zero number, so it must be empty", i + 1));
        }
    }

    auto known = KNOWN_TYPE_MAP.find(static_cast<uint16_t>(messageType.getValue()));
    if (known != KNOWN_TYPE_MAP.end()) {
        knownType = known->second;
    }

    std::vector<uint8_t> argTags(MAX_ARGUMENTS, 0);
    for (size_t i = 0; i < arguments.size(); ++i) {
        argTags[i] = arguments[i]->getArgumentTag();
    }

    fields.reserve(arguments.size() + 5);
    fields.push_back(std::make_shared<NumberField>(MESSAGE_START));
    fields.push_back(std::make_shared<NumberField>(transaction));
    fields.push_back(std::make_shared<NumberField>(messageType));
    fields.push_back(std::make_shared<NumberField>(argumentCount));
    fields.push_back(std::make_shared<BinaryField>(std::move(argTags)));
    fields.insert(fields.end(), arguments.begin(), arguments.end());
}

Message Message::read(DataReader& reader) {
    auto start = readExpected<NumberField>(reader, "start");
    if (start->getSize() != 4) {
        throw ProtocolError("Number field to start message must be of size 4");
    }
    if (start->getValue() != MESSAGE_START.getValue()) {
        throw ProtocolError(fmt::format("Number field had wrong value to start message: 0x{:08x}", start->getValue()));
    }

    auto transactionNumber = readExpected<NumberField>(reader, "transaction ID");
    if (transactionNumber->getSize() != 4) {
        throw ProtocolError("Transaction ID of message must be of size 4");
    }

    auto typeNumber = readExpected<NumberField>(reader, "type");
    if (typeNumber->getSize() != 2) {
        throw ProtocolError("Type of message must be of size 2");
    }

    auto argCountNumber = readExpected<NumberField>(reader, "argument count");
    if (argCountNumber->getSize() != 1) {
        throw ProtocolError("Argument count of message must be of size 1");
    }
    const auto argCount = static_cast<size_t>(argCountNumber->getValue());
    if (argCount > MAX_ARGUMENTS) {
        throw ProtocolError(fmt::format("Illegal argument count while reading message: {}", argCount));
    }

    auto argTypes = readExpected<BinaryField>(reader, "argument types");
    auto argTags = argTypes->getValue();
    if (argTags.size() != MAX_ARGUMENTS) {
        throw ProtocolError(fmt::format("Argument tag blob must be 12 bytes long, found {}", argTags.size()));
    }

    std::vector<FieldPtr> args;
    args.reserve(argCount);
    for (size_t i = 0; i < argCount; ++i) {
        // An empty blob is sent as nothing at all, right after its zero length.
        if (argTags[i] == Field::ARGUMENT_TAG_BINARY && i > 0) {
            auto lastNumber = std::dynamic_pointer_cast<NumberField>(args.back());
            if (lastNumber && lastNumber->getValue() == 0) {
                args.push_back(std::make_shared<BinaryField>(std::vector<uint8_t>{}));
                continue;
            }
        }
        auto arg = Field::read(reader);
        if (arg->getArgumentTag() != argTags[i]) {
            throw ProtocolError(fmt::format("Found argument {} of wrong type reading message: expected tag 0x{:02x}, got 0x{:02x}",
                                            i + 1, argTags[i], arg->getArgumentTag()));
        }
        args.push_back(std::move(arg));
    }

    return Message(*transactionNumber, *typeNumber, std::move(args));
}

std::string Message::describeArgument(size_t index) const {
    std::string description = "unknown";
    if (!knownType) {
        return description;
    }
    const auto* info = getKnownTypeInfo(*knownType);
    if (info && index < info->arguments.size()) {
        description = info->arguments[index];
    }
    if (*knownType == KnownType::MENU_ITEM && index == 6 && index < arguments.size()) {
        if (auto num = std::dynamic_pointer_cast<NumberField>(arguments[index])) {
            const auto itemType = lookupMenuItemType(num->getValue());
            if (itemType != MenuItemType::UNKNOWN) {
                description += ": " + getMenuItemTypeName(itemType);
            }
        }
    }
    return description;
}

std::string Message::toString() const {
    const auto* info = knownType ? getKnownTypeInfo(*knownType) : nullptr;
    std::string result = fmt::format("Message: [transaction: {}, type: 0x{:04x} ({}), arg count: {}, arguments:\n",
                                     transaction.getValue(), messageType.getValue(),
                                     info ? info->description : "unknown", argumentCount.getValue());

    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& arg = arguments[i];
        result += fmt::format("{:4d}: ", i + 1);
        if (auto num = std::dynamic_pointer_cast<NumberField>(arg)) {
            result += fmt::format("number: {:10d} (0x{:08x})", num->getValue(), num->getValue());
        } else if (auto bin = std::dynamic_pointer_cast<BinaryField>(arg)) {
            result += fmt::format("blob length {}:", bin->getSize());
            for (auto b : bin->getValue()) {
                result += fmt::format(" {:02x}", b);
            }
        } else if (auto str = std::dynamic_pointer_cast<StringField>(arg)) {
            result += fmt::format("string length {}: \"{}\"", str->getSize(), str->getValue());
        } else {
            result += "unknown: " + arg->toString();
        }
        result += fmt::format(" [{}]\n", describeArgument(i));
    }
    result += "]";
    return result;
}

int64_t Message::getMenuResultsCount() const {
    if (!isType(KnownType::MENU_AVAILABLE)) {
        throw std::invalid_argument("getMenuResultsCount() can only be used with MENU_AVAILABLE responses.");
    }
    return getNumberArgument(1);
}

Message::MenuItemType Message::getMenuItemType() const {
    if (!isType(KnownType::MENU_ITEM)) {
        throw std::invalid_argument("getMenuItemType() can only be used with MENU_ITEM responses.");
    }
    return lookupMenuItemType(getNumberArgument(6));
}

bool Message::isTrackListEntry() const {
    if (!isType(KnownType::MENU_ITEM) || arguments.size() < 7) {
        return false;
    }
    auto num = std::dynamic_pointer_cast<NumberField>(arguments[6]);
    if (!num) {
        return false;
    }
    // Every track row has 04 in its low byte; the high byte names the second column shown.
    const auto itemType = lookupMenuItemType(num->getValue());
    return itemType != MenuItemType::UNKNOWN && (static_cast<uint32_t>(itemType) & 0xff) == 0x04;
}

int64_t Message::getNumberArgument(size_t index) const {
    if (index >= arguments.size()) {
        throw ProtocolError(fmt::format("Message has no argument {}", index + 1));
    }
    auto num = std::dynamic_pointer_cast<NumberField>(arguments[index]);
    if (!num) {
        throw ProtocolError(fmt::format("Argument {} ({}) is not a number", index + 1, describeArgument(index)));
    }
    return num->getValue();
}

const std::string& Message::getStringArgument(size_t index) const {
    if (index >= arguments.size()) {
        throw ProtocolError(fmt::format("Message has no argument {}", index + 1));
    }
    auto str = std::dynamic_pointer_cast<StringField>(arguments[index]);
    if (!str) {
        throw ProtocolError(fmt::format("Argument {} ({}) is not a string", index + 1, describeArgument(index)));
    }
    return str->getValue();
}

std::vector<uint8_t> Message::getBinaryArgument(size_t index) const {
    if (index >= arguments.size()) {
        throw ProtocolError(fmt::format("Message has no argument {}", index + 1));
    }
    auto bin = std::dynamic_pointer_cast<BinaryField>(arguments[index]);
    if (!bin) {
        throw ProtocolError(fmt::format("Argument {} ({}) is not a blob", index + 1, describeArgument(index)));
    }
    return bin->getValueAsArray();
}

std::vector<uint8_t> Message::toBytes() const {
    std::vector<uint8_t> combined;
    const size_t headerCount = fields.size() - arguments.size();
    for (size_t i = 0; i < headerCount; ++i) {
        fields[i]->appendTo(combined);
    }
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (!followsZeroNumber(arguments, i)) {
            arguments[i]->appendTo(combined);
        }
    }
    return combined;
}

bool Message::followsZeroNumber(const std::vector<FieldPtr>& args, size_t index) {
    if (index == 0 || index >= args.size() || args[index]->getArgumentTag() != Field::ARGUMENT_TAG_BINARY) {
        return false;
    }
    auto lastNumber = std::dynamic_pointer_cast<NumberField>(args[index - 1]);
    return lastNumber && lastNumber->getValue() == 0;
}

void Message::write(asio::ip::tcp::socket& socket) const {
    const auto bytes = toBytes();
    asio::write(socket, asio::buffer(bytes.data(), bytes.size()));
}

const Message::KnownTypeInfo* Message::getKnownTypeInfo(KnownType type) {
    for (const auto& entry : KNOWN_TYPES) {
        if (entry.type == type) {
            return &entry;
        }
    }
    return nullptr;
}

Message::MenuItemType Message::lookupMenuItemType(int64_t rawValue) {
    auto match = MENU_ITEM_TYPE_MAP.find(static_cast<uint32_t>(rawValue & 0xffff));
    if (match == MENU_ITEM_TYPE_MAP.end()) {
        return MenuItemType::UNKNOWN;
    }
    return match->second;
}

std::string Message::getMenuItemTypeName(MenuItemType type) {
    for (const auto& entry : MENU_ITEM_TYPES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

} // namespace cdjmeta::dbserver
