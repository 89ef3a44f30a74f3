#pragma once

#include "DeviceUpdate.hpp"

#include <optional>
#include <span>
#include <string>

namespace cdjmeta {

/**
 * The media slot a track was loaded from.
 */
enum class TrackSourceSlot : uint8_t {
    NO_TRACK = 0,
    CD_SLOT = 1,
    SD_SLOT = 2,
    USB_SLOT = 3,
    COLLECTION = 4,
    USB_2_SLOT = 7,
    UNKNOWN = 0xff
};

enum class TrackType : uint8_t {
    NO_TRACK = 0,
    REKORDBOX = 1,
    UNANALYZED = 2,
    CD_DIGITAL_AUDIO = 5,
    UNKNOWN = 0xff
};

const char* toString(TrackSourceSlot slot) noexcept;
const char* toString(TrackType type) noexcept;

/**
 * A status update sent by a player. Only the parts needed to follow which
 * track is loaded, and which media slots are mounted, are decoded.
 */
class CdjStatus : public DeviceUpdate {
public:
    static constexpr size_t TRACK_SOURCE_PLAYER_OFFSET = 0x28;
    static constexpr size_t TRACK_SOURCE_SLOT_OFFSET = 0x29;
    static constexpr size_t TRACK_TYPE_OFFSET = 0x2a;
    static constexpr size_t REKORDBOX_ID_OFFSET = 0x2c;
    static constexpr size_t LOCAL_USB_STATE = 0x6f;
    static constexpr size_t LOCAL_SD_STATE = 0x73;

    static constexpr uint8_t MEDIA_LOADED = 0;
    static constexpr uint8_t MEDIA_UNLOADING = 2;
    static constexpr uint8_t MEDIA_EMPTY = 4;

    /**
     * Minimum packet size for CDJ status.
     */
    static constexpr size_t MIN_PACKET_SIZE = 0xcc;

    /**
     * Parse a status packet, returning nothing if it is too short to be one.
     */
    [[nodiscard]] static std::optional<CdjStatus> create(std::span<const uint8_t> data,
                                                         const asio::ip::address_v4& senderAddress);

    /**
     * Assembles a status packet field by field, for replaying captured
     * sessions and for tests.
     */
    class Builder {
    public:
        Builder& deviceNumber(int number);
        Builder& deviceName(const std::string& name);
        Builder& address(const asio::ip::address_v4& address);
        Builder& trackSource(int player, TrackSourceSlot slot);
        Builder& trackType(TrackType type);
        Builder& rekordboxId(int id);
        Builder& usbState(uint8_t state);
        Builder& sdState(uint8_t state);

        /**
         * Shorthand for a rekordbox track loaded from the given player and slot.
         */
        Builder& rekordboxTrack(int player, TrackSourceSlot slot, int id);

        CdjStatus build() const;

    private:
        int deviceNumber_ = 1;
        std::string deviceName_ = "CDJ-2000NXS2";
        asio::ip::address_v4 address_ = asio::ip::make_address_v4("169.254.1.1");
        int sourcePlayer_ = 0;
        TrackSourceSlot slot_ = TrackSourceSlot::NO_TRACK;
        TrackType trackType_ = TrackType::NO_TRACK;
        int rekordboxId_ = 0;
        uint8_t usbState_ = MEDIA_EMPTY;
        uint8_t sdState_ = MEDIA_EMPTY;
    };

    int getTrackSourcePlayer() const { return trackSourcePlayer_; }
    TrackSourceSlot getTrackSourceSlot() const { return trackSourceSlot_; }
    TrackType getTrackType() const { return trackType_; }
    int getRekordboxId() const { return rekordboxId_; }

    bool isLocalUsbLoaded() const { return packetBytes_[LOCAL_USB_STATE] == MEDIA_LOADED; }
    bool isLocalUsbUnloading() const { return packetBytes_[LOCAL_USB_STATE] == MEDIA_UNLOADING; }
    bool isLocalUsbEmpty() const { return packetBytes_[LOCAL_USB_STATE] == MEDIA_EMPTY; }

    bool isLocalSdLoaded() const { return packetBytes_[LOCAL_SD_STATE] == MEDIA_LOADED; }
    bool isLocalSdUnloading() const { return packetBytes_[LOCAL_SD_STATE] == MEDIA_UNLOADING; }
    bool isLocalSdEmpty() const { return packetBytes_[LOCAL_SD_STATE] == MEDIA_EMPTY; }

    bool isTrackLoaded() const { return trackType_ != TrackType::NO_TRACK; }

    std::string toString() const override;

private:
    CdjStatus(std::span<const uint8_t> data, const asio::ip::address_v4& senderAddress);

    int trackSourcePlayer_ = 0;
    TrackSourceSlot trackSourceSlot_ = TrackSourceSlot::NO_TRACK;
    TrackType trackType_ = TrackType::NO_TRACK;
    int rekordboxId_ = 0;
};

} // namespace cdjmeta
