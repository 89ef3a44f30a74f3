#include "cdjmeta/CdjStatus.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace cdjmeta {

namespace {

TrackSourceSlot slotFromByte(uint8_t value) {
    switch (value) {
        case 0: return TrackSourceSlot::NO_TRACK;
        case 1: return TrackSourceSlot::CD_SLOT;
        case 2: return TrackSourceSlot::SD_SLOT;
        case 3: return TrackSourceSlot::USB_SLOT;
        case 4: return TrackSourceSlot::COLLECTION;
        case 7: return TrackSourceSlot::USB_2_SLOT;
        default: return TrackSourceSlot::UNKNOWN;
    }
}

TrackType trackTypeFromByte(uint8_t value) {
    switch (value) {
        case 0: return TrackType::NO_TRACK;
        case 1: return TrackType::REKORDBOX;
        case 2: return TrackType::UNANALYZED;
        case 5: return TrackType::CD_DIGITAL_AUDIO;
        default: return TrackType::UNKNOWN;
    }
}

} // namespace

const char* toString(TrackSourceSlot slot) noexcept {
    switch (slot) {
        case TrackSourceSlot::NO_TRACK: return "NO_TRACK";
        case TrackSourceSlot::CD_SLOT: return "CD_SLOT";
        case TrackSourceSlot::SD_SLOT: return "SD_SLOT";
        case TrackSourceSlot::USB_SLOT: return "USB_SLOT";
        case TrackSourceSlot::COLLECTION: return "COLLECTION";
        case TrackSourceSlot::USB_2_SLOT: return "USB_2_SLOT";
        case TrackSourceSlot::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(TrackType type) noexcept {
    switch (type) {
        case TrackType::NO_TRACK: return "NO_TRACK";
        case TrackType::REKORDBOX: return "REKORDBOX";
        case TrackType::UNANALYZED: return "UNANALYZED";
        case TrackType::CD_DIGITAL_AUDIO: return "CD_DIGITAL_AUDIO";
        case TrackType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::optional<CdjStatus> CdjStatus::create(std::span<const uint8_t> data,
                                           const asio::ip::address_v4& senderAddress) {
    if (data.size() < MIN_PACKET_SIZE) {
        return std::nullopt;
    }
    return CdjStatus(data, senderAddress);
}

CdjStatus::CdjStatus(std::span<const uint8_t> data, const asio::ip::address_v4& senderAddress)
    : DeviceUpdate(data, senderAddress)
{
    trackSourcePlayer_ = data[TRACK_SOURCE_PLAYER_OFFSET];
    trackSourceSlot_ = slotFromByte(data[TRACK_SOURCE_SLOT_OFFSET]);
    trackType_ = trackTypeFromByte(data[TRACK_TYPE_OFFSET]);
    rekordboxId_ = static_cast<int>(Util::bytesToNumber(data.data(), REKORDBOX_ID_OFFSET, 4));
}

std::string CdjStatus::toString() const {
    return fmt::format("CdjStatus: Device {}, name: {}, address: {}, track: player {} {} {} id {}, usb: {}, sd: {}",
                       deviceNumber_, deviceName_, address_.to_string(), trackSourcePlayer_,
                       cdjmeta::toString(trackSourceSlot_), cdjmeta::toString(trackType_), rekordboxId_,
                       packetBytes_[LOCAL_USB_STATE], packetBytes_[LOCAL_SD_STATE]);
}

CdjStatus::Builder& CdjStatus::Builder::deviceNumber(int number) {
    deviceNumber_ = number;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::deviceName(const std::string& name) {
    deviceName_ = name;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::address(const asio::ip::address_v4& address) {
    address_ = address;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::trackSource(int player, TrackSourceSlot slot) {
    sourcePlayer_ = player;
    slot_ = slot;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::trackType(TrackType type) {
    trackType_ = type;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::rekordboxId(int id) {
    rekordboxId_ = id;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::usbState(uint8_t state) {
    usbState_ = state;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::sdState(uint8_t state) {
    sdState_ = state;
    return *this;
}

CdjStatus::Builder& CdjStatus::Builder::rekordboxTrack(int player, TrackSourceSlot slot, int id) {
    return trackSource(player, slot).trackType(TrackType::REKORDBOX).rekordboxId(id);
}

CdjStatus CdjStatus::Builder::build() const {
    std::vector<uint8_t> packet(0xd4, 0);
    const auto nameLength = std::min(deviceName_.size(), DEVICE_NAME_LENGTH);
    std::copy_n(deviceName_.begin(), nameLength, packet.begin() + DEVICE_NAME_OFFSET);
    packet[DEVICE_NUMBER_OFFSET] = static_cast<uint8_t>(deviceNumber_);
    packet[TRACK_SOURCE_PLAYER_OFFSET] = static_cast<uint8_t>(sourcePlayer_);
    packet[TRACK_SOURCE_SLOT_OFFSET] = static_cast<uint8_t>(slot_);
    packet[TRACK_TYPE_OFFSET] = static_cast<uint8_t>(trackType_);
    Util::numberToBytes(rekordboxId_, packet.data(), REKORDBOX_ID_OFFSET, 4);
    packet[LOCAL_USB_STATE] = usbState_;
    packet[LOCAL_SD_STATE] = sdState_;
    return CdjStatus(packet, address_);
}

} // namespace cdjmeta
