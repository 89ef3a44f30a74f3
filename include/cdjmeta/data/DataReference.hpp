#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <string>

#include "cdjmeta/CdjStatus.hpp"

namespace cdjmeta::data {

/**
 * Identifies a rekordbox track by the player and slot holding its media.
 */
class DataReference {
public:
    DataReference(int player, TrackSourceSlot slot, int rekordboxId)
        : player_(player)
        , slot_(slot)
        , rekordboxId_(rekordboxId)
    {
    }

    int getPlayer() const { return player_; }
    TrackSourceSlot getSlot() const { return slot_; }
    int getRekordboxId() const { return rekordboxId_; }

    std::string toString() const {
        return fmt::format("DataReference[player:{}, slot:{}, rekordboxId:{}]",
                           player_, cdjmeta::toString(slot_), rekordboxId_);
    }

    bool operator==(const DataReference& other) const {
        return player_ == other.player_ && slot_ == other.slot_ && rekordboxId_ == other.rekordboxId_;
    }

    bool operator!=(const DataReference& other) const {
        return !(*this == other);
    }

    std::size_t hash() const {
        std::size_t scratch = 7;
        scratch = scratch * 31 + static_cast<std::size_t>(player_);
        scratch = scratch * 31 + static_cast<std::size_t>(slot_);
        return scratch * 31 + static_cast<std::size_t>(rekordboxId_);
    }

private:
    int player_;
    TrackSourceSlot slot_;
    int rekordboxId_;
};

struct DataReferenceHash {
    std::size_t operator()(const DataReference& ref) const {
        return ref.hash();
    }
};

} // namespace cdjmeta::data
