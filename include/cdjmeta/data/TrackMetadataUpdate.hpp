#pragma once

#include <fmt/format.h>

#include <string>

#include "TrackMetadata.hpp"

namespace cdjmeta::data {

/**
 * Reports the metadata now known for a player. A null metadata pointer means
 * the player has no track loaded, or the track is not known yet.
 */
class TrackMetadataUpdate {
public:
    TrackMetadataUpdate(int player, TrackMetadataPtr metadata)
        : player(player)
        , metadata(std::move(metadata))
    {
    }

    std::string toString() const {
        return fmt::format("TrackMetadataUpdate[player:{}, metadata:{}]", player,
                           metadata ? metadata->toString() : std::string("null"));
    }

    int player;
    TrackMetadataPtr metadata;
};

} // namespace cdjmeta::data
