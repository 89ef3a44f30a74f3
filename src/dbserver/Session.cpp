#include "cdjmeta/dbserver/Session.hpp"

namespace cdjmeta::dbserver {

NumberField Session::buildRMST(int requestingPlayer, Message::MenuIdentifier targetMenu,
                               TrackSourceSlot slot, TrackType trackType) {
    const int64_t value =
        (static_cast<int64_t>(requestingPlayer & 0xff) << 24) |
        (static_cast<int64_t>(static_cast<uint8_t>(targetMenu)) << 16) |
        (static_cast<int64_t>(static_cast<uint8_t>(slot)) << 8) |
        static_cast<int64_t>(static_cast<uint8_t>(trackType));
    return NumberField(value, 4);
}

} // namespace cdjmeta::dbserver
