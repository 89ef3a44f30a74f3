#include "cdjmeta/data/BeatGrid.hpp"

#include "cdjmeta/Util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace cdjmeta::data {

namespace {
constexpr size_t kHeaderSize = 20;
constexpr size_t kEntrySize = 16;
}

BeatGrid::BeatGrid(DataReference reference, const dbserver::Message& message)
    : dataReference_(std::move(reference))
    , rawData_(message.getBinaryArgument(3))
{
    parseData();
}

BeatGrid::BeatGrid(DataReference reference, std::span<const uint8_t> buffer)
    : dataReference_(std::move(reference))
    , rawData_(buffer.begin(), buffer.end())
{
    parseData();
}

void BeatGrid::parseData() {
    const size_t beatCount = (rawData_.size() > kHeaderSize) ? (rawData_.size() - kHeaderSize) / kEntrySize : 0;
    beatWithinBarValues_.resize(beatCount);
    bpmValues_.resize(beatCount);
    timeWithinTrackValues_.resize(beatCount);
    for (size_t beat = 0; beat < beatCount; ++beat) {
        const size_t base = kHeaderSize + beat * kEntrySize;
        beatWithinBarValues_[beat] = static_cast<int>(Util::bytesToNumberLittleEndian(rawData_.data(), base, 2));
        bpmValues_[beat] = static_cast<int>(Util::bytesToNumberLittleEndian(rawData_.data(), base + 2, 2));
        timeWithinTrackValues_[beat] = Util::bytesToNumberLittleEndian(rawData_.data(), base + 4, 4);
    }
}

int BeatGrid::beatOffset(int beatNumber) const {
    const int count = getBeatCount();
    if (count == 0) {
        throw std::logic_error("There are no beats in this beat grid.");
    }
    if (beatNumber < 1) {
        return 0;
    }
    if (beatNumber > count) {
        return count - 1;
    }
    return beatNumber - 1;
}

int64_t BeatGrid::getTimeWithinTrack(int beatNumber) const {
    if (beatNumber == 0) {
        return 0;
    }
    return timeWithinTrackValues_[beatOffset(beatNumber)];
}

int BeatGrid::getBeatWithinBar(int beatNumber) const {
    return beatWithinBarValues_[beatOffset(beatNumber)];
}

int BeatGrid::getBpm(int beatNumber) const {
    return bpmValues_[beatOffset(beatNumber)];
}

int BeatGrid::getBarNumber(int beatNumber) const {
    // A grid whose first beat is not a downbeat starts with a partial bar, numbered -1.
    const int offset = getBeatWithinBar(1) - 1;
    const int bar = (offset + beatOffset(beatNumber)) / 4;
    if (offset == 0) {
        return bar + 1;
    }
    if (bar == 0) {
        return -1;
    }
    return bar;
}

int BeatGrid::findBeatAtTime(int64_t milliseconds) const {
    auto it = std::lower_bound(timeWithinTrackValues_.begin(), timeWithinTrackValues_.end(), milliseconds);
    if (it != timeWithinTrackValues_.end() && *it == milliseconds) {
        return static_cast<int>(std::distance(timeWithinTrackValues_.begin(), it)) + 1;
    }
    if (it == timeWithinTrackValues_.begin()) {
        return -1;
    }
    return static_cast<int>(std::distance(timeWithinTrackValues_.begin(), it));
}

std::string BeatGrid::toString() const {
    return fmt::format("BeatGrid[dataReference:{}, beats:{}]", dataReference_.toString(), getBeatCount());
}

} // namespace cdjmeta::data
