#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "DataReference.hpp"
#include "cdjmeta/dbserver/Message.hpp"

namespace cdjmeta::data {

/**
 * The beats of a track as analyzed by rekordbox. The raw blob has a twenty
 * byte header followed by one sixteen byte little-endian entry per beat: the
 * beat within its bar, the tempo at that beat (bpm times 100), and the time
 * of the beat in milliseconds.
 */
class BeatGrid {
public:
    /**
     * Parse the blob carried as the fourth argument of a BEAT_GRID response.
     *
     * @throws ProtocolError if the response has no such blob
     */
    BeatGrid(DataReference reference, const dbserver::Message& message);

    BeatGrid(DataReference reference, std::span<const uint8_t> buffer);

    /**
     * The bytes exactly as received, so they can be written to a metadata cache.
     */
    std::span<const uint8_t> getRawData() const { return rawData_; }

    const DataReference& getDataReference() const { return dataReference_; }

    int getBeatCount() const { return static_cast<int>(beatWithinBarValues_.size()); }

    /**
     * Milliseconds into the track at which a beat occurs. Beat 0 is the start
     * of the track; beat numbers outside the grid are clamped to it.
     *
     * @throws std::logic_error if the grid has no beats
     */
    int64_t getTimeWithinTrack(int beatNumber) const;

    /**
     * @throws std::logic_error if the grid has no beats
     */
    int getBeatWithinBar(int beatNumber) const;

    /**
     * @throws std::logic_error if the grid has no beats
     */
    int getBpm(int beatNumber) const;

    int getBarNumber(int beatNumber) const;

    /**
     * The beat that is playing at a given time, or -1 if the time falls
     * before the first beat.
     */
    int findBeatAtTime(int64_t milliseconds) const;

    std::string toString() const;

private:
    int beatOffset(int beatNumber) const;
    void parseData();

    DataReference dataReference_;
    std::vector<uint8_t> rawData_;
    std::vector<int> beatWithinBarValues_;
    std::vector<int> bpmValues_;
    std::vector<int64_t> timeWithinTrackValues_;
};

using BeatGridPtr = std::shared_ptr<const BeatGrid>;

} // namespace cdjmeta::data
