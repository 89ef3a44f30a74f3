/**
 * @file test_metadata_finder.cpp
 * @brief Unit tests for MetadataFinder status processing, caches and listeners
 */

#include <catch2/catch_all.hpp>
#include "TestSupport.hpp"
#include <cdjmeta/data/MetadataFinder.hpp>
#include <cdjmeta/data/ZipArchive.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace cdjmeta;
using namespace cdjmeta::data;

namespace {

asio::ip::address_v4 playerAddress(int player) {
    return asio::ip::make_address_v4(fmt::format("169.254.1.{}", player));
}

/**
 * A running-ready finder watching four players, with a listener recording
 * every metadata update it delivers.
 */
struct FinderFixture {
    DeviceRoster roster;
    test::FakeSessionProvider sessions;
    MetadataFinder finder{roster, sessions};

    mutable std::mutex updatesMutex;
    std::vector<TrackMetadataUpdate> updates;
    TrackMetadataListenerPtr recorder;

    FinderFixture() {
        for (int player = 1; player <= 4; ++player) {
            roster.deviceFound(DeviceAnnouncement(player, "CDJ-3000", playerAddress(player)));
        }
        recorder = std::make_shared<TrackMetadataCallbacks>([this](const TrackMetadataUpdate& update) {
            std::lock_guard<std::mutex> lock(updatesMutex);
            updates.push_back(update);
        });
        finder.addTrackMetadataListener(recorder);
    }

    ~FinderFixture() {
        sessions.openGate();
        finder.stop();
    }

    static CdjStatus status(int player, int sourcePlayer, TrackSourceSlot slot, int rekordboxId) {
        return CdjStatus::Builder()
            .deviceNumber(player)
            .address(playerAddress(player))
            .rekordboxTrack(sourcePlayer, slot, rekordboxId)
            .usbState(CdjStatus::MEDIA_LOADED)
            .sdState(CdjStatus::MEDIA_LOADED)
            .build();
    }

    static CdjStatus emptyStatus(int player, uint8_t usbState = CdjStatus::MEDIA_LOADED) {
        return CdjStatus::Builder()
            .deviceNumber(player)
            .address(playerAddress(player))
            .usbState(usbState)
            .sdState(CdjStatus::MEDIA_LOADED)
            .build();
    }

    std::vector<TrackMetadataUpdate> updatesFor(int player) const {
        std::lock_guard<std::mutex> lock(updatesMutex);
        std::vector<TrackMetadataUpdate> result;
        for (const auto& update : updates) {
            if (update.player == player) {
                result.push_back(update);
            }
        }
        return result;
    }

    void clearUpdates() {
        std::lock_guard<std::mutex> lock(updatesMutex);
        updates.clear();
    }

    bool waitForTitle(int player, const std::string& title) {
        return test::waitUntil([this, player, &title]() {
            auto metadata = finder.getLatestMetadataFor(player);
            return metadata && metadata->getTitle() == title;
        });
    }

    bool waitForIdle() {
        return test::waitUntil([this]() { return finder.getActiveRequests().empty(); });
    }
};

int countEntries(const std::string& path, const std::string& prefix) {
    ZipArchive archive;
    if (!archive.open(path)) {
        return -1;
    }
    const auto files = archive.listFiles();
    return static_cast<int>(std::count_if(files.begin(), files.end(), [&prefix](const std::string& name) {
        return name.rfind(prefix, 0) == 0;
    }));
}

void writeCache(const std::string& path, int rekordboxId, const std::string& title) {
    MetadataCacheWriter writer(path);
    writer.addMetadata(TrackMetadata(DataReference(0, TrackSourceSlot::USB_SLOT, rekordboxId),
                                     test::trackMetadataItems(rekordboxId, test::FakeTrack{title, 0})));
    writer.addBeatGrid(BeatGrid(DataReference(0, TrackSourceSlot::USB_SLOT, rekordboxId), test::beatGridBytes(12)));
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder lifecycle", "[MetadataFinder]") {
    SECTION("Latest metadata needs a running finder") {
        CHECK_THROWS_AS(finder.getLatestMetadata(), IllegalStateError);
        CHECK_THROWS_AS(finder.getLatestMetadataFor(1), IllegalStateError);
    }

    SECTION("Start and stop are announced once each") {
        std::vector<std::string> events;
        auto listener = std::make_shared<LifecycleCallbacks>(
            [&events](LifecycleParticipant&) { events.push_back("started"); },
            [&events](LifecycleParticipant&) { events.push_back("stopped"); });
        finder.addLifecycleListener(listener);

        finder.start();
        finder.start();
        CHECK(finder.isRunning());
        CHECK(finder.getLatestMetadata().empty());
        finder.stop();
        finder.stop();
        CHECK_FALSE(finder.isRunning());
        CHECK(events == std::vector<std::string>{"started", "stopped"});
        finder.removeLifecycleListener(listener);
    }

    SECTION("Updates delivered while stopped are ignored") {
        finder.getUpdateListener()->received(status(1, 1, TrackSourceSlot::USB_SLOT, 57));
        finder.start();
        CHECK(updatesFor(1).empty());
        CHECK(sessions.totalSessions() == 0);
    }

    SECTION("Stopping forgets metadata and reports it gone") {
        sessions.media(2).addTrack(57, {"Strobe", 9});
        finder.start();
        finder.handleUpdate(status(2, 2, TrackSourceSlot::USB_SLOT, 57));
        REQUIRE(waitForTitle(2, "Strobe"));
        clearUpdates();

        finder.stop();
        auto reported = updatesFor(2);
        REQUIRE(reported.size() == 1);
        CHECK_FALSE(reported[0].metadata);

        finder.start();
        CHECK(finder.getLatestMetadata().empty());
    }
}

TEST_CASE("MetadataFinder stops along with its session provider", "[MetadataFinder]") {
    DeviceRoster roster;
    test::StoppableSessionProvider sessions;
    MetadataFinder finder(roster, sessions);

    sessions.start();
    finder.start();
    CHECK(sessions.getLifecycleListeners().size() == 1);

    sessions.stop();
    CHECK_FALSE(finder.isRunning());
    CHECK(sessions.getLifecycleListeners().empty());
}

// =============================================================================
// Status updates
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder fetches metadata for loaded tracks", "[MetadataFinder]") {
    sessions.media(2).addTrack(57, {"Strobe", 9});
    finder.start();

    finder.getUpdateListener()->received(status(1, 2, TrackSourceSlot::USB_SLOT, 57));
    REQUIRE(waitForTitle(1, "Strobe"));
    CHECK(waitForIdle());

    auto metadata = finder.getLatestMetadataFor(1);
    CHECK(metadata->getTrackReference() == DataReference(2, TrackSourceSlot::USB_SLOT, 57));
    REQUIRE(metadata->getRawArtwork().has_value());
    CHECK(finder.getLatestMetadataFor(status(1, 2, TrackSourceSlot::USB_SLOT, 57)) == metadata);
    CHECK(finder.getLatestMetadata().size() == 1);
    CHECK(sessions.sessionsFor(2) == 1);

    auto reported = updatesFor(1);
    REQUIRE(reported.size() == 2);
    CHECK_FALSE(reported[0].metadata);
    CHECK(reported[1].metadata == metadata);
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder reports unloaded tracks", "[MetadataFinder]") {
    sessions.media(2).addTrack(57, {"Strobe", 9});
    finder.start();
    finder.handleUpdate(status(2, 2, TrackSourceSlot::USB_SLOT, 57));
    REQUIRE(waitForTitle(2, "Strobe"));
    REQUIRE(waitForIdle());
    clearUpdates();

    finder.handleUpdate(status(2, 2, TrackSourceSlot::USB_SLOT, 0));

    auto reported = updatesFor(2);
    REQUIRE(reported.size() == 1);
    CHECK_FALSE(reported[0].metadata);
    CHECK_FALSE(finder.getLatestMetadataFor(2));
    CHECK(finder.getLatestMetadata().count(2) == 0);
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder only fetches each new track once", "[MetadataFinder]") {
    sessions.media(3).addTrack(1001, {"Ghosts 'n' Stuff", 0});
    finder.start();
    const auto update = status(3, 3, TrackSourceSlot::USB_SLOT, 1001);

    sessions.closeGate();
    finder.handleUpdate(update);
    REQUIRE(sessions.waitForWaiting(1));
    CHECK(finder.getActiveRequests() == std::set<int>{3});

    finder.handleUpdate(update);
    CHECK(sessions.sessionsFor(3) == 1);

    sessions.openGate();
    REQUIRE(waitForTitle(3, "Ghosts 'n' Stuff"));
    REQUIRE(waitForIdle());

    finder.handleUpdate(update);
    CHECK(waitForIdle());
    CHECK(sessions.sessionsFor(3) == 1);
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder keeps the result of a fetch that was overtaken", "[MetadataFinder]") {
    sessions.media(2).addTrack(10, {"First", 0});
    sessions.media(2).addTrack(11, {"Second", 0});
    finder.start();

    sessions.closeGate();
    finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 10));
    REQUIRE(sessions.waitForWaiting(1));

    // The player has moved on, but a fetch from the same source player is still running.
    finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 11));
    sessions.openGate();
    REQUIRE(waitForIdle());
    REQUIRE(waitForTitle(1, "First"));
    CHECK(sessions.sessionsFor(2) == 1);

    // The next status update notices the difference.
    finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 11));
    CHECK(waitForTitle(1, "Second"));
    CHECK(waitForIdle());
    CHECK(sessions.sessionsFor(2) == 2);
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder ignores tracks it cannot look up", "[MetadataFinder]") {
    finder.start();

    SECTION("Non-rekordbox tracks") {
        auto cd = CdjStatus::Builder()
                      .deviceNumber(1)
                      .address(playerAddress(1))
                      .trackSource(1, TrackSourceSlot::CD_SLOT)
                      .trackType(TrackType::CD_DIGITAL_AUDIO)
                      .rekordboxId(3)
                      .build();
        finder.handleUpdate(cd);
        CHECK(finder.getActiveRequests().empty());
        CHECK(sessions.totalSessions() == 0);
        REQUIRE(updatesFor(1).size() == 1);
        CHECK_FALSE(updatesFor(1)[0].metadata);
    }

    SECTION("Tracks the player does not know") {
        sessions.media(2);
        finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 404));
        CHECK(waitForIdle());
        CHECK(sessions.sessionsFor(2) == 1);
        CHECK_FALSE(finder.getLatestMetadataFor(1));
    }

    SECTION("Players we cannot reach") {
        test::LogCapture logs;
        finder.handleUpdate(status(1, 4, TrackSourceSlot::USB_SLOT, 5));
        CHECK(waitForIdle());
        CHECK_FALSE(finder.getLatestMetadataFor(1));
        CHECK(logs.count(LogLevel::Error, "Problem requesting metadata") == 1);
    }
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder discards updates when its queue is full", "[MetadataFinder]") {
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool released = false;
    std::atomic<bool> entered{false};
    std::atomic<int> delivered{0};

    finder.removeTrackMetadataListener(recorder);
    finder.addTrackMetadataListener(std::make_shared<TrackMetadataCallbacks>([&](const TrackMetadataUpdate&) {
        entered = true;
        std::unique_lock<std::mutex> lock(gateMutex);
        gateCv.wait(lock, [&released]() { return released; });
        ++delivered;
    }));
    finder.start();

    test::LogCapture logs;
    finder.getUpdateListener()->received(emptyStatus(1));
    REQUIRE(test::waitUntil([&entered]() { return entered.load(); }));

    const int extra = 10;
    for (size_t i = 0; i < MetadataFinder::MAX_PENDING_UPDATES + extra; ++i) {
        finder.getUpdateListener()->received(emptyStatus(1));
    }
    CHECK(logs.count(LogLevel::Warning, "queue is backed up") == extra);

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        released = true;
    }
    gateCv.notify_all();
    CHECK(test::waitUntil([&delivered]() {
        return delivered.load() == static_cast<int>(MetadataFinder::MAX_PENDING_UPDATES) + 1;
    }));
    finder.stop();
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder isolates failing listeners", "[MetadataFinder]") {
    finder.removeTrackMetadataListener(recorder);
    finder.addTrackMetadataListener(std::make_shared<TrackMetadataCallbacks>([](const TrackMetadataUpdate&) {
        throw std::runtime_error("listener failure");
    }));
    finder.addTrackMetadataListener(recorder);
    finder.addTrackMetadataListener(recorder);
    CHECK(finder.getTrackMetadataListeners().size() == 2);
    finder.start();

    test::LogCapture logs;
    finder.handleUpdate(emptyStatus(2));
    CHECK(updatesFor(2).size() == 1);
    CHECK(logs.count(LogLevel::Warning, "Problem delivering track metadata update") == 1);
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder survives listeners throwing anything", "[MetadataFinder]") {
    sessions.media(2).addTrack(57, {"Strobe", 0});
    finder.addTrackMetadataListener(std::make_shared<TrackMetadataCallbacks>([](const TrackMetadataUpdate&) {
        throw 42;
    }));
    finder.addMetadataCacheListener(std::make_shared<MetadataCacheCallbacks>(
        [](const std::map<int, std::string>&, const std::map<int, std::string>&,
           const std::set<int>&, const std::set<int>&) {
            throw std::string("not an exception class");
        }));
    finder.start();

    test::LogCapture logs;
    finder.getUpdateListener()->received(emptyStatus(3));
    finder.getUpdateListener()->received(status(1, 2, TrackSourceSlot::USB_SLOT, 57));
    REQUIRE(waitForTitle(1, "Strobe"));
    CHECK(waitForIdle());

    CHECK(updatesFor(1).size() == 2);
    CHECK(logs.count(LogLevel::Warning, "unknown exception") >= 3);
    finder.stop();
}

TEST_CASE("MetadataFinder can be destroyed as soon as its fetches finish", "[MetadataFinder]") {
    DeviceRoster roster;
    for (int player = 1; player <= 2; ++player) {
        roster.deviceFound(DeviceAnnouncement(player, "CDJ-3000", playerAddress(player)));
    }
    test::FakeSessionProvider sessions;
    sessions.media(2).addTrack(57, {"Strobe", 0});

    for (int round = 0; round < 25; ++round) {
        auto finder = std::make_unique<MetadataFinder>(roster, sessions);
        finder->start();
        finder->handleUpdate(FinderFixture::status(1, 2, TrackSourceSlot::USB_SLOT, 57));
        REQUIRE(test::waitUntil([&finder]() { return finder->getLatestMetadataFor(1) != nullptr; }));
        // The fetch thread may still be finishing up here.
        finder.reset();
    }
}

// =============================================================================
// Passive mode
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder in passive mode", "[MetadataFinder]") {
    sessions.media(2).addTrack(57, {"Strobe", 9});
    finder.setPassive(true);
    finder.start();
    CHECK(finder.isPassive());

    SECTION("Players are not asked about loaded tracks") {
        finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 57));
        CHECK(waitForIdle());
        CHECK(sessions.totalSessions() == 0);
        CHECK_FALSE(finder.getLatestMetadataFor(1));
    }

    SECTION("Attached caches are still used") {
        test::TempPath path("passive");
        writeCache(path.str(), 57, "Cached Strobe");
        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, path.str());

        finder.handleUpdate(status(1, 2, TrackSourceSlot::USB_SLOT, 57));
        CHECK(waitForTitle(1, "Cached Strobe"));
        CHECK(sessions.totalSessions() == 0);
        finder.detachMetadataCache(2, TrackSourceSlot::USB_SLOT);
    }

    SECTION("Explicit requests still go to the player") {
        auto metadata = finder.requestMetadataFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(metadata);
        CHECK(metadata->getTitle() == "Strobe");
        CHECK(sessions.sessionsFor(2) == 1);
    }
}

// =============================================================================
// Explicit requests
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder explicit requests", "[MetadataFinder]") {
    auto& media = sessions.media(2);
    media.addTrack(57, {"Strobe", 9});
    media.addTrack(58, {"Raise Your Weapon", 0});
    media.beatGrids.erase(58);
    media.playlists[7] = {58, 57};

    SECTION("Metadata from a status update") {
        auto metadata = finder.requestMetadataFrom(status(1, 2, TrackSourceSlot::USB_SLOT, 57));
        REQUIRE(metadata);
        CHECK(metadata->getArtworkId() == 9);
        CHECK_FALSE(finder.requestMetadataFrom(emptyStatus(1)));
        CHECK(sessions.sessionsFor(2) == 1);
    }

    SECTION("Beat grids") {
        auto grid = finder.requestBeatGridFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(grid);
        CHECK(grid->getBeatCount() == 8);
        CHECK(grid->getDataReference() == DataReference(2, TrackSourceSlot::USB_SLOT, 57));

        test::LogCapture logs;
        CHECK_FALSE(finder.requestBeatGridFrom(2, TrackSourceSlot::USB_SLOT, 58));
        CHECK(logs.count(LogLevel::Error, "Unexpected response type") == 1);
    }

    SECTION("Beat grid failures propagate") {
        CHECK_THROWS_AS(finder.requestBeatGridFrom(3, TrackSourceSlot::USB_SLOT, 57), std::runtime_error);
    }

    SECTION("Playlist contents") {
        auto rows = finder.requestPlaylistItemsFrom(2, TrackSourceSlot::USB_SLOT, 0, 7, false);
        REQUIRE(rows.size() == 2);
        CHECK(rows[0].getNumberArgument(1) == 58);
        CHECK(rows[1].getStringArgument(3) == "Strobe");
        CHECK(finder.requestPlaylistItemsFrom(2, TrackSourceSlot::USB_SLOT, 0, 99, false).empty());
    }
}

// =============================================================================
// Attached caches and mounted media
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder attaching caches", "[MetadataFinder]") {
    test::TempPath first("first");
    test::TempPath second("second");
    test::TempPath bogus("bogus");
    writeCache(first.str(), 57, "From First");
    writeCache(second.str(), 57, "From Second");
    std::ofstream(bogus.str()) << "not a cache";

    SECTION("Only while running") {
        CHECK_THROWS_AS(finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str()), IllegalStateError);
    }

    finder.start();

    SECTION("Only for players we can see") {
        CHECK_THROWS_AS(finder.attachMetadataCache(5, TrackSourceSlot::USB_SLOT, first.str()), std::invalid_argument);
        roster.deviceLost(4);
        CHECK_THROWS_AS(finder.attachMetadataCache(4, TrackSourceSlot::USB_SLOT, first.str()), std::invalid_argument);
    }

    SECTION("Only for SD and USB slots") {
        CHECK_THROWS_AS(finder.attachMetadataCache(2, TrackSourceSlot::CD_SLOT, first.str()), std::invalid_argument);
        CHECK_FALSE(finder.getMetadataCache(2, TrackSourceSlot::CD_SLOT).has_value());
    }

    SECTION("Lookups use the attached cache") {
        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        CHECK(finder.getMetadataCache(2, TrackSourceSlot::USB_SLOT) == first.str());
        CHECK_FALSE(finder.getMetadataCache(2, TrackSourceSlot::SD_SLOT).has_value());

        auto metadata = finder.requestMetadataFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(metadata);
        CHECK(metadata->getTitle() == "From First");
        auto grid = finder.requestBeatGridFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(grid);
        CHECK(grid->getBeatCount() == 12);
        CHECK_FALSE(finder.requestMetadataFrom(2, TrackSourceSlot::USB_SLOT, 58));
        CHECK(sessions.totalSessions() == 0);
    }

    SECTION("A bad file leaves the attached cache alone") {
        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        CHECK_THROWS_AS(finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, bogus.str()), CacheFormatError);
        CHECK(finder.getMetadataCache(2, TrackSourceSlot::USB_SLOT) == first.str());
        auto metadata = finder.requestMetadataFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(metadata);
        CHECK(metadata->getTitle() == "From First");
    }

    SECTION("Attaching the same file again closes the old handle once") {
        const auto previous = Log::getLevel();
        Log::setLevel(LogLevel::Debug);
        test::LogCapture logs;

        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        auto original = finder.findCache(2, TrackSourceSlot::USB_SLOT);
        REQUIRE(original);
        CHECK(original->isOpen());

        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        auto replacement = finder.findCache(2, TrackSourceSlot::USB_SLOT);
        Log::setLevel(previous);

        REQUIRE(replacement);
        CHECK(replacement != original);
        CHECK(replacement->isOpen());
        CHECK_FALSE(original->isOpen());
        CHECK(logs.count(LogLevel::Debug, "Closed metadata cache") == 1);
        CHECK(finder.getMetadataCache(2, TrackSourceSlot::USB_SLOT) == first.str());
        auto metadata = finder.requestMetadataFrom(2, TrackSourceSlot::USB_SLOT, 57);
        REQUIRE(metadata);
        CHECK(metadata->getTitle() == "From First");
    }

    SECTION("Attaching again replaces the cache") {
        finder.attachMetadataCache(2, TrackSourceSlot::SD_SLOT, first.str());
        finder.attachMetadataCache(2, TrackSourceSlot::SD_SLOT, second.str());
        CHECK(finder.getMetadataCache(2, TrackSourceSlot::SD_SLOT) == second.str());
        auto metadata = finder.requestMetadataFrom(2, TrackSourceSlot::SD_SLOT, 57);
        REQUIRE(metadata);
        CHECK(metadata->getTitle() == "From Second");
    }

    SECTION("Caches stay attached across a restart") {
        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        finder.stop();
        CHECK(finder.getMetadataCache(2, TrackSourceSlot::USB_SLOT) == first.str());
    }

    SECTION("Null listeners are ignored") {
        finder.addMetadataCacheListener(nullptr);
        finder.addTrackMetadataListener(nullptr);
        CHECK(finder.getMetadataCacheListeners().empty());
        CHECK(finder.getTrackMetadataListeners().size() == 1);
        finder.removeMetadataCacheListener(nullptr);
        finder.removeTrackMetadataListener(nullptr);
        CHECK(finder.getTrackMetadataListeners().size() == 1);

        finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, first.str());
        CHECK(finder.findCache(2, TrackSourceSlot::USB_SLOT));
        CHECK_FALSE(finder.findCache(2, TrackSourceSlot::CD_SLOT));
    }

    SECTION("Detaching something that is not attached is harmless") {
        finder.detachMetadataCache(3, TrackSourceSlot::USB_SLOT);
        finder.detachMetadataCache(3, TrackSourceSlot::CD_SLOT);
        CHECK_FALSE(finder.getMetadataCache(3, TrackSourceSlot::USB_SLOT).has_value());
    }
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder follows mounted media", "[MetadataFinder]") {
    test::TempPath path("mounted");
    writeCache(path.str(), 57, "Cached");

    struct CacheState {
        std::map<int, std::string> usbCaches;
        std::set<int> usbMounts;
    };
    std::vector<CacheState> states;
    finder.addMetadataCacheListener(std::make_shared<MetadataCacheCallbacks>(
        [&states](const std::map<int, std::string>&, const std::map<int, std::string>& usbCaches,
                  const std::set<int>&, const std::set<int>& usbMounts) {
            states.push_back({usbCaches, usbMounts});
        }));
    CHECK(finder.getMetadataCacheListeners().size() == 1);
    finder.start();

    finder.handleUpdate(emptyStatus(2));
    finder.handleUpdate(emptyStatus(2));
    CHECK(finder.getPlayersWithMediaIn(TrackSourceSlot::USB_SLOT) == std::set<int>{2});
    CHECK(finder.getPlayersWithMediaIn(TrackSourceSlot::SD_SLOT) == std::set<int>{2});
    // One for USB, one for SD; the repeated update changes nothing.
    REQUIRE(states.size() == 2);
    CHECK(states[1].usbMounts == std::set<int>{2});

    finder.attachMetadataCache(2, TrackSourceSlot::USB_SLOT, path.str());
    REQUIRE(states.size() == 3);
    CHECK(states[2].usbCaches.at(2) == path.str());

    finder.handleUpdate(emptyStatus(2, CdjStatus::MEDIA_EMPTY));
    CHECK_FALSE(finder.getMetadataCache(2, TrackSourceSlot::USB_SLOT).has_value());
    CHECK(finder.getPlayersWithMediaIn(TrackSourceSlot::USB_SLOT).empty());
    REQUIRE(states.size() == 5);
    CHECK(states[3].usbCaches.empty());
    CHECK(states[3].usbMounts == std::set<int>{2});
    CHECK(states[4].usbMounts.empty());

    CHECK_THROWS_AS(finder.getPlayersWithMediaIn(TrackSourceSlot::CD_SLOT), std::invalid_argument);
    finder.stop();
}

TEST_CASE_METHOD(FinderFixture, "MetadataFinder forgets players that disappear", "[MetadataFinder]") {
    test::TempPath path("lost");
    writeCache(path.str(), 57, "Cached");
    sessions.media(2).addTrack(57, {"Strobe", 9});
    finder.start();

    finder.handleUpdate(status(2, 2, TrackSourceSlot::USB_SLOT, 57));
    REQUIRE(waitForTitle(2, "Strobe"));
    REQUIRE(waitForIdle());
    finder.attachMetadataCache(2, TrackSourceSlot::SD_SLOT, path.str());
    clearUpdates();

    roster.deviceLost(2);
    roster.deviceLost(3);

    auto reported = updatesFor(2);
    REQUIRE(reported.size() == 1);
    CHECK_FALSE(reported[0].metadata);
    CHECK(updatesFor(3).empty());
    CHECK_FALSE(finder.getLatestMetadataFor(2));
    CHECK_FALSE(finder.getMetadataCache(2, TrackSourceSlot::SD_SLOT).has_value());

    // A player that comes back with the same track is asked again.
    roster.deviceFound(DeviceAnnouncement(2, "CDJ-3000", playerAddress(2)));
    finder.handleUpdate(status(2, 2, TrackSourceSlot::USB_SLOT, 57));
    CHECK(waitForTitle(2, "Strobe"));
    CHECK(waitForIdle());
    CHECK(sessions.sessionsFor(2) == 2);
}

// =============================================================================
// Building caches
// =============================================================================

TEST_CASE_METHOD(FinderFixture, "MetadataFinder builds metadata caches", "[MetadataFinder]") {
    auto& media = sessions.media(2);
    media.addTrack(1, {"Alpha", 21});
    media.trackList.push_back(2);
    media.addTrack(3, {"Gamma", 23});
    media.playlists[7] = {1, 2, 3};
    test::TempPath path("built");

    struct Progress {
        bool hadTrack;
        int added;
        int total;
    };
    std::vector<Progress> progress;
    bool cancelOnSecond = false;
    auto listener = std::make_shared<MetadataCacheCreationCallbacks>(
        [&progress, &cancelOnSecond](const TrackMetadataPtr& track, int added, int total) {
            progress.push_back({track != nullptr, added, total});
            return !(cancelOnSecond && added == 2);
        });

    SECTION("From a playlist, skipping a track without metadata") {
        finder.createMetadataCache(2, TrackSourceSlot::USB_SLOT, 7, path.str(), listener);

        REQUIRE(progress.size() == 3);
        CHECK(progress[0].hadTrack);
        CHECK_FALSE(progress[1].hadTrack);
        CHECK(progress[2].added == 3);
        CHECK(progress[2].total == 3);

        CHECK(countEntries(path.str(), "BLTMetaCache/metadata/") == 2);
        CHECK(countEntries(path.str(), "BLTMetaCache/artwork/") == 2);
        CHECK(countEntries(path.str(), "BLTMetaCache/beatgrid/") == 2);

        auto cache = MetadataCache::open(path.str());
        auto gamma = cache->getCachedMetadata(DataReference(2, TrackSourceSlot::USB_SLOT, 3));
        REQUIRE(gamma);
        CHECK(gamma->getTitle() == "Gamma");
        CHECK(gamma->getRawArtwork().has_value());
    }

    SECTION("From the whole track list, replacing an old file") {
        std::ofstream(path.str()) << "previous contents";
        finder.createMetadataCache(2, TrackSourceSlot::USB_SLOT, 0, path.str());
        CHECK(countEntries(path.str(), "BLTMetaCache/metadata/") == 2);
        CHECK_NOTHROW(MetadataCache::open(path.str()));
    }

    SECTION("Canceled by the listener") {
        cancelOnSecond = true;
        finder.createMetadataCache(2, TrackSourceSlot::USB_SLOT, 7, path.str(), listener);
        CHECK(progress.size() == 2);
        CHECK_FALSE(path.exists());
    }

    SECTION("Listener failures propagate") {
        auto failing = std::make_shared<MetadataCacheCreationCallbacks>([](const TrackMetadataPtr&, int, int) -> bool {
            throw std::runtime_error("listener failure");
        });
        CHECK_THROWS_AS(finder.createMetadataCache(2, TrackSourceSlot::USB_SLOT, 7, path.str(), failing),
                        std::runtime_error);
    }

    SECTION("Something other than a track in the track list") {
        media.extraTrackListRows.push_back(test::menuItem(dbserver::Message::MenuItemType::ARTIST, 9, "Not a track"));
        CHECK_THROWS_AS(finder.createMetadataCache(2, TrackSourceSlot::USB_SLOT, 0, path.str()), CacheFormatError);
    }

    SECTION("Player that cannot be reached") {
        CHECK_THROWS_AS(finder.createMetadataCache(3, TrackSourceSlot::USB_SLOT, 0, path.str()), std::runtime_error);
    }
}
