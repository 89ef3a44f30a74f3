/**
 * @file test_client.cpp
 * @brief Tests for dbserver client sessions and the connection manager,
 *        talking to a scripted dbserver on the loopback interface
 */

#include <catch2/catch_all.hpp>
#include "TestSupport.hpp"
#include <cdjmeta/data/BeatGrid.hpp>
#include <cdjmeta/dbserver/Client.hpp>
#include <cdjmeta/dbserver/ConnectionManager.hpp>
#include <cdjmeta/dbserver/DataReader.hpp>
#include <array>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace cdjmeta;
using namespace cdjmeta::dbserver;

namespace {

const auto loopback = asio::ip::address_v4::loopback();
constexpr std::chrono::milliseconds kTimeout{5000};

/**
 * Accepts one connection on an ephemeral loopback port and runs a script
 * against it on a thread of its own. Whatever the script throws is kept
 * for the test to rethrow.
 */
class ScriptedServer {
public:
    using Script = std::function<void(asio::ip::tcp::socket&, SocketDataReader&)>;

    explicit ScriptedServer(Script script)
        : acceptor_(io_, asio::ip::tcp::endpoint(loopback, 0))
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, script = std::move(script)]() {
            try {
                asio::ip::tcp::socket socket(io_);
                acceptor_.accept(socket);
                accepted_ = true;
                SocketDataReader reader(socket, kTimeout);
                script(socket, reader);
            } catch (const std::exception&) {
                failure_ = std::current_exception();
            }
        });
    }

    ~ScriptedServer() {
        if (!accepted_) {
            // Nobody connected; unblock the accept so the thread can finish.
            asio::io_context io;
            asio::ip::tcp::socket socket(io);
            asio::error_code ignored;
            socket.connect(asio::ip::tcp::endpoint(loopback, port_), ignored);
        }
        join();
    }

    ScriptedServer(const ScriptedServer&) = delete;
    ScriptedServer& operator=(const ScriptedServer&) = delete;

    int port() const { return port_; }

    /**
     * Wait for the script to finish, and rethrow anything it threw.
     */
    void finish() {
        join();
        if (failure_) {
            std::rethrow_exception(failure_);
        }
    }

private:
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> accepted_{false};
    std::thread thread_;
    std::exception_ptr failure_;
};

void send(asio::ip::tcp::socket& socket, const Message& message) {
    message.write(socket);
}

/**
 * Plays the player's side of the greeting and setup exchange, returning the
 * player number the client claimed to be.
 */
int acceptSetup(asio::ip::tcp::socket& socket, SocketDataReader& reader, int targetPlayer) {
    auto greeting = std::dynamic_pointer_cast<NumberField>(Field::read(reader));
    if (!greeting || greeting->getValue() != 1) {
        throw ProtocolError("expected greeting");
    }
    auto bytes = Client::GREETING_FIELD.getBytes();
    asio::write(socket, asio::buffer(bytes.data(), bytes.size()));

    auto setup = Message::read(reader);
    if (!setup.isType(Message::KnownType::SETUP_REQ)) {
        throw ProtocolError("expected setup request, got " + setup.toString());
    }
    send(socket, Message(Client::SETUP_TRANSACTION, Message::KnownType::MENU_AVAILABLE,
                         {std::make_shared<NumberField>(0), std::make_shared<NumberField>(targetPlayer)}));
    return static_cast<int>(setup.getNumberArgument(0));
}

void expectTeardown(SocketDataReader& reader) {
    auto teardown = Message::read(reader);
    if (!teardown.isType(Message::KnownType::TEARDOWN_REQ)) {
        throw ProtocolError("expected teardown, got " + teardown.toString());
    }
}

/**
 * Answers RENDER_MENU_REQ batches from a list of items until the client
 * has seen all of them.
 */
void serveMenu(asio::ip::tcp::socket& socket, SocketDataReader& reader, const std::vector<Message>& items,
               std::vector<int64_t>& batchSizes) {
    size_t served = 0;
    while (served < items.size()) {
        auto render = Message::read(reader);
        if (!render.isType(Message::KnownType::RENDER_MENU_REQ)) {
            throw ProtocolError("expected render request, got " + render.toString());
        }
        const auto offset = static_cast<size_t>(render.getNumberArgument(1));
        const auto count = static_cast<size_t>(render.getNumberArgument(2));
        batchSizes.push_back(static_cast<int64_t>(count));

        send(socket, Message(render.transaction.getValue(), Message::KnownType::MENU_HEADER));
        for (size_t i = offset; i < offset + count && i < items.size(); ++i) {
            send(socket, items[i]);
        }
        send(socket, Message(render.transaction.getValue(), Message::KnownType::MENU_FOOTER));
        served = offset + count;
    }
}

} // namespace

// =============================================================================
// Client
// =============================================================================

TEST_CASE("Client setup and teardown", "[Client]") {
    int claimedPlayer = 0;
    ScriptedServer server([&claimedPlayer](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        claimedPlayer = acceptSetup(socket, reader, 2);
        expectTeardown(reader);
    });

    {
        Client client(loopback, server.port(), 2, 3, kTimeout);
        CHECK(client.isConnected());
        CHECK(client.targetPlayer() == 2);
        CHECK(client.posingAsPlayer() == 3);
        client.close();
        CHECK_FALSE(client.isConnected());
        client.close();
    }

    server.finish();
    CHECK(claimedPlayer == 3);
}

TEST_CASE("Client rejects a welcome from the wrong player", "[Client]") {
    ScriptedServer server([](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        acceptSetup(socket, reader, 4);
        expectTeardown(reader);
    });

    CHECK_THROWS_AS(Client(loopback, server.port(), 2, 2, kTimeout), ProtocolError);
    server.finish();
}

TEST_CASE("Client simple requests", "[Client]") {
    const std::vector<uint8_t> art = {0xff, 0xd8, 0xff, 0xe0, 0xd9};
    std::vector<Message> received;

    SECTION("Response with the matching transaction") {
        ScriptedServer server([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
            acceptSetup(socket, reader, 2);
            auto request = Message::read(reader);
            received.push_back(request);
            send(socket, test::blobResponse(request.transaction.getValue(), Message::KnownType::ALBUM_ART,
                                            Message::KnownType::ALBUM_ART_REQ, art));
            expectTeardown(reader);
        });

        {
            Client client(loopback, server.port(), 2, 2, kTimeout);
            auto response = client.simpleRequest(
                Message::KnownType::ALBUM_ART_REQ, Message::KnownType::ALBUM_ART,
                {std::make_shared<NumberField>(client.buildRMST(Message::MenuIdentifier::DATA,
                                                                TrackSourceSlot::USB_SLOT)),
                 std::make_shared<NumberField>(9)});
            CHECK(response.getBinaryArgument(3) == art);
        }
        server.finish();

        REQUIRE(received.size() == 1);
        CHECK(received[0].transaction.getValue() == 1);
        CHECK(received[0].isType(Message::KnownType::ALBUM_ART_REQ));
        const auto rmst = received[0].getNumberArgument(0);
        CHECK(((rmst >> 24) & 0xff) == 2);
        CHECK(((rmst >> 16) & 0xff) == static_cast<int>(Message::MenuIdentifier::DATA));
        CHECK(((rmst >> 8) & 0xff) == static_cast<int>(TrackSourceSlot::USB_SLOT));
        CHECK(received[0].getNumberArgument(1) == 9);
    }

    SECTION("Response for some other transaction") {
        ScriptedServer server([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
            acceptSetup(socket, reader, 2);
            Message::read(reader);
            send(socket, Message(99, Message::KnownType::ALBUM_ART));
            expectTeardown(reader);
        });

        {
            Client client(loopback, server.port(), 2, 2, kTimeout);
            CHECK_THROWS_AS(client.simpleRequest(Message::KnownType::ALBUM_ART_REQ, Message::KnownType::ALBUM_ART,
                                                 {std::make_shared<NumberField>(0), std::make_shared<NumberField>(9)}),
                            ProtocolError);
        }
        server.finish();
    }

    SECTION("Response of the wrong type") {
        ScriptedServer server([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
            acceptSetup(socket, reader, 2);
            auto request = Message::read(reader);
            send(socket, Message(request.transaction.getValue(), Message::KnownType::UNAVAILABLE));
            expectTeardown(reader);
        });

        {
            Client client(loopback, server.port(), 2, 2, kTimeout);
            CHECK_THROWS_AS(client.simpleRequest(Message::KnownType::ALBUM_ART_REQ, Message::KnownType::ALBUM_ART,
                                                 {std::make_shared<NumberField>(0), std::make_shared<NumberField>(9)}),
                            ProtocolError);
        }
        server.finish();
    }
}

TEST_CASE("Client menu requests", "[Client]") {
    const std::vector<Message> items = {
        test::menuItem(Message::MenuItemType::TRACK_TITLE, 57, "Strobe", 9),
        test::menuItem(Message::MenuItemType::ARTIST, 11, "Deadmau5"),
        test::menuItem(Message::MenuItemType::ALBUM_TITLE, 12, "For Lack of a Better Name"),
    };
    std::vector<int64_t> batchSizes;
    int64_t requestedId = 0;

    ScriptedServer server([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        acceptSetup(socket, reader, 3);
        auto request = Message::read(reader);
        requestedId = request.getNumberArgument(1);
        send(socket, Message(request.transaction.getValue(), Message::KnownType::MENU_AVAILABLE,
                             {std::make_shared<NumberField>(static_cast<int64_t>(Message::KnownType::REKORDBOX_METADATA_REQ)),
                              std::make_shared<NumberField>(static_cast<int64_t>(items.size()))}));
        serveMenu(socket, reader, items, batchSizes);
        expectTeardown(reader);
    });

    const int previousBatchSize = Client::getMenuBatchSize();
    Client::setMenuBatchSize(2);
    std::vector<Message> rendered;
    {
        Client client(loopback, server.port(), 3, 3, kTimeout);

        CHECK_THROWS_AS(client.menuRequest(Message::KnownType::REKORDBOX_METADATA_REQ,
                                           Message::MenuIdentifier::MAIN_MENU, TrackSourceSlot::USB_SLOT,
                                           {std::make_shared<NumberField>(57)}),
                        std::logic_error);

        MenuLockGuard lock(client, kTimeout);
        auto available = client.menuRequest(Message::KnownType::REKORDBOX_METADATA_REQ,
                                            Message::MenuIdentifier::MAIN_MENU, TrackSourceSlot::USB_SLOT,
                                            {std::make_shared<NumberField>(57)});
        CHECK(available.getMenuResultsCount() == 3);
        rendered = client.renderMenuItems(Message::MenuIdentifier::MAIN_MENU, TrackSourceSlot::USB_SLOT,
                                          TrackType::REKORDBOX, available);
    }
    Client::setMenuBatchSize(previousBatchSize);
    server.finish();

    CHECK(requestedId == 57);
    CHECK(batchSizes == std::vector<int64_t>{2, 1});
    REQUIRE(rendered.size() == 3);
    CHECK(rendered[0].getStringArgument(3) == "Strobe");
    CHECK(rendered[2].getMenuItemType() == Message::MenuItemType::ALBUM_TITLE);

    CHECK_THROWS_AS(Client::setMenuBatchSize(0), std::invalid_argument);
}

TEST_CASE("Client survives an absurd menu item count", "[Client]") {
    std::vector<int64_t> batchSizes;
    ScriptedServer server([&batchSizes](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        acceptSetup(socket, reader, 2);
        auto render = Message::read(reader);
        batchSizes.push_back(render.getNumberArgument(2));
        send(socket, Message(render.transaction.getValue(), Message::KnownType::MENU_HEADER));
        send(socket, Message(render.transaction.getValue(), Message::KnownType::MENU_FOOTER));
        // Hang up instead of serving the rest of the claimed items.
    });

    {
        Client client(loopback, server.port(), 2, 2, kTimeout);
        MenuLockGuard lock(client, kTimeout);
        CHECK_THROWS_AS(client.renderMenuItems(Message::MenuIdentifier::MAIN_MENU, TrackSourceSlot::USB_SLOT,
                                               TrackType::REKORDBOX, 0, 0x7fffffff),
                        std::runtime_error);
    }
    server.finish();

    REQUIRE(batchSizes.size() == 1);
    CHECK(batchSizes[0] == Client::getMenuBatchSize());
}

// =============================================================================
// ConnectionManager
// =============================================================================

TEST_CASE("ConnectionManager settings", "[ConnectionManager]") {
    DeviceRoster roster;
    ConnectionManager manager(roster);

    CHECK(manager.getPosingAsPlayer() == 0);
    CHECK(manager.getDbServerQueryPort() == ConnectionManager::DEFAULT_DB_SERVER_QUERY_PORT);
    CHECK_THROWS_AS(manager.setPosingAsPlayer(256), std::invalid_argument);
    CHECK_THROWS_AS(manager.setDbServerQueryPort(0), std::invalid_argument);
    CHECK_THROWS_AS(manager.setIdleLimit(-1), std::invalid_argument);
    CHECK_THROWS_AS(manager.setSocketTimeout(-1), std::invalid_argument);
    CHECK(manager.getPlayerDBServerPort(2) == -1);

    CHECK_THROWS_AS(manager.withSession(2, [](Session&) {}, "testing"), IllegalStateError);
}

TEST_CASE("ConnectionManager finds dbservers and hands out sessions", "[ConnectionManager]") {
    std::vector<uint8_t> query(19);
    int claimedPlayer = 0;
    int64_t requestedTrack = 0;

    ScriptedServer dbServer([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        claimedPlayer = acceptSetup(socket, reader, 2);
        auto request = Message::read(reader);
        requestedTrack = request.getNumberArgument(1);
        send(socket, test::blobResponse(request.transaction.getValue(), Message::KnownType::BEAT_GRID,
                                        Message::KnownType::BEAT_GRID_REQ, test::beatGridBytes(4)));
        expectTeardown(reader);
    });

    const auto dbServerPort = static_cast<uint16_t>(dbServer.port());
    ScriptedServer portServer([&](asio::ip::tcp::socket& socket, SocketDataReader& reader) {
        reader.readFully(query.data(), query.size());
        const std::array<uint8_t, 2> reply = {static_cast<uint8_t>(dbServerPort >> 8),
                                              static_cast<uint8_t>(dbServerPort & 0xff)};
        asio::write(socket, asio::buffer(reply));
    });

    DeviceRoster roster;
    roster.deviceFound(DeviceAnnouncement(2, "CDJ-3000", loopback));

    ConnectionManager manager(roster);
    manager.setDbServerQueryPort(portServer.port());
    manager.setIdleLimit(0);
    manager.start();
    CHECK(manager.isRunning());

    REQUIRE(test::waitUntil([&manager, &dbServer]() { return manager.getPlayerDBServerPort(2) == dbServer.port(); }));
    portServer.finish();
    CHECK(query[3] == 0x0f);
    CHECK(std::string(query.begin() + 4, query.begin() + 18) == "RemoteDBServer");

    CHECK_THROWS_AS(manager.withSession(3, [](Session&) {}, "testing"), std::runtime_error);

    const int beats = manager.invokeWithClientSession(
        2,
        [](Session& session) {
            auto response = session.simpleRequest(
                Message::KnownType::BEAT_GRID_REQ, Message::KnownType::BEAT_GRID,
                {std::make_shared<NumberField>(session.buildRMST(Message::MenuIdentifier::DATA,
                                                                 TrackSourceSlot::USB_SLOT)),
                 std::make_shared<NumberField>(57)});
            return data::BeatGrid(data::DataReference(2, TrackSourceSlot::USB_SLOT, 57), response).getBeatCount();
        },
        "requesting beat grid");

    dbServer.finish();
    CHECK(beats == 4);
    CHECK(requestedTrack == 57);
    CHECK(claimedPlayer == 2);

    manager.stop();
    CHECK_FALSE(manager.isRunning());
    CHECK(manager.getPlayerDBServerPort(2) == -1);
}
