#pragma once

#include "DataReader.hpp"
#include "Message.hpp"
#include "NumberField.hpp"
#include "Session.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cdjmeta::dbserver {

/**
 * A TCP connection to a player's dbserver.
 *
 * Construction connects, exchanges greetings and performs the setup request,
 * so a constructed Client is ready for requests. Requests from several threads
 * are serialized; menu operations additionally require the menu lock.
 */
class Client : public Session {
public:
    static constexpr int DEFAULT_MENU_BATCH_SIZE = 64;
    static const NumberField GREETING_FIELD;

    /**
     * The transaction number used for setup and teardown requests.
     */
    static constexpr int64_t SETUP_TRANSACTION = 0xfffffffeLL;

    /**
     * @throws std::system_error if the connection fails
     * @throws ProtocolError if the player does not answer the greeting or setup correctly
     */
    Client(const asio::ip::address_v4& address, int port, int targetPlayer, int posingAsPlayer,
           std::chrono::milliseconds timeout);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    int targetPlayer() const override { return targetPlayer_; }
    int posingAsPlayer() const override { return posingAsPlayer_; }

    bool isConnected() const;

    /**
     * Send the teardown request and close the socket. Safe to call more than once.
     */
    void close();

    Message simpleRequest(Message::KnownType requestType, std::optional<Message::KnownType> responseType,
                          const std::vector<FieldPtr>& arguments) override;

    Message menuRequestTyped(Message::KnownType requestType, Message::MenuIdentifier targetMenu,
                             TrackSourceSlot slot, TrackType trackType,
                             const std::vector<FieldPtr>& arguments) override;

    std::vector<Message> renderMenuItems(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                                         TrackType trackType, const Message& availableResponse) override;

    std::vector<Message> renderMenuItems(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                                         TrackType trackType, int offset, int count);

    bool tryLockingForMenuOperations(std::chrono::milliseconds timeout) override;
    void unlockForMenuOperations() override;

    /**
     * How many menu items are requested per render request.
     */
    static int getMenuBatchSize();
    static void setMenuBatchSize(int batchSize);

    std::string toString() const;

private:
    void performSetupExchange();
    void performTeardownExchange();

    void sendField(const Field& field);
    void sendMessage(const Message& message);
    Message readResponseTo(const NumberField& transaction);

    NumberField assignTransactionNumber();

    bool isMenuLockedByCurrentThread() const;

    asio::io_context ioContext_;
    asio::ip::tcp::socket socket_;
    SocketDataReader reader_;

    int targetPlayer_;
    int posingAsPlayer_;
    int64_t transactionCounter_{0};

    mutable std::recursive_mutex requestMutex_;
    std::timed_mutex menuLock_;
    mutable std::mutex menuOwnerMutex_;
    std::thread::id menuOwner_{};

    static std::atomic<int> menuBatchSize_;
};

} // namespace cdjmeta::dbserver
