#include "cdjmeta/dbserver/Client.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/Log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace cdjmeta::dbserver {

const NumberField Client::GREETING_FIELD = NumberField(1, 4);
std::atomic<int> Client::menuBatchSize_{Client::DEFAULT_MENU_BATCH_SIZE};

Client::Client(const asio::ip::address_v4& address, int port, int targetPlayer, int posingAsPlayer,
               std::chrono::milliseconds timeout)
    : socket_(ioContext_)
    , reader_(socket_, timeout)
    , targetPlayer_(targetPlayer)
    , posingAsPlayer_(posingAsPlayer)
{
    socket_.connect(asio::ip::tcp::endpoint(address, static_cast<unsigned short>(port)));

    try {
        sendField(GREETING_FIELD);
        auto response = std::dynamic_pointer_cast<NumberField>(Field::read(reader_));
        if (!response || response->getSize() != 4 || response->getValue() != 1) {
            throw ProtocolError("Did not receive expected greeting response from dbserver");
        }
        performSetupExchange();
    } catch (const std::exception&) {
        close();
        throw;
    }
}

Client::~Client() {
    close();
}

bool Client::isConnected() const {
    return socket_.is_open();
}

void Client::close() {
    std::lock_guard<std::recursive_mutex> lock(requestMutex_);
    if (!socket_.is_open()) {
        return;
    }
    try {
        performTeardownExchange();
    } catch (const std::exception& e) {
        Log::debug("Client", "Problem sending teardown request to player {}: {}", targetPlayer_, e.what());
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void Client::sendField(const Field& field) {
    if (!isConnected()) {
        throw std::runtime_error("sendField() called after dbserver connection was closed");
    }
    auto bytes = field.getBytes();
    asio::write(socket_, asio::buffer(bytes.data(), bytes.size()));
}

void Client::sendMessage(const Message& message) {
    if (!isConnected()) {
        throw std::runtime_error("sendMessage() called after dbserver connection was closed");
    }
    if (Log::isEnabled(LogLevel::Debug)) {
        Log::debug("Client", "Sending> {}", message.toString());
    }
    message.write(socket_);
}

Message Client::readResponseTo(const NumberField& transaction) {
    Message response = Message::read(reader_);
    if (Log::isEnabled(LogLevel::Debug)) {
        Log::debug("Client", "Received< {}", response.toString());
    }
    if (response.transaction.getValue() != transaction.getValue()) {
        throw ProtocolError(fmt::format("Received response with wrong transaction ID: expected {}, got {}",
                                        transaction.getValue(), response.transaction.getValue()));
    }
    return response;
}

NumberField Client::assignTransactionNumber() {
    return NumberField(++transactionCounter_, 4);
}

void Client::performSetupExchange() {
    Message setupRequest(SETUP_TRANSACTION, Message::KnownType::SETUP_REQ,
                         {std::make_shared<NumberField>(posingAsPlayer_, 4)});
    sendMessage(setupRequest);
    Message response = Message::read(reader_);
    if (!response.isType(Message::KnownType::MENU_AVAILABLE)) {
        throw ProtocolError("Did not receive message type 0x4000 in response to setup message");
    }
    if (response.arguments.size() != 2) {
        throw ProtocolError("Did not receive two arguments in response to setup message");
    }
    if (response.getNumberArgument(1) != targetPlayer_) {
        throw ProtocolError(fmt::format("Welcome response identified wrong player: expected {}, got {}",
                                        targetPlayer_, response.getNumberArgument(1)));
    }
}

void Client::performTeardownExchange() {
    sendMessage(Message(SETUP_TRANSACTION, Message::KnownType::TEARDOWN_REQ));
}

Message Client::simpleRequest(Message::KnownType requestType, std::optional<Message::KnownType> responseType,
                              const std::vector<FieldPtr>& arguments) {
    std::lock_guard<std::recursive_mutex> lock(requestMutex_);
    const NumberField transaction = assignTransactionNumber();
    sendMessage(Message(transaction.getValue(), requestType, arguments));
    Message response = readResponseTo(transaction);
    if (responseType && !response.isType(*responseType)) {
        throw ProtocolError(fmt::format("Received response with wrong type: expected 0x{:04x}, got 0x{:04x}",
                                        static_cast<uint16_t>(*responseType), response.messageType.getValue()));
    }
    return response;
}

Message Client::menuRequestTyped(Message::KnownType requestType, Message::MenuIdentifier targetMenu,
                                 TrackSourceSlot slot, TrackType trackType, const std::vector<FieldPtr>& arguments) {
    if (!isMenuLockedByCurrentThread()) {
        throw std::logic_error("menuRequestTyped() cannot be called without holding menu lock");
    }

    std::vector<FieldPtr> combined;
    combined.reserve(arguments.size() + 1);
    combined.push_back(std::make_shared<NumberField>(buildRMST(targetMenu, slot, trackType)));
    combined.insert(combined.end(), arguments.begin(), arguments.end());

    Message response = simpleRequest(requestType, Message::KnownType::MENU_AVAILABLE, combined);
    if (response.getNumberArgument(0) != static_cast<int64_t>(requestType)) {
        throw ProtocolError("Menu request did not return result for same type as request");
    }
    return response;
}

int Client::getMenuBatchSize() {
    return menuBatchSize_.load();
}

void Client::setMenuBatchSize(int batchSize) {
    if (batchSize < 1) {
        throw std::invalid_argument("menu batch size must be positive");
    }
    menuBatchSize_.store(batchSize);
}

bool Client::tryLockingForMenuOperations(std::chrono::milliseconds timeout) {
    if (menuLock_.try_lock_for(timeout)) {
        std::lock_guard<std::mutex> lock(menuOwnerMutex_);
        menuOwner_ = std::this_thread::get_id();
        return true;
    }
    return false;
}

void Client::unlockForMenuOperations() {
    {
        std::lock_guard<std::mutex> lock(menuOwnerMutex_);
        menuOwner_ = std::thread::id();
    }
    menuLock_.unlock();
}

bool Client::isMenuLockedByCurrentThread() const {
    std::lock_guard<std::mutex> lock(menuOwnerMutex_);
    return menuOwner_ == std::this_thread::get_id();
}

std::vector<Message> Client::renderMenuItems(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                                             TrackType trackType, const Message& availableResponse) {
    const auto count = availableResponse.getMenuResultsCount();
    if (count == Message::NO_MENU_RESULTS_AVAILABLE || count == 0) {
        return {};
    }
    return renderMenuItems(targetMenu, slot, trackType, 0, static_cast<int>(count));
}

std::vector<Message> Client::renderMenuItems(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                                             TrackType trackType, int offset, int count) {
    std::lock_guard<std::recursive_mutex> lock(requestMutex_);
    if (!isMenuLockedByCurrentThread()) {
        throw std::logic_error("renderMenuItems() cannot be called without holding menu lock");
    }
    if (offset < 0) {
        throw std::invalid_argument("offset must be nonnegative");
    }
    if (count < 1) {
        throw std::invalid_argument("count must be positive");
    }

    // Reserve at most one batch; the count is whatever the player reported.
    std::vector<Message> results;
    results.reserve(static_cast<size_t>(std::min(count, menuBatchSize_.load())));

    int gathered = 0;
    while (gathered < count) {
        const int batchSize = std::min(count - gathered, menuBatchSize_.load());
        const NumberField transaction = assignTransactionNumber();

        sendMessage(Message(transaction.getValue(), Message::KnownType::RENDER_MENU_REQ,
                            {std::make_shared<NumberField>(buildRMST(targetMenu, slot, trackType)),
                             std::make_shared<NumberField>(offset + gathered),
                             std::make_shared<NumberField>(batchSize),
                             std::make_shared<NumberField>(NumberField::WORD_0),
                             std::make_shared<NumberField>(count),
                             std::make_shared<NumberField>(NumberField::WORD_0)}));

        Message response = readResponseTo(transaction);
        if (!response.isType(Message::KnownType::MENU_HEADER)) {
            throw ProtocolError("Expecting MENU_HEADER in response to render menu request");
        }

        response = Message::read(reader_);
        while (response.isType(Message::KnownType::MENU_ITEM)) {
            results.push_back(response);
            response = Message::read(reader_);
        }
        if (!response.isType(Message::KnownType::MENU_FOOTER)) {
            throw ProtocolError("Expecting MENU_FOOTER after MENU_ITEM responses");
        }

        gathered += batchSize;
    }
    return results;
}

std::string Client::toString() const {
    return fmt::format("DBServer Client[targetPlayer: {}, posingAsPlayer: {}, transactionCounter: {}, menuBatchSize: {}]",
                       targetPlayer_, posingAsPlayer_, transactionCounter_, menuBatchSize_.load());
}

} // namespace cdjmeta::dbserver
