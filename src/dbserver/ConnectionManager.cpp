#include "cdjmeta/dbserver/ConnectionManager.hpp"

#include "cdjmeta/Exceptions.hpp"
#include "cdjmeta/Log.hpp"
#include "cdjmeta/Util.hpp"
#include "cdjmeta/dbserver/DataReader.hpp"

#include <fmt/format.h>

#include <array>

namespace cdjmeta::dbserver {

namespace {

constexpr std::array<uint8_t, 19> DB_SERVER_QUERY_PACKET = {
    0x00, 0x00, 0x00, 0x0f,
    0x52, 0x65, 0x6d, 0x6f, 0x74, 0x65, 0x44, 0x42, 0x53, 0x65, 0x72, 0x76, 0x65, 0x72,  // "RemoteDBServer"
    0x00
};

constexpr int DB_SERVER_QUERY_ATTEMPTS = 4;

} // namespace

ConnectionManager::ConnectionManager(DeviceRoster& roster)
    : roster_(roster)
{
}

ConnectionManager::~ConnectionManager() {
    stop();
}

bool ConnectionManager::isRunning() const {
    return running_.load();
}

void ConnectionManager::setIdleLimit(int seconds) {
    if (seconds < 0) {
        throw std::invalid_argument("seconds cannot be negative");
    }
    idleLimit_.store(seconds);
}

int ConnectionManager::getIdleLimit() const {
    return idleLimit_.load();
}

void ConnectionManager::setSocketTimeout(int timeoutMs) {
    if (timeoutMs < 0) {
        throw std::invalid_argument("timeout cannot be negative");
    }
    socketTimeout_.store(timeoutMs);
}

int ConnectionManager::getSocketTimeout() const {
    return socketTimeout_.load();
}

void ConnectionManager::setPosingAsPlayer(int player) {
    if (player < 0 || player > 0xff) {
        throw std::invalid_argument("player number must be between 0 and 255");
    }
    posingAsPlayer_.store(player);
}

int ConnectionManager::getPosingAsPlayer() const {
    return posingAsPlayer_.load();
}

void ConnectionManager::setDbServerQueryPort(int port) {
    if (port < 1 || port > 0xffff) {
        throw std::invalid_argument("port must be between 1 and 65535");
    }
    dbServerQueryPort_.store(port);
}

int ConnectionManager::getDbServerQueryPort() const {
    return dbServerQueryPort_.load();
}

int ConnectionManager::getPlayerDBServerPort(int player) const {
    auto announcement = roster_.getLatestAnnouncementFrom(player);
    if (!announcement) {
        return -1;
    }
    std::lock_guard<std::mutex> lock(dbServerMutex_);
    auto it = dbServerPorts_.find(announcement->getAddress().to_uint());
    if (it == dbServerPorts_.end()) {
        return -1;
    }
    return it->second;
}

void ConnectionManager::withSession(int targetPlayer, const std::function<void(Session&)>& task,
                                    const std::string& description) {
    if (!isRunning()) {
        throw IllegalStateError("ConnectionManager is not running, aborting " + description);
    }

    auto client = allocateClient(targetPlayer, description);
    struct Release {
        ConnectionManager& manager;
        const std::shared_ptr<Client>& client;
        ~Release() { manager.freeClient(client); }
    } release{*this, client};

    task(*client);
}

std::shared_ptr<Client> ConnectionManager::allocateClient(int targetPlayer, const std::string& description) {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    auto it = openClients_.find(targetPlayer);
    if (it != openClients_.end() && it->second.client->isConnected()) {
        it->second.useCount += 1;
        return it->second.client;
    }

    auto announcement = roster_.getLatestAnnouncementFrom(targetPlayer);
    if (!announcement) {
        throw std::runtime_error(fmt::format("Player {} could not be found {}", targetPlayer, description));
    }
    const int dbServerPort = getPlayerDBServerPort(targetPlayer);
    if (dbServerPort < 0) {
        throw std::runtime_error(fmt::format("Player {} does not have a db server {}", targetPlayer, description));
    }

    auto client = std::make_shared<Client>(announcement->getAddress(), dbServerPort, targetPlayer,
                                           chooseAskingPlayerNumber(*announcement),
                                           std::chrono::milliseconds(socketTimeout_.load()));
    openClients_.insert_or_assign(targetPlayer, ClientRecord{client, 1, std::chrono::steady_clock::now()});
    return client;
}

void ConnectionManager::freeClient(const std::shared_ptr<Client>& client) {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    auto it = openClients_.find(client->targetPlayer());
    if (it == openClients_.end() || it->second.client != client) {
        return;
    }
    if (it->second.useCount > 0) {
        it->second.useCount -= 1;
        it->second.lastUsed = std::chrono::steady_clock::now();
        if (it->second.useCount == 0 && idleLimit_.load() == 0) {
            it->second.client->close();
            openClients_.erase(it);
        }
    }
}

void ConnectionManager::closeIdleClients() {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto idleLimit = std::chrono::seconds(idleLimit_.load());
    for (auto it = openClients_.begin(); it != openClients_.end();) {
        if (it->second.useCount < 1 && now - it->second.lastUsed >= idleLimit) {
            Log::debug("ConnectionManager", "Closing idle connection to player {}", it->first);
            it->second.client->close();
            it = openClients_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConnectionManager::requestPlayerDBServerPort(const DeviceAnnouncement& announcement) {
    const auto addressKey = announcement.getAddress().to_uint();
    struct QueryGuard {
        ConnectionManager& manager;
        uint32_t key;
        ~QueryGuard() {
            std::lock_guard<std::mutex> lock(manager.activeQueryMutex_);
            manager.activeQueries_.erase(key);
            manager.queriesFinished_.notify_all();
        }
    } guard{*this, addressKey};

    for (int tries = 0; tries < DB_SERVER_QUERY_ATTEMPTS && isRunning(); ++tries) {
        if (tries > 0) {
            std::unique_lock<std::mutex> lock(stopMutex_);
            if (stopCondition_.wait_for(lock, std::chrono::seconds(tries), [this] { return !isRunning(); })) {
                return;
            }
        }

        try {
            asio::io_context io;
            asio::ip::tcp::socket socket(io);
            socket.connect(asio::ip::tcp::endpoint(announcement.getAddress(),
                                                   static_cast<unsigned short>(dbServerQueryPort_.load())));
            asio::write(socket, asio::buffer(DB_SERVER_QUERY_PACKET.data(), DB_SERVER_QUERY_PACKET.size()));

            std::array<uint8_t, 2> response{};
            SocketDataReader reader(socket, std::chrono::milliseconds(socketTimeout_.load()));
            reader.readFully(response.data(), response.size());

            const int portReturned = static_cast<int>(Util::bytesToNumber(response.data(), 0, 2));
            if (portReturned == 65535) {
                Log::info("ConnectionManager", "Player {} reported dbserver port of {}, not yet ready?",
                          announcement.getDeviceNumber(), portReturned);
                continue;
            }
            if (isRunning()) {
                std::lock_guard<std::mutex> lock(dbServerMutex_);
                dbServerPorts_[addressKey] = portReturned;
            }
            return;
        } catch (const std::exception& e) {
            Log::info("ConnectionManager", "Problem requesting database server port number from {}: {}",
                      announcement.toString(), e.what());
        }
    }
    Log::warn("ConnectionManager", "Unable to find dbserver port for {}", announcement.toString());
}

int ConnectionManager::chooseAskingPlayerNumber(const DeviceAnnouncement& targetPlayer) const {
    const int configured = posingAsPlayer_.load();
    return configured == 0 ? targetPlayer.getDeviceNumber() : configured;
}

void ConnectionManager::start() {
    if (isRunning()) {
        return;
    }
    running_.store(true);

    announcementListener_ = std::make_shared<DeviceAnnouncementCallbacks>(
        [this](const DeviceAnnouncement& announcement) {
            if (!isRunning()) {
                return;
            }
            const auto addressKey = announcement.getAddress().to_uint();
            {
                std::lock_guard<std::mutex> lock(activeQueryMutex_);
                if (!activeQueries_.insert(addressKey).second) {
                    return;
                }
            }
            std::thread([this, announcement]() { requestPlayerDBServerPort(announcement); }).detach();
        },
        [this](const DeviceAnnouncement& announcement) {
            std::lock_guard<std::mutex> lock(dbServerMutex_);
            dbServerPorts_.erase(announcement.getAddress().to_uint());
        });

    roster_.addDeviceAnnouncementListener(announcementListener_);
    for (const auto& device : roster_.getCurrentDevices()) {
        announcementListener_->deviceFound(device);
    }

    idleCloserThread_ = std::thread([this]() {
        std::unique_lock<std::mutex> lock(stopMutex_);
        while (!stopCondition_.wait_for(lock, std::chrono::milliseconds(500), [this] { return !isRunning(); })) {
            lock.unlock();
            closeIdleClients();
            lock.lock();
        }
    });

    deliverLifecycleAnnouncement(true);
}

void ConnectionManager::stop() {
    if (!isRunning()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        running_.store(false);
    }
    stopCondition_.notify_all();

    roster_.removeDeviceAnnouncementListener(announcementListener_);
    announcementListener_.reset();

    if (idleCloserThread_.joinable()) {
        idleCloserThread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(activeQueryMutex_);
        queriesFinished_.wait(lock, [this] { return activeQueries_.empty(); });
    }

    {
        std::lock_guard<std::mutex> lock(dbServerMutex_);
        dbServerPorts_.clear();
    }

    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (auto& entry : openClients_) {
            entry.second.client->close();
        }
        openClients_.clear();
    }

    deliverLifecycleAnnouncement(false);
}

std::string ConnectionManager::toString() const {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    return fmt::format("ConnectionManager[running: {}, openClients: {}, idleLimit: {}]",
                       isRunning(), openClients_.size(), idleLimit_.load());
}

} // namespace cdjmeta::dbserver
