#pragma once

#include "Client.hpp"
#include "SessionProvider.hpp"

#include "cdjmeta/DeviceAnnouncement.hpp"
#include "cdjmeta/DeviceAnnouncementListener.hpp"
#include "cdjmeta/DeviceRoster.hpp"
#include "cdjmeta/LifecycleParticipant.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace cdjmeta::dbserver {

/**
 * Opens and shares dbserver connections to the players found on the network.
 *
 * When a device appears in the roster we ask it which port its dbserver
 * listens on. Sessions requested for the same player share one Client, which
 * is closed once it has been idle for longer than the idle limit.
 */
class ConnectionManager : public LifecycleParticipant, public SessionProvider {
public:
    static constexpr int DEFAULT_SOCKET_TIMEOUT = 10000;
    static constexpr int DEFAULT_DB_SERVER_QUERY_PORT = 12523;

    explicit ConnectionManager(DeviceRoster& roster);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    bool isRunning() const override;

    void start();
    void stop();

    /**
     * How many seconds an unused connection is kept open. Zero closes
     * connections as soon as they are released.
     */
    void setIdleLimit(int seconds);
    int getIdleLimit() const;

    void setSocketTimeout(int timeoutMs);
    int getSocketTimeout() const;

    /**
     * The player number to claim when opening sessions. Zero, the default,
     * means claiming the number of the player being queried, which modern
     * players accept from software on the network.
     */
    void setPosingAsPlayer(int player);
    int getPosingAsPlayer() const;

    /**
     * The TCP port on which players answer dbserver port queries.
     */
    void setDbServerQueryPort(int port);
    int getDbServerQueryPort() const;

    /**
     * The dbserver port a player told us about, or -1 if we do not know it yet.
     */
    int getPlayerDBServerPort(int player) const;

    void withSession(int targetPlayer, const std::function<void(Session&)>& task,
                     const std::string& description) override;

    std::string toString() const;

protected:
    std::string participantName() const override { return "ConnectionManager"; }

private:
    std::shared_ptr<Client> allocateClient(int targetPlayer, const std::string& description);
    void freeClient(const std::shared_ptr<Client>& client);
    void closeIdleClients();

    void requestPlayerDBServerPort(const DeviceAnnouncement& announcement);
    int chooseAskingPlayerNumber(const DeviceAnnouncement& targetPlayer) const;

    struct ClientRecord {
        std::shared_ptr<Client> client;
        int useCount{0};
        std::chrono::steady_clock::time_point lastUsed;
    };

    DeviceRoster& roster_;

    mutable std::mutex clientsMutex_;
    std::unordered_map<int, ClientRecord> openClients_;

    mutable std::mutex dbServerMutex_;
    std::unordered_map<uint32_t, int> dbServerPorts_;

    std::atomic<int> idleLimit_{1};
    std::atomic<int> socketTimeout_{DEFAULT_SOCKET_TIMEOUT};
    std::atomic<int> posingAsPlayer_{0};
    std::atomic<int> dbServerQueryPort_{DEFAULT_DB_SERVER_QUERY_PORT};

    std::atomic<bool> running_{false};

    DeviceAnnouncementListenerPtr announcementListener_;

    std::mutex stopMutex_;
    std::condition_variable stopCondition_;
    std::thread idleCloserThread_;

    std::mutex activeQueryMutex_;
    std::condition_variable queriesFinished_;
    std::unordered_set<uint32_t> activeQueries_;
};

} // namespace cdjmeta::dbserver
