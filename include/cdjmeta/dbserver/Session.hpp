#pragma once

#include "Message.hpp"
#include "NumberField.hpp"

#include "cdjmeta/CdjStatus.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>

namespace cdjmeta::dbserver {

/**
 * An open conversation with one player's dbserver. Requests are numbered and
 * answered in order; menu requests leave a menu behind on the player that
 * must be rendered before another menu is requested, which is what the menu
 * lock protects.
 */
class Session {
public:
    virtual ~Session() = default;

    /**
     * The player whose database we are talking to.
     */
    virtual int targetPlayer() const = 0;

    /**
     * The player number we claimed when setting up the session.
     */
    virtual int posingAsPlayer() const = 0;

    /**
     * Build the packed "requesting player, menu, slot, track type" argument
     * that starts most requests.
     */
    static NumberField buildRMST(int requestingPlayer, Message::MenuIdentifier targetMenu,
                                 TrackSourceSlot slot, TrackType trackType = TrackType::REKORDBOX);

    NumberField buildRMST(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                          TrackType trackType = TrackType::REKORDBOX) const {
        return buildRMST(posingAsPlayer(), targetMenu, slot, trackType);
    }

    /**
     * Send a request and wait for its response.
     *
     * @param responseType if present, the type the response must have
     * @throws ProtocolError if the response has the wrong transaction or type
     */
    virtual Message simpleRequest(Message::KnownType requestType, std::optional<Message::KnownType> responseType,
                                  const std::vector<FieldPtr>& arguments) = 0;

    /**
     * Ask the player to build a menu. The caller must hold the menu lock, and
     * the response is the MENU_AVAILABLE message telling how many items there are.
     */
    virtual Message menuRequestTyped(Message::KnownType requestType, Message::MenuIdentifier targetMenu,
                                     TrackSourceSlot slot, TrackType trackType,
                                     const std::vector<FieldPtr>& arguments) = 0;

    Message menuRequest(Message::KnownType requestType, Message::MenuIdentifier targetMenu,
                        TrackSourceSlot slot, const std::vector<FieldPtr>& arguments) {
        return menuRequestTyped(requestType, targetMenu, slot, TrackType::REKORDBOX, arguments);
    }

    /**
     * Retrieve every item of the menu most recently built by menuRequest().
     * Returns an empty list when the player reported no results.
     */
    virtual std::vector<Message> renderMenuItems(Message::MenuIdentifier targetMenu, TrackSourceSlot slot,
                                                 TrackType trackType, const Message& availableResponse) = 0;

    virtual bool tryLockingForMenuOperations(std::chrono::milliseconds timeout) = 0;
    virtual void unlockForMenuOperations() = 0;
};

/**
 * Holds a session's menu lock for the lifetime of the guard.
 */
class MenuLockGuard {
public:
    /**
     * @throws std::runtime_error if the lock could not be obtained in time
     */
    MenuLockGuard(Session& session, std::chrono::milliseconds timeout)
        : session_(session)
    {
        if (!session_.tryLockingForMenuOperations(timeout)) {
            throw std::runtime_error("Unable to lock player " + std::to_string(session_.targetPlayer()) +
                                     " for menu operations");
        }
    }

    ~MenuLockGuard() {
        session_.unlockForMenuOperations();
    }

    MenuLockGuard(const MenuLockGuard&) = delete;
    MenuLockGuard& operator=(const MenuLockGuard&) = delete;

private:
    Session& session_;
};

} // namespace cdjmeta::dbserver
