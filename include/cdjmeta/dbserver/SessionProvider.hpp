#pragma once

#include "Session.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace cdjmeta::dbserver {

/**
 * Hands out dbserver sessions for players on the network.
 */
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    /**
     * Run a task with a session for the target player, opening one if needed.
     * Exceptions thrown by the task, or while opening the session, propagate.
     *
     * @param description what the task is doing, used in error messages
     */
    virtual void withSession(int targetPlayer, const std::function<void(Session&)>& task,
                             const std::string& description) = 0;

    /**
     * Like withSession(), but returns whatever the task returns.
     */
    template <typename Task>
    auto invokeWithClientSession(int targetPlayer, Task&& task, const std::string& description)
        -> decltype(task(std::declval<Session&>())) {
        using Result = decltype(task(std::declval<Session&>()));
        if constexpr (std::is_void_v<Result>) {
            withSession(targetPlayer, [&task](Session& session) { task(session); }, description);
        } else {
            std::optional<Result> result;
            withSession(targetPlayer, [&task, &result](Session& session) { result.emplace(task(session)); },
                        description);
            if (!result) {
                throw std::logic_error("Session task was never run for " + description);
            }
            return std::move(*result);
        }
    }
};

} // namespace cdjmeta::dbserver
