#pragma once

#include "Exceptions.hpp"
#include "LifecycleListener.hpp"
#include "Log.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace cdjmeta {

/**
 * A component that can be started and stopped, and tells interested
 * listeners when that happens.
 */
class LifecycleParticipant {
public:
    virtual ~LifecycleParticipant() = default;

    void addLifecycleListener(const LifecycleListenerPtr& listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (std::find(lifecycleListeners_.begin(), lifecycleListeners_.end(), listener) == lifecycleListeners_.end()) {
            lifecycleListeners_.push_back(listener);
        }
    }

    void removeLifecycleListener(const LifecycleListenerPtr& listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        lifecycleListeners_.erase(
            std::remove(lifecycleListeners_.begin(), lifecycleListeners_.end(), listener),
            lifecycleListeners_.end());
    }

    std::vector<LifecycleListenerPtr> getLifecycleListeners() const {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        return lifecycleListeners_;
    }

    virtual bool isRunning() const = 0;

protected:
    virtual std::string participantName() const = 0;

    /**
     * Tell the lifecycle listeners we have started or stopped. Delivered on
     * the calling thread, so listeners see the events in order.
     */
    void deliverLifecycleAnnouncement(bool starting) {
        for (const auto& listener : getLifecycleListeners()) {
            try {
                if (starting) {
                    listener->started(*this);
                } else {
                    listener->stopped(*this);
                }
            } catch (const std::exception& e) {
                Log::warn(participantName(), "Problem delivering lifecycle announcement to listener: {}", e.what());
            } catch (...) {
                Log::warn(participantName(), "Problem delivering lifecycle announcement to listener: unknown exception");
            }
        }
    }

    /**
     * @throws IllegalStateError if we are not running
     */
    void ensureRunning() const {
        if (!isRunning()) {
            throw IllegalStateError(participantName() + " is not running");
        }
    }

private:
    mutable std::mutex lifecycleMutex_;
    std::vector<LifecycleListenerPtr> lifecycleListeners_;
};

} // namespace cdjmeta
