#pragma once

#include "events/event.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace roomcast::events {

/**
 * @brief In-process fan-out of daemon events.
 *
 * The coordinator and volume controller publish here; the control plane forwards
 * every event onto the ZeroMQ PUB socket. Handlers run on the publishing thread,
 * outside the bus lock, so a handler may subscribe or unsubscribe.
 */
class EventBus {
   public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    void publish(const Event& event) const;

   private:
    struct Entry {
        SubscriptionId id;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> handlers_;
    SubscriptionId nextId_ = 1;
};

inline EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    handlers_.push_back(Entry{id, std::move(handler)});
    return id;
}

inline void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
        if (it->id == id) {
            handlers_.erase(it);
            return;
        }
    }
}

inline void EventBus::publish(const Event& event) const {
    std::vector<Entry> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handlers_;
    }
    for (const auto& entry : copy) {
        if (entry.handler) {
            entry.handler(event);
        }
    }
}

}  // namespace roomcast::events
