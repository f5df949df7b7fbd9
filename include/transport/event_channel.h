#pragma once

#include "events/event.h"

#include <functional>
#include <mutex>

namespace roomcast::transport {

/**
 * @brief Client side of the event broadcast.
 *
 * Delivers decoded events to a single sink and reports every established
 * connection (the first one included) through the reconnect handler, so the owner
 * can refetch a snapshot. Events are not replayed across a reconnect.
 */
class EventChannel {
   public:
    using EventHandler = std::function<void(const events::Event&)>;
    using ReconnectHandler = std::function<void()>;

    virtual ~EventChannel() = default;

    // Idempotent. Keeps retrying with backoff until close().
    virtual void connect() = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    void setEventHandler(EventHandler handler);
    void setReconnectHandler(ReconnectHandler handler);

   protected:
    void deliver(const events::Event& event);
    void notifyConnected();

   private:
    mutable std::mutex handlerMutex_;
    EventHandler eventHandler_;
    ReconnectHandler reconnectHandler_;
};

}  // namespace roomcast::transport
