#include "transport/event_channel.h"

namespace roomcast::transport {

void EventChannel::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    eventHandler_ = std::move(handler);
}

void EventChannel::setReconnectHandler(ReconnectHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    reconnectHandler_ = std::move(handler);
}

void EventChannel::deliver(const events::Event& event) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = eventHandler_;
    }
    if (handler) {
        handler(event);
    }
}

void EventChannel::notifyConnected() {
    ReconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = reconnectHandler_;
    }
    if (handler) {
        handler();
    }
}

}  // namespace roomcast::transport
