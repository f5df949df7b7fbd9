#include "transport/subscription_registry.h"

#include "logging/logger.h"

#include <stdexcept>

namespace roomcast::transport {

SubscriptionRegistry::SubscriptionRegistry(std::shared_ptr<EventChannel> channel,
                                           std::shared_ptr<SnapshotSource> snapshots)
    : channel_(std::move(channel)), snapshots_(std::move(snapshots)) {
    if (!channel_ || !snapshots_) {
        throw std::invalid_argument("SubscriptionRegistry requires a channel and a snapshot source");
    }
    channel_->setEventHandler([this](const events::Event& event) { dispatch(event); });
    channel_->setReconnectHandler([this]() { onConnected(); });
}

SubscriptionRegistry::~SubscriptionRegistry() {
    channel_->close();
    channel_->setEventHandler(nullptr);
    channel_->setReconnectHandler(nullptr);
}

bool SubscriptionRegistry::addSubscriber(const std::string& id, Callbacks callbacks) {
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->id = id;
    subscriber->callbacks = std::move(callbacks);

    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!subscribers_.emplace(id, subscriber).second) {
            LOG_DEBUG("[Registry] Subscriber {} already registered", id);
            return false;
        }
        first = (subscribers_.size() == 1);
        count_.store(subscribers_.size(), std::memory_order_release);
    }
    LOG_DEBUG("[Registry] Added {} ({} total)", id, subscriberCount());

    if (first) {
        // Snapshot for everyone arrives through onConnected()
        channel_->connect();
        return true;
    }
    if (!channel_->isConnected()) {
        return true;
    }

    auto fullState = snapshots_->fetch();
    if (!fullState) {
        LOG_WARN("[Registry] Snapshot fetch for {} failed; waiting for live events", id);
        return true;
    }
    deliverTo(*subscriber, makeSnapshotEvent(*fullState));
    return true;
}

bool SubscriptionRegistry::removeSubscriber(const std::string& id) {
    SubscriberPtr removed;
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return false;
        }
        removed = it->second;
        subscribers_.erase(it);
        count_.store(subscribers_.size(), std::memory_order_release);
        last = subscribers_.empty();
        if (last) {
            cachedFullState_.reset();
        }
    }
    removed->active.store(false, std::memory_order_release);
    LOG_DEBUG("[Registry] Removed {} ({} left)", id, subscriberCount());

    if (last) {
        channel_->close();
        // A subscriber added while the channel was closing still needs a connection
        if (subscriberCount() > 0) {
            channel_->connect();
        }
    }
    return true;
}

std::optional<nlohmann::json> SubscriptionRegistry::cachedFullState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cachedFullState_;
}

void SubscriptionRegistry::dispatch(const events::Event& event) {
    if (event.kind == events::EventKind::SystemStateChanged && event.data.contains("full_state") &&
        event.data["full_state"].is_object()) {
        cacheFullState(event.data["full_state"]);
    }
    for (const auto& subscriber : subscribersCopy()) {
        deliverTo(*subscriber, event);
    }
}

void SubscriptionRegistry::onConnected() {
    auto fullState = snapshots_->fetch();
    if (!fullState) {
        LOG_WARN("[Registry] Snapshot fetch after connect failed");
        return;
    }
    cacheFullState(*fullState);

    // Versions do not carry across a connection (the daemon may have restarted)
    auto snapshot = makeSnapshotEvent(*fullState);
    for (const auto& subscriber : subscribersCopy()) {
        {
            std::lock_guard<std::mutex> lock(subscriber->deliveryMutex);
            subscriber->lastVersion.fill(std::nullopt);
        }
        deliverTo(*subscriber, snapshot);
    }
}

std::vector<SubscriptionRegistry::SubscriberPtr> SubscriptionRegistry::subscribersCopy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SubscriberPtr> copy;
    copy.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
        copy.push_back(entry.second);
    }
    return copy;
}

void SubscriptionRegistry::cacheFullState(const nlohmann::json& fullState) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscribers_.empty()) {
        cachedFullState_ = fullState;
    }
}

void SubscriptionRegistry::deliverTo(Subscriber& subscriber, const events::Event& event) {
    std::lock_guard<std::mutex> lock(subscriber.deliveryMutex);
    if (!subscriber.active.load(std::memory_order_acquire)) {
        return;
    }
    if (auto version = events::fullStateVersion(event)) {
        auto& last = subscriber.lastVersion[events::eventKindIndex(event.kind)];
        if (last && *version <= *last) {
            LOG_TRACE("[Registry] Suppressed {} v{} for {} (last v{})",
                      events::eventKindName(event.kind), *version, subscriber.id, *last);
            return;
        }
        last = *version;
    }

    auto it = subscriber.callbacks.find(event.kind);
    if (it == subscriber.callbacks.end() || !it->second) {
        return;
    }
    it->second(event);
}

events::Event SubscriptionRegistry::makeSnapshotEvent(const nlohmann::json& fullState) {
    events::Event event;
    event.kind = events::EventKind::SystemStateChanged;
    event.data = nlohmann::json{{"full_state", fullState}, {"reason", "snapshot"}};
    event.source = "registry";
    event.timestampMs = events::nowMs();
    return event;
}

}  // namespace roomcast::transport
