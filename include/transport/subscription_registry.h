#pragma once

#include "events/event.h"
#include "transport/event_channel.h"
#include "transport/snapshot_source.h"

#include <array>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomcast::transport {

/**
 * @brief Multiplexes local observers onto one shared EventChannel.
 *
 * The first subscriber opens the channel and the last one closes it. Every
 * established connection triggers a fresh snapshot fetch delivered to all
 * subscribers; a subscriber added while already connected gets its own fresh
 * snapshot. Events carrying a full_state are suppressed per subscriber and kind
 * when their version is not newer than the last one delivered.
 *
 * Callbacks run on the channel thread (or the caller of addSubscriber for its
 * initial snapshot) with no registry lock held. They may add or remove
 * subscribers.
 */
class SubscriptionRegistry {
   public:
    using Callback = std::function<void(const events::Event&)>;
    using Callbacks = std::map<events::EventKind, Callback>;

    SubscriptionRegistry(std::shared_ptr<EventChannel> channel,
                         std::shared_ptr<SnapshotSource> snapshots);
    ~SubscriptionRegistry();

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    // @return false if the id is already registered (nothing changes)
    bool addSubscriber(const std::string& id, Callbacks callbacks);
    // @return false if the id is not registered
    bool removeSubscriber(const std::string& id);

    size_t subscriberCount() const {
        return count_.load(std::memory_order_acquire);
    }

    // Latest system.state_changed full_state seen on the channel
    std::optional<nlohmann::json> cachedFullState() const;

    // Routes an inbound event to every matching callback
    void dispatch(const events::Event& event);

   private:
    struct Subscriber {
        std::string id;
        Callbacks callbacks;
        std::atomic<bool> active{true};
        std::mutex deliveryMutex;  // serializes delivery to this subscriber
        std::array<std::optional<uint64_t>, events::kEventKindCount> lastVersion;
    };
    using SubscriberPtr = std::shared_ptr<Subscriber>;

    void onConnected();
    std::vector<SubscriberPtr> subscribersCopy() const;
    void cacheFullState(const nlohmann::json& fullState);
    static void deliverTo(Subscriber& subscriber, const events::Event& event);
    static events::Event makeSnapshotEvent(const nlohmann::json& fullState);

    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<SnapshotSource> snapshots_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SubscriberPtr> subscribers_;
    std::atomic<size_t> count_{0};
    std::optional<nlohmann::json> cachedFullState_;
};

}  // namespace roomcast::transport
