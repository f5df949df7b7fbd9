/**
 * @file test_subscription_registry.cpp
 * @brief Unit tests for SubscriptionRegistry with an in-process channel.
 */

#include "transport/event_channel.h"
#include "transport/snapshot_source.h"
#include "transport/subscription_registry.h"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;
using namespace roomcast;
using namespace roomcast::transport;
using roomcast::events::EventKind;

namespace {

// Connects synchronously unless told to stay down
class FakeEventChannel : public EventChannel {
   public:
    void connect() override {
        ++connectCalls;
        if (connected_ || !reachable) {
            return;
        }
        connected_ = true;
        notifyConnected();
    }

    void close() override {
        if (connected_) {
            ++closeCalls;
        }
        connected_ = false;
    }

    bool isConnected() const override {
        return connected_;
    }

    // Daemon came up (or came back) while connect() was retrying
    void comeUp() {
        reachable = true;
        connected_ = true;
        notifyConnected();
    }

    void emit(const events::Event& event) {
        deliver(event);
    }

    bool reachable = true;
    int connectCalls = 0;
    int closeCalls = 0;

   private:
    std::atomic<bool> connected_{false};
};

class FakeSnapshotSource : public SnapshotSource {
   public:
    std::optional<json> fetch() override {
        ++fetchCalls;
        if (failing) {
            return std::nullopt;
        }
        return state;
    }

    void setVersion(uint64_t version, const std::string& activeSource = "none") {
        state = json{{"active_source", activeSource}, {"version", version}};
    }

    json state = json{{"active_source", "none"}, {"version", uint64_t{0}}};
    bool failing = false;
    int fetchCalls = 0;
};

events::Event stateChanged(uint64_t version, const std::string& activeSource = "roc") {
    events::Event event;
    event.kind = EventKind::SystemStateChanged;
    event.data = json{{"full_state", {{"active_source", activeSource}, {"version", version}}},
                      {"reason", "source_changed"}};
    event.source = "coordinator";
    return event;
}

events::Event transitionStart(uint64_t version) {
    events::Event event = stateChanged(version);
    event.kind = EventKind::SystemTransitionStart;
    return event;
}

events::Event volumeChanged(int level) {
    events::Event event;
    event.kind = EventKind::VolumeChanged;
    event.data = json{{"volume", level}};
    return event;
}

// Collects what one subscriber saw
struct Observer {
    std::vector<events::Event> seen;
    std::mutex mutex;

    SubscriptionRegistry::Callback callback() {
        return [this](const events::Event& event) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(event);
        };
    }

    SubscriptionRegistry::Callbacks all() {
        SubscriptionRegistry::Callbacks callbacks;
        for (auto kind : events::kAllEventKinds) {
            callbacks[kind] = callback();
        }
        return callbacks;
    }

    std::vector<uint64_t> stateVersions() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<uint64_t> versions;
        for (const auto& event : seen) {
            if (event.kind == EventKind::SystemStateChanged) {
                versions.push_back(event.data["full_state"]["version"].get<uint64_t>());
            }
        }
        return versions;
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size();
    }
};

}  // namespace

class SubscriptionRegistryTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeEventChannel> channel = std::make_shared<FakeEventChannel>();
    std::shared_ptr<FakeSnapshotSource> snapshots = std::make_shared<FakeSnapshotSource>();
    SubscriptionRegistry registry{channel, snapshots};
};

// ============================================================
// Lifecycle
// ============================================================

TEST(SubscriptionRegistryConstruction, RejectsNullCollaborators) {
    EXPECT_THROW(SubscriptionRegistry(nullptr, std::make_shared<FakeSnapshotSource>()),
                 std::invalid_argument);
    EXPECT_THROW(SubscriptionRegistry(std::make_shared<FakeEventChannel>(), nullptr),
                 std::invalid_argument);
}

TEST_F(SubscriptionRegistryTest, FirstSubscriberOpensChannelAndGetsSnapshot) {
    snapshots->setVersion(3, "bluetooth");
    Observer first;

    EXPECT_TRUE(registry.addSubscriber("first", first.all()));

    EXPECT_EQ(channel->connectCalls, 1);
    EXPECT_TRUE(channel->isConnected());
    EXPECT_EQ(snapshots->fetchCalls, 1);
    ASSERT_EQ(first.count(), 1u);
    EXPECT_EQ(first.seen[0].data["reason"], "snapshot");
    EXPECT_EQ(first.seen[0].source, "registry");
    EXPECT_EQ(first.seen[0].data["full_state"]["active_source"], "bluetooth");

    auto cached = registry.cachedFullState();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ((*cached)["version"], 3);
}

TEST_F(SubscriptionRegistryTest, AddAndRemoveAreIdempotent) {
    Observer observer;
    EXPECT_TRUE(registry.addSubscriber("a", observer.all()));
    EXPECT_FALSE(registry.addSubscriber("a", observer.all()));
    EXPECT_EQ(registry.subscriberCount(), 1u);
    EXPECT_EQ(channel->connectCalls, 1);

    EXPECT_TRUE(registry.removeSubscriber("a"));
    EXPECT_FALSE(registry.removeSubscriber("a"));
    EXPECT_FALSE(registry.removeSubscriber("never"));
    EXPECT_EQ(registry.subscriberCount(), 0u);
    EXPECT_EQ(channel->closeCalls, 1);
}

TEST_F(SubscriptionRegistryTest, LastSubscriberClosesChannelAndDropsCache) {
    Observer a;
    Observer b;
    registry.addSubscriber("a", a.all());
    registry.addSubscriber("b", b.all());

    registry.removeSubscriber("a");
    EXPECT_TRUE(channel->isConnected());
    EXPECT_TRUE(registry.cachedFullState().has_value());

    registry.removeSubscriber("b");
    EXPECT_FALSE(channel->isConnected());
    EXPECT_FALSE(registry.cachedFullState().has_value());
}

TEST_F(SubscriptionRegistryTest, ReopenAfterZeroDeliversFreshSnapshot) {
    snapshots->setVersion(3);
    Observer early;
    registry.addSubscriber("early", early.all());
    channel->emit(stateChanged(4));
    registry.removeSubscriber("early");

    // State moved on while nobody was listening
    snapshots->setVersion(9, "librespot");
    Observer later;
    registry.addSubscriber("later", later.all());

    EXPECT_EQ(channel->connectCalls, 2);
    EXPECT_EQ(later.stateVersions(), std::vector<uint64_t>{9});
    EXPECT_EQ(later.seen[0].data["full_state"]["active_source"], "librespot");
    EXPECT_EQ((*registry.cachedFullState())["version"], 9);
}

TEST_F(SubscriptionRegistryTest, DestructorClosesChannel) {
    auto localChannel = std::make_shared<FakeEventChannel>();
    {
        SubscriptionRegistry local(localChannel, snapshots);
        Observer observer;
        local.addSubscriber("x", observer.all());
        EXPECT_TRUE(localChannel->isConnected());
    }
    EXPECT_FALSE(localChannel->isConnected());

    // handlers were detached with the registry
    localChannel->emit(stateChanged(1));
}

// ============================================================
// Late joiners
// ============================================================

TEST_F(SubscriptionRegistryTest, LateJoinerGetsItsOwnFreshSnapshot) {
    snapshots->setVersion(1);
    Observer first;
    registry.addSubscriber("first", first.all());
    channel->emit(stateChanged(2));
    channel->emit(stateChanged(3));

    snapshots->setVersion(3, "roc");
    Observer late;
    registry.addSubscriber("late", late.all());

    EXPECT_EQ(snapshots->fetchCalls, 2);
    EXPECT_EQ(late.stateVersions(), std::vector<uint64_t>{3});
    // the existing subscriber is not disturbed
    EXPECT_EQ(first.stateVersions(), (std::vector<uint64_t>{1, 2, 3}));
}

TEST_F(SubscriptionRegistryTest, LateJoinerDropsOlderLiveEvents) {
    Observer first;
    registry.addSubscriber("first", first.all());

    snapshots->setVersion(10);
    Observer late;
    registry.addSubscriber("late", late.all());

    // in flight before the snapshot was taken
    channel->emit(stateChanged(9));
    channel->emit(stateChanged(10));
    channel->emit(stateChanged(11));

    EXPECT_EQ(late.stateVersions(), (std::vector<uint64_t>{10, 11}));
    EXPECT_EQ(first.stateVersions(), (std::vector<uint64_t>{0, 9, 10, 11}));
}

TEST_F(SubscriptionRegistryTest, LateJoinerWithFailedFetchWaitsForLiveEvents) {
    Observer first;
    registry.addSubscriber("first", first.all());

    snapshots->failing = true;
    Observer late;
    EXPECT_TRUE(registry.addSubscriber("late", late.all()));
    EXPECT_EQ(late.count(), 0u);

    channel->emit(stateChanged(5));
    EXPECT_EQ(late.stateVersions(), std::vector<uint64_t>{5});
}

TEST_F(SubscriptionRegistryTest, SubscribersAddedWhileConnectingShareFirstSnapshot) {
    channel->reachable = false;
    Observer a;
    Observer b;
    registry.addSubscriber("a", a.all());
    registry.addSubscriber("b", b.all());
    EXPECT_EQ(snapshots->fetchCalls, 0);

    snapshots->setVersion(6);
    channel->comeUp();

    EXPECT_EQ(snapshots->fetchCalls, 1);
    EXPECT_EQ(a.stateVersions(), std::vector<uint64_t>{6});
    EXPECT_EQ(b.stateVersions(), std::vector<uint64_t>{6});
}

// ============================================================
// Dispatch and suppression
// ============================================================

TEST_F(SubscriptionRegistryTest, RoutesOnlyToRegisteredKinds) {
    Observer volumeOnly;
    Observer stateOnly;
    registry.addSubscriber("volume", {{EventKind::VolumeChanged, volumeOnly.callback()}});
    registry.addSubscriber("state", {{EventKind::SystemStateChanged, stateOnly.callback()}});
    const size_t stateBaseline = stateOnly.count();

    channel->emit(volumeChanged(30));
    channel->emit(stateChanged(5));

    ASSERT_EQ(volumeOnly.count(), 1u);
    EXPECT_EQ(volumeOnly.seen[0].data["volume"], 30);
    EXPECT_EQ(stateOnly.count(), stateBaseline + 1);
}

TEST_F(SubscriptionRegistryTest, StaleAndDuplicateSnapshotsAreSuppressed) {
    Observer observer;
    registry.addSubscriber("o", observer.all());

    channel->emit(stateChanged(5));
    channel->emit(stateChanged(4));
    channel->emit(stateChanged(5));
    channel->emit(stateChanged(6));

    EXPECT_EQ(observer.stateVersions(), (std::vector<uint64_t>{0, 5, 6}));
}

TEST_F(SubscriptionRegistryTest, SuppressionIsPerKind) {
    Observer observer;
    registry.addSubscriber("o", observer.all());
    const size_t baseline = observer.count();

    channel->emit(stateChanged(7));
    channel->emit(transitionStart(7));
    channel->emit(transitionStart(7));

    EXPECT_EQ(observer.count(), baseline + 2);
}

TEST_F(SubscriptionRegistryTest, EventsWithoutFullStateAreNeverSuppressed) {
    Observer observer;
    registry.addSubscriber("o", observer.all());
    const size_t baseline = observer.count();

    channel->emit(volumeChanged(20));
    channel->emit(volumeChanged(20));

    EXPECT_EQ(observer.count(), baseline + 2);
}

TEST_F(SubscriptionRegistryTest, StateChangedIsCachedFromLiveEvents) {
    Observer volumeOnly;
    registry.addSubscriber("v", {{EventKind::VolumeChanged, volumeOnly.callback()}});

    channel->emit(stateChanged(12, "bluetooth"));
    auto cached = registry.cachedFullState();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ((*cached)["active_source"], "bluetooth");
}

// ============================================================
// Reconnect
// ============================================================

TEST_F(SubscriptionRegistryTest, ReconnectRefetchesAndResetsVersions) {
    snapshots->setVersion(20);
    Observer observer;
    registry.addSubscriber("o", observer.all());
    channel->emit(stateChanged(21));

    // daemon restarted: versions begin again
    snapshots->setVersion(1, "none");
    channel->comeUp();
    channel->emit(stateChanged(2));

    EXPECT_EQ(observer.stateVersions(), (std::vector<uint64_t>{20, 21, 1, 2}));
    EXPECT_EQ(snapshots->fetchCalls, 2);
}

TEST_F(SubscriptionRegistryTest, FailedRefetchKeepsDelivering) {
    Observer observer;
    registry.addSubscriber("o", observer.all());

    snapshots->failing = true;
    channel->comeUp();
    channel->emit(stateChanged(3));

    EXPECT_EQ(observer.stateVersions(), (std::vector<uint64_t>{0, 3}));
}

// ============================================================
// Re-entrancy
// ============================================================

TEST_F(SubscriptionRegistryTest, CallbackMayRemoveItself) {
    int calls = 0;
    SubscriptionRegistry::Callbacks callbacks;
    callbacks[EventKind::VolumeChanged] = [&](const events::Event&) {
        ++calls;
        registry.removeSubscriber("self");
    };
    registry.addSubscriber("self", callbacks);

    channel->emit(volumeChanged(1));
    channel->emit(volumeChanged(2));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(registry.subscriberCount(), 0u);
    EXPECT_FALSE(channel->isConnected());
}

TEST_F(SubscriptionRegistryTest, CallbackMayAddSubscriber) {
    Observer added;
    bool once = false;
    SubscriptionRegistry::Callbacks callbacks;
    callbacks[EventKind::VolumeChanged] = [&](const events::Event&) {
        if (!once) {
            once = true;
            registry.addSubscriber("added", added.all());
        }
    };
    registry.addSubscriber("adder", callbacks);

    snapshots->setVersion(8);
    channel->emit(volumeChanged(1));

    EXPECT_EQ(registry.subscriberCount(), 2u);
    EXPECT_EQ(added.stateVersions(), std::vector<uint64_t>{8});
}
