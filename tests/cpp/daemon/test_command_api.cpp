/**
 * @file test_command_api.cpp
 * @brief Unit tests for CommandApi param validation and response envelopes.
 */

#include "coordinator/state_committer.h"
#include "coordinator/transition_coordinator.h"
#include "daemon/control/command_api.h"
#include "events/event_bus.h"
#include "state/state_store.h"
#include "support/fake_backend.h"
#include "volume/volume_controller.h"

#include <chrono>
#include <gtest/gtest.h>
#include <limits>
#include <memory>

using json = nlohmann::json;
using namespace roomcast;
using roomcast::state::SourceId;
using roomcast::testing::FakeBackend;

namespace {

constexpr std::chrono::milliseconds kIdleWait{3000};

bool isAccepted(const json& response) {
    return response["status"] == "ok" && response.contains("data") &&
           response["data"].value("accepted", false);
}

bool isNoOp(const json& response) {
    return response["status"] == "ok" && response.contains("data") &&
           response["data"].value("noop", false);
}

std::string errorCodeOf(const json& response) {
    if (response["status"] != "error") {
        return "";
    }
    return response["error_code"].get<std::string>();
}

}  // namespace

// ============================================================
// Envelope helpers
// ============================================================

TEST(CommandApiResponse, OkResponseOmitsEmptyFields) {
    json bare = api::buildOkResponse();
    EXPECT_EQ(bare["status"], "ok");
    EXPECT_FALSE(bare.contains("message"));
    EXPECT_FALSE(bare.contains("data"));

    json full = api::buildOkResponse("pong", json{{"instance", "abc"}});
    EXPECT_EQ(full["message"], "pong");
    EXPECT_EQ(full["data"]["instance"], "abc");
}

TEST(CommandApiResponse, RequestResultMapping) {
    EXPECT_TRUE(isAccepted(api::toResponse(coordinator::RequestResult::accepted())));
    EXPECT_TRUE(isNoOp(api::toResponse(coordinator::RequestResult::noop())));
    EXPECT_EQ(errorCodeOf(api::toResponse(coordinator::RequestResult::busy())),
              "TRANSITION_BUSY");
    EXPECT_EQ(errorCodeOf(api::toResponse(coordinator::RequestResult::invalid(
                  ErrorCode::VALIDATION_INVALID_VOLUME, "bad"))),
              "VALIDATION_INVALID_VOLUME");
}

// ============================================================
// Commands
// ============================================================

class CommandApiTest : public ::testing::Test {
   protected:
    void SetUp() override {
        volume::VolumeOptions options;
        options.coalesceWindow = std::chrono::milliseconds(10);
        options.hardwareMax = 100;
        transitions = std::make_unique<coordinator::TransitionCoordinator>(committer, fakeBackend);
        volumeControl = std::make_unique<volume::VolumeController>(committer, fakeBackend, options);
        commandApi = std::make_unique<api::CommandApi>(committer, *transitions, *volumeControl,
                                                       fakeBackend, "1700000000000-42");
    }

    void TearDown() override {
        fakeBackend->releaseGate();
        commandApi.reset();
        volumeControl.reset();
        transitions.reset();
    }

    void waitIdle() {
        ASSERT_TRUE(transitions->waitUntilIdle(kIdleWait));
        ASSERT_TRUE(volumeControl->waitUntilIdle(kIdleWait));
    }

    state::StateStore store;
    events::EventBus bus;
    coordinator::StateCommitter committer{store, bus};
    std::shared_ptr<FakeBackend> fakeBackend = std::make_shared<FakeBackend>();
    std::unique_ptr<coordinator::TransitionCoordinator> transitions;
    std::unique_ptr<volume::VolumeController> volumeControl;
    std::unique_ptr<api::CommandApi> commandApi;
};

TEST_F(CommandApiTest, PingCarriesInstanceId) {
    json response = commandApi->ping();
    EXPECT_EQ(response["status"], "ok");
    EXPECT_EQ(response["message"], "pong");
    EXPECT_EQ(response["data"]["instance"], "1700000000000-42");
}

TEST_F(CommandApiTest, GetStateReturnsFullSnapshot) {
    json response = commandApi->getState();
    ASSERT_EQ(response["status"], "ok");
    const auto& full = response["data"]["full_state"];
    EXPECT_EQ(full["active_source"], "none");
    EXPECT_EQ(full["version"], store.version());
}

TEST_F(CommandApiTest, SetSourceValidatesParams) {
    EXPECT_EQ(errorCodeOf(commandApi->setSource(json::object())), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setSource(json{{"source", 3}})), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setSource(json{{"source", "radio"}})),
              "VALIDATION_INVALID_SOURCE");
    EXPECT_TRUE(fakeBackend->calls().empty());
    EXPECT_EQ(store.version(), 0u);
}

TEST_F(CommandApiTest, SetSourceAcceptsThenNoOps) {
    EXPECT_TRUE(isAccepted(commandApi->setSource(json{{"source", "roc"}})));
    waitIdle();
    EXPECT_EQ(store.snapshot().activeSource, SourceId::Roc);
    EXPECT_TRUE(isNoOp(commandApi->setSource(json{{"source", "roc"}})));
}

TEST_F(CommandApiTest, BusyIsReportedAsError) {
    fakeBackend->closeGate("start:bluetooth");
    ASSERT_TRUE(isAccepted(commandApi->setSource(json{{"source", "bluetooth"}})));
    ASSERT_TRUE(fakeBackend->waitForCount("start:bluetooth", 1));

    json response = commandApi->setEqualizer(json{{"enabled", true}});
    EXPECT_EQ(errorCodeOf(response), "TRANSITION_BUSY");
    EXPECT_FALSE(response["message"].get<std::string>().empty());

    fakeBackend->releaseGate();
    waitIdle();
}

TEST_F(CommandApiTest, RoutingAcceptsModeOrFlag) {
    EXPECT_EQ(errorCodeOf(commandApi->setRouting(json::object())), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setRouting(json{{"mode", "surround"}})),
              "VALIDATION_INVALID_ROUTING_MODE");

    EXPECT_TRUE(isAccepted(commandApi->setRouting(json{{"mode", "multiroom"}})));
    waitIdle();
    EXPECT_TRUE(store.snapshot().multiroomEnabled());

    EXPECT_TRUE(isNoOp(commandApi->setRouting(json{{"multiroom", true}})));
    EXPECT_TRUE(isAccepted(commandApi->setRouting(json{{"multiroom", false}})));
    waitIdle();
    EXPECT_FALSE(store.snapshot().multiroomEnabled());
}

TEST_F(CommandApiTest, EqualizerRequiresBool) {
    EXPECT_EQ(errorCodeOf(commandApi->setEqualizer(json{{"enabled", "yes"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_TRUE(isAccepted(commandApi->setEqualizer(json{{"enabled", true}})));
    waitIdle();
    EXPECT_TRUE(store.snapshot().equalizerEnabled);
}

TEST_F(CommandApiTest, VolumeCommands) {
    EXPECT_EQ(errorCodeOf(commandApi->setVolume(json::object())), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setVolume(json{{"volume", 12.5}})), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setVolume(json{{"volume", 101}})),
              "VALIDATION_INVALID_VOLUME");

    EXPECT_TRUE(isAccepted(commandApi->setVolume(json{{"volume", 40}, {"show_bar", true}})));
    waitIdle();
    EXPECT_EQ(store.snapshot().volume.level, 40);

    EXPECT_TRUE(isAccepted(commandApi->adjustVolume(json{{"delta", -15}})));
    waitIdle();
    EXPECT_EQ(store.snapshot().volume.level, 25);

    EXPECT_TRUE(isAccepted(commandApi->adjustVolume(json{{"client_steps", 2}})));
    waitIdle();
    EXPECT_EQ(store.snapshot().volume.level, 35);

    EXPECT_EQ(errorCodeOf(commandApi->adjustVolume(json::object())), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->adjustVolume(json{{"delta", "up"}})),
              "IPC_INVALID_PARAMS");
}

TEST_F(CommandApiTest, VolumeIntegersOutsideIntRangeAreRejected) {
    // 2^32 + 50 would read back as 50 if truncated to int
    EXPECT_EQ(errorCodeOf(commandApi->setVolume(json{{"volume", 4294967346ULL}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->setVolume(json{{"volume", -4294967246LL}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->adjustVolume(json{{"delta", 4294967296LL}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->adjustVolume(json{{"client_steps", 9223372036854775807LL}})),
              "IPC_INVALID_PARAMS");
    waitIdle();
    EXPECT_EQ(fakeBackend->count("volume"), 0u);

    EXPECT_TRUE(
        isAccepted(commandApi->adjustVolume(json{{"delta", std::numeric_limits<int>::max()}})));
    waitIdle();
    EXPECT_EQ(store.snapshot().volume.level, 100);
}

TEST_F(CommandApiTest, MuteCommand) {
    EXPECT_EQ(errorCodeOf(commandApi->setMute(json{{"muted", 1}})), "IPC_INVALID_PARAMS");
    EXPECT_TRUE(isNoOp(commandApi->setMute(json{{"muted", false}})));
    EXPECT_TRUE(isAccepted(commandApi->setMute(json{{"muted", true}})));
    waitIdle();
    EXPECT_TRUE(store.snapshot().volume.muted);
}

TEST_F(CommandApiTest, PlaybackValidation) {
    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"command", "play"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"source", "roc"}})), "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"source", "none"}, {"command", "play"}})),
              "VALIDATION_INVALID_SOURCE");
    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"source", "roc"}, {"command", "rewind"}})),
              "VALIDATION_INVALID_PLAYBACK_COMMAND");
    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"source", "roc"}, {"command", "play"}})),
              "VALIDATION_SOURCE_NOT_ACTIVE");

    ASSERT_TRUE(isAccepted(commandApi->setSource(json{{"source", "roc"}})));
    waitIdle();

    EXPECT_EQ(errorCodeOf(commandApi->playback(json{{"source", "roc"}, {"command", "seek"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_TRUE(isAccepted(commandApi->playback(
        json{{"source", "roc"}, {"command", "seek"}, {"data", {{"position_ms", 1500}}}})));
    ASSERT_TRUE(fakeBackend->waitForCount("playback", 1));
    EXPECT_EQ(fakeBackend->calls().back().data["position_ms"], 1500);
}

TEST_F(CommandApiTest, DismissErrorNoOpWithoutError) {
    EXPECT_TRUE(isNoOp(commandApi->dismissError()));

    fakeBackend->failOnce("start:librespot");
    ASSERT_TRUE(isAccepted(commandApi->setSource(json{{"source", "librespot"}})));
    waitIdle();
    ASSERT_TRUE(store.snapshot().error.has_value());

    EXPECT_TRUE(isAccepted(commandApi->dismissError()));
    EXPECT_FALSE(store.snapshot().error.has_value());
}

TEST_F(CommandApiTest, PluginReportPushesThroughBackend) {
    ASSERT_TRUE(isAccepted(commandApi->setSource(json{{"source", "librespot"}})));
    waitIdle();

    json response = commandApi->pluginReport(
        json{{"source", "librespot"},
             {"plugin_state", "connected"},
             {"metadata", {{"title", "Song"}, {"is_playing", true}}}});
    EXPECT_TRUE(isAccepted(response));

    auto current = store.snapshot();
    EXPECT_EQ(current.pluginState, state::PluginState::Connected);
    ASSERT_EQ(current.metadata.count(SourceId::Librespot), 1u);
    EXPECT_EQ(current.metadata[SourceId::Librespot].title, "Song");
}

TEST_F(CommandApiTest, PluginReportValidation) {
    EXPECT_EQ(errorCodeOf(commandApi->pluginReport(json{{"plugin_state", "ready"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->pluginReport(json{{"source", "none"},
                                                        {"plugin_state", "ready"}})),
              "VALIDATION_INVALID_SOURCE");
    EXPECT_EQ(errorCodeOf(commandApi->pluginReport(json{{"source", "roc"},
                                                        {"plugin_state", "dancing"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->pluginReport(json{{"source", "roc"}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(errorCodeOf(commandApi->pluginReport(
                  json{{"source", "roc"}, {"metadata", {{"position_ms", "soon"}}}})),
              "IPC_INVALID_PARAMS");
    EXPECT_EQ(store.version(), 0u);
}
