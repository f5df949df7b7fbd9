/**
 * @file test_daemon_app.cpp
 * @brief Daemon startup state and the shutdown/reload loop control.
 */

#include "coordinator/routing_settings.h"
#include "daemon/app/app.h"
#include "daemon/shutdown_manager.h"
#include "volume/volume_controller.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace roomcast;

// ============================================================
// buildInitialState
// ============================================================

TEST(DaemonInitialState, TakesRoutingAndStartupVolumeFromConfig) {
    AppConfig config;
    config.routing.multiroom = true;
    config.routing.equalizer = true;
    config.volume.startup = 35;

    auto initial = daemon_app::buildInitialState(config);
    EXPECT_EQ(initial.routingMode, state::RoutingMode::Multiroom);
    EXPECT_TRUE(initial.equalizerEnabled);
    EXPECT_EQ(initial.volume.level, 35);
    EXPECT_FALSE(initial.volume.muted);
    EXPECT_EQ(initial.activeSource, state::SourceId::None);
}

TEST(DaemonInitialState, RestoresLastVolumeWhenEnabled) {
    fs::path file =
        fs::temp_directory_path() / ("roomcast_last_volume_" + std::to_string(getpid()));
    ASSERT_TRUE(volume::saveLastVolume(file, 62));

    AppConfig config;
    config.volume.startup = 20;
    config.volume.lastVolumeFile = file.string();

    EXPECT_EQ(daemon_app::buildInitialState(config).volume.level, 20);

    config.volume.restoreLast = true;
    EXPECT_EQ(daemon_app::buildInitialState(config).volume.level, 62);

    fs::remove(file);
    EXPECT_EQ(daemon_app::buildInitialState(config).volume.level, 20);
}

TEST(DaemonInitialState, RestoresPersistedRoutingFlagsWhenEnabled) {
    fs::path file =
        fs::temp_directory_path() / ("roomcast_routing_" + std::to_string(getpid()) + ".json");
    coordinator::RoutingSettings saved;
    saved.multiroom = true;
    saved.equalizer = true;
    ASSERT_TRUE(coordinator::saveRoutingSettings(file, saved));

    AppConfig config;
    config.routing.settingsFile = file.string();

    auto initial = daemon_app::buildInitialState(config);
    EXPECT_EQ(initial.routingMode, state::RoutingMode::Direct);
    EXPECT_FALSE(initial.equalizerEnabled);

    config.routing.restoreLast = true;
    initial = daemon_app::buildInitialState(config);
    EXPECT_EQ(initial.routingMode, state::RoutingMode::Multiroom);
    EXPECT_TRUE(initial.equalizerEnabled);

    fs::remove(file);
    EXPECT_EQ(daemon_app::buildInitialState(config).routingMode, state::RoutingMode::Direct);
}

TEST(DaemonInitialState, ReloadContinuesVersionWithNewInstanceId) {
    AppConfig config;
    EXPECT_EQ(daemon_app::buildInitialState(config).version, 0u);
    EXPECT_EQ(daemon_app::buildInitialState(config, 40).version, 40u);

    std::string first = daemon_app::makeInstanceId(0);
    std::string second = daemon_app::makeInstanceId(1);
    EXPECT_NE(first, second);
    EXPECT_NE(first.find("-" + std::to_string(getpid()) + "."), std::string::npos);
}

// ============================================================
// ShutdownManager
// ============================================================

class ShutdownManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        manager.reset();
    }

    void TearDown() override {
        GracefulShutdown::getGlobalSignalState().reset();
    }

    shutdown_manager::ShutdownManager manager;
};

TEST_F(ShutdownManagerTest, KeepsRunningWithoutSignals) {
    EXPECT_TRUE(manager.tick());
    EXPECT_TRUE(manager.waitAndTick(std::chrono::milliseconds(5)));
    EXPECT_FALSE(manager.isReloadRequested());
}

TEST_F(ShutdownManagerTest, TerminationSignalStopsLoop) {
    int stops = 0;
    manager.setStopCallback([&stops] { ++stops; });

    GracefulShutdown::signalHandler(SIGTERM);
    EXPECT_FALSE(manager.tick());
    EXPECT_FALSE(manager.isRunning());
    EXPECT_FALSE(manager.isReloadRequested());
    EXPECT_EQ(stops, 1);
}

TEST_F(ShutdownManagerTest, HangupRequestsReloadUntilReset) {
    GracefulShutdown::signalHandler(SIGHUP);
    EXPECT_FALSE(manager.tick());
    EXPECT_TRUE(manager.isReloadRequested());

    manager.reset();
    EXPECT_TRUE(manager.isRunning());
    EXPECT_FALSE(manager.isReloadRequested());
}

TEST_F(ShutdownManagerTest, RequestStopWakesWaiter) {
    std::thread stopper([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        manager.requestStop();
    });

    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(manager.waitAndTick(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    stopper.join();
}
