#include "daemon/app/app.h"

#include "backend/command_backend.h"
#include "coordinator/routing_settings.h"
#include "coordinator/state_committer.h"
#include "coordinator/transition_coordinator.h"
#include "daemon/control/command_api.h"
#include "daemon/control/control_plane.h"
#include "daemon/shutdown_manager.h"
#include "events/event_bus.h"
#include "logging/logger.h"
#include "state/state_store.h"
#include "volume/volume_controller.h"

#include <chrono>
#include <memory>
#include <string>
#include <unistd.h>

namespace roomcast::daemon_app {

namespace {

constexpr std::chrono::milliseconds kLoopInterval{100};

volume::VolumeOptions makeVolumeOptions(const AppConfig& config) {
    volume::VolumeOptions options;
    options.step = config.volume.step;
    options.coalesceWindow = std::chrono::milliseconds(config.volume.coalesceMs);
    options.hardwareMin = config.volume.hardwareMin;
    options.hardwareMax = config.volume.hardwareMax;
    options.backendTimeout = std::chrono::milliseconds(config.transition.backendTimeoutMs);
    if (config.volume.restoreLast) {
        options.lastVolumeFile = config.volume.lastVolumeFile;
    }
    return options;
}

coordinator::CoordinatorOptions makeCoordinatorOptions(const AppConfig& config) {
    coordinator::CoordinatorOptions options;
    options.backendTimeout = std::chrono::milliseconds(config.transition.backendTimeoutMs);
    if (config.routing.restoreLast) {
        options.routingSettingsFile = config.routing.settingsFile;
    }
    return options;
}

}  // namespace

std::string makeInstanceId(unsigned generation) {
    return std::to_string(events::nowMs()) + "-" + std::to_string(static_cast<long>(getpid())) +
           "." + std::to_string(generation);
}

state::SystemState buildInitialState(const AppConfig& config, uint64_t previousVersion) {
    state::SystemState initial;
    initial.version = previousVersion;
    initial.routingMode =
        config.routing.multiroom ? state::RoutingMode::Multiroom : state::RoutingMode::Direct;
    initial.equalizerEnabled = config.routing.equalizer;
    initial.volume.level = config.volume.startup;

    if (config.routing.restoreLast) {
        auto restored = coordinator::loadRoutingSettings(config.routing.settingsFile);
        if (restored) {
            LOG_INFO("[Routing] Restored multiroom={} equalizer={}", restored->multiroom,
                     restored->equalizer);
            initial.routingMode = restored->multiroom ? state::RoutingMode::Multiroom
                                                      : state::RoutingMode::Direct;
            initial.equalizerEnabled = restored->equalizer;
        }
    }

    if (config.volume.restoreLast) {
        auto restored = volume::loadLastVolume(
            config.volume.lastVolumeFile,
            std::chrono::seconds(DaemonConstants::LAST_VOLUME_MAX_AGE_SECONDS));
        if (restored) {
            LOG_INFO("[Volume] Restored last volume {}", *restored);
            initial.volume.level = *restored;
        }
    }
    return initial;
}

App::App(std::string configFilePath) : configFilePath_(std::move(configFilePath)) {}

int App::run(const AppOverrides& overrides) {
    shutdown_manager::ShutdownManager shutdownManager;
    shutdownManager.installSignalHandlers();

    int exitCode = 0;
    unsigned generation = 0;
    uint64_t lastVersion = 0;

    do {
        shutdownManager.reset();
        const std::string instanceId = makeInstanceId(generation++);

        AppConfig config;
        if (!loadAppConfig(configFilePath_, config)) {
            LOG_WARN("Config {} not loaded, using defaults", configFilePath_);
        }
        if (overrides.endpoint) {
            config.ipc.endpoint = *overrides.endpoint;
        }
        if (overrides.initialSource) {
            config.transition.initialSource = *overrides.initialSource;
        }
        logging::reconfigure(config.logging);

        const auto backendTimeout = std::chrono::milliseconds(config.transition.backendTimeoutMs);

        state::StateStore store(buildInitialState(config, lastVersion));
        events::EventBus bus;
        coordinator::StateCommitter committer(store, bus);

        auto audioBackend =
            std::make_shared<backend::CommandBackend>(config.backends, backendTimeout);
        coordinator::TransitionCoordinator transitions(committer, audioBackend,
                                                       makeCoordinatorOptions(config));
        volume::VolumeController volumeControl(committer, audioBackend, makeVolumeOptions(config));
        api::CommandApi commandApi(committer, transitions, volumeControl, audioBackend, instanceId);

        control::ControlPlaneDependencies controlDeps;
        controlDeps.api = &commandApi;
        controlDeps.bus = &bus;
        controlDeps.endpoint = config.ipc.endpoint;
        controlDeps.recvTimeoutMs = config.ipc.recvTimeoutMs;
        controlDeps.heartbeatInterval =
            std::chrono::milliseconds(config.transport.heartbeatIntervalMs);
        control::ControlPlane controlPlane(controlDeps);

        if (!controlPlane.start()) {
            LOG_ERROR("Startup aborted: control plane could not bind {}", config.ipc.endpoint);
            transitions.shutdown();
            volumeControl.stop();
            exitCode = 1;
            break;
        }
        LOG_INFO("roomcastd ready (instance {}, commands on {}, events on {})", instanceId,
                 config.ipc.endpoint, controlPlane.pubEndpoint());

        // Bring the backend in line with the initial state
        auto sync = transitions.requestOutputSync();
        if (!sync.ok()) {
            LOG_WARN("Initial output sync not started: {}", sync.message);
        }
        auto volumeInit = volumeControl.setVolume(store.snapshot().volume.level, false);
        if (!volumeInit.ok()) {
            LOG_WARN("Initial volume not applied: {}", volumeInit.message);
        }
        if (config.transition.initialSource != state::SourceId::None) {
            transitions.waitUntilIdle(backendTimeout * 3);
            auto start = transitions.requestSourceChange(config.transition.initialSource);
            if (!start.ok()) {
                LOG_WARN("Initial source {} not started: {}",
                         state::sourceToString(config.transition.initialSource), start.message);
            }
        }

        shutdownManager.notifyReady();
        while (shutdownManager.waitAndTick(kLoopInterval)) {
            if (controlPlane.hasBindError()) {
                LOG_ERROR("ZeroMQ bind failure, stopping");
                exitCode = 1;
                break;
            }
        }

        shutdownManager.runShutdownSequence();
        transitions.shutdown();
        volumeControl.stop();
        controlPlane.stop();
        lastVersion = store.version();

        if (exitCode != 0) {
            break;
        }
        if (shutdownManager.isReloadRequested()) {
            LOG_INFO("Reload requested. Restarting with updated config...");
        }
    } while (shutdownManager.isReloadRequested());

    LOG_INFO("Goodbye!");
    return exitCode;
}

}  // namespace roomcast::daemon_app
