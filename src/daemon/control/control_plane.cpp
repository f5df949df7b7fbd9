#include "daemon/control/control_plane.h"

#include "logging/logger.h"

#include <stdexcept>
#include <utility>

namespace roomcast::control {

ControlPlane::ControlPlane(ControlPlaneDependencies deps) : deps_(std::move(deps)) {
    if (!deps_.api || !deps_.bus) {
        throw std::invalid_argument("ControlPlane requires a command API and an event bus");
    }
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    zmqServer_ = std::make_unique<ipc::ZmqCommandServer>(deps_.endpoint, deps_.recvTimeoutMs);
    registerHandlers();

    if (!zmqServer_->start()) {
        LOG_ERROR("[ControlPlane] Failed to start ZeroMQ server on {}", deps_.endpoint);
        return false;
    }

    busSubscription_ = deps_.bus->subscribe([this](const events::Event& event) { forward(event); });

    {
        std::lock_guard<std::mutex> lock(heartbeatMutex_);
        heartbeatRunning_ = true;
    }
    heartbeatThread_ = std::thread(&ControlPlane::heartbeatLoop, this);
    return true;
}

void ControlPlane::stop() {
    if (busSubscription_ != 0) {
        deps_.bus->unsubscribe(busSubscription_);
        busSubscription_ = 0;
    }

    {
        std::lock_guard<std::mutex> lock(heartbeatMutex_);
        heartbeatRunning_ = false;
    }
    heartbeatCv_.notify_all();
    if (heartbeatThread_.joinable()) {
        heartbeatThread_.join();
    }

    if (zmqServer_) {
        zmqServer_->stop();
    }
}

bool ControlPlane::hasBindError() const {
    return zmqServer_ && zmqServer_->hasBindError();
}

std::string ControlPlane::pubEndpoint() const {
    return zmqServer_ ? zmqServer_->pubEndpoint() : std::string();
}

void ControlPlane::registerHandlers() {
    auto* api = deps_.api;
    zmqServer_->registerCommand("PING", [api](const auto&) { return api->ping(); });
    zmqServer_->registerCommand("GET_STATE", [api](const auto&) { return api->getState(); });
    zmqServer_->registerCommand("SOURCE_SET",
                                [api](const auto& req) { return api->setSource(req.params); });
    zmqServer_->registerCommand("ROUTING_SET",
                                [api](const auto& req) { return api->setRouting(req.params); });
    zmqServer_->registerCommand("EQUALIZER_SET",
                                [api](const auto& req) { return api->setEqualizer(req.params); });
    zmqServer_->registerCommand("VOLUME_SET",
                                [api](const auto& req) { return api->setVolume(req.params); });
    zmqServer_->registerCommand("VOLUME_ADJUST",
                                [api](const auto& req) { return api->adjustVolume(req.params); });
    zmqServer_->registerCommand("VOLUME_MUTE",
                                [api](const auto& req) { return api->setMute(req.params); });
    zmqServer_->registerCommand("PLAYBACK",
                                [api](const auto& req) { return api->playback(req.params); });
    zmqServer_->registerCommand("ERROR_DISMISS", [api](const auto&) { return api->dismissError(); });
    zmqServer_->registerCommand("PLUGIN_REPORT",
                                [api](const auto& req) { return api->pluginReport(req.params); });
}

void ControlPlane::forward(const events::Event& event) {
    if (!zmqServer_ || !zmqServer_->publish(events::encodeEvent(event))) {
        LOG_EVERY_N(WARN, 50, "[ControlPlane] Dropped {} (PUB not ready)",
                    events::eventKindName(event.kind));
    }
}

void ControlPlane::heartbeatLoop() {
    std::unique_lock<std::mutex> lock(heartbeatMutex_);
    while (heartbeatRunning_) {
        if (heartbeatCv_.wait_for(lock, deps_.heartbeatInterval,
                                  [this] { return !heartbeatRunning_; })) {
            break;
        }
        lock.unlock();
        forward(events::makeHeartbeat());
        lock.lock();
    }
}

}  // namespace roomcast::control
