#pragma once

#include "daemon/control/command_api.h"
#include "daemon/control/zmq_server.h"
#include "events/event_bus.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace roomcast::control {

struct ControlPlaneDependencies {
    api::CommandApi* api = nullptr;
    events::EventBus* bus = nullptr;
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    int recvTimeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS;
    std::chrono::milliseconds heartbeatInterval{DaemonConstants::DEFAULT_HEARTBEAT_INTERVAL_MS};
};

/**
 * @brief Binds the command API to the ZeroMQ REP socket and forwards every bus
 * event, plus a periodic system.heartbeat, onto the PUB socket.
 */
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    bool hasBindError() const;
    std::string pubEndpoint() const;

   private:
    void registerHandlers();
    void forward(const events::Event& event);
    void heartbeatLoop();

    ControlPlaneDependencies deps_;
    std::unique_ptr<ipc::ZmqCommandServer> zmqServer_;
    events::EventBus::SubscriptionId busSubscription_ = 0;

    std::mutex heartbeatMutex_;
    std::condition_variable heartbeatCv_;
    bool heartbeatRunning_ = false;
    std::thread heartbeatThread_;
};

}  // namespace roomcast::control
