#pragma once

#include "transport/backoff.h"
#include "transport/command_client.h"
#include "transport/event_channel.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <string>
#include <thread>

namespace zmq {
class context_t;
}  // namespace zmq

namespace roomcast::transport {

struct TransportOptions {
    std::chrono::milliseconds heartbeatInterval{DaemonConstants::DEFAULT_HEARTBEAT_INTERVAL_MS};
    std::chrono::milliseconds heartbeatTimeout{DaemonConstants::DEFAULT_HEARTBEAT_TIMEOUT_MS};
    std::chrono::milliseconds pollInterval{DaemonConstants::SUBSCRIBER_POLL_INTERVAL_MS};
    BackoffPolicy backoff;
};

/**
 * @brief SUB socket on the daemon's PUB endpoint plus a PING heartbeat.
 *
 * A connection counts as established once the daemon answers PING. A missing
 * heartbeat reply, or a reply from a different daemon instance, tears the
 * connection down and reconnects with exponential backoff.
 */
class ZmqEventChannel : public EventChannel {
   public:
    explicit ZmqEventChannel(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                             TransportOptions options = {});
    ~ZmqEventChannel() override;

    ZmqEventChannel(const ZmqEventChannel&) = delete;
    ZmqEventChannel& operator=(const ZmqEventChannel&) = delete;

    void connect() override;
    void close() override;
    bool isConnected() const override {
        return connected_.load(std::memory_order_acquire);
    }

    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

   private:
    void run();
    // Empty optional: no usable reply. Otherwise the daemon instance id ("" if none).
    std::optional<std::string> ping();
    void sleepFor(std::chrono::milliseconds delay);
    void joinWorker();

    std::string endpoint_;
    std::string pubEndpoint_;
    TransportOptions options_;
    CommandClient client_;
    std::unique_ptr<zmq::context_t> context_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::mutex mutex_;  // guards worker_ and the sleep cv
    std::condition_variable cv_;
    std::thread worker_;
};

}  // namespace roomcast::transport
