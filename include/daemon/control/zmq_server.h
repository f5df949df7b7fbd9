#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace roomcast::ipc {

struct ZmqRequest {
    std::string raw;
    nlohmann::json json;  // whole request object
    std::string command;  // json["cmd"]
    nlohmann::json params = nlohmann::json::object();
    std::string parseError;
};

// {status:"error", error_code, message, category, retryable}
nlohmann::json buildErrorResponse(ErrorCode code, const std::string& message);

/**
 * @brief REP command socket plus PUB event socket.
 *
 * Requests are JSON objects {cmd, params}. Handlers run on the server thread one
 * at a time; publish() may be called from any thread.
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<nlohmann::json(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                              int recvTimeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start()
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

   private:
    ZmqRequest buildRequest(const std::string& raw) const;
    nlohmann::json dispatchRequest(const ZmqRequest& request);
    void serverLoop();
    void cleanupSockets();

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace roomcast::ipc
