#pragma once

#include "core/daemon_constants.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace zmq {
class context_t;
}  // namespace zmq

namespace roomcast::transport {

/**
 * @brief Request/response client for the daemon's REP socket.
 *
 * Every request uses a fresh REQ socket, so a timed-out request never leaves the
 * client stuck in the REQ state machine. Safe to use from several threads.
 */
class CommandClient {
   public:
    explicit CommandClient(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                           int timeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS);
    ~CommandClient();

    CommandClient(const CommandClient&) = delete;
    CommandClient& operator=(const CommandClient&) = delete;

    // @return parsed reply, or std::nullopt on timeout / transport / parse failure
    std::optional<nlohmann::json> request(const std::string& cmd,
                                          const nlohmann::json& params = nlohmann::json::object());

    const std::string& endpoint() const {
        return endpoint_;
    }

   private:
    std::string endpoint_;
    int timeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
};

// True for a {status:"ok"} reply
bool isOkResponse(const nlohmann::json& reply);

}  // namespace roomcast::transport
