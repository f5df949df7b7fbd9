#include "transport/command_client.h"

#include "logging/logger.h"

#include <zmq.hpp>

namespace roomcast::transport {

CommandClient::CommandClient(std::string endpoint, int timeoutMs)
    : endpoint_(std::move(endpoint)),
      timeoutMs_(timeoutMs),
      context_(std::make_unique<zmq::context_t>(1)) {}

CommandClient::~CommandClient() = default;

std::optional<nlohmann::json> CommandClient::request(const std::string& cmd,
                                                     const nlohmann::json& params) {
    nlohmann::json message;
    message["cmd"] = cmd;
    message["params"] = params;
    const std::string payload = message.dump();

    try {
        zmq::socket_t socket(*context_, zmq::socket_type::req);
        socket.set(zmq::sockopt::linger, 0);
        socket.set(zmq::sockopt::rcvtimeo, timeoutMs_);
        socket.set(zmq::sockopt::sndtimeo, timeoutMs_);
        socket.connect(endpoint_);

        auto sent = socket.send(zmq::buffer(payload), zmq::send_flags::none);
        if (!sent) {
            LOG_DEBUG("[CommandClient] {} send timed out", cmd);
            return std::nullopt;
        }

        zmq::message_t reply;
        auto received = socket.recv(reply, zmq::recv_flags::none);
        if (!received) {
            LOG_DEBUG("[CommandClient] {} reply timed out after {}ms", cmd, timeoutMs_);
            return std::nullopt;
        }

        std::string raw(static_cast<const char*>(reply.data()), reply.size());
        return nlohmann::json::parse(raw);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("[CommandClient] {} failed: {}", cmd, e.what());
        return std::nullopt;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("[CommandClient] {} returned malformed reply: {}", cmd, e.what());
        return std::nullopt;
    }
}

bool isOkResponse(const nlohmann::json& reply) {
    return reply.is_object() && reply.contains("status") && reply["status"] == "ok";
}

}  // namespace roomcast::transport
