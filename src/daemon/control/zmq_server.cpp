#include "daemon/control/zmq_server.h"

#include "logging/logger.h"
#include "transport/endpoint.h"

#include <zmq.hpp>

namespace roomcast::ipc {

namespace {

constexpr const char* kShutdownSentinel = "SHUTDOWN";

}  // namespace

nlohmann::json buildErrorResponse(ErrorCode code, const std::string& message) {
    nlohmann::json resp;
    resp["status"] = "error";
    resp["error_code"] = errorCodeToString(code);
    resp["message"] = message;
    resp["category"] = getErrorCategory(code);
    resp["retryable"] = isRetryable(code);
    return resp;
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(transport::derivePubEndpoint(endpoint_)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);

        transport::removeIpcSocketFile(endpoint_);
        repSocket_->bind(endpoint_);

        {
            std::lock_guard<std::mutex> lock(pubMutex_);
            pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
            pubSocket_->set(zmq::sockopt::linger, 0);
            transport::removeIpcSocketFile(pubEndpoint_);
            pubSocket_->bind(pubEndpoint_);
        }

        running_.store(true);
        bindFailed_.store(false);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("ZeroMQ: Listening on {}", endpoint_);
        LOG_INFO("ZeroMQ: PUB socket on {}", pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_CRITICAL("ZeroMQ: Fatal error - {}", e.what());
        bindFailed_.store(true);
        running_.store(false);
        cleanupSockets();
        return false;
    }
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the REP loop instead of waiting out the receive timeout
    try {
        zmq::context_t tempCtx{1};
        zmq::socket_t tempSocket{tempCtx, zmq::socket_type::req};
        tempSocket.set(zmq::sockopt::linger, 0);
        tempSocket.connect(endpoint_);
        (void)tempSocket.send(zmq::buffer(std::string(kShutdownSentinel)),
                              zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("ZeroMQ: shutdown wake-up failed: {}", e.what());
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    cleanupSockets();
    transport::removeIpcSocketFile(endpoint_);
    transport::removeIpcSocketFile(pubEndpoint_);
    LOG_INFO("ZeroMQ: Server stopped");
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    try {
        auto sent = pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return sent.has_value();
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) const {
    ZmqRequest request;
    request.raw = raw;

    try {
        request.json = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        request.parseError = e.what();
        return request;
    }

    if (!request.json.is_object()) {
        request.parseError = "request must be a JSON object";
        return request;
    }
    if (request.json.contains("cmd") && request.json["cmd"].is_string()) {
        request.command = request.json["cmd"].get<std::string>();
    }
    if (request.json.contains("params")) {
        request.params = request.json["params"];
    }
    return request;
}

nlohmann::json ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(ErrorCode::IPC_PROTOCOL_ERROR,
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "(missing cmd)" : request.command;
        return buildErrorResponse(ErrorCode::IPC_INVALID_COMMAND, "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const nlohmann::json::exception& e) {
        return buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                  std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        return buildErrorResponse(ErrorCode::IPC_PROTOCOL_ERROR,
                                  std::string("Handler exception: ") + e.what());
    }
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = repSocket_->recv(request, zmq::recv_flags::none);
            if (!recvResult) {
                continue;
            }

            std::string raw(static_cast<char*>(request.data()), request.size());
            if (raw == kShutdownSentinel) {
                (void)repSocket_->send(zmq::buffer(std::string("OK")), zmq::send_flags::dontwait);
                continue;
            }

            std::string response = dispatchRequest(buildRequest(raw)).dump();
            (void)repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("ZeroMQ: Listener error - {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        if (pubSocket_) {
            pubSocket_->close();
        }
        pubSocket_.reset();
    }
    if (repSocket_) {
        repSocket_->close();
    }
    repSocket_.reset();
    context_.reset();
}

}  // namespace roomcast::ipc
