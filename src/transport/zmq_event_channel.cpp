#include "transport/zmq_event_channel.h"

#include "logging/logger.h"
#include "transport/endpoint.h"

#include <zmq.hpp>

namespace roomcast::transport {

ZmqEventChannel::ZmqEventChannel(std::string endpoint, TransportOptions options)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      options_(options),
      client_(endpoint_, static_cast<int>(options.heartbeatTimeout.count())),
      context_(std::make_unique<zmq::context_t>(1)) {}

ZmqEventChannel::~ZmqEventChannel() {
    close();
    joinWorker();
}

void ZmqEventChannel::connect() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.load()) {
            return;
        }
        if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
            // close() then connect() from a callback: the current worker keeps going
            running_ = true;
            return;
        }
        previous = std::move(worker_);
    }
    // Left behind by a close() issued from the worker itself
    if (previous.joinable()) {
        previous.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load() || worker_.joinable()) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&ZmqEventChannel::run, this);
}

void ZmqEventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    joinWorker();
}

void ZmqEventChannel::joinWorker() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable() || worker_.get_id() == std::this_thread::get_id()) {
            return;
        }
        worker = std::move(worker_);
    }
    worker.join();
}

std::optional<std::string> ZmqEventChannel::ping() {
    auto reply = client_.request("PING");
    if (!reply || !isOkResponse(*reply)) {
        return std::nullopt;
    }
    if (reply->contains("data") && (*reply)["data"].contains("instance") &&
        (*reply)["data"]["instance"].is_string()) {
        return (*reply)["data"]["instance"].get<std::string>();
    }
    return std::string();
}

void ZmqEventChannel::sleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

void ZmqEventChannel::run() {
    int attempt = 0;
    const int pollMs = static_cast<int>(options_.pollInterval.count());

    while (running_.load()) {
        try {
            zmq::socket_t sub(*context_, zmq::socket_type::sub);
            sub.set(zmq::sockopt::linger, 0);
            sub.set(zmq::sockopt::rcvtimeo, pollMs);
            sub.set(zmq::sockopt::subscribe, "");
            sub.connect(pubEndpoint_);

            // SUB connects first so the PING round trip covers the subscription handshake
            auto instance = ping();
            if (instance) {
                attempt = 0;
                connected_ = true;
                LOG_INFO("[EventChannel] Connected to {} (events on {})", endpoint_, pubEndpoint_);
                notifyConnected();

                auto nextHeartbeat = std::chrono::steady_clock::now() + options_.heartbeatInterval;
                while (running_.load()) {
                    zmq::message_t message;
                    auto received = sub.recv(message, zmq::recv_flags::none);
                    if (received) {
                        std::string raw(static_cast<const char*>(message.data()), message.size());
                        if (auto event = events::decodeEvent(raw)) {
                            deliver(*event);
                        }
                    }

                    if (std::chrono::steady_clock::now() < nextHeartbeat) {
                        continue;
                    }
                    auto current = ping();
                    if (!current) {
                        LOG_WARN("[EventChannel] Heartbeat timed out, reconnecting");
                        break;
                    }
                    if (*current != *instance) {
                        LOG_WARN("[EventChannel] Daemon restarted, reconnecting");
                        break;
                    }
                    nextHeartbeat = std::chrono::steady_clock::now() + options_.heartbeatInterval;
                }
                connected_ = false;
            }
        } catch (const zmq::error_t& e) {
            connected_ = false;
            LOG_WARN("[EventChannel] ZeroMQ error: {}", e.what());
        }

        if (!running_.load()) {
            break;
        }
        auto delay = backoffDelay(attempt++, options_.backoff);
        LOG_EVERY_N(INFO, 10, "[EventChannel] Daemon unreachable, retrying in {}ms",
                    delay.count());
        sleepFor(delay);
    }
    connected_ = false;
}

}  // namespace roomcast::transport
