#include "transport/snapshot_source.h"

#include "logging/logger.h"

namespace roomcast::transport {

ZmqSnapshotSource::ZmqSnapshotSource(std::string endpoint, int timeoutMs)
    : client_(std::move(endpoint), timeoutMs) {}

std::optional<nlohmann::json> ZmqSnapshotSource::fetch() {
    auto reply = client_.request("GET_STATE");
    if (!reply) {
        return std::nullopt;
    }
    if (!isOkResponse(*reply) || !reply->contains("data") ||
        !(*reply)["data"].contains("full_state") || !(*reply)["data"]["full_state"].is_object()) {
        LOG_WARN("[Snapshot] Unexpected GET_STATE reply: {}", reply->dump());
        return std::nullopt;
    }
    return (*reply)["data"]["full_state"];
}

}  // namespace roomcast::transport
