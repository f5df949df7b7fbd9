#pragma once

#include "transport/command_client.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>

namespace roomcast::transport {

// Fetches the daemon's current full_state on demand
class SnapshotSource {
   public:
    virtual ~SnapshotSource() = default;
    virtual std::optional<nlohmann::json> fetch() = 0;
};

// GET_STATE over the REQ/REP channel
class ZmqSnapshotSource : public SnapshotSource {
   public:
    explicit ZmqSnapshotSource(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                               int timeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS);

    std::optional<nlohmann::json> fetch() override;

   private:
    CommandClient client_;
};

}  // namespace roomcast::transport
