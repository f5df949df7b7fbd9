#pragma once

#include <string>

namespace roomcast::transport {

// PUB endpoint paired with a REP endpoint: "<ipc>.pub", or tcp port + 1
std::string derivePubEndpoint(const std::string& endpoint);

// Remove a stale ipc:// socket file; no-op for other transports
void removeIpcSocketFile(const std::string& endpoint);

}  // namespace roomcast::transport
