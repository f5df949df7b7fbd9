#include "transport/endpoint.h"

#include "core/daemon_constants.h"

#include <cstdio>
#include <stdexcept>

namespace roomcast::transport {

namespace {

constexpr const char* kIpcScheme = "ipc://";
constexpr const char* kTcpScheme = "tcp://";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

std::string derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, kTcpScheme)) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos && colonPos > 5) {
            try {
                int port = std::stoi(endpoint.substr(colonPos + 1));
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            } catch (const std::logic_error&) {
                // Not a numeric port; fall through to the suffix form
            }
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

void removeIpcSocketFile(const std::string& endpoint) {
    if (!startsWith(endpoint, kIpcScheme)) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (!path.empty()) {
        std::remove(path.c_str());
    }
}

}  // namespace roomcast::transport
