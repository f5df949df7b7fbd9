#ifndef ROOMCAST_DAEMON_CONSTANTS_H
#define ROOMCAST_DAEMON_CONSTANTS_H

#include <cstdint>

// Constants shared by roomcastd, roomcastctl and the tests

namespace roomcast::DaemonConstants {

constexpr const char* DEFAULT_CONFIG_FILE = "/etc/roomcast/roomcast.json";
constexpr const char* DEFAULT_PID_FILE = "/tmp/roomcastd.pid";

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/roomcast.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";
constexpr int ZEROMQ_RECV_TIMEOUT_MS = 1000;

// Transition
constexpr int DEFAULT_BACKEND_TIMEOUT_MS = 8000;

// Volume (display scale is 0..100, hardware scale is the mixer range)
constexpr int VOLUME_MIN = 0;
constexpr int VOLUME_MAX = 100;
constexpr int DEFAULT_STARTUP_VOLUME = 37;
constexpr int DEFAULT_VOLUME_STEP = 5;
constexpr int DEFAULT_VOLUME_COALESCE_MS = 50;
constexpr int DEFAULT_HARDWARE_VOLUME_MIN = 0;
constexpr int DEFAULT_HARDWARE_VOLUME_MAX = 65;
constexpr int64_t LAST_VOLUME_MAX_AGE_SECONDS = 7 * 24 * 60 * 60;  // 7 days
constexpr const char* DEFAULT_LAST_VOLUME_FILE = "/var/lib/roomcast/last_volume";

// Routing flags persisted across restarts
constexpr const char* DEFAULT_ROUTING_SETTINGS_FILE = "/var/lib/roomcast/routing.json";

// Event transport
constexpr int DEFAULT_HEARTBEAT_INTERVAL_MS = 20000;
constexpr int DEFAULT_HEARTBEAT_TIMEOUT_MS = 3000;
constexpr int DEFAULT_BACKOFF_INITIAL_MS = 1000;
constexpr double DEFAULT_BACKOFF_FACTOR = 1.5;
constexpr int DEFAULT_BACKOFF_MAX_MS = 30000;
constexpr int BACKOFF_MAX_EXPONENT = 10;
constexpr int SUBSCRIBER_POLL_INTERVAL_MS = 100;

}  // namespace roomcast::DaemonConstants

#endif  // ROOMCAST_DAEMON_CONSTANTS_H
