#pragma once

#include "core/daemon_constants.h"

#include <chrono>

namespace roomcast::transport {

struct BackoffPolicy {
    std::chrono::milliseconds initial{DaemonConstants::DEFAULT_BACKOFF_INITIAL_MS};
    double factor = DaemonConstants::DEFAULT_BACKOFF_FACTOR;
    std::chrono::milliseconds max{DaemonConstants::DEFAULT_BACKOFF_MAX_MS};
    int maxExponent = DaemonConstants::BACKOFF_MAX_EXPONENT;
};

// min(max, initial * factor^min(attempt, maxExponent)); attempt starts at 0
std::chrono::milliseconds backoffDelay(int attempt, const BackoffPolicy& policy);

}  // namespace roomcast::transport
