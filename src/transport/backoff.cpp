#include "transport/backoff.h"

#include <algorithm>
#include <cmath>

namespace roomcast::transport {

std::chrono::milliseconds backoffDelay(int attempt, const BackoffPolicy& policy) {
    int exponent = std::clamp(attempt, 0, std::max(policy.maxExponent, 0));
    double delay = static_cast<double>(policy.initial.count()) * std::pow(policy.factor, exponent);
    double ceiling = static_cast<double>(policy.max.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, ceiling)));
}

}  // namespace roomcast::transport
