#ifndef ROOMCAST_ERROR_CODES_H
#define ROOMCAST_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace roomcast {

/**
 * @brief Error codes for the roomcast daemon.
 *
 * Categories use upper 4 bits of the 16-bit value (0xF000 mask):
 * - 0x1xxx: Transition (state machine rejections)
 * - 0x2xxx: Backend (external audio daemons)
 * - 0x3xxx: IPC/ZeroMQ and event transport
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Transition (0x1000)
    TRANSITION_BUSY = 0x1001,
    TRANSITION_NO_BACKEND = 0x1002,
    TRANSITION_ROLLBACK_FAILED = 0x1003,

    // Backend (0x2000)
    BACKEND_START_FAILED = 0x2001,
    BACKEND_STOP_FAILED = 0x2002,
    BACKEND_RECONFIGURE_FAILED = 0x2003,
    BACKEND_TIMEOUT = 0x2004,
    BACKEND_COMMAND_FAILED = 0x2005,
    BACKEND_VOLUME_FAILED = 0x2006,

    // IPC/ZeroMQ (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_DAEMON_NOT_RUNNING = 0x3005,
    IPC_PROTOCOL_ERROR = 0x3006,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_SOURCE = 0x5002,
    VALIDATION_INVALID_ROUTING_MODE = 0x5003,
    VALIDATION_INVALID_VOLUME = 0x5004,
    VALIDATION_INVALID_PLAYBACK_COMMAND = 0x5005,
    VALIDATION_SOURCE_NOT_ACTIVE = 0x5006,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Last transition or backend failure, as kept in SystemState.error.
 */
struct ErrorDescriptor {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string source;         // Source or subsystem that failed ("librespot", "output", ...)
    int64_t timestampMs = 0;    // Wall clock, milliseconds since epoch
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "TRANSITION_BUSY"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "backend"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "BACKEND_TIMEOUT")
 * @return Corresponding ErrorCode, or std::nullopt if not found
 */
std::optional<ErrorCode> stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isTransitionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isBackendError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is retryable.
 *
 * A busy rejection leaves state untouched, so the caller may simply retry once the
 * in-flight transition has broadcast its outcome. Transport level failures are
 * retryable as well.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::TRANSITION_BUSY || code == ErrorCode::IPC_DAEMON_NOT_RUNNING ||
           code == ErrorCode::IPC_TIMEOUT || code == ErrorCode::IPC_CONNECTION_FAILED;
}

}  // namespace roomcast

#endif  // ROOMCAST_ERROR_CODES_H
