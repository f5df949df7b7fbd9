#include "core/error_codes.h"

#include <array>

namespace roomcast {
namespace {

struct ErrorCodeEntry {
    ErrorCode code;
    const char* name;
};

// Single source of truth for wire names
constexpr std::array<ErrorCodeEntry, 23> kErrorCodeTable = {{
    {ErrorCode::OK, "OK"},

    // Transition
    {ErrorCode::TRANSITION_BUSY, "TRANSITION_BUSY"},
    {ErrorCode::TRANSITION_NO_BACKEND, "TRANSITION_NO_BACKEND"},
    {ErrorCode::TRANSITION_ROLLBACK_FAILED, "TRANSITION_ROLLBACK_FAILED"},

    // Backend
    {ErrorCode::BACKEND_START_FAILED, "BACKEND_START_FAILED"},
    {ErrorCode::BACKEND_STOP_FAILED, "BACKEND_STOP_FAILED"},
    {ErrorCode::BACKEND_RECONFIGURE_FAILED, "BACKEND_RECONFIGURE_FAILED"},
    {ErrorCode::BACKEND_TIMEOUT, "BACKEND_TIMEOUT"},
    {ErrorCode::BACKEND_COMMAND_FAILED, "BACKEND_COMMAND_FAILED"},
    {ErrorCode::BACKEND_VOLUME_FAILED, "BACKEND_VOLUME_FAILED"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_DAEMON_NOT_RUNNING, "IPC_DAEMON_NOT_RUNNING"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_SOURCE, "VALIDATION_INVALID_SOURCE"},
    {ErrorCode::VALIDATION_INVALID_ROUTING_MODE, "VALIDATION_INVALID_ROUTING_MODE"},
    {ErrorCode::VALIDATION_INVALID_VOLUME, "VALIDATION_INVALID_VOLUME"},
    {ErrorCode::VALIDATION_INVALID_PLAYBACK_COMMAND, "VALIDATION_INVALID_PLAYBACK_COMMAND"},
    {ErrorCode::VALIDATION_SOURCE_NOT_ACTIVE, "VALIDATION_SOURCE_NOT_ACTIVE"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
}};

const ErrorCodeEntry* findEntry(ErrorCode code) {
    for (const auto& entry : kErrorCodeTable) {
        if (entry.code == code) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace

const char* errorCodeToString(ErrorCode code) {
    const auto* entry = findEntry(code);
    return entry ? entry->name : "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isTransitionError(code)) {
        return "transition";
    }
    if (isBackendError(code)) {
        return "backend";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::optional<ErrorCode> stringToErrorCode(const std::string& str) {
    for (const auto& entry : kErrorCodeTable) {
        if (str == entry.name) {
            return entry.code;
        }
    }
    return std::nullopt;
}

}  // namespace roomcast
