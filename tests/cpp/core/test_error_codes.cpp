/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error codes and JSON error response building.
 */

#include "core/error_codes.h"
#include "daemon/control/zmq_server.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace roomcast;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::TRANSITION_BUSY), "TRANSITION_BUSY");
    EXPECT_STREQ(errorCodeToString(ErrorCode::BACKEND_TIMEOUT), "BACKEND_TIMEOUT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::IPC_INVALID_PARAMS), "IPC_INVALID_PARAMS");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_SOURCE_NOT_ACTIVE),
                 "VALIDATION_SOURCE_NOT_ACTIVE");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

TEST(ErrorCodes, StringToErrorCodeRoundTripsNames) {
    EXPECT_EQ(stringToErrorCode("BACKEND_START_FAILED"), ErrorCode::BACKEND_START_FAILED);
    EXPECT_EQ(stringToErrorCode("TRANSITION_BUSY"), ErrorCode::TRANSITION_BUSY);
    EXPECT_FALSE(stringToErrorCode("NOT_A_CODE").has_value());
    EXPECT_FALSE(stringToErrorCode("").has_value());
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::TRANSITION_BUSY), "transition");
    EXPECT_STREQ(getErrorCategory(ErrorCode::BACKEND_STOP_FAILED), "backend");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IPC_CONNECTION_FAILED), "ipc_zeromq");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_VOLUME), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(getErrorCategory(unknownCode), "internal");
}

TEST(ErrorCodes, CategoryCheckers) {
    EXPECT_TRUE(isTransitionError(ErrorCode::TRANSITION_ROLLBACK_FAILED));
    EXPECT_FALSE(isTransitionError(ErrorCode::BACKEND_TIMEOUT));

    EXPECT_TRUE(isBackendError(ErrorCode::BACKEND_TIMEOUT));
    EXPECT_TRUE(isBackendError(ErrorCode::BACKEND_VOLUME_FAILED));
    EXPECT_FALSE(isBackendError(ErrorCode::IPC_TIMEOUT));

    EXPECT_TRUE(isIpcError(ErrorCode::IPC_PROTOCOL_ERROR));
    EXPECT_FALSE(isIpcError(ErrorCode::VALIDATION_INVALID_CONFIG));

    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_INVALID_PLAYBACK_COMMAND));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
}

TEST(ErrorCodes, BusyAndTransportErrorsAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::TRANSITION_BUSY));
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_TIMEOUT));
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_DAEMON_NOT_RUNNING));

    EXPECT_FALSE(isRetryable(ErrorCode::BACKEND_START_FAILED));
    EXPECT_FALSE(isRetryable(ErrorCode::VALIDATION_INVALID_SOURCE));
}

// ============================================================
// JSON Error Response Building Tests
// ============================================================

TEST(ErrorCodes, BuildErrorResponse) {
    json j = ipc::buildErrorResponse(ErrorCode::TRANSITION_BUSY, "busy");

    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["error_code"], "TRANSITION_BUSY");
    EXPECT_EQ(j["message"], "busy");
    EXPECT_EQ(j["category"], "transition");
    EXPECT_EQ(j["retryable"], true);
}

TEST(ErrorCodes, BuildErrorResponseMarksPermanentFailures) {
    json j = ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_VOLUME, "too loud");

    EXPECT_EQ(j["error_code"], "VALIDATION_INVALID_VOLUME");
    EXPECT_EQ(j["category"], "validation");
    EXPECT_EQ(j["retryable"], false);
}
