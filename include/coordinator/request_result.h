#pragma once

#include "core/error_codes.h"

#include <string>
#include <utility>

namespace roomcast::coordinator {

// Synchronous answer to a mutating request. Acceptance says nothing about the
// outcome; that arrives later as a broadcast.
enum class RequestStatus : uint8_t {
    Accepted,  // queued, outcome will be broadcast
    NoOp,      // already in the requested state
    Busy,      // another transition is in flight, nothing changed
    Invalid,   // rejected before reaching the state machine
};

struct RequestResult {
    RequestStatus status = RequestStatus::Accepted;
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return status == RequestStatus::Accepted || status == RequestStatus::NoOp;
    }

    static RequestResult accepted() {
        return RequestResult{};
    }
    static RequestResult noop() {
        return RequestResult{RequestStatus::NoOp, ErrorCode::OK, {}};
    }
    static RequestResult busy() {
        return RequestResult{RequestStatus::Busy, ErrorCode::TRANSITION_BUSY,
                             "A transition is already in progress"};
    }
    static RequestResult invalid(ErrorCode code, std::string message) {
        return RequestResult{RequestStatus::Invalid, code, std::move(message)};
    }
};

}  // namespace roomcast::coordinator
