#include "daemon/control/command_api.h"

#include "daemon/control/zmq_server.h"
#include "logging/logger.h"

#include <cstdint>
#include <limits>
#include <optional>

namespace roomcast::api {

namespace {

using json = nlohmann::json;
using coordinator::RequestResult;
using coordinator::RequestStatus;

json missingParam(const char* name, const char* type) {
    return ipc::buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                   std::string("params.") + name + " (" + type + ") is required");
}

std::optional<bool> boolParam(const json& params, const char* name) {
    if (params.is_object() && params.contains(name) && params[name].is_boolean()) {
        return params[name].get<bool>();
    }
    return std::nullopt;
}

// Integers outside the int range are treated like a missing parameter
std::optional<int> intParam(const json& params, const char* name) {
    if (!params.is_object() || !params.contains(name) || !params[name].is_number_integer()) {
        return std::nullopt;
    }
    const json& value = params[name];
    if (value.is_number_unsigned()) {
        auto wide = value.get<uint64_t>();
        if (wide > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(wide);
    }
    auto wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(wide);
}

std::optional<std::string> stringParam(const json& params, const char* name) {
    if (params.is_object() && params.contains(name) && params[name].is_string()) {
        return params[name].get<std::string>();
    }
    return std::nullopt;
}

bool hasParam(const json& params, const char* name) {
    return params.is_object() && params.contains(name) && !params[name].is_null();
}

}  // namespace

json buildOkResponse(const std::string& message, const json& data) {
    json resp;
    resp["status"] = "ok";
    if (!message.empty()) {
        resp["message"] = message;
    }
    if (!data.is_null() && !data.empty()) {
        resp["data"] = data;
    }
    return resp;
}

json toResponse(const RequestResult& result) {
    switch (result.status) {
    case RequestStatus::Accepted:
        return buildOkResponse("", json{{"accepted", true}});
    case RequestStatus::NoOp:
        return buildOkResponse("", json{{"noop", true}});
    case RequestStatus::Busy:
    case RequestStatus::Invalid:
    default:
        return ipc::buildErrorResponse(result.code, result.message);
    }
}

CommandApi::CommandApi(coordinator::StateCommitter& committer,
                       coordinator::TransitionCoordinator& coordinator,
                       volume::VolumeController& volume,
                       std::shared_ptr<backend::AudioBackend> backend, std::string instanceId)
    : committer_(committer),
      coordinator_(coordinator),
      volume_(volume),
      backend_(std::move(backend)),
      instanceId_(std::move(instanceId)) {}

json CommandApi::ping() const {
    if (instanceId_.empty()) {
        return buildOkResponse("pong");
    }
    return buildOkResponse("pong", json{{"instance", instanceId_}});
}

json CommandApi::getState() const {
    return buildOkResponse("", json{{"full_state", state::stateToJson(committer_.snapshot())}});
}

json CommandApi::setSource(const json& params) {
    auto name = stringParam(params, "source");
    if (!name) {
        return missingParam("source", "string");
    }
    auto source = state::parseSource(*name);
    if (!source) {
        return ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_SOURCE,
                                       "Unknown source: " + *name);
    }
    return toResponse(coordinator_.requestSourceChange(*source));
}

json CommandApi::setRouting(const json& params) {
    std::optional<bool> multiroom = boolParam(params, "multiroom");
    if (!multiroom) {
        auto modeName = stringParam(params, "mode");
        if (!modeName) {
            return ipc::buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                           "params.mode (string) or params.multiroom (bool) "
                                           "is required");
        }
        auto mode = state::parseRoutingMode(*modeName);
        if (!mode) {
            return ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_ROUTING_MODE,
                                           "Unknown routing mode: " + *modeName);
        }
        multiroom = (*mode == state::RoutingMode::Multiroom);
    }
    return toResponse(coordinator_.requestRoutingModeChange(*multiroom));
}

json CommandApi::setEqualizer(const json& params) {
    auto enabled = boolParam(params, "enabled");
    if (!enabled) {
        return missingParam("enabled", "bool");
    }
    return toResponse(coordinator_.requestEqualizerChange(*enabled));
}

json CommandApi::setVolume(const json& params) {
    auto level = intParam(params, "volume");
    if (!level) {
        return missingParam("volume", "integer");
    }
    bool showBar = boolParam(params, "show_bar").value_or(false);
    return toResponse(volume_.setVolume(*level, showBar));
}

json CommandApi::adjustVolume(const json& params) {
    if (hasParam(params, "delta") && !intParam(params, "delta")) {
        return missingParam("delta", "integer");
    }
    if (hasParam(params, "client_steps") && !intParam(params, "client_steps")) {
        return missingParam("client_steps", "integer");
    }
    bool showBar = boolParam(params, "show_bar").value_or(false);
    return toResponse(
        volume_.adjustVolume(intParam(params, "delta"), intParam(params, "client_steps"), showBar));
}

json CommandApi::setMute(const json& params) {
    auto muted = boolParam(params, "muted");
    if (!muted) {
        return missingParam("muted", "bool");
    }
    return toResponse(volume_.setMuted(*muted));
}

json CommandApi::playback(const json& params) {
    auto sourceName = stringParam(params, "source");
    if (!sourceName) {
        return missingParam("source", "string");
    }
    auto commandName = stringParam(params, "command");
    if (!commandName) {
        return missingParam("command", "string");
    }

    auto source = state::parseSource(*sourceName);
    if (!source || *source == state::SourceId::None) {
        return ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_SOURCE,
                                       "Unknown source: " + *sourceName);
    }
    auto command = backend::parsePlaybackCommand(*commandName);
    if (!command) {
        return ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_PLAYBACK_COMMAND,
                                       "Unknown playback command: " + *commandName);
    }

    json data = json::object();
    if (params.contains("data") && params["data"].is_object()) {
        data = params["data"];
    }
    if (*command == backend::PlaybackCommand::Seek && !intParam(data, "position_ms")) {
        return missingParam("data.position_ms", "integer");
    }
    return toResponse(coordinator_.requestPlayback(*source, *command, data));
}

json CommandApi::dismissError() {
    return toResponse(coordinator_.dismissError());
}

json CommandApi::pluginReport(const json& params) {
    auto sourceName = stringParam(params, "source");
    if (!sourceName) {
        return missingParam("source", "string");
    }
    auto source = state::parseSource(*sourceName);
    if (!source || *source == state::SourceId::None) {
        return ipc::buildErrorResponse(ErrorCode::VALIDATION_INVALID_SOURCE,
                                       "Unknown source: " + *sourceName);
    }

    std::optional<state::PluginState> pluginState;
    if (hasParam(params, "plugin_state")) {
        auto name = stringParam(params, "plugin_state");
        pluginState = name ? state::parsePluginState(*name) : std::nullopt;
        if (!pluginState) {
            return ipc::buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                           "params.plugin_state must be one of "
                                           "inactive|ready|connected|error");
        }
    }
    bool hasMetadata = params.contains("metadata") && params["metadata"].is_object();
    if (!pluginState && !hasMetadata) {
        return ipc::buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                       "params.plugin_state or params.metadata is required");
    }
    if (!backend_) {
        return ipc::buildErrorResponse(ErrorCode::TRANSITION_NO_BACKEND, "No backend configured");
    }

    if (hasMetadata) {
        state::PlaybackMetadata metadata;
        try {
            metadata = state::metadataFromJson(params["metadata"]);
        } catch (const json::exception& e) {
            return ipc::buildErrorResponse(ErrorCode::IPC_INVALID_PARAMS,
                                           std::string("params.metadata: ") + e.what());
        }
        backend_->pushMetadata(*source, metadata);
    }
    if (pluginState) {
        backend_->pushPluginState(*source, *pluginState);
    }
    return buildOkResponse("", json{{"accepted", true}});
}

}  // namespace roomcast::api
