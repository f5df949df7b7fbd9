#pragma once

#include "backend/audio_backend.h"
#include "coordinator/request_result.h"
#include "coordinator/state_committer.h"
#include "coordinator/transition_coordinator.h"
#include "volume/volume_controller.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace roomcast::api {

// {status:"ok", message?, data?}
nlohmann::json buildOkResponse(const std::string& message = "",
                               const nlohmann::json& data = nlohmann::json());

// Accepted / no-op map to ok with data.accepted / data.noop; the rest to an error envelope
nlohmann::json toResponse(const coordinator::RequestResult& result);

/**
 * @brief Request surface used by every external caller.
 *
 * Validates params and rejects malformed requests before anything reaches the
 * coordinator. Holds no state of its own.
 */
class CommandApi {
   public:
    CommandApi(coordinator::StateCommitter& committer, coordinator::TransitionCoordinator& coordinator,
               volume::VolumeController& volume, std::shared_ptr<backend::AudioBackend> backend,
               std::string instanceId = "");

    // data.instance changes whenever the daemon restarts
    nlohmann::json ping() const;
    nlohmann::json getState() const;
    nlohmann::json setSource(const nlohmann::json& params);
    nlohmann::json setRouting(const nlohmann::json& params);
    nlohmann::json setEqualizer(const nlohmann::json& params);
    nlohmann::json setVolume(const nlohmann::json& params);
    nlohmann::json adjustVolume(const nlohmann::json& params);
    nlohmann::json setMute(const nlohmann::json& params);
    nlohmann::json playback(const nlohmann::json& params);
    nlohmann::json dismissError();

    // Metadata / plugin state pushed by a receiver's event hook
    nlohmann::json pluginReport(const nlohmann::json& params);

   private:
    coordinator::StateCommitter& committer_;
    coordinator::TransitionCoordinator& coordinator_;
    volume::VolumeController& volume_;
    std::shared_ptr<backend::AudioBackend> backend_;
    std::string instanceId_;
};

}  // namespace roomcast::api
