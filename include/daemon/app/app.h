#pragma once

#include "core/config_loader.h"

#include <cstdint>
#include <optional>
#include <string>

namespace roomcast::daemon_app {

struct AppOverrides {
    std::optional<std::string> endpoint;
    std::optional<state::SourceId> initialSource;
};

/**
 * @brief Initial SystemState for one config load.
 *
 * Routing flags and volume come from config unless a persisted value is enabled
 * and readable. The version continues from @p previousVersion so observers of a
 * reloaded daemon never see it move backwards.
 */
state::SystemState buildInitialState(const AppConfig& config, uint64_t previousVersion = 0);

// "<ms>-<pid>.<generation>"; the generation is bumped on every reload
std::string makeInstanceId(unsigned generation);

class App {
   public:
    explicit App(std::string configFilePath);

    // Runs until SIGINT/SIGTERM; SIGHUP reloads the config and restarts the loop
    int run(const AppOverrides& overrides);

   private:
    std::string configFilePath_;
};

}  // namespace roomcast::daemon_app
