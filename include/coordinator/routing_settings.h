#pragma once

#include <filesystem>
#include <optional>

namespace roomcast::coordinator {

// Routing flags as last confirmed by the backend
struct RoutingSettings {
    bool multiroom = false;
    bool equalizer = false;
};

/**
 * @brief Read persisted routing flags.
 * @return std::nullopt if the file is missing, not JSON, or lacks either flag
 */
std::optional<RoutingSettings> loadRoutingSettings(const std::filesystem::path& path);

// Atomic write (temp file + rename) of {"routing.multiroom", "routing.equalizer"}
bool saveRoutingSettings(const std::filesystem::path& path, const RoutingSettings& settings);

}  // namespace roomcast::coordinator
