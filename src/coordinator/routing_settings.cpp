#include "coordinator/routing_settings.h"

#include "logging/logger.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace roomcast::coordinator {

namespace {

constexpr const char* kMultiroomKey = "routing.multiroom";
constexpr const char* kEqualizerKey = "routing.equalizer";

}  // namespace

std::optional<RoutingSettings> loadRoutingSettings(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in) {
        LOG_WARN("[Routing] Cannot open {}", path.string());
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("[Routing] Unreadable settings file {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains(kMultiroomKey) || !j[kMultiroomKey].is_boolean() ||
        !j.contains(kEqualizerKey) || !j[kEqualizerKey].is_boolean()) {
        LOG_WARN("[Routing] {} does not hold both routing flags, ignoring", path.string());
        return std::nullopt;
    }

    RoutingSettings settings;
    settings.multiroom = j[kMultiroomKey].get<bool>();
    settings.equalizer = j[kEqualizerKey].get<bool>();
    return settings;
}

bool saveRoutingSettings(const std::filesystem::path& path, const RoutingSettings& settings) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    nlohmann::json j;
    j[kMultiroomKey] = settings.multiroom;
    j[kEqualizerKey] = settings.equalizer;

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return false;
        }
        out << j.dump(2) << '\n';
        if (!out.flush()) {
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    return !ec;
}

}  // namespace roomcast::coordinator
