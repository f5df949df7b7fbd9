#include "backend/audio_backend.h"

#include <array>

namespace roomcast::backend {

namespace {

constexpr std::array<PlaybackCommand, 6> kPlaybackCommands = {
    PlaybackCommand::Play, PlaybackCommand::Pause,    PlaybackCommand::Toggle,
    PlaybackCommand::Next, PlaybackCommand::Previous, PlaybackCommand::Seek};

}  // namespace

const char* playbackCommandToString(PlaybackCommand command) {
    switch (command) {
    case PlaybackCommand::Play:
        return "play";
    case PlaybackCommand::Pause:
        return "pause";
    case PlaybackCommand::Toggle:
        return "toggle";
    case PlaybackCommand::Next:
        return "next";
    case PlaybackCommand::Previous:
        return "previous";
    case PlaybackCommand::Seek:
        return "seek";
    default:
        return "play";
    }
}

std::optional<PlaybackCommand> parsePlaybackCommand(const std::string& str) {
    for (PlaybackCommand command : kPlaybackCommands) {
        if (str == playbackCommandToString(command)) {
            return command;
        }
    }
    return std::nullopt;
}

void AudioBackend::setMetadataCallback(MetadataCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metadataCallback_ = std::move(callback);
}

void AudioBackend::setPluginStateCallback(PluginStateCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    pluginStateCallback_ = std::move(callback);
}

void AudioBackend::pushMetadata(state::SourceId source, const state::PlaybackMetadata& metadata) {
    MetadataCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = metadataCallback_;
    }
    if (callback) {
        callback(source, metadata);
    }
}

void AudioBackend::pushPluginState(state::SourceId source, state::PluginState pluginState) {
    PluginStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = pluginStateCallback_;
    }
    if (callback) {
        callback(source, pluginState);
    }
}

}  // namespace roomcast::backend
