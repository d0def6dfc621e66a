/*
 * File: include/common/event.hpp
 * Project: OBS Relay
 * Purpose: Closed set of internal events carried by the event bus
 * Notes:
 *  - Wire shape: {"event": name, "data": {...}, "ts": RFC3339}
 * Last updated: 2026-10-17
 */

#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "common/log.hpp"

enum class EventType
{
    SceneSwitched,
    SceneChangedExternal,
    PresetActivated,
    PlaylistActivated,
    TrackChanged,
    PlaylistEnded,
    StreamStarted,
    StreamStopped,
    RecordingStarted,
    RecordingStopped,
    TransitionChanged,
    SessionConnected,
    SessionDisconnected,
    OverlayTriggered,
    OverlayHidden,
    ExternalStateChanged
};

inline const char *event_name(EventType t)
{
    switch (t)
    {
    case EventType::SceneSwitched: return "scene_switched";
    case EventType::SceneChangedExternal: return "scene_changed_external";
    case EventType::PresetActivated: return "preset_activated";
    case EventType::PlaylistActivated: return "playlist_activated";
    case EventType::TrackChanged: return "track_changed";
    case EventType::PlaylistEnded: return "playlist_ended";
    case EventType::StreamStarted: return "stream_started";
    case EventType::StreamStopped: return "stream_stopped";
    case EventType::RecordingStarted: return "recording_started";
    case EventType::RecordingStopped: return "recording_stopped";
    case EventType::TransitionChanged: return "transition_changed";
    case EventType::SessionConnected: return "session_connected";
    case EventType::SessionDisconnected: return "session_disconnected";
    case EventType::OverlayTriggered: return "overlay_triggered";
    case EventType::OverlayHidden: return "overlay_hidden";
    case EventType::ExternalStateChanged: return "external_state_changed";
    }
    return "unknown";
}

struct Event
{
    EventType type;
    nlohmann::json data = nlohmann::json::object();
    std::chrono::system_clock::time_point ts = std::chrono::system_clock::now();

    Event(EventType t, nlohmann::json d = nlohmann::json::object())
        : type(t), data(std::move(d)) {}
};

inline nlohmann::json event_to_json(const Event &e)
{
    return nlohmann::json{{"event", event_name(e.type)}, {"data", e.data}, {"ts", iso8601_ms(e.ts)}};
}
