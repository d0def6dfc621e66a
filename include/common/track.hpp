/*
 * File: include/common/track.hpp
 * Project: OBS Relay
 * Purpose: Track and Playlist records loaded from extended M3U
 * Notes:
 *  - Playlists are immutable once loaded; reload = restart
 *  - duration < 0 means unknown
 * Last updated: 2026-10-17
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


// Per-track title overlay overrides (#EXTOVERLAY:key=value).
struct OverlayHints {
std::optional<std::string> text;
std::optional<double> hold;   // seconds visible
std::optional<double> delay;  // seconds after the track starts
bool skip{false};
bool empty() const { return !text && !hold && !delay && !skip; }
};


struct Track {
std::string path;            // absolute path or URL
std::string title;
double duration{-1};         // seconds, -1 = unknown
std::optional<double> trim_in;
std::optional<double> trim_out;
OverlayHints overlay;
};


struct Playlist {
std::string name;
std::vector<Track> tracks;
bool loop{true};
std::string source_file;
std::size_t size() const { return tracks.size(); }
};


inline bool is_remote_path(const std::string& p){
for (const char* scheme : {"http://", "https://", "rtmp://", "rtsp://", "srt://"})
    if (p.rfind(scheme, 0) == 0) return true;
return false;
}


inline nlohmann::json track_to_json(const Track& t){
using nlohmann::json;
json j{{"path", t.path}, {"title", t.title}, {"duration", t.duration}};
j["start_time"] = t.trim_in ? json(*t.trim_in) : json(nullptr);
j["stop_time"] = t.trim_out ? json(*t.trim_out) : json(nullptr);
if (!t.overlay.empty()) {
    json o{{"skip", t.overlay.skip}};
    if (t.overlay.text) o["text"] = *t.overlay.text;
    if (t.overlay.hold) o["hold_sec"] = *t.overlay.hold;
    if (t.overlay.delay) o["delay_sec"] = *t.overlay.delay;
    j["overlay"] = std::move(o);
}
return j;
}


inline nlohmann::json playlist_to_json(const Playlist& p, bool with_tracks = false){
nlohmann::json j{{"name", p.name}, {"total_items", p.size()}, {"loop", p.loop}};
if (with_tracks) {
    auto arr = nlohmann::json::array();
    for (const auto& t : p.tracks) arr.push_back(track_to_json(t));
    j["tracks"] = std::move(arr);
}
return j;
}
