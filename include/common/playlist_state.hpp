/*
 * File: include/common/playlist_state.hpp
 * Project: OBS Relay
 * Purpose: Persisted playlist position record
 * Notes:
 *  - {active_playlist, position, auto_advance, updated_at}
 *  - updated_at is kept at millisecond precision so it survives a round trip
 * Last updated: 2026-10-17
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>


struct PlaylistState {
std::optional<std::string> active_playlist;
std::size_t position{0};
bool auto_advance{true};
std::chrono::system_clock::time_point updated_at{};

bool operator==(const PlaylistState& o) const {
    return active_playlist == o.active_playlist && position == o.position &&
           auto_advance == o.auto_advance && updated_at == o.updated_at;
}
bool operator!=(const PlaylistState& o) const { return !(*this == o); }
};


inline std::chrono::system_clock::time_point now_ms(){
using namespace std::chrono;
return time_point_cast<milliseconds>(system_clock::now());
}


inline nlohmann::json state_to_json(const PlaylistState& s){
using nlohmann::json; using namespace std::chrono;
auto ms = duration_cast<milliseconds>(s.updated_at.time_since_epoch()).count();
return json{
{"active_playlist", s.active_playlist ? json(*s.active_playlist) : json(nullptr)},
{"position", s.position},
{"auto_advance", s.auto_advance},
{"updated_at", ms}
};
}


// Throws nlohmann::json::exception on missing or mistyped fields.
inline PlaylistState state_from_json(const nlohmann::json& j){
using namespace std::chrono;
PlaylistState s;
const auto& ap = j.at("active_playlist");
if (!ap.is_null()) s.active_playlist = ap.get<std::string>();
auto pos = j.at("position").get<long long>();
if (pos < 0) throw std::out_of_range("negative position");
s.position = static_cast<std::size_t>(pos);
s.auto_advance = j.value("auto_advance", true);
s.updated_at = system_clock::time_point(milliseconds(j.value("updated_at", 0LL)));
return s;
}
