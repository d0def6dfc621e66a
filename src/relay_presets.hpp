/*
 * File: src/relay_presets.hpp
 * Project: OBS Relay
 * Purpose: Named broadcast-state presets and their execution
 * Notes:
 *  - Execution: one batch (scene + side effects), then the linked playlist
 * Last updated: 2026-10-17
 */

#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "common/relay_error.hpp"
#include "obs_protocol.hpp"
#include "relay_bus.hpp"
#include "relay_scheduler.hpp"
#include "relay_studio.hpp"

struct PresetAction
{
    std::string type; // set_mute | set_volume | media_play | media_pause | media_restart
    nlohmann::json params = nlohmann::json::object();
};

struct ScenePreset
{
    std::string name;
    std::string scene_name;
    std::string description;
    std::optional<std::string> playlist;
    std::optional<std::string> hotkey;
    std::vector<PresetAction> actions;
};

// Maps one preset action onto an upstream request. Throws std::invalid_argument for unknown types
// or missing parameters.
inline std::pair<std::string, nlohmann::json> action_request(const PresetAction &a)
{
    auto source = [&]
    {
        auto it = a.params.find("source_name");
        if (it == a.params.end() || !it->is_string())
            throw std::invalid_argument(a.type + ": missing source_name");
        return it->get<std::string>();
    };
    auto media = [&](const char *action)
    {
        return std::make_pair(std::string("TriggerMediaInputAction"),
                              nlohmann::json{{"inputName", source()}, {"mediaAction", action}});
    };
    if (a.type == "set_mute")
        return {"SetInputMute", {{"inputName", source()}, {"inputMuted", a.params.value("muted", true)}}};
    if (a.type == "set_volume")
    {
        if (!a.params.contains("volume_db") || !a.params["volume_db"].is_number())
            throw std::invalid_argument("set_volume: missing volume_db");
        return {"SetInputVolume", {{"inputName", source()}, {"inputVolumeDb", a.params["volume_db"].get<double>()}}};
    }
    if (a.type == "media_play")
        return media("OBS_WEBSOCKET_MEDIA_INPUT_ACTION_PLAY");
    if (a.type == "media_pause")
        return media("OBS_WEBSOCKET_MEDIA_INPUT_ACTION_PAUSE");
    if (a.type == "media_restart")
        return media("OBS_WEBSOCKET_MEDIA_INPUT_ACTION_RESTART");
    throw std::invalid_argument("unknown preset action '" + a.type + "'");
}

inline ScenePreset preset_from_json(const nlohmann::json &j)
{
    ScenePreset p;
    p.name = j.at("name").get<std::string>();
    p.scene_name = j.at("scene_name").get<std::string>();
    p.description = j.value("description", std::string());
    if (j.contains("playlist") && !j["playlist"].is_null())
        p.playlist = j["playlist"].get<std::string>();
    if (j.contains("hotkey") && !j["hotkey"].is_null())
        p.hotkey = j["hotkey"].get<std::string>();
    for (const auto &a : j.value("actions", nlohmann::json::array()))
    {
        PresetAction act{a.at("type").get<std::string>(), a.value("params", nlohmann::json::object())};
        action_request(act); // validate now rather than on air
        p.actions.push_back(std::move(act));
    }
    return p;
}

inline nlohmann::json preset_to_json(const ScenePreset &p)
{
    using nlohmann::json;
    auto actions = json::array();
    for (const auto &a : p.actions)
        actions.push_back({{"type", a.type}, {"params", a.params}});
    return json{{"name", p.name},
                {"scene_name", p.scene_name},
                {"description", p.description},
                {"playlist", p.playlist ? json(*p.playlist) : json(nullptr)},
                {"hotkey", p.hotkey ? json(*p.hotkey) : json(nullptr)},
                {"actions", actions}};
}

class PresetCatalog
{
    std::map<std::string, ScenePreset> presets_;

public:
    void add(ScenePreset p)
    {
        Log::debug("studio", "preset " + p.name + " -> " + p.scene_name);
        std::string key = p.name;
        presets_[key] = std::move(p);
    }

    // Built-ins; entries already present (from configuration) win.
    void add_defaults()
    {
        auto def = [&](const char *name, const char *scene, const char *desc)
        {
            ScenePreset p;
            p.name = name;
            p.scene_name = scene;
            p.description = desc;
            p.hotkey = std::string("/obs/scene/") + name;
            return p;
        };
        std::vector<ScenePreset> defaults;
        defaults.push_back(def("live", "Live", "Main live broadcast scene"));
        defaults.push_back(def("brb", "BRB", "Be Right Back screen"));
        defaults.back().actions.push_back({"set_mute", {{"source_name", "Mic"}, {"muted", true}}});
        defaults.push_back(def("standby", "Standby", "Holding / pre-show screen"));
        defaults.push_back(def("intermission", "Intermission", "Intermission loop with playlist"));
        defaults.back().playlist = "intermission";
        defaults.push_back(def("end_card", "EndCard", "Post-show slate"));
        for (auto &p : defaults)
            if (!presets_.count(p.name))
                add(std::move(p));
    }

    const ScenePreset *find(const std::string &name) const
    {
        auto it = presets_.find(name);
        return it == presets_.end() ? nullptr : &it->second;
    }

    nlohmann::json list() const
    {
        auto arr = nlohmann::json::array();
        for (const auto &[name, p] : presets_)
            arr.push_back(preset_to_json(p));
        return arr;
    }
};

class PresetRunner
{
    const PresetCatalog &catalog_;
    StudioControl &studio_;
    PlaylistScheduler &scheduler_;
    EventBus &bus_;

public:
    PresetRunner(const PresetCatalog &catalog, StudioControl &studio, PlaylistScheduler &scheduler, EventBus &bus)
        : catalog_(catalog), studio_(studio), scheduler_(scheduler), bus_(bus) {}

    // Throws NotFound / UpstreamUnavailable synchronously; other failures arrive through done.
    void activate(const std::string &name, ReplyHandler done)
    {
        const ScenePreset *p = catalog_.find(name);
        if (!p)
            throw RelayError(ErrorCode::NotFound, "preset '" + name + "' not found");
        obs::RequestList extra;
        for (const auto &a : p->actions)
            extra.push_back(action_request(a));

        ScenePreset preset = *p;
        studio_.run_scene_batch(preset.scene_name, extra, [this, preset, done](const Outcome &o)
                                {
            if (!o.ok) return done(o);
            nlohmann::json data{{"preset", preset.name}, {"scene", preset.scene_name}};
            Outcome out = Outcome::success();
            if (preset.playlist)
            {
                try
                {
                    Outcome pl = scheduler_.activate(*preset.playlist);
                    data["playlist"] = *preset.playlist;
                    data["track"] = pl.data.value("track", std::string());
                    out.warning = pl.warning;
                }
                catch (const RelayError &e)
                {
                    Log::warn("studio", "preset " + preset.name + ": playlist activation failed: " + e.what());
                    out.warning = std::string(error_code_name(e.code())) + ": " + e.what();
                }
            }
            Log::info("studio", "activated preset: " + preset.name);
            bus_.publish(Event(EventType::PresetActivated, data));
            out.data = data;
            done(out); });
    }
};
