/*
 * File: include/common/command.hpp
 * Project: OBS Relay
 * Purpose: Closed command set accepted from every control surface
 * Notes:
 *  - parse_command() is the only way to build a Command from wire input;
 *    unknown names and bad parameters throw RelayError(SchemaError)
 * Last updated: 2026-10-17
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

#include "common/relay_error.hpp"

struct ActivatePreset { std::string name; };
struct SwitchScene { std::string scene; };
struct PlaylistActivate { std::string name; std::optional<long long> position; };
struct PlaylistNext {};
struct PlaylistPrev {};
struct PlaylistSeek { long long position{0}; };
struct SetAutoAdvance { bool enabled{true}; };
struct StreamStart {};
struct StreamStop {};
struct RecordStart {};
struct RecordStop {};
struct SetTransition { std::optional<std::string> name; std::optional<long long> duration_ms; };
struct GetStatus {};
struct PlaylistValidate {};
// No text: re-show the current track's title.
struct OverlayTrigger { std::optional<std::string> text; std::optional<double> hold_sec; std::optional<double> delay_sec; };
struct OverlayHide {};
struct OverlayConfigure { nlohmann::json settings; };

using CommandBody = std::variant<
    ActivatePreset, SwitchScene, PlaylistActivate, PlaylistNext, PlaylistPrev, PlaylistSeek,
    SetAutoAdvance, StreamStart, StreamStop, RecordStart, RecordStop, SetTransition,
    GetStatus, PlaylistValidate, OverlayTrigger, OverlayHide, OverlayConfigure>;

struct Command
{
    CommandBody body;
    std::string origin; // subscriber identity of the sender
};

namespace detail
{
    struct CommandNamer
    {
        const char *operator()(const ActivatePreset &) const { return "activate_preset"; }
        const char *operator()(const SwitchScene &) const { return "switch_scene"; }
        const char *operator()(const PlaylistActivate &) const { return "playlist_activate"; }
        const char *operator()(const PlaylistNext &) const { return "playlist_next"; }
        const char *operator()(const PlaylistPrev &) const { return "playlist_prev"; }
        const char *operator()(const PlaylistSeek &) const { return "playlist_seek"; }
        const char *operator()(const SetAutoAdvance &) const { return "set_auto_advance"; }
        const char *operator()(const StreamStart &) const { return "stream_start"; }
        const char *operator()(const StreamStop &) const { return "stream_stop"; }
        const char *operator()(const RecordStart &) const { return "record_start"; }
        const char *operator()(const RecordStop &) const { return "record_stop"; }
        const char *operator()(const SetTransition &) const { return "set_transition"; }
        const char *operator()(const GetStatus &) const { return "get_status"; }
        const char *operator()(const PlaylistValidate &) const { return "playlist_validate"; }
        const char *operator()(const OverlayTrigger &) const { return "overlay_trigger"; }
        const char *operator()(const OverlayHide &) const { return "overlay_hide"; }
        const char *operator()(const OverlayConfigure &) const { return "overlay_configure"; }
    };

    inline const nlohmann::json *param(const nlohmann::json &params, const char *key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
            return nullptr;
        return &*it;
    }

    inline std::string require_string(const nlohmann::json &params, const char *key)
    {
        auto *v = param(params, key);
        if (!v)
            throw RelayError(ErrorCode::SchemaError, std::string("missing parameter '") + key + "'");
        if (!v->is_string() || v->get<std::string>().empty())
            throw RelayError(ErrorCode::SchemaError, std::string("parameter '") + key + "' must be a non-empty string");
        return v->get<std::string>();
    }

    inline std::optional<long long> optional_int(const nlohmann::json &params, const char *key)
    {
        auto *v = param(params, key);
        if (!v)
            return std::nullopt;
        if (!v->is_number_integer())
            throw RelayError(ErrorCode::SchemaError, std::string("parameter '") + key + "' must be an integer");
        return v->get<long long>();
    }

    inline long long require_int(const nlohmann::json &params, const char *key)
    {
        auto v = optional_int(params, key);
        if (!v)
            throw RelayError(ErrorCode::SchemaError, std::string("missing parameter '") + key + "'");
        return *v;
    }

    // Non-negative seconds.
    inline std::optional<double> optional_seconds(const nlohmann::json &params, const char *key)
    {
        auto *v = param(params, key);
        if (!v)
            return std::nullopt;
        if (!v->is_number() || v->get<double>() < 0)
            throw RelayError(ErrorCode::SchemaError, std::string("parameter '") + key + "' must be a non-negative number");
        return v->get<double>();
    }

    inline bool require_bool(const nlohmann::json &params, const char *key)
    {
        auto *v = param(params, key);
        if (!v)
            throw RelayError(ErrorCode::SchemaError, std::string("missing parameter '") + key + "'");
        if (!v->is_boolean())
            throw RelayError(ErrorCode::SchemaError, std::string("parameter '") + key + "' must be a boolean");
        return v->get<bool>();
    }
}

inline const char *command_name(const CommandBody &body)
{
    return std::visit(detail::CommandNamer{}, body);
}

// Builds a command from {"cmd": name, "params": {...}}.
inline Command parse_command(const nlohmann::json &msg, const std::string &origin)
{
    using namespace detail;
    if (!msg.is_object())
        throw RelayError(ErrorCode::SchemaError, "command must be a JSON object");
    auto it = msg.find("cmd");
    if (it == msg.end() || !it->is_string())
        throw RelayError(ErrorCode::SchemaError, "missing 'cmd'");
    const std::string cmd = it->get<std::string>();

    nlohmann::json params = nlohmann::json::object();
    if (auto p = msg.find("params"); p != msg.end() && !p->is_null())
    {
        if (!p->is_object())
            throw RelayError(ErrorCode::SchemaError, "'params' must be an object");
        params = *p;
    }

    Command c{GetStatus{}, origin};
    if (cmd == "activate_preset")
        c.body = ActivatePreset{require_string(params, "name")};
    else if (cmd == "switch_scene")
        c.body = SwitchScene{require_string(params, "scene_name")};
    else if (cmd == "playlist_activate")
        c.body = PlaylistActivate{require_string(params, "name"), optional_int(params, "position")};
    else if (cmd == "playlist_next")
        c.body = PlaylistNext{};
    else if (cmd == "playlist_prev")
        c.body = PlaylistPrev{};
    else if (cmd == "playlist_seek")
        c.body = PlaylistSeek{require_int(params, "position")};
    else if (cmd == "set_auto_advance")
        c.body = SetAutoAdvance{require_bool(params, "enabled")};
    else if (cmd == "stream_start")
        c.body = StreamStart{};
    else if (cmd == "stream_stop")
        c.body = StreamStop{};
    else if (cmd == "record_start")
        c.body = RecordStart{};
    else if (cmd == "record_stop")
        c.body = RecordStop{};
    else if (cmd == "set_transition")
    {
        SetTransition t;
        if (param(params, "name"))
            t.name = require_string(params, "name");
        t.duration_ms = optional_int(params, "duration_ms");
        if (!t.name && !t.duration_ms)
            throw RelayError(ErrorCode::SchemaError, "set_transition needs 'name' or 'duration_ms'");
        if (t.duration_ms && *t.duration_ms < 0)
            throw RelayError(ErrorCode::SchemaError, "'duration_ms' must not be negative");
        c.body = t;
    }
    else if (cmd == "get_status")
        c.body = GetStatus{};
    else if (cmd == "playlist_validate")
        c.body = PlaylistValidate{};
    else if (cmd == "overlay_trigger")
    {
        OverlayTrigger t;
        if (param(params, "text"))
            t.text = require_string(params, "text");
        t.hold_sec = optional_seconds(params, "hold_sec");
        t.delay_sec = optional_seconds(params, "delay_sec");
        c.body = t;
    }
    else if (cmd == "overlay_hide")
        c.body = OverlayHide{};
    else if (cmd == "overlay_configure")
    {
        if (params.empty())
            throw RelayError(ErrorCode::SchemaError, "overlay_configure needs at least one setting");
        c.body = OverlayConfigure{params};
    }
    else
        throw RelayError(ErrorCode::SchemaError, "unknown command '" + cmd + "'");
    return c;
}
