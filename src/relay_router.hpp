/*
 * File: src/relay_router.hpp
 * Project: OBS Relay
 * Purpose: Authenticates, validates and dispatches commands from every control surface
 * Notes:
 *  - Credential check runs before parsing, so a rejected caller learns nothing about the command
 *  - Each command maps to exactly one core operation
 *  - Replies are Outcome values; adapters serialise them with Outcome::to_json()
 * Last updated: 2026-10-17
 */

#pragma once
#include <openssl/crypto.h>

#include <exception>
#include <mutex>
#include <set>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

#include "common/command.hpp"
#include "common/log.hpp"
#include "common/relay_error.hpp"
#include "relay_broadcast.hpp"
#include "relay_overlay.hpp"
#include "relay_presets.hpp"
#include "relay_scheduler.hpp"
#include "relay_session.hpp"
#include "relay_studio.hpp"

// "Bearer <token>" -> token; anything else -> empty.
inline std::string bearer_token(const std::string &header)
{
    const std::string prefix = "Bearer ";
    if (header.size() <= prefix.size() || header.compare(0, prefix.size(), prefix) != 0)
        return {};
    auto token = header.substr(prefix.size());
    auto last = token.find_last_not_of(" \t");
    return last == std::string::npos ? std::string() : token.substr(0, last + 1);
}

struct RouterDeps
{
    SessionSupervisor &session;
    PlaylistScheduler &scheduler;
    StudioControl &studio;
    PresetRunner &presets;
    OverlayController &overlay;
    const Broadcaster &broadcaster;
};

class CommandRouter
{
public:
    CommandRouter(RouterDeps deps, std::string access_key)
        : d_(deps), key_(std::move(access_key)) {}

    bool auth_required() const { return !key_.empty(); }

    // Returns true (and remembers origin) when credential matches the access key.
    bool present_credential(const std::string &origin, const std::string &credential)
    {
        if (!auth_required())
            return true;
        bool match = credential.size() == key_.size() &&
                     CRYPTO_memcmp(credential.data(), key_.data(), key_.size()) == 0;
        if (!match)
        {
            Log::warn("router", "rejected credential from " + origin);
            return false;
        }
        std::scoped_lock lk(mtx_);
        authorized_.insert(origin);
        return true;
    }

    void forget(const std::string &origin)
    {
        std::scoped_lock lk(mtx_);
        authorized_.erase(origin);
    }

    bool authorized(const std::string &origin) const
    {
        if (!auth_required())
            return true;
        std::scoped_lock lk(mtx_);
        return authorized_.count(origin) > 0;
    }

    // done is invoked exactly once, possibly later on the io thread for upstream commands.
    void handle(const nlohmann::json &msg, const std::string &origin, ReplyHandler done)
    {
        if (!authorized(origin))
            return done(Outcome::failure(ErrorCode::AuthError, "missing or invalid credential"));
        Command cmd{GetStatus{}, origin};
        try
        {
            cmd = parse_command(msg, origin);
        }
        catch (const RelayError &e)
        {
            Log::debug("router", origin + ": " + e.what());
            return done(Outcome::from(e));
        }
        dispatch(cmd, std::move(done));
    }

    void dispatch(const Command &cmd, ReplyHandler done)
    {
        const char *name = command_name(cmd.body);
        Log::debug("router", cmd.origin + " -> " + name);
        try
        {
            std::visit(Dispatch{d_, done}, cmd.body);
        }
        catch (const RelayError &e)
        {
            Log::info("router", std::string(name) + " failed: " + error_code_name(e.code()) + ": " + e.what());
            done(Outcome::from(e));
        }
        catch (const std::exception &e)
        {
            Log::error("router", std::string(name) + " raised: " + e.what());
            done(Outcome::failure(ErrorCode::Internal, e.what()));
        }
    }

    nlohmann::json status() const { return snapshot(d_); }

private:
    static nlohmann::json snapshot(const RouterDeps &d)
    {
        using nlohmann::json;
        auto scene = d.studio.current_scene();
        return json{{"session", d.session.status()},
                    {"scene", scene ? json(*scene) : json(nullptr)},
                    {"playlist", d.scheduler.status()},
                    {"overlay", d.overlay.status()},
                    {"subscribers", d.broadcaster.count()}};
    }

    struct Dispatch
    {
        RouterDeps &d;
        ReplyHandler &done;

        void operator()(const ActivatePreset &c) { d.presets.activate(c.name, done); }
        void operator()(const SwitchScene &c) { d.studio.switch_scene(c.scene, done); }
        void operator()(const PlaylistActivate &c) { done(d.scheduler.activate(c.name, c.position)); }
        void operator()(const PlaylistNext &) { done(d.scheduler.next()); }
        void operator()(const PlaylistPrev &) { done(d.scheduler.prev()); }
        void operator()(const PlaylistSeek &c) { done(d.scheduler.seek(c.position)); }
        void operator()(const SetAutoAdvance &c) { done(d.scheduler.set_auto_advance(c.enabled)); }
        void operator()(const StreamStart &) { d.studio.stream(true, done); }
        void operator()(const StreamStop &) { d.studio.stream(false, done); }
        void operator()(const RecordStart &) { d.studio.record(true, done); }
        void operator()(const RecordStop &) { d.studio.record(false, done); }
        void operator()(const SetTransition &c) { d.studio.set_transition(c.name, c.duration_ms, done); }

        void operator()(const GetStatus &) { done(Outcome::success(snapshot(d))); }

        void operator()(const PlaylistValidate &)
        {
            PreflightReport r = d.scheduler.preflight();
            d.scheduler.record_preflight(r);
            done(Outcome::success(preflight_to_json(r)));
        }

        void operator()(const OverlayTrigger &c)
        {
            if (c.text)
                return done(d.overlay.trigger(*c.text, c.hold_sec, c.delay_sec));
            auto item = d.scheduler.status()["current_item"];
            if (!item.is_object())
                throw RelayError(ErrorCode::NoActivePlaylist, "no active track to show");
            done(d.overlay.trigger_track(item, c.hold_sec));
        }

        void operator()(const OverlayHide &) { done(d.overlay.hide()); }
        void operator()(const OverlayConfigure &c) { done(d.overlay.configure(c.settings)); }
    };

    RouterDeps d_;
    std::string key_;
    mutable std::mutex mtx_;
    std::set<std::string> authorized_;
};
