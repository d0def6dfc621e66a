/*
 * File: src/relay_overlay.hpp
 * Project: OBS Relay
 * Purpose: Timed title overlay shown on a text source when the track changes
 * Notes:
 *  - Sequence per trigger: wait delay, set text + show the scene item, wait hold, hide
 *  - A new trigger or a manual hide cancels the running sequence (generation counter)
 *  - Per-track #EXTOVERLAY hints override text, hold and delay, or skip the track
 *  - Timer work runs on the io_context; state is shared under one mutex
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "common/m3u.hpp"
#include "common/relay_error.hpp"
#include "obs_protocol.hpp"
#include "relay_bus.hpp"
#include "relay_session.hpp"
#include "relay_studio.hpp"

struct OverlaySettings
{
    bool enabled = true;
    std::string source_name = "TitleOverlay";
    std::string scene_name; // empty = current program scene
    double hold_sec = 8.0;
    double delay_sec = 1.0;
    std::string prefix;
    std::string suffix;
    std::string mode = "current"; // current | next_up
    bool auto_trigger = true;
    std::string next_up_prefix = "Up Next: ";
};

inline nlohmann::json overlay_settings_to_json(const OverlaySettings &s)
{
    return nlohmann::json{{"enabled", s.enabled},
                          {"source_name", s.source_name},
                          {"scene_name", s.scene_name},
                          {"hold_sec", s.hold_sec},
                          {"delay_sec", s.delay_sec},
                          {"prefix", s.prefix},
                          {"suffix", s.suffix},
                          {"mode", s.mode},
                          {"auto_trigger", s.auto_trigger},
                          {"next_up_prefix", s.next_up_prefix}};
}

// Applies the keys present in patch onto s. Throws RelayError(SchemaError) naming the
// first bad key; s is left untouched in that case.
inline void apply_overlay_settings(OverlaySettings &s, const nlohmann::json &patch)
{
    if (!patch.is_object())
        throw RelayError(ErrorCode::SchemaError, "overlay settings must be an object");
    OverlaySettings next = s;
    auto bad = [](const std::string &key, const char *want)
    { return RelayError(ErrorCode::SchemaError, "overlay: '" + key + "' must be " + want); };

    for (auto it = patch.begin(); it != patch.end(); ++it)
    {
        const std::string &key = it.key();
        const nlohmann::json &v = it.value();
        if (v.is_null())
            continue;
        if (key == "enabled" || key == "auto_trigger")
        {
            if (!v.is_boolean())
                throw bad(key, "a boolean");
            (key == "enabled" ? next.enabled : next.auto_trigger) = v.get<bool>();
        }
        else if (key == "hold_sec" || key == "delay_sec")
        {
            if (!v.is_number())
                throw bad(key, "a number");
            double d = v.get<double>();
            if (!(d >= 0 && d <= kMaxMediaSeconds))
                throw bad(key, "between 0 and 86400");
            (key == "hold_sec" ? next.hold_sec : next.delay_sec) = d;
        }
        else if (key == "source_name" || key == "scene_name" || key == "prefix" || key == "suffix" ||
                 key == "mode" || key == "next_up_prefix")
        {
            if (!v.is_string())
                throw bad(key, "a string");
            std::string str = v.get<std::string>();
            if (key == "source_name")
            {
                if (str.empty())
                    throw bad(key, "a non-empty string");
                next.source_name = str;
            }
            else if (key == "mode")
            {
                if (str != "current" && str != "next_up")
                    throw bad(key, "current or next_up");
                next.mode = str;
            }
            else if (key == "scene_name")
                next.scene_name = str;
            else if (key == "prefix")
                next.prefix = str;
            else if (key == "suffix")
                next.suffix = str;
            else
                next.next_up_prefix = str;
        }
        else
            throw RelayError(ErrorCode::SchemaError, "overlay: unknown setting '" + key + "'");
    }
    s = std::move(next);
}

class OverlayController
{
    using clock = std::chrono::steady_clock;

public:
    OverlayController(boost::asio::io_context &ioc, SessionSupervisor &session, StudioControl &studio,
                      EventBus &bus, OverlaySettings cfg)
        : ioc_(ioc), session_(session), studio_(studio), bus_(bus), cfg_(std::move(cfg)), timer_(ioc)
    {
        for (auto type : {EventType::PlaylistActivated, EventType::TrackChanged})
            tokens_.push_back(bus_.subscribe(type, [this](const Event &ev)
                                             { on_track(ev); }));
    }

    ~OverlayController()
    {
        for (auto t : tokens_)
            bus_.unsubscribe(t);
    }

    OverlayController(const OverlayController &) = delete;
    OverlayController &operator=(const OverlayController &) = delete;

    // Shows text now (after delay) and cancels whatever overlay is running.
    // Throws RelayError(UpstreamUnavailable) unless the session is Connected.
    Outcome trigger(const std::string &text, std::optional<double> hold, std::optional<double> delay)
    {
        require_session();
        OverlaySettings cfg = settings();
        return start(text, hold.value_or(cfg.hold_sec), delay.value_or(cfg.delay_sec), "manual", nullptr);
    }

    // Re-shows the title of a track (track_to_json shape) without the start delay.
    Outcome trigger_track(const nlohmann::json &item, std::optional<double> hold = std::nullopt)
    {
        require_session();
        OverlaySettings cfg = settings();
        const auto hints = item.value("overlay", nlohmann::json::object());
        std::string text = hints.value("text", std::string());
        if (text.empty())
            text = cfg.prefix + item.value("title", std::string()) + cfg.suffix;
        return start(text, hold.value_or(hints.value("hold_sec", cfg.hold_sec)), 0.0, "manual", &item);
    }

    // Cancels the running sequence and hides the source.
    Outcome hide()
    {
        bool was_active = cancel_sequence();
        const std::string source = settings().source_name;
        Outcome out = Outcome::success({{"status", "hidden"}, {"source", source}, {"was_active", was_active}});
        if (session_.healthy())
            set_visible(false);
        else
            out.warning = "upstream_unavailable: source not hidden";
        Log::info("overlay", "hidden (manual)");
        bus_.publish(Event(EventType::OverlayHidden, {{"source", source}, {"cause", "manual"}}));
        return out;
    }

    Outcome configure(const nlohmann::json &patch)
    {
        std::scoped_lock lk(mtx_);
        apply_overlay_settings(cfg_, patch);
        for (auto it = patch.begin(); it != patch.end(); ++it)
            Log::info("overlay", "config: " + it.key() + " = " + it.value().dump());
        return Outcome::success(overlay_settings_to_json(cfg_));
    }

    OverlaySettings settings() const
    {
        std::scoped_lock lk(mtx_);
        return cfg_;
    }

    nlohmann::json status() const
    {
        std::scoped_lock lk(mtx_);
        double remaining = 0;
        if (phase_ != Phase::Idle)
            remaining = std::max(0.0, std::chrono::duration<double>(deadline_ - clock::now()).count());
        return nlohmann::json{{"active", phase_ != Phase::Idle},
                              {"visible", phase_ == Phase::Showing},
                              {"current_text", text_},
                              {"track_title", track_title_},
                              {"playlist", playlist_},
                              {"position", position_},
                              {"timer_remaining", std::round(remaining * 10) / 10},
                              {"config", overlay_settings_to_json(cfg_)}};
    }

    // Shutdown: drop the running sequence without touching the upstream source.
    void cancel() { cancel_sequence(); }

private:
    enum class Phase
    {
        Idle,
        Delaying,
        Showing
    };

    void require_session() const
    {
        if (!session_.healthy())
            throw RelayError(ErrorCode::UpstreamUnavailable,
                             std::string("overlay: upstream session is ") + session_state_name(session_.current_state()));
    }

    void on_track(const Event &ev)
    {
        OverlaySettings cfg = settings();
        if (!cfg.enabled || !cfg.auto_trigger)
            return;
        const auto item = ev.data.value("item", nlohmann::json::object());
        const auto hints = item.value("overlay", nlohmann::json::object());
        const std::string title = ev.data.value("track", std::string());
        if (hints.value("skip", false))
        {
            Log::info("overlay", "skipped for track: " + title);
            return;
        }
        if (!session_.healthy())
        {
            Log::debug("overlay", "session not connected, no overlay for: " + title);
            return;
        }

        std::string text = hints.value("text", std::string());
        if (text.empty() && cfg.mode == "next_up")
        {
            std::string upcoming = title;
            if (ev.data.contains("next_track") && ev.data["next_track"].is_string())
                upcoming = ev.data["next_track"].get<std::string>();
            text = cfg.next_up_prefix + upcoming;
        }
        else if (text.empty())
            text = cfg.prefix + title + cfg.suffix;

        start(text, hints.value("hold_sec", cfg.hold_sec), hints.value("delay_sec", cfg.delay_sec), "track", &ev.data);
    }

    Outcome start(const std::string &text, double hold, double delay, const char *cause, const nlohmann::json *track)
    {
        hold = std::clamp(hold, 0.0, kMaxMediaSeconds);
        delay = std::clamp(delay, 0.0, kMaxMediaSeconds);
        bool was_showing = false;
        std::uint64_t gen = 0;
        std::string source;
        {
            std::scoped_lock lk(mtx_);
            was_showing = phase_ == Phase::Showing;
            gen = ++gen_;
            phase_ = Phase::Delaying;
            text_ = text;
            deadline_ = clock::now() + to_ms(delay);
            if (track)
            {
                track_title_ = track->value("track", track->value("title", std::string()));
                playlist_ = track->value("playlist", std::string());
                position_ = track->value("position", 0LL);
            }
            source = cfg_.source_name;
        }
        // with no delay the new text simply replaces the old on the visible source
        if (was_showing && delay > 0)
            set_visible(false);

        boost::asio::post(ioc_, [this, gen, text, hold, delay]
                          {
            if (gen != gen_) return;
            timer_.expires_after(to_ms(delay));
            timer_.async_wait([this, gen, text, hold](boost::system::error_code ec)
                              {
                if (ec || gen != gen_) return;
                show(gen, text, hold); }); });

        nlohmann::json data{{"status", "triggered"},
                            {"text", text},
                            {"hold_sec", hold},
                            {"delay_sec", delay},
                            {"source", source},
                            {"cause", cause}};
        Log::info("overlay", "triggered: '" + text + "' hold=" + std::to_string(hold) + "s delay=" + std::to_string(delay) + "s");
        bus_.publish(Event(EventType::OverlayTriggered, data));
        return Outcome::success(data);
    }

    void show(std::uint64_t gen, const std::string &text, double hold)
    {
        const std::string source = settings().source_name;
        with_scene_item([this, gen, text, hold, source](const std::string &scene, long long item)
                        {
            obs::RequestList reqs;
            reqs.push_back({"SetInputSettings", {{"inputName", source}, {"inputSettings", {{"text", text}}}}});
            reqs.push_back({"SetSceneItemEnabled",
                            {{"sceneName", scene}, {"sceneItemId", item}, {"sceneItemEnabled", true}}});
            send_batch(reqs, [this, gen, text, hold, scene](const Outcome &o)
                       {
                if (!o.ok)
                {
                    Log::warn("overlay", "show rejected: " + o.message);
                    finish(gen);
                    return;
                }
                if (gen != gen_)
                {
                    // cancelled while the show was in flight
                    if (idle())
                        set_visible(false);
                    return;
                }
                {
                    std::scoped_lock lk(mtx_);
                    phase_ = Phase::Showing;
                    deadline_ = clock::now() + to_ms(hold);
                }
                Log::debug("overlay", "shown in scene '" + scene + "': " + text);
                timer_.expires_after(to_ms(hold));
                timer_.async_wait([this, gen](boost::system::error_code ec)
                                  {
                    if (ec || gen != gen_) return;
                    expire(gen); }); }); },
                        [this, gen](const std::string &why)
                        {
                            Log::warn("overlay", "cannot show: " + why);
                            finish(gen);
                        });
    }

    void expire(std::uint64_t gen)
    {
        set_visible(false);
        finish(gen);
        Log::debug("overlay", "hold elapsed");
        bus_.publish(Event(EventType::OverlayHidden, {{"source", settings().source_name}, {"cause", "timeout"}}));
    }

    void finish(std::uint64_t gen)
    {
        std::scoped_lock lk(mtx_);
        if (gen != gen_)
            return;
        phase_ = Phase::Idle;
        text_.clear();
    }

    bool idle() const
    {
        std::scoped_lock lk(mtx_);
        return phase_ == Phase::Idle;
    }

    // Returns true when a sequence was running.
    bool cancel_sequence()
    {
        bool active = false;
        std::uint64_t gen = 0;
        {
            std::scoped_lock lk(mtx_);
            active = phase_ != Phase::Idle;
            phase_ = Phase::Idle;
            text_.clear();
            gen = ++gen_;
        }
        boost::asio::post(ioc_, [this, gen]
                          {
            if (gen == gen_) timer_.cancel(); });
        return active;
    }

    void set_visible(bool visible)
    {
        with_scene_item([this, visible](const std::string &scene, long long item)
                        { send("SetSceneItemEnabled",
                               {{"sceneName", scene}, {"sceneItemId", item}, {"sceneItemEnabled", visible}},
                               [visible](const Outcome &o)
                               {
                                   if (!o.ok)
                                       Log::warn("overlay", std::string(visible ? "show" : "hide") + " rejected: " + o.message);
                               }); },
                        [](const std::string &why)
                        { Log::warn("overlay", "cannot hide: " + why); });
    }

    // Resolves the configured (or current program) scene and the overlay's item id in it.
    void with_scene_item(std::function<void(const std::string &, long long)> next,
                         std::function<void(const std::string &)> fail)
    {
        OverlaySettings cfg = settings();
        auto lookup = [this, source = cfg.source_name, next, fail](const std::string &scene)
        {
            send("GetSceneItemId", {{"sceneName", scene}, {"sourceName", source}},
                 [scene, source, next, fail](const Outcome &o)
                 {
                     long long id = o.ok ? o.data.value("sceneItemId", -1LL) : -1;
                     if (id < 0)
                         return fail("source '" + source + "' not found in scene '" + scene + "'");
                     next(scene, id);
                 });
        };

        std::string scene = cfg.scene_name;
        if (scene.empty())
            scene = studio_.current_scene().value_or(std::string());
        if (!scene.empty())
            return lookup(scene);
        send("GetCurrentProgramScene", nlohmann::json::object(), [lookup, fail](const Outcome &o)
             {
                 std::string current = o.ok ? o.data.value("currentProgramSceneName", o.data.value("sceneName", std::string()))
                                            : std::string();
                 if (current.empty())
                     return fail("current program scene unknown");
                 lookup(current); });
    }

    void send(const std::string &type, const nlohmann::json &data, ReplyHandler done)
    {
        try
        {
            session_.send(type, data, done);
        }
        catch (const RelayError &e)
        {
            done(Outcome::from(e));
        }
    }

    void send_batch(const obs::RequestList &reqs, ReplyHandler done)
    {
        try
        {
            session_.send_batch(reqs, done);
        }
        catch (const RelayError &e)
        {
            done(Outcome::from(e));
        }
    }

    static std::chrono::milliseconds to_ms(double seconds)
    {
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    }

    boost::asio::io_context &ioc_;
    SessionSupervisor &session_;
    StudioControl &studio_;
    EventBus &bus_;
    std::vector<EventBus::Token> tokens_;

    mutable std::mutex mtx_;
    OverlaySettings cfg_;
    Phase phase_ = Phase::Idle;
    std::string text_;
    std::string track_title_;
    std::string playlist_;
    long long position_ = 0;
    clock::time_point deadline_{};

    boost::asio::steady_timer timer_;
    std::atomic<std::uint64_t> gen_{0};
};
