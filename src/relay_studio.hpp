/*
 * File: src/relay_studio.hpp
 * Project: OBS Relay
 * Purpose: Thin upstream operations (scene, outputs, transition) and media loading
 * Notes:
 *  - Each operation is one upstream request or one batch
 *  - The upstream echo of a locally issued scene switch is not re-broadcast
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "common/relay_error.hpp"
#include "common/track.hpp"
#include "obs_protocol.hpp"
#include "relay_bus.hpp"
#include "relay_scheduler.hpp"
#include "relay_session.hpp"

class StudioControl
{
public:
    StudioControl(SessionSupervisor &session, EventBus &bus) : session_(session), bus_(bus)
    {
        token_ = bus_.subscribe(EventType::ExternalStateChanged, [this](const Event &ev)
                                { on_external(ev); });
    }
    ~StudioControl() { bus_.unsubscribe(token_); }

    StudioControl(const StudioControl &) = delete;
    StudioControl &operator=(const StudioControl &) = delete;

    void switch_scene(const std::string &scene, ReplyHandler done)
    {
        expect_echo(scene);
        try
        {
            session_.send("SetCurrentProgramScene", {{"sceneName", scene}}, [this, scene, done](const Outcome &o)
                          {
                if (!o.ok)
                {
                    clear_echo(scene);
                    return done(o);
                }
                set_current(scene);
                Log::info("studio", "switched to scene: " + scene);
                bus_.publish(Event(EventType::SceneSwitched, {{"scene", scene}}));
                done(Outcome::success({{"scene", scene}, {"status", "ok"}})); });
        }
        catch (const RelayError &)
        {
            clear_echo(scene);
            throw;
        }
    }

    void stream(bool start, ReplyHandler done)
    {
        session_.send(start ? "StartStream" : "StopStream", nlohmann::json::object(), [this, start, done](const Outcome &o)
                      {
            if (!o.ok) return done(o);
            Log::info("studio", start ? "stream started" : "stream stopped");
            bus_.publish(Event(start ? EventType::StreamStarted : EventType::StreamStopped));
            done(Outcome::success({{"status", start ? "streaming_started" : "streaming_stopped"}})); });
    }

    void record(bool start, ReplyHandler done)
    {
        session_.send(start ? "StartRecord" : "StopRecord", nlohmann::json::object(), [this, start, done](const Outcome &o)
                      {
            if (!o.ok) return done(o);
            nlohmann::json data = nlohmann::json::object();
            if (!start)
                data["output_path"] = o.data.value("outputPath", std::string());
            Log::info("studio", start ? "recording started" : "recording stopped");
            bus_.publish(Event(start ? EventType::RecordingStarted : EventType::RecordingStopped, data));
            data["status"] = start ? "recording_started" : "recording_stopped";
            done(Outcome::success(data)); });
    }

    void set_transition(const std::optional<std::string> &name, std::optional<long long> duration_ms,
                        ReplyHandler done)
    {
        obs::RequestList reqs;
        nlohmann::json data = nlohmann::json::object();
        if (name)
        {
            reqs.push_back({"SetCurrentSceneTransition", {{"transitionName", *name}}});
            data["transition"] = *name;
        }
        if (duration_ms)
        {
            reqs.push_back({"SetCurrentSceneTransitionDuration", {{"transitionDuration", *duration_ms}}});
            data["duration_ms"] = *duration_ms;
        }
        session_.send_batch(reqs, [this, data, done](const Outcome &o)
                            {
            if (!o.ok) return done(o);
            bus_.publish(Event(EventType::TransitionChanged, data));
            done(Outcome::success(data)); });
    }

    // Scene switch plus side effects in one batch; used by preset activation.
    void run_scene_batch(const std::string &scene, const obs::RequestList &extra, ReplyHandler done)
    {
        obs::RequestList reqs;
        reqs.push_back({"SetCurrentProgramScene", {{"sceneName", scene}}});
        reqs.insert(reqs.end(), extra.begin(), extra.end());
        expect_echo(scene);
        try
        {
            session_.send_batch(reqs, [this, scene, done](const Outcome &o)
                                {
                if (!o.ok)
                    clear_echo(scene);
                else
                    set_current(scene);
                done(o); });
        }
        catch (const RelayError &)
        {
            clear_echo(scene);
            throw;
        }
    }

    std::optional<std::string> current_scene() const
    {
        std::scoped_lock lk(mtx_);
        return current_;
    }

private:
    void expect_echo(const std::string &scene)
    {
        std::scoped_lock lk(mtx_);
        echo_ = scene;
    }

    void clear_echo(const std::string &scene)
    {
        std::scoped_lock lk(mtx_);
        if (echo_ && *echo_ == scene)
            echo_.reset();
    }

    void set_current(const std::string &scene)
    {
        std::scoped_lock lk(mtx_);
        current_ = scene;
    }

    void on_external(const Event &ev)
    {
        if (ev.data.value("type", std::string()) != "CurrentProgramSceneChanged")
            return;
        std::string scene = ev.data.value("data", nlohmann::json::object()).value("sceneName", std::string());
        {
            std::scoped_lock lk(mtx_);
            current_ = scene;
            if (echo_ && *echo_ == scene)
            {
                echo_.reset();
                return;
            }
        }
        Log::info("studio", "program scene changed upstream: " + scene);
        bus_.publish(Event(EventType::SceneChangedExternal, {{"scene", scene}}));
    }

    SessionSupervisor &session_;
    EventBus &bus_;
    EventBus::Token token_ = 0;
    mutable std::mutex mtx_;
    std::optional<std::string> echo_;
    std::optional<std::string> current_;
};

// Loads playlist tracks into the upstream media source and enforces trim-out.
class ObsMediaLoader : public MediaLoader
{
public:
    ObsMediaLoader(boost::asio::io_context &ioc, SessionSupervisor &session, EventBus &bus, std::string source)
        : ioc_(ioc), session_(session), bus_(bus), source_(std::move(source)), trim_timer_(ioc) {}

    bool load(const Track &t) override
    {
        nlohmann::json settings{{"looping", false}};
        settings["is_local_file"] = !is_remote_path(t.path);
        settings[is_remote_path(t.path) ? "input" : "local_file"] = t.path;

        obs::RequestList reqs;
        reqs.push_back({"SetInputSettings", {{"inputName", source_}, {"inputSettings", settings}}});
        if (t.trim_in && *t.trim_in > 0)
            reqs.push_back({"SetMediaInputCursor",
                            {{"inputName", source_}, {"mediaCursor", static_cast<long long>(*t.trim_in * 1000)}}});

        std::uint64_t gen = ++load_gen_;
        try
        {
            std::string path = t.path;
            session_.send_batch(reqs, [path](const Outcome &o)
                                {
                if (!o.ok) Log::warn("studio", "load of " + path + " rejected: " + o.message); });
        }
        catch (const RelayError &e)
        {
            Log::warn("studio", std::string("track not loaded: ") + e.what());
            disarm(gen);
            return false;
        }
        Log::info("studio", "media source '" + source_ + "' -> " + t.path);
        if (t.trim_out)
            arm(gen, *t.trim_out - t.trim_in.value_or(0));
        else
            disarm(gen);
        return true;
    }

    // Shutdown: drop any pending trim-out.
    void cancel() { disarm(++load_gen_); }

private:
    void arm(std::uint64_t gen, double seconds)
    {
        seconds = std::clamp(seconds, 0.0, kMaxMediaSeconds);
        auto delay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        boost::asio::post(ioc_, [this, gen, delay]
                          {
            if (gen != load_gen_) return;
            trim_timer_.expires_after(delay);
            trim_timer_.async_wait([this, gen](boost::system::error_code ec)
                                   {
                if (ec || gen != load_gen_) return;
                trim_reached(); }); });
    }

    void disarm(std::uint64_t gen)
    {
        boost::asio::post(ioc_, [this, gen]
                          {
            if (gen == load_gen_) trim_timer_.cancel(); });
    }

    void trim_reached()
    {
        Log::info("studio", "trim-out reached on '" + source_ + "'");
        try
        {
            session_.send("TriggerMediaInputAction",
                          {{"inputName", source_}, {"mediaAction", "OBS_WEBSOCKET_MEDIA_INPUT_ACTION_STOP"}},
                          [](const Outcome &) {});
        }
        catch (const RelayError &e)
        {
            Log::warn("studio", std::string("could not stop at trim-out: ") + e.what());
        }
        bus_.publish(Event(EventType::ExternalStateChanged,
                           {{"type", "MediaInputPlaybackEnded"},
                            {"data", {{"inputName", source_}}},
                            {"synthetic", true}}));
    }

    boost::asio::io_context &ioc_;
    SessionSupervisor &session_;
    EventBus &bus_;
    std::string source_;
    boost::asio::steady_timer trim_timer_;
    std::atomic<std::uint64_t> load_gen_{0};
};
