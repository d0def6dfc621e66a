/*
 * File: tests/test_router.cpp
 * Project: OBS Relay
 * Purpose: Command routing: auth, schema, dispatch to scheduler, studio and presets
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>

#include "relay_broadcast.hpp"
#include "relay_presets.hpp"
#include "relay_router.hpp"
#include "relay_scheduler.hpp"
#include "relay_session.hpp"
#include "relay_store.hpp"
#include "relay_studio.hpp"
#include "support/fake_upstream.hpp"

using namespace std::chrono_literals;

namespace
{
    SessionConfig quick()
    {
        SessionConfig c;
        c.reconnect_interval = 5ms;
        c.max_reconnect_interval = 20ms;
        c.max_reconnect_attempts = 2;
        c.handshake_timeout = 500ms;
        return c;
    }

    // Track changes do not show the overlay, so upstream request lists stay exact.
    OverlaySettings manual_overlay()
    {
        OverlaySettings s;
        s.auto_trigger = false;
        return s;
    }

    struct Rig
    {
        boost::asio::io_context ioc;
        EventBus bus;
        FakeObs obs{ioc};
        EventLog log{bus};
        TempDir dir;
        PlaylistLibrary lib = sample_library(dir);
        StateStore store{(dir.path() / "state.json").string()};
        RecordingLoader loader;
        SessionSupervisor session{ioc, bus, quick(), obs.link_factory()};
        PlaylistScheduler sched{lib, store, bus, loader};
        StudioControl studio{session, bus};
        PresetCatalog catalog;
        PresetRunner presets{catalog, studio, sched, bus};
        OverlayController overlay{ioc, session, studio, bus, manual_overlay()};
        Broadcaster broadcaster{bus};
        CommandRouter router;

        explicit Rig(std::string key = "")
            : router(RouterDeps{session, sched, studio, presets, overlay, broadcaster}, std::move(key))
        {
            catalog.add_defaults();
        }

        bool connect()
        {
            session.connect();
            return run_until(ioc, [&]
                             { return session.healthy(); });
        }

        Outcome call(const json &msg, const std::string &origin = "test")
        {
            auto got = std::make_shared<std::optional<Outcome>>();
            router.handle(msg, origin, [got](const Outcome &o)
                          { *got = o; });
            REQUIRE(run_until(ioc, [got]
                              { return got->has_value(); }));
            return **got;
        }

        Outcome cmd(const std::string &name, const json &params = json::object())
        {
            return call(json{{"cmd", name}, {"params", params}});
        }
    };
}

TEST_CASE("malformed commands are schema errors")
{
    Rig r;
    REQUIRE(r.call(json::array()).code == ErrorCode::SchemaError);
    REQUIRE(r.call(json{{"params", json::object()}}).code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("self_destruct").code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("playlist_seek").code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("playlist_seek", {{"position", "two"}}).code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("set_auto_advance", {{"enabled", 1}}).code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("switch_scene", {{"scene_name", ""}}).code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("set_transition").code == ErrorCode::SchemaError);
    REQUIRE(r.cmd("set_transition", {{"duration_ms", -5}}).code == ErrorCode::SchemaError);
    REQUIRE(r.call(json{{"cmd", "get_status"}, {"params", "x"}}).code == ErrorCode::SchemaError);

    auto j = r.cmd("self_destruct").to_json();
    REQUIRE(j["ok"] == false);
    REQUIRE(j["error"]["code"] == "schema_error");
}

TEST_CASE("credential is checked before the command is parsed")
{
    Rig r("s3cret");
    REQUIRE(r.router.auth_required());
    REQUIRE(r.call(json{{"cmd", "self_destruct"}}).code == ErrorCode::AuthError);
    REQUIRE(r.cmd("get_status").code == ErrorCode::AuthError);

    REQUIRE_FALSE(r.router.present_credential("test", "wrong"));
    REQUIRE_FALSE(r.router.present_credential("test", "s3cret "));
    REQUIRE(r.cmd("get_status").code == ErrorCode::AuthError);

    REQUIRE(r.router.present_credential("test", "s3cret"));
    REQUIRE(r.cmd("get_status").ok);
    REQUIRE(r.call(json{{"cmd", "get_status"}}, "other").code == ErrorCode::AuthError);

    r.router.forget("test");
    REQUIRE(r.cmd("get_status").code == ErrorCode::AuthError);
}

TEST_CASE("no access key means every origin is authorized")
{
    Rig r;
    REQUIRE_FALSE(r.router.auth_required());
    REQUIRE(r.router.authorized("anyone"));
    REQUIRE(r.router.present_credential("anyone", ""));
}

TEST_CASE("playlist commands reach the scheduler")
{
    Rig r;
    REQUIRE(r.cmd("playlist_next").code == ErrorCode::NoActivePlaylist);

    auto a = r.cmd("playlist_activate", {{"name", "main"}});
    REQUIRE(a.ok);
    REQUIRE(a.data["track"] == "Alpha");

    REQUIRE(r.cmd("playlist_next").data["track"] == "Bravo");
    REQUIRE(r.cmd("playlist_prev").data["track"] == "Alpha");
    REQUIRE(r.cmd("playlist_seek", {{"position", 2}}).data["track"] == "Charlie");
    REQUIRE(r.cmd("playlist_seek", {{"position", 3}}).code == ErrorCode::OutOfRange);
    REQUIRE(r.cmd("playlist_activate", {{"name", "nope"}}).code == ErrorCode::NotFound);
    REQUIRE(r.cmd("playlist_activate", {{"name", "loop"}, {"position", 1}}).data["track"] == "Two");

    REQUIRE(r.cmd("set_auto_advance", {{"enabled", false}}).ok);
    REQUIRE_FALSE(r.sched.state().auto_advance);
}

TEST_CASE("get_status reports session, scene, playlist and subscribers")
{
    Rig r;
    REQUIRE(r.cmd("playlist_activate", {{"name", "main"}}).ok);
    auto s = r.cmd("get_status");
    REQUIRE(s.ok);
    REQUIRE(s.data["session"]["state"] == "disconnected");
    REQUIRE(s.data["session"]["connected"] == false);
    REQUIRE(s.data["scene"].is_null());
    REQUIRE(s.data["playlist"]["active_playlist"] == "main");
    REQUIRE(s.data["playlist"]["current_item"]["title"] == "Alpha");
    REQUIRE(s.data["subscribers"] == 0);
    REQUIRE(r.router.status() == s.data);
}

TEST_CASE("playlist_validate reports missing files and records the result")
{
    Rig r;
    r.lib.add(parse_m3u_text("present.mp4\nabsent.mp4\n", "partial", r.dir.path()));
    r.dir.touch("present.mp4");

    auto o = r.cmd("playlist_validate");
    REQUIRE(o.ok);
    REQUIRE(o.data["all_valid"] == false);
    REQUIRE(o.data["playlists"]["main"]["valid"] == true);
    REQUIRE(o.data["playlists"]["partial"]["missing_count"] == 1);
}

TEST_CASE("upstream commands fail fast while disconnected")
{
    Rig r;
    REQUIRE(r.cmd("switch_scene", {{"scene_name", "Live"}}).code == ErrorCode::UpstreamUnavailable);
    REQUIRE(r.cmd("stream_start").code == ErrorCode::UpstreamUnavailable);
    REQUIRE(r.cmd("record_stop").code == ErrorCode::UpstreamUnavailable);
    REQUIRE(r.cmd("activate_preset", {{"name", "live"}}).code == ErrorCode::UpstreamUnavailable);
    REQUIRE(r.obs.requests.empty());
    REQUIRE(r.log.count(EventType::SceneSwitched) == 0);
}

TEST_CASE("switch_scene and the upstream echo")
{
    Rig r;
    REQUIRE(r.connect());

    auto o = r.cmd("switch_scene", {{"scene_name", "Live"}});
    REQUIRE(o.ok);
    REQUIRE(o.data["scene"] == "Live");
    REQUIRE(r.obs.request_types() == std::vector<std::string>{"SetCurrentProgramScene"});
    REQUIRE(r.obs.requests[0]["requestData"]["sceneName"] == "Live");
    REQUIRE(r.log.count(EventType::SceneSwitched) == 1);
    REQUIRE(r.studio.current_scene() == std::optional<std::string>("Live"));

    SECTION("our own switch echoed back is not re-broadcast")
    {
        r.obs.push_event("CurrentProgramSceneChanged", {{"sceneName", "Live"}});
        run_for(r.ioc, 50ms);
        REQUIRE(r.log.count(EventType::SceneChangedExternal) == 0);
    }
    SECTION("a switch made in the studio is reported")
    {
        r.obs.push_event("CurrentProgramSceneChanged", {{"sceneName", "Live"}});
        r.obs.push_event("CurrentProgramSceneChanged", {{"sceneName", "Backstage"}});
        REQUIRE(run_until(r.ioc, [&]
                          { return r.log.count(EventType::SceneChangedExternal) == 1; }));
        REQUIRE(r.log.of(EventType::SceneChangedExternal)[0].data["scene"] == "Backstage");
        REQUIRE(r.studio.current_scene() == std::optional<std::string>("Backstage"));
    }
}

TEST_CASE("rejected scene switch reports upstream_rejected")
{
    Rig r;
    r.obs.responder = [](const std::string &, const json &)
    {
        return json{{"requestStatus", {{"result", false}, {"code", 600}, {"comment", "No source was found"}}}};
    };
    REQUIRE(r.connect());
    auto o = r.cmd("switch_scene", {{"scene_name", "Ghost"}});
    REQUIRE(o.code == ErrorCode::UpstreamRejected);
    REQUIRE_FALSE(r.studio.current_scene());
    REQUIRE(r.log.count(EventType::SceneSwitched) == 0);
}

TEST_CASE("stream, record and transition commands")
{
    Rig r;
    r.obs.responder = [](const std::string &type, const json &)
    {
        json data = json::object();
        if (type == "StopRecord")
            data["outputPath"] = "/rec/show.mkv";
        return json{{"requestStatus", {{"result", true}, {"code", 100}}}, {"responseData", data}};
    };
    REQUIRE(r.connect());

    REQUIRE(r.cmd("stream_start").data["status"] == "streaming_started");
    REQUIRE(r.cmd("stream_stop").data["status"] == "streaming_stopped");
    REQUIRE(r.cmd("record_start").ok);
    auto stop = r.cmd("record_stop");
    REQUIRE(stop.data["output_path"] == "/rec/show.mkv");

    auto t = r.cmd("set_transition", {{"name", "Fade"}, {"duration_ms", 300}});
    REQUIRE(t.ok);
    REQUIRE(t.data["transition"] == "Fade");
    REQUIRE(t.data["duration_ms"] == 300);

    REQUIRE(r.obs.request_types() == std::vector<std::string>{"StartStream", "StopStream", "StartRecord", "StopRecord",
                                                              "SetCurrentSceneTransition",
                                                              "SetCurrentSceneTransitionDuration"});
    REQUIRE(r.log.count(EventType::StreamStarted) == 1);
    REQUIRE(r.log.count(EventType::StreamStopped) == 1);
    REQUIRE(r.log.count(EventType::RecordingStarted) == 1);
    REQUIRE(r.log.of(EventType::RecordingStopped)[0].data["output_path"] == "/rec/show.mkv");
    REQUIRE(r.log.count(EventType::TransitionChanged) == 1);
}

TEST_CASE("preset activation runs one batch and publishes preset_activated")
{
    Rig r;
    REQUIRE(r.connect());

    auto o = r.cmd("activate_preset", {{"name", "brb"}});
    REQUIRE(o.ok);
    REQUIRE(o.data["preset"] == "brb");
    REQUIRE(o.data["scene"] == "BRB");
    REQUIRE(r.obs.request_types() == std::vector<std::string>{"SetCurrentProgramScene", "SetInputMute"});
    REQUIRE(r.obs.requests[1]["requestData"]["inputName"] == "Mic");
    REQUIRE(r.obs.requests[1]["requestData"]["inputMuted"] == true);
    REQUIRE(r.studio.current_scene() == std::optional<std::string>("BRB"));
    REQUIRE(r.log.count(EventType::PresetActivated) == 1);

    REQUIRE(r.cmd("activate_preset", {{"name", "nope"}}).code == ErrorCode::NotFound);
}

TEST_CASE("preset with a linked playlist activates it")
{
    Rig r;
    REQUIRE(r.connect());

    SECTION("playlist present")
    {
        r.dir.touch("loop.mp4");
        r.lib.add(parse_m3u_text("#EXTINF:60,Holding Loop\nloop.mp4\n", "intermission", r.dir.path()));
        auto o = r.cmd("activate_preset", {{"name", "intermission"}});
        REQUIRE(o.ok);
        REQUIRE(o.warning.empty());
        REQUIRE(o.data["playlist"] == "intermission");
        REQUIRE(o.data["track"] == "Holding Loop");
        REQUIRE(r.sched.state().active_playlist == std::optional<std::string>("intermission"));
        REQUIRE(r.log.count(EventType::PlaylistActivated) == 1);
    }
    SECTION("playlist missing becomes a warning")
    {
        auto o = r.cmd("activate_preset", {{"name", "intermission"}});
        REQUIRE(o.ok);
        REQUIRE_THAT(o.warning, Catch::Matchers::StartsWith("not_found"));
        REQUIRE(r.studio.current_scene() == std::optional<std::string>("Intermission"));
        REQUIRE(r.log.count(EventType::PresetActivated) == 1);
    }
}

TEST_CASE("configured presets override the built-ins")
{
    PresetCatalog c;
    c.add(preset_from_json(json{{"name", "live"},
                                {"scene_name", "Main Cam"},
                                {"actions", {{{"type", "set_volume"}, {"params", {{"source_name", "Mic"}, {"volume_db", -6.0}}}}}}}));
    c.add_defaults();
    REQUIRE(c.find("live")->scene_name == "Main Cam");
    REQUIRE(c.find("brb")->scene_name == "BRB");
    REQUIRE(c.list().size() == 5);

    auto req = action_request(c.find("live")->actions[0]);
    REQUIRE(req.first == "SetInputVolume");
    REQUIRE(req.second["inputVolumeDb"] == -6.0);

    REQUIRE_THROWS_AS(preset_from_json(json{{"name", "x"}, {"scene_name", "X"}, {"actions", {{{"type", "explode"}}}}}),
                      std::invalid_argument);
}
