/*
 * File: tests/test_overlay.cpp
 * Project: OBS Relay
 * Purpose: Title overlay sequence, per-track hints and overlay commands
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>

#include "relay_broadcast.hpp"
#include "relay_overlay.hpp"
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
        c.max_reconnect_attempts = 1;
        c.handshake_timeout = 500ms;
        return c;
    }

    json ok(json data = json::object())
    {
        return json{{"requestStatus", {{"result", true}, {"code", 100}}}, {"responseData", std::move(data)}};
    }

    OverlaySettings timing(double delay, double hold)
    {
        OverlaySettings s;
        s.delay_sec = delay;
        s.hold_sec = hold;
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
        OverlayController overlay;
        Broadcaster broadcaster{bus};
        CommandRouter router;

        explicit Rig(OverlaySettings s = timing(0, 0.1))
            : overlay(ioc, session, studio, bus, std::move(s)),
              router(RouterDeps{session, sched, studio, presets, overlay, broadcaster}, "")
        {
            lib.add(parse_m3u_text("#EXTINF:10,Ep1\n#EXTOVERLAY:skip=1\na.mp4\n"
                                   "#EXTINF:10,Ep2\n#EXTOVERLAY:text=Special\n#EXTOVERLAY:hold=0.05\nb.mp4\n"
                                   "#EXTINF:10,Ep3\nc.mp4\n",
                                   "hinted", dir.path()));
            obs.responder = [](const std::string &type, const json &)
            {
                if (type == "GetCurrentProgramScene")
                    return ok({{"currentProgramSceneName", "Live"}});
                if (type == "GetSceneItemId")
                    return ok({{"sceneItemId", 7}});
                return ok();
            };
        }

        bool connect()
        {
            session.connect();
            return run_until(ioc, [&]
                             { return session.healthy(); });
        }

        std::vector<json> sent(const std::string &type) const
        {
            std::vector<json> out;
            for (const auto &r : obs.requests)
                if (r["requestType"] == type)
                    out.push_back(r["requestData"]);
            return out;
        }

        Outcome cmd(const std::string &name, const json &params = json::object())
        {
            auto got = std::make_shared<std::optional<Outcome>>();
            router.handle(json{{"cmd", name}, {"params", params}}, "test", [got](const Outcome &o)
                          { *got = o; });
            REQUIRE(run_until(ioc, [got]
                              { return got->has_value(); }));
            return **got;
        }

        std::vector<std::string> triggered_texts() const
        {
            std::vector<std::string> out;
            for (const auto &e : log.of(EventType::OverlayTriggered))
                out.push_back(e.data["text"].get<std::string>());
            return out;
        }
    };
}

TEST_CASE("track change shows the title and hides it after the hold")
{
    OverlaySettings s = timing(0, 0.1);
    s.prefix = "Now: ";
    Rig r(s);
    REQUIRE(r.connect());

    r.sched.activate("main");
    REQUIRE(r.triggered_texts() == std::vector<std::string>{"Now: Alpha"});
    REQUIRE(run_until(r.ioc, [&]
                      { return r.sent("SetSceneItemEnabled").size() == 2; }));

    auto text = r.sent("SetInputSettings");
    REQUIRE(text.size() == 1);
    REQUIRE(text[0]["inputName"] == "TitleOverlay");
    REQUIRE(text[0]["inputSettings"]["text"] == "Now: Alpha");
    auto enables = r.sent("SetSceneItemEnabled");
    REQUIRE(enables[0]["sceneName"] == "Live");
    REQUIRE(enables[0]["sceneItemId"] == 7);
    REQUIRE(enables[0]["sceneItemEnabled"] == true);
    REQUIRE(enables[1]["sceneItemEnabled"] == false);

    REQUIRE(run_until(r.ioc, [&]
                      { return r.log.count(EventType::OverlayHidden) == 1; }));
    REQUIRE(r.log.of(EventType::OverlayHidden)[0].data["cause"] == "timeout");
    REQUIRE(r.overlay.status()["active"] == false);
}

TEST_CASE("a new track replaces the running overlay")
{
    Rig r(timing(0, 5));
    REQUIRE(r.connect());

    r.sched.activate("main");
    REQUIRE(run_until(r.ioc, [&]
                      { return r.overlay.status()["visible"] == true; }));
    r.sched.next();
    REQUIRE(run_until(r.ioc, [&]
                      { return r.sent("SetInputSettings").size() == 2; }));
    run_for(r.ioc, 100ms);

    REQUIRE(r.sent("SetInputSettings")[1]["inputSettings"]["text"] == "Bravo");
    for (const auto &e : r.sent("SetSceneItemEnabled"))
        REQUIRE(e["sceneItemEnabled"] == true);
    auto st = r.overlay.status();
    REQUIRE(st["visible"] == true);
    REQUIRE(st["current_text"] == "Bravo");
    REQUIRE(st["track_title"] == "Bravo");
    REQUIRE(st["timer_remaining"].get<double>() > 4.0);
    REQUIRE(r.log.count(EventType::OverlayHidden) == 0);

    Outcome o = r.overlay.hide();
    REQUIRE(o.ok);
    REQUIRE(o.data["was_active"] == true);
    REQUIRE(run_until(r.ioc, [&]
                      { return r.sent("SetSceneItemEnabled").back()["sceneItemEnabled"] == false; }));
    REQUIRE(r.log.of(EventType::OverlayHidden).at(0).data["cause"] == "manual");
    REQUIRE(r.overlay.status()["active"] == false);
}

TEST_CASE("hide during the start delay cancels the show")
{
    Rig r(timing(0.2, 5));
    REQUIRE(r.connect());
    r.sched.activate("main");
    REQUIRE(r.overlay.status()["active"] == true);
    REQUIRE(r.overlay.status()["visible"] == false);

    r.overlay.hide();
    run_for(r.ioc, 400ms);
    REQUIRE(r.sent("SetInputSettings").empty());
    REQUIRE(r.overlay.status()["active"] == false);
}

TEST_CASE("per-track hints skip, override text and hold")
{
    Rig r(timing(5, 8));
    REQUIRE(r.connect());

    r.sched.activate("hinted");
    REQUIRE(r.log.count(EventType::OverlayTriggered) == 0);

    r.sched.next();
    auto ev = r.log.of(EventType::OverlayTriggered);
    REQUIRE(ev.size() == 1);
    REQUIRE(ev[0].data["text"] == "Special");
    REQUIRE(ev[0].data["hold_sec"] == 0.05);
    REQUIRE(ev[0].data["delay_sec"] == 5.0);
    REQUIRE(ev[0].data["cause"] == "track");
}

TEST_CASE("next-up mode announces the following track")
{
    OverlaySettings s = timing(5, 8);
    s.mode = "next_up";
    Rig r(s);
    REQUIRE(r.connect());

    r.sched.activate("loop");
    r.sched.seek(2);
    REQUIRE(r.triggered_texts() == std::vector<std::string>{"Up Next: Two", "Up Next: One"});
}

TEST_CASE("disabled overlay and automatic triggers while disconnected do nothing")
{
    SECTION("disabled")
    {
        Rig r;
        REQUIRE(r.connect());
        REQUIRE(r.overlay.configure(json{{"enabled", false}}).data["enabled"] == false);
        r.sched.activate("main");
        REQUIRE(r.log.count(EventType::OverlayTriggered) == 0);
    }
    SECTION("disconnected")
    {
        Rig r;
        r.sched.activate("main");
        run_for(r.ioc, 200ms);
        REQUIRE(r.log.count(EventType::OverlayTriggered) == 0);
        REQUIRE(r.obs.requests.empty());
    }
}

TEST_CASE("source missing from the scene leaves the overlay idle")
{
    Rig r;
    r.obs.responder = [](const std::string &type, const json &)
    {
        if (type == "GetSceneItemId")
            return json{{"requestStatus", {{"result", false}, {"code", 600}, {"comment", "No scene items were found"}}}};
        return ok({{"currentProgramSceneName", "Live"}});
    };
    REQUIRE(r.connect());
    r.sched.activate("main");
    REQUIRE(run_until(r.ioc, [&]
                      { return r.overlay.status()["active"] == false; }));
    REQUIRE(r.sent("SetInputSettings").empty());
    REQUIRE(r.sent("SetSceneItemEnabled").empty());
}

TEST_CASE("overlay commands")
{
    Rig r(timing(0, 5));

    REQUIRE(r.cmd("overlay_trigger", {{"text", "Back soon"}}).code == ErrorCode::UpstreamUnavailable);
    REQUIRE(r.connect());

    SECTION("manual text")
    {
        Outcome o = r.cmd("overlay_trigger", {{"text", "Back soon"}, {"hold_sec", 2}});
        REQUIRE(o.ok);
        REQUIRE(o.data["text"] == "Back soon");
        REQUIRE(o.data["hold_sec"] == 2.0);
        REQUIRE(o.data["cause"] == "manual");
        REQUIRE(run_until(r.ioc, [&]
                          { return r.overlay.status()["visible"] == true; }));
        REQUIRE(r.cmd("overlay_hide").data["status"] == "hidden");
    }
    SECTION("current track without text")
    {
        REQUIRE(r.cmd("overlay_trigger").code == ErrorCode::NoActivePlaylist);
        r.sched.activate("main", 1);
        Outcome o = r.cmd("overlay_trigger");
        REQUIRE(o.ok);
        REQUIRE(o.data["text"] == "Bravo");
        REQUIRE(o.data["delay_sec"] == 0.0);
    }
    SECTION("configure")
    {
        Outcome o = r.cmd("overlay_configure", {{"hold_sec", 3}, {"prefix", "> "}});
        REQUIRE(o.ok);
        REQUIRE(o.data["hold_sec"] == 3.0);
        REQUIRE(r.overlay.settings().prefix == "> ");

        REQUIRE(r.cmd("overlay_configure", {{"mode", "sideways"}}).code == ErrorCode::SchemaError);
        REQUIRE(r.cmd("overlay_configure", {{"volume", 3}}).code == ErrorCode::SchemaError);
        REQUIRE(r.cmd("overlay_configure").code == ErrorCode::SchemaError);
        REQUIRE(r.overlay.settings().mode == "current");
    }
    SECTION("schema")
    {
        REQUIRE(r.cmd("overlay_trigger", {{"text", ""}}).code == ErrorCode::SchemaError);
        REQUIRE(r.cmd("overlay_trigger", {{"text", "x"}, {"hold_sec", -1}}).code == ErrorCode::SchemaError);
    }
    SECTION("status snapshot")
    {
        auto st = r.cmd("get_status").data["overlay"];
        REQUIRE(st["active"] == false);
        REQUIRE(st["config"]["source_name"] == "TitleOverlay");
    }
}

TEST_CASE("settings patch is all or nothing")
{
    OverlaySettings s;
    REQUIRE_THROWS_AS(apply_overlay_settings(s, json{{"hold_sec", 4}, {"mode", "bad"}}), RelayError);
    REQUIRE(s.hold_sec == 8.0);
    apply_overlay_settings(s, json{{"hold_sec", 4}, {"scene_name", "Main"}, {"suffix", nullptr}});
    REQUIRE(s.hold_sec == 4.0);
    REQUIRE(s.scene_name == "Main");
}
