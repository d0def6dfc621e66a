/*
 * File: tests/test_media_loader.cpp
 * Project: OBS Relay
 * Purpose: Track loading into the media source and the trim-out timer
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>

#include <algorithm>

#include "relay_scheduler.hpp"
#include "relay_session.hpp"
#include "relay_store.hpp"
#include "relay_studio.hpp"
#include "support/fake_upstream.hpp"

using namespace std::chrono_literals;

namespace
{
    struct Rig
    {
        boost::asio::io_context ioc;
        EventBus bus;
        FakeObs obs{ioc};
        EventLog log{bus};
        TempDir dir;
        PlaylistLibrary lib;
        StateStore store{(dir.path() / "state.json").string()};
        SessionSupervisor session{ioc, bus, SessionConfig{}, obs.link_factory()};
        ObsMediaLoader loader{ioc, session, bus, "MediaSource"};
        PlaylistScheduler sched{lib, store, bus, loader};

        Rig()
        {
            for (const char *f : {"a.mp4", "b.mp4", "c.mp4"})
                dir.touch(f);
            lib.add(parse_m3u_text("#EXTINF:10,Short\n#EXTVLCOPT:stop-time=0.05\na.mp4\n"
                                   "#EXTINF:10,Long\nb.mp4\n"
                                   "#EXTINF:10,Held\n#EXTVLCOPT:start-time=1\n#EXTVLCOPT:stop-time=1.4\nc.mp4\n",
                                   "trimmed", dir.path()));
        }

        bool connect()
        {
            session.connect();
            return run_until(ioc, [&]
                             { return session.healthy(); });
        }

        std::size_t sent(const std::string &type) const
        {
            auto types = obs.request_types();
            return static_cast<std::size_t>(std::count(types.begin(), types.end(), type));
        }
    };
}

TEST_CASE("loading a track sets the media source and seeks to trim-in")
{
    Rig r;
    REQUIRE(r.connect());
    r.sched.activate("trimmed", 2);
    REQUIRE(run_until(r.ioc, [&]
                      { return r.sent("SetMediaInputCursor") == 1; }));

    const auto &settings = r.obs.requests.at(0)["requestData"];
    REQUIRE(settings["inputName"] == "MediaSource");
    REQUIRE(settings["inputSettings"]["local_file"] == r.lib.find("trimmed")->tracks[2].path);
    REQUIRE(settings["inputSettings"]["looping"] == false);
    REQUIRE(r.obs.requests.at(1)["requestData"]["mediaCursor"] == 1000);
}

TEST_CASE("trim-out ends the track and auto-advance moves on")
{
    Rig r;
    REQUIRE(r.connect());
    Outcome o = r.sched.activate("trimmed");
    REQUIRE(o.data["loaded"] == true);

    REQUIRE(run_until(r.ioc, [&]
                      { return r.sched.state().position == 1; }));
    REQUIRE(r.sent("TriggerMediaInputAction") == 1);
    auto ended = r.log.of(EventType::ExternalStateChanged);
    REQUIRE(ended.size() == 1);
    REQUIRE(ended[0].data["synthetic"] == true);
    REQUIRE(r.log.of(EventType::TrackChanged).at(0).data["cause"] == "auto_advance");

    // "Long" has no trim-out, so nothing else fires
    run_for(r.ioc, 200ms);
    REQUIRE(r.sched.state().position == 1);
    REQUIRE(r.sent("TriggerMediaInputAction") == 1);
}

TEST_CASE("loading another track cancels the pending trim-out")
{
    Rig r;
    REQUIRE(r.connect());
    r.sched.activate("trimmed", 2);
    run_for(r.ioc, 50ms);
    r.sched.seek(1);

    run_for(r.ioc, 700ms);
    REQUIRE(r.sched.state().position == 1);
    REQUIRE(r.sent("TriggerMediaInputAction") == 0);
    REQUIRE(r.log.count(EventType::ExternalStateChanged) == 0);
}

TEST_CASE("track is not loaded and no timer runs while disconnected")
{
    Rig r;
    Outcome o = r.sched.activate("trimmed");
    REQUIRE(o.data["loaded"] == false);
    run_for(r.ioc, 200ms);
    REQUIRE(r.sched.state().position == 0);
    REQUIRE(r.obs.requests.empty());
    REQUIRE(r.log.count(EventType::ExternalStateChanged) == 0);
}
