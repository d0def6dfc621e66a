/*
 * File: tests/test_http_endpoints.cpp
 * Project: OBS Relay
 * Purpose: HTTP routing and handlers
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>

#include "relay_http.hpp"
#include "support/served_relay.hpp"

using boost::beast::http::verb;

TEST_CASE("error codes map to HTTP statuses")
{
    using s = http::status;
    REQUIRE(http_status_for(Outcome::success()) == s::ok);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::SchemaError, "")) == s::bad_request);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::AuthError, "")) == s::unauthorized);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::NotFound, "")) == s::not_found);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::NoActivePlaylist, "")) == s::conflict);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::Unvalidated, "")) == s::conflict);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::OutOfRange, "")) == s::unprocessable_entity);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::UpstreamUnavailable, "")) == s::service_unavailable);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::UpstreamRejected, "")) == s::internal_server_error);
    REQUIRE(http_status_for(Outcome::failure(ErrorCode::PersistenceFailure, "")) == s::internal_server_error);
}

TEST_CASE("bearer token extraction")
{
    REQUIRE(bearer_token("Bearer abc123") == "abc123");
    REQUIRE(bearer_token("Bearer abc123  ") == "abc123");
    REQUIRE(bearer_token("Bearer ").empty());
    REQUIRE(bearer_token("Basic abc123").empty());
    REQUIRE(bearer_token("").empty());
}

TEST_CASE("health endpoints need no credential")
{
    ServedRelay relay("k");
    auto [code, body] = relay.request(verb::get, "/health");
    REQUIRE(code == 200);
    REQUIRE(body["status"] == "ok");
    REQUIRE(body["connected"] == false);
    REQUIRE(body["session"] == "disconnected");

    auto [zcode, zbody] = relay.request(verb::get, "/healthz");
    REQUIRE(zcode == 503);
    REQUIRE(zbody["status"] == "unhealthy");
}

TEST_CASE("v1 routes require the bearer key when one is configured")
{
    ServedRelay relay("k");
    REQUIRE(relay.request(verb::get, "/v1/status").first == 401);
    REQUIRE(relay.request(verb::get, "/v1/status", "", "wrong").first == 401);
    REQUIRE(relay.command(json{{"cmd", "bogus"}}).first == 401);
    REQUIRE(relay.request(verb::post, "/v1/command", "{oops", "").first == 401);

    auto [code, body] = relay.request(verb::get, "/v1/status", "", "k");
    REQUIRE(code == 200);
    REQUIRE(body["ok"] == true);
    REQUIRE(body["result"]["session"]["state"] == "disconnected");

    // a credential is good for its own request only
    REQUIRE(relay.request(verb::get, "/v1/status").first == 401);
}

TEST_CASE("commands over HTTP")
{
    ServedRelay relay;

    auto none = relay.command(json{{"cmd", "playlist_next"}});
    REQUIRE(none.first == 409);
    REQUIRE(none.second["error"]["code"] == "no_active_playlist");

    auto act = relay.command(json{{"cmd", "playlist_activate"}, {"params", {{"name", "main"}}}});
    REQUIRE(act.first == 200);
    REQUIRE(act.second["result"]["track"] == "Alpha");
    REQUIRE(act.second["warning"] == "upstream_unavailable: track not loaded");
    REQUIRE(relay.state->scheduler.state().active_playlist == std::optional<std::string>("main"));

    REQUIRE(relay.command(json{{"cmd", "playlist_seek"}, {"params", {{"position", 9}}}}).first == 422);
    REQUIRE(relay.command(json{{"cmd", "playlist_activate"}, {"params", {{"name", "nope"}}}}).first == 404);
    REQUIRE(relay.command(json{{"cmd", "switch_scene"}, {"params", {{"scene_name", "Live"}}}}).first == 503);
    REQUIRE(relay.command(json{{"cmd", "warp"}}).first == 400);
    REQUIRE(relay.request(verb::post, "/v1/command", "{oops").first == 400);
}

TEST_CASE("playlist listing, validation and unknown routes")
{
    ServedRelay relay;

    auto [code, body] = relay.request(verb::get, "/v1/playlists");
    REQUIRE(code == 200);
    auto lists = body["result"]["playlists"];
    REQUIRE(lists.size() == 1);
    REQUIRE(lists[0]["name"] == "main");
    REQUIRE(lists[0]["loop"] == false);
    REQUIRE(lists[0]["tracks"].size() == 3);

    auto [vcode, vbody] = relay.request(verb::get, "/v1/playlists/validate");
    REQUIRE(vcode == 200);
    REQUIRE(vbody["result"]["all_valid"] == true);

    auto [ncode, nbody] = relay.request(verb::get, "/v2/anything");
    REQUIRE(ncode == 404);
    REQUIRE(nbody["error"]["code"] == "not_found");
    REQUIRE(relay.request(verb::delete_, "/v1/status").first == 404);
}

TEST_CASE("overlay status route and overlay commands while disconnected")
{
    ServedRelay relay("k");
    REQUIRE(relay.request(verb::get, "/v1/overlay").first == 401);

    auto [code, body] = relay.request(verb::get, "/v1/overlay", "", "k");
    REQUIRE(code == 200);
    REQUIRE(body["result"]["active"] == false);
    REQUIRE(body["result"]["config"]["source_name"] == "TitleOverlay");

    REQUIRE(relay.command(json{{"cmd", "overlay_trigger"}, {"params", {{"text", "Hi"}}}}, "k").first == 503);
    REQUIRE(relay.command(json{{"cmd", "overlay_configure"}, {"params", {{"mode", "next_up"}}}}, "k").first == 200);
}

TEST_CASE("session retry restarts the connection")
{
    ServedRelay relay;
    auto [code, body] = relay.request(verb::post, "/v1/session/retry");
    REQUIRE(code == 200);
    REQUIRE(body["ok"] == true);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    unsigned status = 0;
    while (std::chrono::steady_clock::now() < deadline && status != 200)
    {
        status = relay.request(verb::get, "/healthz").first;
        if (status != 200)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(status == 200);
}
