/*
 * File: tests/support/served_relay.hpp
 * Project: OBS Relay
 * Purpose: Relay core plus HTTP and WebSocket listeners on loopback, driven by a background io thread
 * Notes:
 *  - Listeners bind port 0; tests read the chosen ports back
 *  - The upstream is a FakeObs that is never connected unless a test asks
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>

#include "relay_http.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"
#include "support/fake_upstream.hpp"

struct ServedRelay
{
    TempDir dir;
    boost::asio::io_context ioc;
    FakeObs obs{ioc};
    std::unique_ptr<RelayState> state;
    std::unique_ptr<HttpServer> http_server;
    std::unique_ptr<WsServer> ws_server;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard{ioc.get_executor()};
    std::thread io;

    explicit ServedRelay(std::string api_key = "")
    {
        for (const char *f : {"a.mp4", "b.mp4", "c.mp4"})
            dir.touch(f);
        dir.write("main.m3u", "#EXTRELAY:loop=0\n#EXTINF:10,Alpha\na.mp4\n#EXTINF:20,Bravo\nb.mp4\n#EXTINF:30,Charlie\nc.mp4\n");

        RelayConfig cfg;
        cfg.api.api_key = std::move(api_key);
        cfg.playlist.directory = dir.path().string();
        cfg.playlist.state_file = (dir.path() / "state.json").string();
        cfg.obs.max_reconnect_attempts = 1;
        cfg.obs.reconnect_interval_ms = 5;

        auto loopback = boost::asio::ip::address_v4::loopback();
        state = std::make_unique<RelayState>(cfg, ioc, obs.link_factory());
        http_server = std::make_unique<HttpServer>(ioc, boost::asio::ip::tcp::endpoint(loopback, 0), *state);
        ws_server = std::make_unique<WsServer>(ioc, boost::asio::ip::tcp::endpoint(loopback, 0), *state);
        io = std::thread([this]
                         { ioc.run(); });
    }

    ~ServedRelay()
    {
        std::promise<void> stopped;
        boost::asio::post(ioc, [this, &stopped]
                          {
            http_server->stop();
            ws_server->stop();
            state->broadcaster.close_all();
            stopped.set_value(); });
        stopped.get_future().wait();
        guard.reset();
        ioc.stop();
        io.join();
    }

    // One blocking HTTP exchange; returns status and parsed body.
    std::pair<unsigned, nlohmann::json> request(boost::beast::http::verb verb, const std::string &target,
                                                const std::string &body = "", const std::string &token = "")
    {
        namespace bhttp = boost::beast::http;
        boost::asio::io_context cio;
        boost::asio::ip::tcp::socket s(cio);
        s.connect({boost::asio::ip::address_v4::loopback(), http_server->port()});

        bhttp::request<bhttp::string_body> req{verb, target, 11};
        req.set(bhttp::field::host, "127.0.0.1");
        if (!token.empty())
            req.set(bhttp::field::authorization, "Bearer " + token);
        if (!body.empty())
        {
            req.set(bhttp::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        bhttp::write(s, req);

        boost::beast::flat_buffer buf;
        bhttp::response<bhttp::string_body> res;
        bhttp::read(s, buf, res);
        boost::system::error_code ignored;
        s.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        return {res.result_int(), nlohmann::json::parse(res.body())};
    }

    std::pair<unsigned, nlohmann::json> command(const nlohmann::json &cmd, const std::string &token = "")
    {
        return request(boost::beast::http::verb::post, "/v1/command", cmd.dump(), token);
    }
};
