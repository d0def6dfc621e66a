/*
 * File: src/relay_main.cpp
 * Project: OBS Relay
 * Purpose: Main server binary: upstream session, playlist scheduler, HTTP/WS/OSC control surfaces
 * Notes:
 *  - Configuration: --config relay.json, environment, then flags (see relay_config.hpp)
 *  - SIGINT/SIGTERM stop the surfaces, then the core, then drain the event loop
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <memory>
#include <optional>
#include <boost/asio.hpp>

#include "common/log.hpp"
#include "relay_config.hpp"
#include "relay_http.hpp"
#include "relay_osc.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"

int main(int argc, char **argv)
{
    RelayConfig cfg;
    try
    {
        cfg = load_config_file(config_path_arg(argc, argv));
        apply_env(cfg);
        apply_args(cfg, argc, argv);
        validate(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "obs_relay: " << e.what() << "\n";
        return 2;
    }
    if (!Log::set_level(cfg.api.log_level))
        Log::warn("main", "unknown log level " + cfg.api.log_level + ", keeping info");

    boost::asio::io_context ioc{1};
    RelayState state{cfg, ioc, obs_link_factory(ioc, cfg.obs)};
    state.restore();

    std::optional<HttpServer> http;
    std::optional<WsServer> ws;
    std::unique_ptr<OscBridge> osc;
    try
    {
        auto addr = boost::asio::ip::make_address(cfg.api.host);
        http.emplace(ioc, boost::asio::ip::tcp::endpoint{addr, static_cast<unsigned short>(cfg.api.port)}, state);
        ws.emplace(ioc, boost::asio::ip::tcp::endpoint{addr, static_cast<unsigned short>(cfg.api.ws_port)}, state);
        if (cfg.osc.enabled)
        {
            using boost::asio::ip::udp;
            udp::endpoint listen{boost::asio::ip::make_address(cfg.osc.listen_host),
                                 static_cast<unsigned short>(cfg.osc.listen_port)};
            udp::endpoint reply{boost::asio::ip::make_address(cfg.osc.client_host),
                                static_cast<unsigned short>(cfg.osc.reply_port)};
            std::optional<std::string> credential;
            if (cfg.osc.trusted)
                credential = cfg.api.api_key;
            osc = std::make_unique<OscBridge>(ioc, listen, reply, state.router, state.broadcaster,
                                              static_cast<std::size_t>(cfg.broadcast.queue_capacity), credential);
            osc->start();
        }
    }
    catch (const std::exception &e)
    {
        Log::error("main", std::string("cannot start control surfaces: ") + e.what());
        state.shutdown();
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code ec, int sig)
                       {
        if (ec) return;
        Log::info("main", "signal " + std::to_string(sig) + ", shutting down");
        http->stop();
        ws->stop();
        if (osc) osc->stop();
        state.shutdown(); });

    Log::info("main", "obs_relay " + std::string(kRelayVersion) + " upstream=" + cfg.obs.host + ":" +
                          std::to_string(cfg.obs.port) + " playlists=" + std::to_string(state.library.size()));
    state.session.connect();

    ioc.run();
    Log::info("main", "stopped");
    return 0;
}
