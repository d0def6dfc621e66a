/*
 * File: src/relay_state.hpp
 * Project: OBS Relay
 * Purpose: Owns the core components and wires them together
 * Notes:
 *  - Member order is construction order; adapters hold references into it
 *  - shutdown() runs the SIGINT/SIGTERM sequence for the core side
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "common/log.hpp"
#include "relay_broadcast.hpp"
#include "relay_bus.hpp"
#include "relay_config.hpp"
#include "relay_overlay.hpp"
#include "relay_presets.hpp"
#include "relay_router.hpp"
#include "relay_scheduler.hpp"
#include "relay_session.hpp"
#include "relay_store.hpp"
#include "relay_studio.hpp"
#include "relay_upstream.hpp"


struct RelayState {
RelayConfig cfg;
boost::asio::io_context &io;
EventBus bus;
StateStore store;
PlaylistLibrary library;
SessionSupervisor session;
StudioControl studio;
ObsMediaLoader loader;
PlaylistScheduler scheduler;
PresetCatalog catalog;
PresetRunner presets;
OverlayController overlay;
Broadcaster broadcaster;
CommandRouter router;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

RelayState(RelayConfig c, boost::asio::io_context &ioc, LinkFactory factory)
    : cfg(std::move(c)), io(ioc), store(cfg.playlist.state_file),
      library(PlaylistLibrary::load_dir(cfg.playlist.directory, cfg.playlist.loop)),
      session(ioc, bus, session_config(cfg), std::move(factory)),
      studio(session, bus),
      loader(ioc, session, bus, cfg.playlist.source_name),
      scheduler(library, store, bus, loader, SchedulerOptions{cfg.playlist.source_name, cfg.playlist.require_preflight}),
      presets(catalog, studio, scheduler, bus),
      overlay(ioc, session, studio, bus, cfg.overlay),
      broadcaster(bus),
      router(RouterDeps{session, scheduler, studio, presets, overlay, broadcaster}, cfg.api.api_key)
{
    for (const auto &p : cfg.presets) catalog.add(p);
    catalog.add_defaults();
}

RelayState(const RelayState &) = delete;
RelayState &operator=(const RelayState &) = delete;

// Restore the stored position, fall back to the configured default playlist.
void restore()
{
    if (scheduler.restore() || !cfg.playlist.default_playlist) return;
    try {
        Outcome o = scheduler.activate(*cfg.playlist.default_playlist);
        if (!o.warning.empty()) Log::warn("main", "default playlist: " + o.warning);
    } catch (const RelayError &e) {
        Log::warn("main", "default playlist '" + *cfg.playlist.default_playlist + "' not activated: " + e.what());
    }
}

double uptime_s() const
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void shutdown()
{
    loader.cancel();
    overlay.cancel();
    session.shutdown();
    if (!store.flush()) Log::error("main", "playlist state could not be saved at shutdown");
    broadcaster.close_all();
}
};

// Production link factory: a fresh WebSocket client per attempt.
inline LinkFactory obs_link_factory(boost::asio::io_context &ioc, const ObsConfig &obs)
{
    std::string host = obs.host;
    auto port = static_cast<unsigned short>(obs.port);
    return [&ioc, host, port]() -> std::shared_ptr<UpstreamLink>
    { return std::make_shared<ObsWebSocketLink>(ioc, host, port); };
}
