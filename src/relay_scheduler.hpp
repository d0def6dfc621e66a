/*
 * File: src/relay_scheduler.hpp
 * Project: OBS Relay
 * Purpose: Playlist library and the playlist scheduling state machine
 * Notes:
 *  - Every mutation (command or upstream "track ended") runs under one mutex,
 *    so a manual seek and an auto-advance never interleave
 *  - Events are posted under the mutex (commit order) and dispatched after it is released
 *  - In-memory state stays authoritative when a commit fails; the reply carries a warning
 * Last updated: 2026-10-17
 */

#pragma once
#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "common/m3u.hpp"
#include "common/playlist_state.hpp"
#include "common/relay_error.hpp"
#include "common/track.hpp"
#include "relay_bus.hpp"
#include "relay_store.hpp"

namespace fs = std::filesystem;

// playlist name -> track paths missing from storage (empty = fully valid)
using PreflightReport = std::map<std::string, std::vector<std::string>>;

inline nlohmann::json preflight_to_json(const PreflightReport &r)
{
    nlohmann::json out = nlohmann::json::object();
    bool all_valid = true;
    for (const auto &[name, missing] : r)
    {
        out[name] = {{"valid", missing.empty()}, {"missing_count", missing.size()}, {"missing", missing}};
        all_valid = all_valid && missing.empty();
    }
    return nlohmann::json{{"all_valid", all_valid}, {"playlists", out}};
}

// Destination of "load track" commands (the upstream media source).
class MediaLoader
{
public:
    virtual ~MediaLoader() = default;
    // Returns false when the track could not be handed to the upstream session.
    virtual bool load(const Track &track) = 0;
};

class PlaylistLibrary
{
    std::map<std::string, Playlist> playlists_;

public:
    // Loads every *.m3u / *.m3u8 in dir, in name order. Unreadable or empty files are skipped.
    static PlaylistLibrary load_dir(const fs::path &dir, bool default_loop)
    {
        PlaylistLibrary lib;
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            Log::warn("scheduler", "playlist directory " + dir.string() + " does not exist");
            return lib;
        }
        std::vector<fs::path> files;
        for (const auto &entry : fs::directory_iterator(dir, ec))
        {
            auto ext = entry.path().extension().string();
            if (entry.is_regular_file() && (ext == ".m3u" || ext == ".m3u8"))
                files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        for (const auto &f : files)
        {
            try
            {
                lib.add(parse_m3u(f, default_loop));
            }
            catch (const std::exception &e)
            {
                Log::warn("scheduler", "skipping " + f.string() + ": " + e.what());
            }
        }
        Log::info("scheduler", "loaded " + std::to_string(lib.size()) + " playlists from " + dir.string());
        return lib;
    }

    void add(Playlist p)
    {
        if (p.tracks.empty())
            throw std::runtime_error("playlist '" + p.name + "' has no tracks");
        Log::info("scheduler", "playlist '" + p.name + "' - " + std::to_string(p.size()) + " tracks");
        std::string key = p.name;
        playlists_[key] = std::move(p);
    }

    const Playlist *find(const std::string &name) const
    {
        auto it = playlists_.find(name);
        return it == playlists_.end() ? nullptr : &it->second;
    }

    const std::map<std::string, Playlist> &all() const { return playlists_; }
    std::size_t size() const { return playlists_.size(); }
};

// Read-only: which track paths of each loaded playlist are missing from storage.
// URLs count as present.
inline PreflightReport preflight_library(const PlaylistLibrary &lib)
{
    PreflightReport report;
    for (const auto &[name, pl] : lib.all())
    {
        auto &missing = report[name];
        for (const auto &t : pl.tracks)
        {
            if (is_remote_path(t.path))
                continue;
            std::error_code ec;
            if (!fs::exists(t.path, ec))
                missing.push_back(t.path);
        }
        if (!missing.empty())
            Log::warn("scheduler", "preflight: '" + name + "' is missing " + std::to_string(missing.size()) + " file(s)");
    }
    return report;
}

struct SchedulerOptions
{
    std::string source_name = "MediaSource";
    bool require_preflight = false;
};

class PlaylistScheduler
{
public:
    PlaylistScheduler(const PlaylistLibrary &lib, StateStore &store, EventBus &bus,
                      MediaLoader &loader, SchedulerOptions opts = {})
        : lib_(lib), store_(store), bus_(bus), loader_(loader), opts_(std::move(opts))
    {
        ended_token_ = bus_.subscribe(EventType::ExternalStateChanged, [this](const Event &ev)
                                      {
            if (ev.data.value("type", std::string()) != "MediaInputPlaybackEnded")
                return;
            const auto &d = ev.data.contains("data") ? ev.data["data"] : ev.data;
            on_track_ended(d.value("inputName", std::string())); });
        connected_token_ = bus_.subscribe(EventType::SessionConnected, [this](const Event &)
                                          { reload_current(); });
    }

    ~PlaylistScheduler()
    {
        bus_.unsubscribe(ended_token_);
        bus_.unsubscribe(connected_token_);
    }

    PlaylistScheduler(const PlaylistScheduler &) = delete;
    PlaylistScheduler &operator=(const PlaylistScheduler &) = delete;

    // Adopts the stored state if its playlist and index are still valid. A stored
    // playlist that is gone or out of range leaves the whole default state in place.
    // Returns true when a playlist was resumed.
    bool restore()
    {
        PlaylistState loaded = store_.load();
        std::scoped_lock lk(mtx_);
        if (!loaded.active_playlist)
        {
            state_.auto_advance = loaded.auto_advance;
            state_.updated_at = loaded.updated_at;
            return false;
        }
        const Playlist *pl = lib_.find(*loaded.active_playlist);
        if (!pl)
        {
            Log::warn("scheduler", "restore: playlist '" + *loaded.active_playlist + "' no longer exists");
            return false;
        }
        if (loaded.position >= pl->size())
        {
            Log::warn("scheduler", "restore: position " + std::to_string(loaded.position) +
                                       " out of range for '" + pl->name + "'");
            return false;
        }
        state_ = loaded;
        Log::info("scheduler", "restored '" + pl->name + "' at position " + std::to_string(state_.position));
        return true;
    }

    Outcome activate(const std::string &name, std::optional<long long> position = std::nullopt)
    {
        EventBus::DispatchGuard deliver(bus_);
        std::scoped_lock lk(mtx_);
        const Playlist *pl = lib_.find(name);
        if (!pl)
            throw RelayError(ErrorCode::NotFound, "playlist '" + name + "' not found");
        check_validated(name);
        long long pos = position.value_or(0);
        if (pos < 0 || static_cast<std::size_t>(pos) >= pl->size())
            throw RelayError(ErrorCode::OutOfRange, "position " + std::to_string(pos) + " outside [0, " +
                                                        std::to_string(pl->size()) + ")");
        PlaylistState next = state_;
        next.active_playlist = name;
        next.position = static_cast<std::size_t>(pos);
        Log::info("scheduler", "activated playlist '" + name + "' at position " + std::to_string(pos));
        return apply(*pl, next, EventType::PlaylistActivated, "activate");
    }

    Outcome next() { return step(+1, "next"); }
    Outcome prev() { return step(-1, "prev"); }

    Outcome seek(long long position)
    {
        EventBus::DispatchGuard deliver(bus_);
        std::scoped_lock lk(mtx_);
        const Playlist &pl = active_locked();
        if (position < 0 || static_cast<std::size_t>(position) >= pl.size())
            throw RelayError(ErrorCode::OutOfRange, "position " + std::to_string(position) + " outside [0, " +
                                                        std::to_string(pl.size()) + ")");
        PlaylistState next = state_;
        next.position = static_cast<std::size_t>(position);
        return apply(pl, next, EventType::TrackChanged, "seek");
    }

    // Takes effect on the next "track ended" notification.
    Outcome set_auto_advance(bool enabled)
    {
        std::scoped_lock lk(mtx_);
        state_.auto_advance = enabled;
        state_.updated_at = now_ms();
        Log::info("scheduler", std::string("auto-advance ") + (enabled ? "enabled" : "disabled"));
        Outcome out = Outcome::success({{"auto_advance", enabled}});
        commit_locked(out);
        return out;
    }

    // Upstream "track ended" for input_name.
    void on_track_ended(const std::string &input_name)
    {
        if (input_name != opts_.source_name)
            return;
        EventBus::DispatchGuard deliver(bus_);
        std::scoped_lock lk(mtx_);
        if (!state_.auto_advance)
        {
            Log::debug("scheduler", "track ended, auto-advance disabled");
            return;
        }
        if (!state_.active_playlist)
            return;
        Log::info("scheduler", "auto-advance: '" + input_name + "' finished, next track");
        try
        {
            step_locked(+1, "auto_advance");
        }
        catch (const RelayError &e)
        {
            Log::warn("scheduler", std::string("auto-advance failed: ") + e.what());
        }
    }

    // Re-issues the load of the current track without changing state.
    void reload_current()
    {
        std::scoped_lock lk(mtx_);
        if (!state_.active_playlist)
            return;
        const Playlist *pl = lib_.find(*state_.active_playlist);
        if (!pl || state_.position >= pl->size())
            return;
        Log::info("scheduler", "reloading '" + pl->tracks[state_.position].title + "' after reconnect");
        loader_.load(pl->tracks[state_.position]);
    }

    PreflightReport preflight() const { return preflight_library(lib_); }

    void record_preflight(const PreflightReport &r)
    {
        std::scoped_lock lk(mtx_);
        preflight_ = r;
    }

    PlaylistState state() const
    {
        std::scoped_lock lk(mtx_);
        return state_;
    }

    const SchedulerOptions &options() const { return opts_; }

    nlohmann::json status() const
    {
        using nlohmann::json;
        std::scoped_lock lk(mtx_);
        const Playlist *pl = state_.active_playlist ? lib_.find(*state_.active_playlist) : nullptr;
        json j{
            {"active_playlist", pl ? json(pl->name) : json(nullptr)},
            {"position", state_.position},
            {"total_items", pl ? pl->size() : 0},
            {"loop", pl ? pl->loop : false},
            {"auto_advance", state_.auto_advance},
            {"updated_at", iso8601_ms(state_.updated_at)}};
        j["current_item"] = pl ? track_to_json(pl->tracks[state_.position]) : json(nullptr);
        return j;
    }

private:
    const Playlist &active_locked() const
    {
        if (!state_.active_playlist)
            throw RelayError(ErrorCode::NoActivePlaylist, "no active playlist");
        const Playlist *pl = lib_.find(*state_.active_playlist);
        if (!pl)
            throw RelayError(ErrorCode::NoActivePlaylist, "active playlist '" + *state_.active_playlist + "' is gone");
        return *pl;
    }

    void check_validated(const std::string &name) const
    {
        std::string problem;
        if (!preflight_)
            problem = "preflight validation has not been run";
        else if (auto it = preflight_->find(name); it != preflight_->end() && !it->second.empty())
            problem = std::to_string(it->second.size()) + " track(s) missing";
        if (problem.empty())
            return;
        if (opts_.require_preflight)
            throw RelayError(ErrorCode::Unvalidated, "playlist '" + name + "': " + problem);
        Log::warn("scheduler", "activating unverified playlist '" + name + "': " + problem);
    }

    Outcome step(int dir, const char *cause)
    {
        EventBus::DispatchGuard deliver(bus_);
        std::scoped_lock lk(mtx_);
        return step_locked(dir, cause);
    }

    Outcome step_locked(int dir, const char *cause)
    {
        const Playlist &pl = active_locked();
        const long long len = static_cast<long long>(pl.size());
        long long candidate = static_cast<long long>(state_.position) + dir;

        if (candidate >= len && !pl.loop)
        {
            Log::info("scheduler", "playlist '" + pl.name + "' ended (no loop)");
            bus_.post(Event(EventType::PlaylistEnded, {{"playlist", pl.name}, {"position", state_.position}}));
            return Outcome::success({{"playlist", pl.name}, {"position", state_.position}, {"ended", true}});
        }
        if (candidate < 0 && !pl.loop)
            candidate = 0;
        // a looping one-track playlist wraps onto itself and still restarts the track
        const bool wrapped = candidate >= len || candidate < 0;
        candidate = ((candidate % len) + len) % len;

        if (static_cast<std::size_t>(candidate) == state_.position && !wrapped)
            return Outcome::success({{"playlist", pl.name},
                                     {"position", state_.position},
                                     {"track", pl.tracks[state_.position].title},
                                     {"changed", false}});

        PlaylistState next = state_;
        next.position = static_cast<std::size_t>(candidate);
        return apply(pl, next, EventType::TrackChanged, cause);
    }

    // Load upstream, adopt, commit, emit.
    Outcome apply(const Playlist &pl, PlaylistState next, EventType ev, const char *cause)
    {
        const Track &track = pl.tracks[next.position];
        bool loaded = loader_.load(track);
        next.updated_at = now_ms();
        state_ = next;

        nlohmann::json data{
            {"playlist", pl.name},
            {"position", state_.position},
            {"total_items", pl.size()},
            {"track", track.title},
            {"item", track_to_json(track)},
            {"cause", cause}};
        std::size_t after = state_.position + 1;
        if (after >= pl.size() && pl.loop)
            after = 0;
        data["next_track"] = after < pl.size() ? nlohmann::json(pl.tracks[after].title) : nlohmann::json(nullptr);
        Outcome out = Outcome::success(data);
        out.data["loaded"] = loaded;
        if (!loaded)
            out.warning = "upstream_unavailable: track not loaded";
        commit_locked(out);

        Log::info("scheduler", std::string(cause) + " -> " + std::to_string(state_.position) + ": " + track.title);
        bus_.post(Event(ev, std::move(data)));
        return out;
    }

    void commit_locked(Outcome &out)
    {
        try
        {
            store_.commit(state_);
        }
        catch (const RelayError &e)
        {
            std::string w = std::string("persistence_failure: ") + e.what();
            out.warning = out.warning.empty() ? w : out.warning + "; " + w;
        }
    }

    const PlaylistLibrary &lib_;
    StateStore &store_;
    EventBus &bus_;
    MediaLoader &loader_;
    SchedulerOptions opts_;

    mutable std::mutex mtx_;
    PlaylistState state_;
    std::optional<PreflightReport> preflight_;
    EventBus::Token ended_token_ = 0;
    EventBus::Token connected_token_ = 0;
};
