/*
 * File: src/relay_config.hpp
 * Project: OBS Relay
 * Purpose: Runtime configuration (JSON file, environment, command line)
 * Notes:
 *  - Precedence: flags > environment > relay.json > defaults
 *  - validate() throws std::runtime_error naming the offending key
 * Last updated: 2026-10-17
 */

#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "common/log.hpp"
#include "relay_overlay.hpp"
#include "relay_presets.hpp"
#include "relay_session.hpp"

namespace fs = std::filesystem;

struct ObsConfig
{
    std::string host = "localhost";
    long port = 4455;
    std::string password;
    long reconnect_interval_ms = 5000;
    long max_reconnect_interval_ms = 60000;
    std::string backoff = "fixed"; // fixed | exponential
    long max_reconnect_attempts = 10;
    long handshake_timeout_ms = 5000;
};

struct ApiConfig
{
    std::string host = "0.0.0.0";
    long port = 8080;
    long ws_port = 8090;
    std::string api_key;
    std::string log_level = "info";
};

struct OscConfig
{
    bool enabled = true;
    std::string listen_host = "0.0.0.0";
    long listen_port = 9000;
    std::string client_host = "255.255.255.255";
    long reply_port = 9001;
    bool trusted = true;
};

struct PlaylistConfig
{
    std::string directory = "playlists";
    std::optional<std::string> default_playlist;
    bool loop = true;
    std::string source_name = "MediaSource";
    std::string state_file = "playlist_state.json";
    bool require_preflight = false;
};

struct BroadcastConfig
{
    long queue_capacity = 256;
};

struct RelayConfig
{
    ObsConfig obs;
    ApiConfig api;
    OscConfig osc;
    PlaylistConfig playlist;
    BroadcastConfig broadcast;
    OverlaySettings overlay;
    std::vector<ScenePreset> presets;
};

namespace detail
{
    template <typename T>
    inline void take(const nlohmann::json &section, const char *key, T &dst)
    {
        auto it = section.find(key);
        if (it == section.end() || it->is_null())
            return;
        try
        {
            dst = it->get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw std::runtime_error(std::string("config: bad value for '") + key + "'");
        }
    }

    inline const nlohmann::json &section(const nlohmann::json &doc, const char *name)
    {
        static const nlohmann::json empty = nlohmann::json::object();
        auto it = doc.find(name);
        if (it == doc.end())
            return empty;
        if (!it->is_object())
            throw std::runtime_error(std::string("config: section '") + name + "' must be an object");
        return *it;
    }

    inline long to_long(const std::string &key, const std::string &v)
    {
        try
        {
            std::size_t used = 0;
            long p = std::stol(v, &used);
            if (used != v.size())
                throw std::invalid_argument(v);
            return p;
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("config: '" + key + "' is not a number: " + v);
        }
    }

    // "host:port" -> pair; a bare number is a port only.
    inline void split_bind(const std::string &key, const std::string &s, std::string &host, long &port)
    {
        auto p = s.rfind(':');
        if (p == std::string::npos)
        {
            port = to_long(key, s);
            return;
        }
        if (p > 0)
            host = s.substr(0, p);
        port = to_long(key, s.substr(p + 1));
    }
}

inline RelayConfig config_from_json(const nlohmann::json &doc)
{
    using detail::section;
    using detail::take;
    if (!doc.is_object())
        throw std::runtime_error("config: document must be a JSON object");
    RelayConfig c;

    const auto &o = section(doc, "obs");
    take(o, "host", c.obs.host);
    take(o, "port", c.obs.port);
    take(o, "password", c.obs.password);
    take(o, "reconnect_interval_ms", c.obs.reconnect_interval_ms);
    take(o, "max_reconnect_interval_ms", c.obs.max_reconnect_interval_ms);
    take(o, "backoff", c.obs.backoff);
    take(o, "max_reconnect_attempts", c.obs.max_reconnect_attempts);
    take(o, "handshake_timeout_ms", c.obs.handshake_timeout_ms);

    const auto &a = section(doc, "api");
    take(a, "host", c.api.host);
    take(a, "port", c.api.port);
    take(a, "ws_port", c.api.ws_port);
    take(a, "api_key", c.api.api_key);
    take(a, "log_level", c.api.log_level);

    const auto &s = section(doc, "osc");
    take(s, "enabled", c.osc.enabled);
    take(s, "listen_host", c.osc.listen_host);
    take(s, "listen_port", c.osc.listen_port);
    take(s, "client_host", c.osc.client_host);
    take(s, "reply_port", c.osc.reply_port);
    take(s, "trusted", c.osc.trusted);

    const auto &p = section(doc, "playlist");
    take(p, "directory", c.playlist.directory);
    std::string def;
    take(p, "default_playlist", def);
    if (!def.empty())
        c.playlist.default_playlist = def;
    take(p, "loop", c.playlist.loop);
    take(p, "source_name", c.playlist.source_name);
    take(p, "state_file", c.playlist.state_file);
    take(p, "require_preflight", c.playlist.require_preflight);

    take(section(doc, "broadcast"), "queue_capacity", c.broadcast.queue_capacity);

    try
    {
        apply_overlay_settings(c.overlay, section(doc, "overlay"));
    }
    catch (const RelayError &e)
    {
        throw std::runtime_error(std::string("config: ") + e.what());
    }

    if (auto it = doc.find("presets"); it != doc.end() && !it->is_null())
    {
        if (!it->is_array())
            throw std::runtime_error("config: 'presets' must be an array");
        for (const auto &entry : *it)
        {
            try
            {
                c.presets.push_back(preset_from_json(entry));
            }
            catch (const std::exception &e)
            {
                throw std::runtime_error(std::string("config: bad preset: ") + e.what());
            }
        }
    }
    return c;
}

// A missing file yields the defaults; an unreadable or malformed one throws.
inline RelayConfig load_config_file(const fs::path &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        Log::info("main", "no config file at " + path.string() + ", using defaults");
        return RelayConfig{};
    }
    std::string text;
    if (!read_file_all(path, text))
        throw std::runtime_error("config: cannot read " + path.string());
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded())
        throw std::runtime_error("config: " + path.string() + " is not valid JSON");
    return config_from_json(doc);
}

using EnvLookup = std::function<const char *(const char *)>;

inline void apply_env(RelayConfig &c, const EnvLookup &env = [](const char *k) { return std::getenv(k); })
{
    auto str = [&](const char *k, std::string &dst)
    {
        if (const char *v = env(k); v && *v)
            dst = v;
    };
    auto num = [&](const char *k, long &dst)
    {
        if (const char *v = env(k); v && *v)
            dst = detail::to_long(k, v);
    };
    str("OBS_HOST", c.obs.host);
    num("OBS_PORT", c.obs.port);
    str("OBS_PASSWORD", c.obs.password);
    str("API_HOST", c.api.host);
    num("API_PORT", c.api.port);
    str("API_KEY", c.api.api_key);
    str("PLAYLIST_DIR", c.playlist.directory);
}

// Returns the value following --config, or the default path.
inline std::string config_path_arg(int argc, char **argv)
{
    for (int i = 1; i + 1 < argc; ++i)
        if (std::string(argv[i]) == "--config")
            return argv[i + 1];
    return "relay.json";
}

inline void apply_args(RelayConfig &c, int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        if (a == "--config" && has_value)
            ++i;
        else if (a == "--obs" && has_value)
            detail::split_bind("--obs", argv[++i], c.obs.host, c.obs.port);
        else if (a == "--obs-password" && has_value)
            c.obs.password = argv[++i];
        else if (a == "--http" && has_value)
            detail::split_bind("--http", argv[++i], c.api.host, c.api.port);
        else if (a == "--ws" && has_value)
        {
            std::string ignored_host;
            detail::split_bind("--ws", argv[++i], ignored_host, c.api.ws_port);
        }
        else if (a == "--osc" && has_value)
            detail::split_bind("--osc", argv[++i], c.osc.listen_host, c.osc.listen_port);
        else if (a == "--no-osc")
            c.osc.enabled = false;
        else if (a == "--playlists" && has_value)
            c.playlist.directory = argv[++i];
        else if (a == "--state" && has_value)
            c.playlist.state_file = argv[++i];
        else if (a == "--default-playlist" && has_value)
            c.playlist.default_playlist = std::string(argv[++i]);
        else if (a == "--api-key" && has_value)
            c.api.api_key = argv[++i];
        else if (a == "--log-level" && has_value)
            c.api.log_level = argv[++i];
        else if (a == "--require-preflight")
            c.playlist.require_preflight = true;
        else if (a == "--no-overlay")
            c.overlay.enabled = false;
        else
            throw std::runtime_error("unknown or incomplete option: " + a);
    }
}

inline void validate(const RelayConfig &c)
{
    auto port = [](const char *key, long p)
    {
        if (p < 1 || p > 65535)
            throw std::runtime_error(std::string("config: '") + key + "' out of range: " + std::to_string(p));
    };
    auto non_negative = [](const char *key, long v)
    {
        if (v < 0)
            throw std::runtime_error(std::string("config: '") + key + "' must not be negative");
    };
    port("obs.port", c.obs.port);
    port("api.port", c.api.port);
    port("api.ws_port", c.api.ws_port);
    port("osc.listen_port", c.osc.listen_port);
    port("osc.reply_port", c.osc.reply_port);
    non_negative("obs.reconnect_interval_ms", c.obs.reconnect_interval_ms);
    non_negative("obs.max_reconnect_interval_ms", c.obs.max_reconnect_interval_ms);
    non_negative("obs.max_reconnect_attempts", c.obs.max_reconnect_attempts);
    if (c.obs.handshake_timeout_ms <= 0)
        throw std::runtime_error("config: 'obs.handshake_timeout_ms' must be positive");
    if (c.obs.backoff != "fixed" && c.obs.backoff != "exponential")
        throw std::runtime_error("config: 'obs.backoff' must be fixed or exponential, got " + c.obs.backoff);
    if (c.broadcast.queue_capacity <= 0)
        throw std::runtime_error("config: 'broadcast.queue_capacity' must be positive");
    if (c.api.port == c.api.ws_port)
        throw std::runtime_error("config: 'api.port' and 'api.ws_port' collide");
    if (c.playlist.source_name.empty())
        throw std::runtime_error("config: 'playlist.source_name' must not be empty");
    if (c.playlist.state_file.empty())
        throw std::runtime_error("config: 'playlist.state_file' must not be empty");
    const auto &lv = c.api.log_level;
    if (lv != "debug" && lv != "info" && lv != "warn" && lv != "warning" && lv != "error")
        throw std::runtime_error("config: 'api.log_level' unknown: " + lv);
}

inline SessionConfig session_config(const RelayConfig &c)
{
    SessionConfig s;
    s.password = c.obs.password;
    s.reconnect_interval = std::chrono::milliseconds(c.obs.reconnect_interval_ms);
    s.max_reconnect_interval = std::chrono::milliseconds(c.obs.max_reconnect_interval_ms);
    s.exponential_backoff = c.obs.backoff == "exponential";
    s.max_reconnect_attempts = static_cast<unsigned>(c.obs.max_reconnect_attempts);
    s.handshake_timeout = std::chrono::milliseconds(c.obs.handshake_timeout_ms);
    return s;
}
