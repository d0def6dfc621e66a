/*
 * File: include/common/m3u.hpp
 * Project: OBS Relay
 * Purpose: Extended M3U reader/writer for playlist definitions
 * Notes:
 *  - #EXTINF:<duration>,<title> then the path line
 *  - #EXTVLCOPT:start-time= / stop-time= set trim-in / trim-out
 *  - #EXTRELAY:loop=0|1 overrides the configured loop flag
 *  - #EXTOVERLAY:text=|hold=|delay=|skip= set title overlay overrides for the next track
 *  - Numbers must be finite; trims and overlay timings above kMaxMediaSeconds are ignored
 * Last updated: 2026-10-17
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "common/log.hpp"
#include "common/track.hpp"

namespace fs = std::filesystem;

constexpr double kMaxMediaSeconds = 24.0 * 3600.0;

inline std::string trim_ws(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::optional<double> parse_number(const std::string &s)
{
    std::string v = trim_ws(s);
    if (v.empty())
        return std::nullopt;
    char *end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (end == v.c_str() || *end != '\0' || !std::isfinite(d))
        return std::nullopt;
    return d;
}

// Seconds value for a trim or overlay timing: finite, non-negative, within a day.
inline std::optional<double> parse_seconds(const std::string &s)
{
    auto v = parse_number(s);
    if (!v || *v < 0 || *v > kMaxMediaSeconds)
        return std::nullopt;
    return v;
}

inline bool flag_value(const std::string &v)
{
    return !(v.empty() || v == "0" || v == "false" || v == "no");
}

inline std::string resolve_track_path(const std::string &raw, const fs::path &base_dir)
{
    if (is_remote_path(raw))
        return raw;
    fs::path p(raw);
    if (p.is_relative())
        p = base_dir / p;
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal().string();
}

// Parses M3U text. Relative paths resolve against base_dir.
inline Playlist parse_m3u_text(const std::string &text, const std::string &name,
                               const fs::path &base_dir, bool default_loop = true)
{
    Playlist pl;
    pl.name = name;
    pl.loop = default_loop;

    std::optional<double> duration;
    std::optional<std::string> title;
    std::optional<double> trim_in, trim_out;
    OverlayHints overlay;

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw))
    {
        std::string line = trim_ws(raw);
        if (line.empty() || line == "#EXTM3U")
            continue;

        if (line.rfind("#EXTINF:", 0) == 0)
        {
            std::string rest = line.substr(8);
            auto comma = rest.find(',');
            std::string dur = comma == std::string::npos ? rest : rest.substr(0, comma);
            // attributes such as tvg-id="..." may follow the duration
            auto sp = dur.find(' ');
            if (sp != std::string::npos)
                dur = dur.substr(0, sp);
            duration = parse_number(dur);
            title = comma == std::string::npos ? std::string() : trim_ws(rest.substr(comma + 1));
            continue;
        }
        if (line.rfind("#EXTVLCOPT:start-time=", 0) == 0)
        {
            if (auto v = parse_seconds(line.substr(22)))
                trim_in = *v;
            else
                Log::warn("scheduler", name + ": ignoring start-time '" + line.substr(22) + "'");
            continue;
        }
        if (line.rfind("#EXTVLCOPT:stop-time=", 0) == 0)
        {
            if (auto v = parse_seconds(line.substr(21)))
                trim_out = *v;
            else
                Log::warn("scheduler", name + ": ignoring stop-time '" + line.substr(21) + "'");
            continue;
        }
        if (line.rfind("#EXTRELAY:loop=", 0) == 0)
        {
            std::string v = trim_ws(line.substr(15));
            pl.loop = flag_value(v);
            continue;
        }
        if (line.rfind("#EXTOVERLAY:", 0) == 0)
        {
            std::string rest = line.substr(12);
            auto eq = rest.find('=');
            if (eq == std::string::npos)
                continue;
            std::string key = trim_ws(rest.substr(0, eq));
            std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            std::string val = trim_ws(rest.substr(eq + 1));
            if (key == "text")
                overlay.text = val;
            else if (key == "skip")
                overlay.skip = flag_value(val);
            else if (key == "hold" || key == "delay")
            {
                auto v = parse_seconds(val);
                if (!v)
                    Log::warn("scheduler", name + ": ignoring overlay " + key + " '" + val + "'");
                else if (key == "hold")
                    overlay.hold = v;
                else
                    overlay.delay = v;
            }
            continue;
        }
        if (line[0] == '#')
            continue;

        Track t;
        t.path = resolve_track_path(line, base_dir);
        t.duration = duration.value_or(-1);
        if (title && !title->empty())
            t.title = *title;
        else
            t.title = is_remote_path(line) ? line : fs::path(line).stem().string();
        if (trim_in && *trim_in > 0)
            t.trim_in = trim_in;
        if (trim_out && *trim_out > 0)
        {
            if (*trim_out > t.trim_in.value_or(0))
                t.trim_out = trim_out;
            else
                Log::warn("scheduler", name + ": stop-time not after start-time for " + t.path + ", ignored");
        }
        t.overlay = overlay;
        pl.tracks.push_back(std::move(t));

        overlay = OverlayHints{};
        duration.reset();
        title.reset();
        trim_in.reset();
        trim_out.reset();
    }
    return pl;
}

inline Playlist parse_m3u(const fs::path &file, bool default_loop = true)
{
    std::ifstream f(file, std::ios::binary);
    if (!f)
        throw std::runtime_error("open playlist failed: " + file.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    std::error_code ec;
    fs::path dir = fs::absolute(file, ec).parent_path();
    if (ec)
        dir = file.parent_path();
    Playlist pl = parse_m3u_text(ss.str(), file.stem().string(), dir, default_loop);
    pl.source_file = file.string();
    return pl;
}

inline std::string write_m3u(const Playlist &pl)
{
    std::ostringstream out;
    out << "#EXTM3U\n";
    if (!pl.loop)
        out << "#EXTRELAY:loop=0\n";
    out << "\n";
    for (const auto &t : pl.tracks)
    {
        out << "#EXTINF:" << static_cast<long long>(t.duration) << "," << t.title << "\n";
        if (t.trim_in)
            out << "#EXTVLCOPT:start-time=" << *t.trim_in << "\n";
        if (t.trim_out)
            out << "#EXTVLCOPT:stop-time=" << *t.trim_out << "\n";
        if (t.overlay.text)
            out << "#EXTOVERLAY:text=" << *t.overlay.text << "\n";
        if (t.overlay.hold)
            out << "#EXTOVERLAY:hold=" << *t.overlay.hold << "\n";
        if (t.overlay.delay)
            out << "#EXTOVERLAY:delay=" << *t.overlay.delay << "\n";
        if (t.overlay.skip)
            out << "#EXTOVERLAY:skip=1\n";
        out << t.path << "\n\n";
    }
    return out.str();
}
