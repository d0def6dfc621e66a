/*
 * File: services/preflight/preflight_main.cpp
 * Project: OBS Relay
 * Purpose: Offline playlist check before going live
 * Notes:
 *  - relay_preflight [--playlists DIR] [--json] [--quiet]
 *  - Exit status: 0 all tracks present, 1 something missing, 2 no playlists loaded
 * Last updated: 2026-10-17
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

#include "common/log.hpp"
#include "relay_scheduler.hpp"

int main(int argc, char **argv)
{
    std::string dir = "playlists";
    if (const char *env = std::getenv("PLAYLIST_DIR"))
        dir = env;
    bool as_json = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--playlists" && i + 1 < argc)
            dir = argv[++i];
        else if (a == "--json")
            as_json = true;
        else if (a == "--quiet")
            Log::set_level(Log::Level::Warn);
    }

    PlaylistLibrary lib = PlaylistLibrary::load_dir(dir, true);
    if (lib.size() == 0)
    {
        std::cerr << "relay_preflight: no playlists in " << dir << "\n";
        return 2;
    }

    PreflightReport report = preflight_library(lib);

    bool all_valid = true;
    for (const auto &[name, missing] : report)
        all_valid = all_valid && missing.empty();

    if (as_json)
        std::cout << preflight_to_json(report).dump(2) << "\n";
    else
    {
        for (const auto &[name, missing] : report)
        {
            const Playlist *pl = lib.find(name);
            std::cout << (missing.empty() ? "OK      " : "MISSING ") << name << " (" << pl->size() << " tracks";
            if (!missing.empty())
                std::cout << ", " << missing.size() << " missing";
            std::cout << ")\n";
            for (const auto &path : missing)
                std::cout << "    " << path << "\n";
        }
    }
    return all_valid ? 0 : 1;
}
