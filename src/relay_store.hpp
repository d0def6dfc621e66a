/*
 * File: src/relay_store.hpp
 * Project: OBS Relay
 * Purpose: Durable single-record snapshot of the playlist position
 * Notes:
 *  - Atomic file writes via include/atomic_write.hpp
 *  - A failed commit is remembered and retried by flush() at shutdown
 * Last updated: 2026-10-17
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "common/log.hpp"
#include "common/playlist_state.hpp"
#include "common/relay_error.hpp"

class StateStore
{
    std::string path_;
    mutable std::mutex m_;
    std::optional<PlaylistState> unsaved_;

public:
    explicit StateStore(std::string path) : path_(std::move(path)) {}

    const std::string &path() const { return path_; }

    // Last committed state, or the default record when absent or unreadable.
    PlaylistState load() const
    {
        std::scoped_lock lk(m_);
        std::string text;
        if (!read_file_all(path_, text))
        {
            Log::info("store", "no state at " + path_ + ", starting fresh");
            return PlaylistState{};
        }
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            Log::warn("store", "state file " + path_ + " is not valid JSON, ignored");
            return PlaylistState{};
        }
        try
        {
            PlaylistState s = state_from_json(j);
            Log::info("store", "loaded state playlist='" + s.active_playlist.value_or("") +
                                   "' pos=" + std::to_string(s.position));
            return s;
        }
        catch (const std::exception &e)
        {
            Log::warn("store", "state file " + path_ + " unusable: " + e.what());
            return PlaylistState{};
        }
    }

    // Throws RelayError(PersistenceFailure); the snapshot is kept for flush().
    void commit(const PlaylistState &s)
    {
        std::scoped_lock lk(m_);
        try
        {
            write_atomic(path_, state_to_json(s).dump(2));
            unsaved_.reset();
        }
        catch (const std::exception &e)
        {
            unsaved_ = s;
            Log::warn("store", std::string("commit failed: ") + e.what());
            throw RelayError(ErrorCode::PersistenceFailure, e.what());
        }
    }

    bool dirty() const
    {
        std::scoped_lock lk(m_);
        return unsaved_.has_value();
    }

    // Retries the last failed commit. Returns true when nothing is left unsaved.
    bool flush()
    {
        std::scoped_lock lk(m_);
        if (!unsaved_)
            return true;
        try
        {
            write_atomic(path_, state_to_json(*unsaved_).dump(2));
            unsaved_.reset();
            Log::info("store", "flushed pending state");
            return true;
        }
        catch (const std::exception &e)
        {
            Log::error("store", std::string("flush failed: ") + e.what());
            return false;
        }
    }
};
