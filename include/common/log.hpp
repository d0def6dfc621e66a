/*
 * File: include/common/log.hpp
 * Project: OBS Relay
 * Purpose: Leveled stderr logging shared by every component
 * Notes:
 *  - One line per record: <utc ms> [LEVEL] [tag] message
 *  - Threshold set once at startup from api.log_level
 * Last updated: 2026-10-17
 */

#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string iso8601_ms(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(tp);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::string iso8601_now_ms() { return iso8601_ms(std::chrono::system_clock::now()); }

class Log
{
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    static void set_level(Level l) { threshold().store(static_cast<int>(l)); }

    // Accepts debug|info|warn|warning|error; anything else leaves the level unchanged.
    static bool set_level(const std::string &name)
    {
        if (name == "debug") set_level(Level::Debug);
        else if (name == "info") set_level(Level::Info);
        else if (name == "warn" || name == "warning") set_level(Level::Warn);
        else if (name == "error") set_level(Level::Error);
        else return false;
        return true;
    }

    static bool enabled(Level l) { return static_cast<int>(l) >= threshold().load(); }

    static void write(Level l, const std::string &tag, const std::string &msg)
    {
        if (!enabled(l))
            return;
        const char *name = "INFO ";
        switch (l)
        {
        case Level::Debug: name = "DEBUG"; break;
        case Level::Info: name = "INFO "; break;
        case Level::Warn: name = "WARN "; break;
        case Level::Error: name = "ERROR"; break;
        }
        std::string line = iso8601_now_ms() + " [" + name + "] [" + tag + "] " + msg + "\n";
        std::scoped_lock lk(mutex());
        std::cerr << line;
    }

    static void debug(const std::string &tag, const std::string &msg) { write(Level::Debug, tag, msg); }
    static void info(const std::string &tag, const std::string &msg) { write(Level::Info, tag, msg); }
    static void warn(const std::string &tag, const std::string &msg) { write(Level::Warn, tag, msg); }
    static void error(const std::string &tag, const std::string &msg) { write(Level::Error, tag, msg); }

private:
    static std::atomic<int> &threshold()
    {
        static std::atomic<int> t{static_cast<int>(Level::Info)};
        return t;
    }
    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }
};
