/*
 * File: include/common/relay_error.hpp
 * Project: OBS Relay
 * Purpose: Typed failures shared by the core and the control surfaces
 * Notes:
 *  - Synchronous core operations throw RelayError
 *  - Async upstream completions carry an Outcome instead
 * Last updated: 2026-10-17
 */

#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class ErrorCode
{
    None,
    SchemaError,
    AuthError,
    NotFound,
    OutOfRange,
    NoActivePlaylist,
    Unvalidated,
    UpstreamUnavailable,
    UpstreamRejected,
    PersistenceFailure,
    Internal
};

inline const char *error_code_name(ErrorCode c)
{
    switch (c)
    {
    case ErrorCode::None: return "none";
    case ErrorCode::SchemaError: return "schema_error";
    case ErrorCode::AuthError: return "auth_error";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::OutOfRange: return "out_of_range";
    case ErrorCode::NoActivePlaylist: return "no_active_playlist";
    case ErrorCode::Unvalidated: return "unvalidated";
    case ErrorCode::UpstreamUnavailable: return "upstream_unavailable";
    case ErrorCode::UpstreamRejected: return "upstream_rejected";
    case ErrorCode::PersistenceFailure: return "persistence_failure";
    case ErrorCode::Internal: return "internal";
    }
    return "internal";
}

class RelayError : public std::runtime_error
{
    ErrorCode code_;

public:
    RelayError(ErrorCode code, const std::string &what)
        : std::runtime_error(what), code_(code) {}
    ErrorCode code() const noexcept { return code_; }
};

// Result of a completed operation, as handed back to a control surface.
struct Outcome
{
    bool ok = true;
    ErrorCode code = ErrorCode::None;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    std::string warning;

    static Outcome success(nlohmann::json data = nlohmann::json::object())
    {
        Outcome o;
        o.data = std::move(data);
        return o;
    }
    static Outcome failure(ErrorCode code, std::string message)
    {
        Outcome o;
        o.ok = false;
        o.code = code;
        o.message = std::move(message);
        return o;
    }
    static Outcome from(const RelayError &e) { return failure(e.code(), e.what()); }

    nlohmann::json to_json() const
    {
        if (!ok)
            return nlohmann::json{{"ok", false},
                                  {"error", {{"code", error_code_name(code)}, {"message", message}}}};
        nlohmann::json j{{"ok", true}, {"result", data}};
        if (!warning.empty())
            j["warning"] = warning;
        return j;
    }
};
