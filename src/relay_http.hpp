/*
 * File: src/relay_http.hpp
 * Project: OBS Relay
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - /health and /healthz are unauthenticated; /v1/* needs "Authorization: Bearer <key>" when api.api_key is set
 *  - Every /v1 call goes through the command router; errors map to HTTP status codes
 *  - One request per connection
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "common/log.hpp"
#include "common/relay_error.hpp"
#include "relay_state.hpp"

namespace http = boost::beast::http;

inline http::status http_status_for(const Outcome &o)
{
    if (o.ok)
        return http::status::ok;
    switch (o.code)
    {
    case ErrorCode::SchemaError: return http::status::bad_request;
    case ErrorCode::AuthError: return http::status::unauthorized;
    case ErrorCode::NotFound: return http::status::not_found;
    case ErrorCode::NoActivePlaylist:
    case ErrorCode::Unvalidated: return http::status::conflict;
    case ErrorCode::OutOfRange: return http::status::unprocessable_entity;
    case ErrorCode::UpstreamUnavailable: return http::status::service_unavailable;
    default: return http::status::internal_server_error;
    }
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    RelayState &state_;

public:
    // Throws boost::system::system_error when the endpoint cannot be bound.
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        Log::info("http", "listening on " + ep.address().to_string() + ":" + std::to_string(port()));
        do_accept();
    }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                return;
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        RelayState &state;
        std::string origin;

        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : socket(std::move(s)), state(st), origin("http-" + std::to_string(next_id()))
        {
        }

        static std::uint64_t next_id()
        {
            static std::atomic<std::uint64_t> seq{1};
            return seq.fetch_add(1);
        }

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::status status, const nlohmann::json &body)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(status, req.version());
            sp->set(http::field::server, "obs-relay");
            sp->set(http::field::content_type, "application/json");
            sp->body() = body.dump();
            sp->prepare_payload();

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void reply(const Outcome &o)
        {
            state.router.forget(origin);
            if (!o.ok)
                Log::debug("http", std::string(req.target()) + " -> " + error_code_name(o.code));
            respond(http_status_for(o), o.to_json());
        }

        bool authorized()
        {
            return state.router.present_credential(origin, bearer_token(std::string(req[http::field::authorization])));
        }

        void deny() { reply(Outcome::failure(ErrorCode::AuthError, "missing or invalid credential")); }

        // Credential check, then the command, then the reply.
        void command(const nlohmann::json &cmd)
        {
            if (!authorized())
                return deny();
            auto self = shared_from_this();
            state.router.handle(cmd, origin, [self](const Outcome &o)
                                { self->reply(o); });
        }

        void handle()
        {
            using nlohmann::json;
            const auto target = std::string(req.target());
            const bool get = req.method() == http::verb::get;
            const bool post = req.method() == http::verb::post;

            // GET /health
            if (get && target == "/health")
            {
                return respond(http::status::ok, json{{"status", "ok"},
                                                      {"session", session_state_name(state.session.current_state())},
                                                      {"connected", state.session.healthy()},
                                                      {"subscribers", state.broadcaster.count()},
                                                      {"uptime_s", state.uptime_s()}});
            }

            // GET /healthz (liveness for external monitors)
            if (get && target == "/healthz")
            {
                bool up = state.session.healthy();
                return respond(up ? http::status::ok : http::status::service_unavailable,
                               json{{"status", up ? "healthy" : "unhealthy"},
                                    {"session", session_state_name(state.session.current_state())}});
            }

            // GET /v1/status
            if (get && target == "/v1/status")
                return command(json{{"cmd", "get_status"}});

            // GET /v1/playlists/validate
            if (get && target == "/v1/playlists/validate")
                return command(json{{"cmd", "playlist_validate"}});

            // GET /v1/playlists
            if (get && target == "/v1/playlists")
            {
                if (!authorized())
                    return deny();
                auto arr = json::array();
                for (const auto &[name, pl] : state.library.all())
                    arr.push_back(playlist_to_json(pl, true));
                return reply(Outcome::success({{"playlists", arr}}));
            }

            // GET /v1/overlay
            if (get && target == "/v1/overlay")
            {
                if (!authorized())
                    return deny();
                return reply(Outcome::success(state.overlay.status()));
            }

            // POST /v1/command   Body: {"cmd": "...", "params": {...}}
            if (post && target == "/v1/command")
            {
                auto body = json::parse(req.body(), nullptr, false);
                if (body.is_discarded())
                {
                    if (!authorized())
                        return deny();
                    return reply(Outcome::failure(ErrorCode::SchemaError, "body is not valid JSON"));
                }
                return command(body);
            }

            // POST /v1/session/retry
            if (post && target == "/v1/session/retry")
            {
                if (!authorized())
                    return deny();
                state.session.retry();
                return reply(Outcome::success(state.session.status()));
            }

            // 404 fallback
            respond(http::status::not_found, json{{"ok", false},
                                                  {"error", {{"code", "not_found"}, {"message", "no route for " + target}}}});
        }
    };
};
