/*
 * File: src/relay_ws.hpp
 * Project: OBS Relay
 * Purpose: WebSocket control surface: commands in, replies and events out
 * Notes:
 *  - Credential: ?token=<key> on the upgrade target or "Authorization: Bearer <key>"
 *  - Replies go straight to the requesting client; events arrive through its broadcast queue
 *  - One write in flight per client; replies are written before queued events
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "relay_broadcast.hpp"
#include "relay_state.hpp"

namespace websocket = boost::beast::websocket;

constexpr const char *kRelayVersion = "1.1.0";

// Value of one query parameter in a request target ("/ws?token=abc&x=1").
inline std::string query_param(const std::string &target, const std::string &key)
{
    auto q = target.find('?');
    if (q == std::string::npos)
        return {};
    std::string qs = target.substr(q + 1);
    std::size_t pos = 0;
    while (pos <= qs.size())
    {
        auto amp = qs.find('&', pos);
        std::string kv = qs.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = kv.find('=');
        if (kv.substr(0, eq) == key)
            return eq == std::string::npos ? std::string() : kv.substr(eq + 1);
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    return {};
}

class WsServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    RelayState &state_;

public:
    // Throws boost::system::system_error when the endpoint cannot be bound.
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        Log::info("ws", "listening on " + ep.address().to_string() + ":" + std::to_string(port()));
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

    class Session : public Subscriber, public std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws_;
        boost::beast::flat_buffer buffer_;
        boost::beast::http::request<boost::beast::http::string_body> upgrade_;
        RelayState &state_;
        std::deque<std::string> replies_;
        std::string in_flight_;
        bool writing_ = false;
        std::atomic<bool> open_{false};

    public:
        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : Subscriber("ws-" + std::to_string(next_id()), static_cast<std::size_t>(st.cfg.broadcast.queue_capacity)),
              ws_(std::move(s)), state_(st) {}

        static std::uint64_t next_id()
        {
            static std::atomic<std::uint64_t> seq{1};
            return seq.fetch_add(1);
        }

        bool is_open() const override { return open_; }

        void close() override
        {
            if (!open_.exchange(false))
                return;
            auto self = shared_from_this();
            boost::asio::post(ws_.get_executor(), [self]
                              { self->ws_.async_close(websocket::close_code::going_away, [self](auto) {}); });
        }

        void run()
        {
            auto self = shared_from_this();
            boost::beast::http::async_read(ws_.next_layer(), buffer_, upgrade_, [self](auto ec, auto)
                                           {
                if (ec) return;
                if (!websocket::is_upgrade(self->upgrade_))
                {
                    Log::debug("ws", "non-upgrade request dropped");
                    return;
                }
                self->accept(); });
        }

    protected:
        void on_ready() override
        {
            auto self = shared_from_this();
            boost::asio::post(ws_.get_executor(), [self]
                              { self->pump(); });
        }

    private:
        void accept()
        {
            std::string target(upgrade_.target());
            std::string token = query_param(target, "token");
            if (token.empty())
                token = bearer_token(std::string(upgrade_[boost::beast::http::field::authorization]));
            bool ok = state_.router.present_credential(id(), token);

            ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws_.async_accept(upgrade_, [self, ok](auto ec)
                             {
                if (ec) return;
                if (!ok)
                {
                    Log::warn("ws", self->id() + " unauthorized, closing");
                    self->ws_.async_close(websocket::close_reason(static_cast<websocket::close_code>(4001), "Unauthorized"), [self](auto) {});
                    return;
                }
                self->opened(); });
        }

        void opened()
        {
            open_ = true;
            state_.broadcaster.add(shared_from_this());
            Log::info("ws", id() + " connected");
            send_direct(nlohmann::json{{"event", "connected"},
                                       {"data", {{"client_id", id()},
                                                 {"obs_connected", state_.session.healthy()},
                                                 {"version", kRelayVersion}}},
                                       {"ts", iso8601_now_ms()}});
            do_read();
        }

        void finished()
        {
            open_ = false;
            state_.broadcaster.remove(id());
            state_.router.forget(id());
            Log::info("ws", id() + " disconnected (dropped " + std::to_string(dropped()) + " events)");
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws_.async_read(buffer_, [self](auto ec, auto)
                           {
                if (ec)
                    return self->finished();
                auto text = boost::beast::buffers_to_string(self->buffer_.data());
                self->buffer_.consume(self->buffer_.size());
                self->on_msg(text);
                self->do_read(); });
        }

        void on_msg(const std::string &text)
        {
            auto msg = nlohmann::json::parse(text, nullptr, false);
            nlohmann::json request_id = msg.is_object() && msg.contains("id") ? msg["id"] : nlohmann::json();
            if (msg.is_discarded())
            {
                if (!state_.router.authorized(id()))
                    return send_direct(Outcome::failure(ErrorCode::AuthError, "missing or invalid credential").to_json());
                return send_direct(Outcome::failure(ErrorCode::SchemaError, "invalid JSON").to_json());
            }
            auto self = shared_from_this();
            state_.router.handle(msg, id(), [self, request_id](const Outcome &o)
                                 {
                auto reply = o.to_json();
                if (!request_id.is_null())
                    reply["id"] = request_id;
                boost::asio::post(self->ws_.get_executor(), [self, reply]
                                  { self->send_direct(reply); }); });
        }

        void send_direct(const nlohmann::json &j)
        {
            replies_.push_back(j.dump());
            pump();
        }

        // Replies first, then queued events, one frame at a time.
        void pump()
        {
            if (writing_ || !open_)
                return;
            if (!replies_.empty())
            {
                in_flight_ = std::move(replies_.front());
                replies_.pop_front();
            }
            else if (auto ev = next())
                in_flight_ = event_to_json(*ev).dump();
            else
                return;

            writing_ = true;
            ws_.text(true);
            auto self = shared_from_this();
            ws_.async_write(boost::asio::buffer(in_flight_), [self](auto ec, auto)
                            {
                self->writing_ = false;
                if (ec)
                {
                    Log::debug("ws", self->id() + " write failed: " + ec.message());
                    self->open_ = false;
                    return;
                }
                self->pump(); });
        }
    };
};
