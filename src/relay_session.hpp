/*
 * File: src/relay_session.hpp
 * Project: OBS Relay
 * Purpose: Supervisor of the single logical upstream session
 * Notes:
 *  - Disconnected -> Connecting -> Connected -> Reconnecting -> Connecting ...
 *  - Reconnecting -> Disconnected once max attempts (max > 0) are exhausted; retry() restarts
 *  - Every transition is published as session_connected / session_disconnected
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "common/relay_error.hpp"
#include "obs_protocol.hpp"
#include "relay_bus.hpp"
#include "relay_upstream.hpp"

enum class SessionState { Disconnected, Connecting, Connected, Reconnecting };

inline const char *session_state_name(SessionState s)
{
    switch (s)
    {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting: return "connecting";
    case SessionState::Connected: return "connected";
    case SessionState::Reconnecting: return "reconnecting";
    }
    return "disconnected";
}

struct SessionConfig
{
    std::string password;
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds max_reconnect_interval{60000};
    bool exponential_backoff = false;
    unsigned max_reconnect_attempts = 10; // 0 = retry forever
    std::chrono::milliseconds handshake_timeout{5000};
};

using ReplyHandler = std::function<void(const Outcome &)>;

class SessionSupervisor
{
public:
    SessionSupervisor(boost::asio::io_context &ioc, EventBus &bus, SessionConfig cfg, LinkFactory factory)
        : ioc_(ioc), bus_(bus), cfg_(std::move(cfg)), factory_(std::move(factory)),
          backoff_timer_(ioc), handshake_timer_(ioc) {}

    SessionSupervisor(const SessionSupervisor &) = delete;
    SessionSupervisor &operator=(const SessionSupervisor &) = delete;

    // Starts a connection attempt from Disconnected. Ignored in any other state.
    void connect()
    {
        std::uint64_t gen;
        {
            std::scoped_lock lk(mtx_);
            if (stopping_ || state_ != SessionState::Disconnected)
                return;
            attempts_ = 0;
            state_ = SessionState::Connecting;
            gen = ++gen_;
        }
        Log::info("session", "connecting (attempt 1)");
        emit(SessionState::Connecting, {});
        boost::asio::post(ioc_, [this, gen]
                          { open_link(gen); });
    }

    // Manual intervention after max attempts were exhausted.
    void retry()
    {
        Log::info("session", "manual retry requested");
        connect();
    }

    // Cancels backoff and handshake waits, closes the link, fails pending requests.
    void shutdown()
    {
        std::shared_ptr<UpstreamLink> link;
        std::map<std::string, ReplyHandler> pending;
        bool was_connected;
        {
            std::scoped_lock lk(mtx_);
            if (stopping_)
                return;
            stopping_ = true;
            was_connected = state_ == SessionState::Connected;
            state_ = SessionState::Disconnected;
            ++gen_;
            link = std::move(link_);
            pending.swap(pending_);
        }
        boost::asio::post(ioc_, [this]
                          {
            backoff_timer_.cancel();
            handshake_timer_.cancel(); });
        if (link)
            link->close();
        fail_all(pending, "session shut down");
        if (was_connected)
            emit(SessionState::Disconnected, {{"reason", "shutdown"}});
        Log::info("session", "shut down");
    }

    // Issues one upstream request. Throws RelayError(UpstreamUnavailable) unless Connected.
    void send(const std::string &request_type, const nlohmann::json &data, ReplyHandler done)
    {
        auto [id, link] = reserve(std::move(done), request_type);
        Log::debug("session", "request " + request_type + " id=" + id);
        link->write(obs::make_request(request_type, id, data).dump());
    }

    // Issues several requests as one upstream operation.
    void send_batch(const obs::RequestList &requests, ReplyHandler done)
    {
        auto [id, link] = reserve(std::move(done), "RequestBatch");
        Log::debug("session", "batch of " + std::to_string(requests.size()) + " id=" + id);
        link->write(obs::make_batch(requests, id).dump());
    }

    SessionState current_state() const
    {
        std::scoped_lock lk(mtx_);
        return state_;
    }

    bool healthy() const { return current_state() == SessionState::Connected; }

    unsigned attempts() const
    {
        std::scoped_lock lk(mtx_);
        return attempts_;
    }

    nlohmann::json status() const
    {
        std::scoped_lock lk(mtx_);
        return nlohmann::json{{"state", session_state_name(state_)},
                              {"connected", state_ == SessionState::Connected},
                              {"attempts", attempts_},
                              {"max_attempts", cfg_.max_reconnect_attempts}};
    }

    // Wait before the attempt that follows `failed` consecutive failures.
    std::chrono::milliseconds backoff_delay(unsigned failed) const
    {
        if (!cfg_.exponential_backoff || failed <= 1)
            return cfg_.reconnect_interval;
        auto d = cfg_.reconnect_interval;
        for (unsigned i = 1; i < failed && d < cfg_.max_reconnect_interval; ++i)
            d *= 2;
        return std::min(d, cfg_.max_reconnect_interval);
    }

private:
    std::pair<std::string, std::shared_ptr<UpstreamLink>> reserve(ReplyHandler done, const std::string &what)
    {
        std::scoped_lock lk(mtx_);
        if (state_ != SessionState::Connected || !link_)
            throw RelayError(ErrorCode::UpstreamUnavailable,
                             what + ": upstream session is " + session_state_name(state_));
        std::string id = "relay-" + std::to_string(++next_request_);
        pending_[id] = std::move(done);
        return {id, link_};
    }

    void emit(SessionState s, nlohmann::json extra)
    {
        extra["state"] = session_state_name(s);
        {
            std::scoped_lock lk(mtx_);
            extra["attempts"] = attempts_;
        }
        bus_.publish(Event(s == SessionState::Connected ? EventType::SessionConnected
                                                        : EventType::SessionDisconnected,
                           std::move(extra)));
    }

    void open_link(std::uint64_t gen)
    {
        std::shared_ptr<UpstreamLink> link = factory_();
        {
            std::scoped_lock lk(mtx_);
            if (gen != gen_ || state_ != SessionState::Connecting)
                return;
            link_ = link;
        }
        handshake_timer_.expires_after(cfg_.handshake_timeout);
        handshake_timer_.async_wait([this, gen](boost::system::error_code ec)
                                    {
            if (!ec) attempt_failed(gen, "handshake timeout"); });

        UpstreamLink::Handlers h;
        h.on_open = [this, gen](boost::system::error_code ec)
        {
            if (ec)
                attempt_failed(gen, ec.message());
        };
        h.on_message = [this, gen](const std::string &text)
        { on_frame(gen, text); };
        h.on_close = [this, gen](boost::system::error_code ec)
        { on_link_closed(gen, ec.message()); };
        link->open(std::move(h));
    }

    void on_frame(std::uint64_t gen, const std::string &text)
    {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("op") || !j.contains("d"))
        {
            Log::warn("session", "dropping malformed upstream frame");
            return;
        }
        try
        {
            switch (j["op"].get<int>())
            {
            case obs::Hello:
                on_hello(gen, j);
                break;
            case obs::Identified:
                on_identified(gen);
                break;
            case obs::Event:
                on_event(j["d"]);
                break;
            case obs::RequestResponse:
                on_response(j["d"]);
                break;
            case obs::RequestBatchResponse:
                on_batch_response(j["d"]);
                break;
            default:
                break;
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            Log::warn("session", std::string("bad upstream message: ") + e.what());
        }
    }

    void on_hello(std::uint64_t gen, const nlohmann::json &hello)
    {
        std::shared_ptr<UpstreamLink> link;
        {
            std::scoped_lock lk(mtx_);
            if (gen != gen_ || state_ != SessionState::Connecting)
                return;
            link = link_;
        }
        if (hello["d"].contains("authentication") && cfg_.password.empty())
            Log::warn("session", "upstream requires a password but none is configured");
        link->write(obs::make_identify(hello, cfg_.password).dump());
    }

    void on_identified(std::uint64_t gen)
    {
        {
            std::scoped_lock lk(mtx_);
            if (gen != gen_ || state_ != SessionState::Connecting)
                return;
            state_ = SessionState::Connected;
            attempts_ = 0;
        }
        handshake_timer_.cancel();
        Log::info("session", "connected");
        emit(SessionState::Connected, {});
    }

    void on_event(const nlohmann::json &d)
    {
        std::string type = d.value("eventType", std::string());
        nlohmann::json data = d.contains("eventData") ? d["eventData"] : nlohmann::json::object();
        Log::debug("session", "upstream event " + type);
        bus_.publish(Event(EventType::ExternalStateChanged, {{"type", type}, {"data", data}}));
    }

    ReplyHandler take_pending(const std::string &id)
    {
        std::scoped_lock lk(mtx_);
        auto it = pending_.find(id);
        if (it == pending_.end())
            return nullptr;
        ReplyHandler h = std::move(it->second);
        pending_.erase(it);
        return h;
    }

    static Outcome status_outcome(const nlohmann::json &r)
    {
        const auto &st = r.at("requestStatus");
        if (st.value("result", false))
            return Outcome::success(r.contains("responseData") ? r["responseData"] : nlohmann::json::object());
        std::string msg = r.value("requestType", std::string("request")) + " failed (code " +
                          std::to_string(st.value("code", 0)) + ")";
        if (st.contains("comment"))
            msg += ": " + st["comment"].get<std::string>();
        return Outcome::failure(ErrorCode::UpstreamRejected, msg);
    }

    void on_response(const nlohmann::json &d)
    {
        auto h = take_pending(d.value("requestId", std::string()));
        if (!h)
            return;
        h(status_outcome(d));
    }

    void on_batch_response(const nlohmann::json &d)
    {
        auto h = take_pending(d.value("requestId", std::string()));
        if (!h)
            return;
        auto results = nlohmann::json::array();
        for (const auto &r : d.value("results", nlohmann::json::array()))
        {
            Outcome o = status_outcome(r);
            if (!o.ok)
                return h(o);
            results.push_back(o.data);
        }
        h(Outcome::success({{"results", results}}));
    }

    void attempt_failed(std::uint64_t gen, const std::string &reason)
    {
        std::shared_ptr<UpstreamLink> link;
        SessionState next;
        unsigned attempts;
        {
            std::scoped_lock lk(mtx_);
            if (gen != gen_ || state_ != SessionState::Connecting)
                return;
            link = std::move(link_);
            ++attempts_;
            attempts = attempts_;
            bool exhausted = cfg_.max_reconnect_attempts > 0 && attempts_ >= cfg_.max_reconnect_attempts;
            next = exhausted ? SessionState::Disconnected : SessionState::Reconnecting;
            state_ = next;
        }
        handshake_timer_.cancel();
        if (link)
            link->close();
        if (next == SessionState::Disconnected)
        {
            Log::error("session", "giving up after " + std::to_string(attempts) + " attempts: " + reason);
            emit(next, {{"reason", reason}, {"terminal", true}});
            return;
        }
        auto delay = backoff_delay(attempts);
        Log::warn("session", "attempt " + std::to_string(attempts) + " failed (" + reason + "), retry in " +
                                 std::to_string(delay.count()) + " ms");
        emit(next, {{"reason", reason}, {"retry_in_ms", delay.count()}});
        schedule_retry(delay);
    }

    void on_link_closed(std::uint64_t gen, const std::string &reason)
    {
        std::map<std::string, ReplyHandler> pending;
        bool during_handshake = false;
        {
            std::scoped_lock lk(mtx_);
            if (gen != gen_)
                return;
            if (state_ == SessionState::Connecting)
                during_handshake = true;
            else if (state_ == SessionState::Connected)
            {
                state_ = SessionState::Reconnecting;
                link_.reset();
                pending.swap(pending_);
            }
            else
                return;
        }
        if (during_handshake)
            return attempt_failed(gen, reason);

        fail_all(pending, "upstream connection lost");
        Log::warn("session", "upstream connection lost: " + reason);
        emit(SessionState::Reconnecting, {{"reason", reason}});
        schedule_retry(backoff_delay(0));
    }

    void schedule_retry(std::chrono::milliseconds delay)
    {
        std::uint64_t gen;
        {
            std::scoped_lock lk(mtx_);
            gen = gen_;
        }
        backoff_timer_.expires_after(delay);
        backoff_timer_.async_wait([this, gen](boost::system::error_code ec)
                                  {
            if (ec) return;
            begin_attempt(gen); });
    }

    void begin_attempt(std::uint64_t expected_gen)
    {
        std::uint64_t gen;
        unsigned attempt;
        {
            std::scoped_lock lk(mtx_);
            if (stopping_ || expected_gen != gen_ || state_ != SessionState::Reconnecting)
                return;
            state_ = SessionState::Connecting;
            gen = ++gen_;
            attempt = attempts_ + 1;
        }
        Log::info("session", "connecting (attempt " + std::to_string(attempt) + ")");
        emit(SessionState::Connecting, {});
        open_link(gen);
    }

    static void fail_all(std::map<std::string, ReplyHandler> &pending, const std::string &why)
    {
        for (auto &[id, h] : pending)
            if (h)
                h(Outcome::failure(ErrorCode::UpstreamUnavailable, why));
    }

    boost::asio::io_context &ioc_;
    EventBus &bus_;
    SessionConfig cfg_;
    LinkFactory factory_;
    boost::asio::steady_timer backoff_timer_;
    boost::asio::steady_timer handshake_timer_;

    mutable std::mutex mtx_;
    SessionState state_ = SessionState::Disconnected;
    unsigned attempts_ = 0;
    std::uint64_t gen_ = 0;
    std::uint64_t next_request_ = 0;
    bool stopping_ = false;
    std::shared_ptr<UpstreamLink> link_;
    std::map<std::string, ReplyHandler> pending_;
};
