/*
 * File: src/relay_osc.hpp
 * Project: OBS Relay
 * Purpose: OSC 1.0 codec and the UDP control bridge (TouchOSC and similar surfaces)
 * Notes:
 *  - Inbound addresses map to commands; state changes go back as /obs/state/* messages
 *  - Feedback is sent to osc.client_host:osc.reply_port (broadcast by default)
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/event.hpp"
#include "common/log.hpp"
#include "relay_broadcast.hpp"
#include "relay_router.hpp"

using OscValue = std::variant<std::int32_t, float, std::string>;

struct OscMessage
{
    std::string address;
    std::vector<OscValue> args;
};

namespace osc
{
    inline void put_padded(std::string &out, const std::string &s)
    {
        out += s;
        out.push_back('\0');
        while (out.size() % 4)
            out.push_back('\0');
    }

    inline void put_u32(std::string &out, std::uint32_t v)
    {
        out.push_back(static_cast<char>((v >> 24) & 0xff));
        out.push_back(static_cast<char>((v >> 16) & 0xff));
        out.push_back(static_cast<char>((v >> 8) & 0xff));
        out.push_back(static_cast<char>(v & 0xff));
    }

    class Reader
    {
        const std::string &buf_;
        std::size_t pos_;
        std::size_t end_;

    public:
        Reader(const std::string &buf, std::size_t pos, std::size_t end) : buf_(buf), pos_(pos), end_(end) {}

        bool done() const { return pos_ >= end_; }
        std::size_t pos() const { return pos_; }

        std::string str()
        {
            auto nul = buf_.find('\0', pos_);
            if (nul == std::string::npos || nul >= end_)
                throw std::invalid_argument("osc: unterminated string");
            std::string s = buf_.substr(pos_, nul - pos_);
            pos_ = (nul + 4) & ~static_cast<std::size_t>(3);
            if (pos_ > end_)
                throw std::invalid_argument("osc: string padding past end");
            return s;
        }

        std::uint32_t u32()
        {
            if (end_ - pos_ < 4)
                throw std::invalid_argument("osc: truncated argument");
            auto b = [&](std::size_t i)
            { return static_cast<std::uint32_t>(static_cast<unsigned char>(buf_[pos_ + i])); };
            std::uint32_t v = (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
            pos_ += 4;
            return v;
        }

        void skip(std::size_t n)
        {
            if (end_ - pos_ < n)
                throw std::invalid_argument("osc: truncated element");
            pos_ += n;
        }
    };

    inline void decode_into(const std::string &buf, std::size_t begin, std::size_t end,
                            std::vector<OscMessage> &out)
    {
        Reader r(buf, begin, end);
        std::string head = r.str();
        if (head == "#bundle")
        {
            r.skip(8); // time tag, executed immediately
            while (!r.done())
            {
                std::uint32_t size = r.u32();
                if (size % 4 || size > end - r.pos())
                    throw std::invalid_argument("osc: bad bundle element size");
                std::size_t at = r.pos();
                decode_into(buf, at, at + size, out);
                r.skip(size);
            }
            return;
        }
        if (head.empty() || head[0] != '/')
            throw std::invalid_argument("osc: address must start with '/'");

        OscMessage m{head, {}};
        std::string tags = r.done() ? std::string(",") : r.str();
        if (tags.empty() || tags[0] != ',')
            throw std::invalid_argument("osc: missing type tag string");
        for (std::size_t i = 1; i < tags.size(); ++i)
        {
            switch (tags[i])
            {
            case 'i':
                m.args.emplace_back(static_cast<std::int32_t>(r.u32()));
                break;
            case 'f':
            {
                std::uint32_t bits = r.u32();
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                m.args.emplace_back(f);
                break;
            }
            case 's':
                m.args.emplace_back(r.str());
                break;
            case 'T':
                m.args.emplace_back(std::int32_t{1});
                break;
            case 'F':
                m.args.emplace_back(std::int32_t{0});
                break;
            default:
                throw std::invalid_argument(std::string("osc: unsupported type tag '") + tags[i] + "'");
            }
        }
        out.push_back(std::move(m));
    }
}

inline std::string encode_osc(const OscMessage &m)
{
    std::string out;
    osc::put_padded(out, m.address);
    std::string tags = ",";
    for (const auto &a : m.args)
        tags.push_back(std::holds_alternative<std::int32_t>(a) ? 'i' : std::holds_alternative<float>(a) ? 'f' : 's');
    osc::put_padded(out, tags);
    for (const auto &a : m.args)
    {
        if (auto i = std::get_if<std::int32_t>(&a))
            osc::put_u32(out, static_cast<std::uint32_t>(*i));
        else if (auto f = std::get_if<float>(&a))
        {
            std::uint32_t bits;
            std::memcpy(&bits, f, sizeof(bits));
            osc::put_u32(out, bits);
        }
        else
            osc::put_padded(out, std::get<std::string>(a));
    }
    return out;
}

// One datagram: a single message or a bundle. Throws std::invalid_argument when malformed.
inline std::vector<OscMessage> decode_osc(const std::string &datagram)
{
    if (datagram.empty() || datagram.size() % 4)
        throw std::invalid_argument("osc: datagram size must be a non-zero multiple of 4");
    std::vector<OscMessage> out;
    osc::decode_into(datagram, 0, datagram.size(), out);
    return out;
}

inline std::optional<long long> osc_int(const OscMessage &m)
{
    if (m.args.empty())
        return std::nullopt;
    if (auto i = std::get_if<std::int32_t>(&m.args[0]))
        return *i;
    if (auto f = std::get_if<float>(&m.args[0]))
        return static_cast<long long>(*f);
    return std::nullopt;
}

// Address map. Returns the command document, or nullopt for unmapped addresses.
inline std::optional<nlohmann::json> osc_to_command(const OscMessage &m)
{
    using nlohmann::json;
    const std::string &a = m.address;
    auto tail = [&](const std::string &prefix) -> std::optional<std::string>
    {
        if (a.size() <= prefix.size() || a.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;
        return a.substr(prefix.size());
    };
    auto cmd = [](const char *name, json params = json::object())
    { return json{{"cmd", name}, {"params", std::move(params)}}; };

    // Momentary buttons send 1 on press and 0 on release; only the press acts.
    if (!m.args.empty() && osc_int(m) == 0LL && a != "/obs/autoadvance" && a != "/obs/playlist/seek")
        return std::nullopt;

    if (a == "/obs/playlist/next")
        return cmd("playlist_next");
    if (a == "/obs/playlist/prev")
        return cmd("playlist_prev");
    if (a == "/obs/playlist/seek")
    {
        auto pos = osc_int(m);
        if (!pos)
            return std::nullopt;
        return cmd("playlist_seek", {{"position", *pos}});
    }
    if (auto name = tail("/obs/playlist/activate/"))
        return cmd("playlist_activate", {{"name", *name}});
    if (auto preset = tail("/obs/scene/"))
        return cmd("activate_preset", {{"name", *preset}});
    if (a == "/obs/stream/start")
        return cmd("stream_start");
    if (a == "/obs/stream/stop")
        return cmd("stream_stop");
    if (a == "/obs/record/start")
        return cmd("record_start");
    if (a == "/obs/record/stop")
        return cmd("record_stop");
    if (a == "/obs/autoadvance")
        return cmd("set_auto_advance", {{"enabled", osc_int(m).value_or(1) != 0}});
    if (a == "/obs/overlay/show")
        return cmd("overlay_trigger");
    if (a == "/obs/overlay/hide")
        return cmd("overlay_hide");
    return std::nullopt;
}

// Feedback messages for one bus event (may be none).
inline std::vector<OscMessage> event_to_osc(const Event &ev)
{
    const auto &d = ev.data;
    auto s = [&](const char *key)
    { return OscValue(d.value(key, std::string())); };
    switch (ev.type)
    {
    case EventType::SceneSwitched:
    case EventType::SceneChangedExternal:
    case EventType::PresetActivated:
        return {{"/obs/state/scene", {s("scene")}}};
    case EventType::StreamStarted:
        return {{"/obs/state/stream", {std::int32_t{1}}}};
    case EventType::StreamStopped:
        return {{"/obs/state/stream", {std::int32_t{0}}}};
    case EventType::RecordingStarted:
        return {{"/obs/state/record", {std::int32_t{1}}}};
    case EventType::RecordingStopped:
        return {{"/obs/state/record", {std::int32_t{0}}}};
    case EventType::PlaylistActivated:
        return {{"/obs/state/playlist", {s("playlist")}}, {"/obs/state/track", {s("track")}}};
    case EventType::TrackChanged:
        return {{"/obs/state/track", {s("track")}}};
    case EventType::SessionConnected:
        return {{"/obs/state/connected", {std::int32_t{1}}}};
    case EventType::SessionDisconnected:
        return {{"/obs/state/connected", {std::int32_t{0}}}};
    case EventType::OverlayTriggered:
        return {{"/obs/state/overlay", {std::int32_t{1}}}};
    case EventType::OverlayHidden:
        return {{"/obs/state/overlay", {std::int32_t{0}}}};
    default:
        return {};
    }
}

// get_status snapshot -> full state feedback.
inline std::vector<OscMessage> status_to_osc(const nlohmann::json &status)
{
    std::vector<OscMessage> out;
    const auto session = status.value("session", nlohmann::json::object());
    out.push_back({"/obs/state/connected", {std::int32_t{session.value("connected", false) ? 1 : 0}}});
    if (status.contains("scene") && status["scene"].is_string())
        out.push_back({"/obs/state/scene", {status["scene"].get<std::string>()}});
    const auto pl = status.value("playlist", nlohmann::json::object());
    if (pl.contains("active_playlist") && pl["active_playlist"].is_string())
        out.push_back({"/obs/state/playlist", {pl["active_playlist"].get<std::string>()}});
    if (pl.contains("current_item") && pl["current_item"].is_object())
        out.push_back({"/obs/state/track", {pl["current_item"].value("title", std::string())}});
    return out;
}

class OscBridge
{
    using udp = boost::asio::ip::udp;

public:
    OscBridge(boost::asio::io_context &ioc, udp::endpoint listen, udp::endpoint reply,
              CommandRouter &router, Broadcaster &broadcaster, std::size_t queue_capacity,
              std::optional<std::string> credential)
        : ioc_(ioc), socket_(std::make_shared<udp::socket>(ioc)), listen_(listen), reply_(reply),
          router_(router), broadcaster_(broadcaster), capacity_(queue_capacity),
          credential_(std::move(credential)) {}

    ~OscBridge() { stop(); }

    OscBridge(const OscBridge &) = delete;
    OscBridge &operator=(const OscBridge &) = delete;

    // Throws boost::system::system_error when the port cannot be bound.
    void start()
    {
        socket_->open(listen_.protocol());
        socket_->set_option(boost::asio::socket_base::reuse_address(true));
        socket_->set_option(boost::asio::socket_base::broadcast(true));
        socket_->bind(listen_);
        if (credential_ && !router_.present_credential(kOrigin, *credential_))
            Log::warn("osc", "bridge credential rejected; commands will fail auth");
        feedback_ = std::make_shared<Feedback>(ioc_, socket_, reply_, capacity_);
        broadcaster_.add(feedback_);
        Log::info("osc", "listening on " + listen_.address().to_string() + ":" + std::to_string(listen_.port()) +
                             " -> feedback to " + reply_.address().to_string() + ":" + std::to_string(reply_.port()));
        do_receive();
    }

    void stop()
    {
        if (!socket_->is_open())
            return;
        boost::system::error_code ignored;
        socket_->close(ignored);
        if (feedback_)
        {
            broadcaster_.remove(feedback_->id());
            feedback_->close();
        }
        router_.forget(kOrigin);
        Log::info("osc", "bridge stopped");
    }

    void handle_datagram(const std::string &datagram)
    {
        std::vector<OscMessage> msgs;
        try
        {
            msgs = decode_osc(datagram);
        }
        catch (const std::invalid_argument &e)
        {
            Log::debug("osc", std::string("dropping datagram: ") + e.what());
            return;
        }
        for (const auto &m : msgs)
            handle_message(m);
    }

private:
    static constexpr const char *kOrigin = "osc";

    class Feedback : public Subscriber, public std::enable_shared_from_this<Feedback>
    {
    public:
        Feedback(boost::asio::io_context &ioc, std::shared_ptr<udp::socket> socket, udp::endpoint to,
                 std::size_t capacity)
            : Subscriber("osc-feedback", capacity), ioc_(ioc), socket_(std::move(socket)), to_(to) {}

        bool is_open() const override { return open_ && socket_->is_open(); }
        void close() override { open_ = false; }

        void send(const std::vector<OscMessage> &msgs)
        {
            for (const auto &m : msgs)
            {
                auto bytes = std::make_shared<std::string>(encode_osc(m));
                socket_->async_send_to(boost::asio::buffer(*bytes), to_, [bytes](boost::system::error_code ec, std::size_t)
                                       {
                    if (ec) Log::debug("osc", "feedback send failed: " + ec.message()); });
            }
        }

    protected:
        void on_ready() override
        {
            auto self = shared_from_this();
            boost::asio::post(ioc_, [self]
                              {
                while (auto ev = self->next())
                    if (self->is_open()) self->send(event_to_osc(*ev)); });
        }

    private:
        boost::asio::io_context &ioc_;
        std::shared_ptr<udp::socket> socket_;
        udp::endpoint to_;
        std::atomic<bool> open_{true};
    };

    void do_receive()
    {
        socket_->async_receive_from(boost::asio::buffer(rx_), sender_, [this](boost::system::error_code ec, std::size_t n)
                                    {
            if (ec == boost::asio::error::operation_aborted || !socket_->is_open())
                return;
            if (!ec)
                handle_datagram(std::string(rx_.data(), n));
            do_receive(); });
    }

    void handle_message(const OscMessage &m)
    {
        if (m.address == "/obs/state/query")
        {
            auto fb = feedback_;
            router_.handle({{"cmd", "get_status"}}, kOrigin, [fb](const Outcome &o)
                           {
                if (o.ok && fb) fb->send(status_to_osc(o.data)); });
            return;
        }
        auto cmd = osc_to_command(m);
        if (!cmd)
        {
            Log::debug("osc", "unhandled " + m.address);
            return;
        }
        Log::info("osc", m.address + " -> " + (*cmd)["cmd"].get<std::string>());
        std::string address = m.address;
        router_.handle(*cmd, kOrigin, [address](const Outcome &o)
                       {
            if (!o.ok)
                Log::warn("osc", address + ": " + error_code_name(o.code) + ": " + o.message);
            else if (!o.warning.empty())
                Log::warn("osc", address + ": " + o.warning); });
    }

    boost::asio::io_context &ioc_;
    std::shared_ptr<udp::socket> socket_;
    udp::endpoint listen_;
    udp::endpoint reply_;
    udp::endpoint sender_;
    std::array<char, 2048> rx_{};
    CommandRouter &router_;
    Broadcaster &broadcaster_;
    std::size_t capacity_;
    std::optional<std::string> credential_;
    std::shared_ptr<Feedback> feedback_;
};
