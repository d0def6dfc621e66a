/*
 * File: src/relay_upstream.hpp
 * Project: OBS Relay
 * Purpose: Text-frame transport to the controlled application
 * Notes:
 *  - UpstreamLink is the seam the session supervisor drives; tests script it
 *  - ObsWebSocketLink: Beast WebSocket client, all callbacks on the io_context thread
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "common/log.hpp"

namespace websocket = boost::beast::websocket;

class UpstreamLink
{
public:
    struct Handlers
    {
        std::function<void(boost::system::error_code)> on_open;
        std::function<void(const std::string &)> on_message;
        std::function<void(boost::system::error_code)> on_close;
    };

    virtual ~UpstreamLink() = default;

    // Starts connecting; exactly one of on_open(error) or on_open(success)...on_close follows.
    virtual void open(Handlers h) = 0;
    virtual void write(std::string frame) = 0;
    virtual void close() = 0;
};

using LinkFactory = std::function<std::shared_ptr<UpstreamLink>()>;

class ObsWebSocketLink : public UpstreamLink, public std::enable_shared_from_this<ObsWebSocketLink>
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::resolver resolver_;
    websocket::stream<boost::asio::ip::tcp::socket> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    std::string host_;
    std::string port_;
    Handlers h_;
    bool open_ = false;
    bool closed_ = false;

public:
    ObsWebSocketLink(boost::asio::io_context &ioc, std::string host, unsigned short port)
        : ioc_(ioc), resolver_(ioc), ws_(ioc), host_(std::move(host)), port_(std::to_string(port)) {}

    void open(Handlers h) override
    {
        h_ = std::move(h);
        auto self = shared_from_this();
        resolver_.async_resolve(host_, port_, [self](auto ec, auto results)
                                {
            if (ec) return self->fail_open(ec);
            boost::asio::async_connect(self->ws_.next_layer(), results, [self](auto ec, auto)
                                       {
                if (ec) return self->fail_open(ec);
                self->ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
                self->ws_.async_handshake(self->host_ + ":" + self->port_, "/", [self](auto ec)
                                          {
                    if (ec) return self->fail_open(ec);
                    self->open_ = true;
                    if (self->h_.on_open) self->h_.on_open({});
                    self->do_read(); }); }); });
    }

    void write(std::string frame) override
    {
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self, f = std::move(frame)]() mutable
                          {
            if (!self->open_ || self->closed_) return;
            self->outbox_.push_back(std::move(f));
            if (self->outbox_.size() == 1) self->do_write(); });
    }

    void close() override
    {
        auto self = shared_from_this();
        boost::asio::post(ioc_, [self]
                          {
            if (self->closed_) return;
            self->closed_ = true;
            self->resolver_.cancel();
            if (self->open_)
            {
                self->ws_.async_close(websocket::close_code::normal, [self](auto)
                                      {
                    boost::system::error_code ignored;
                    self->ws_.next_layer().close(ignored); });
            }
            else
            {
                boost::system::error_code ignored;
                self->ws_.next_layer().close(ignored);
            } });
    }

private:
    void fail_open(boost::system::error_code ec)
    {
        Log::debug("session", "upstream connect failed: " + ec.message());
        if (h_.on_open)
            h_.on_open(ec);
    }

    void do_read()
    {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [self](auto ec, auto)
                       {
            if (ec)
            {
                self->open_ = false;
                if (self->h_.on_close) self->h_.on_close(ec);
                return;
            }
            auto text = boost::beast::buffers_to_string(self->buffer_.data());
            self->buffer_.consume(self->buffer_.size());
            if (self->h_.on_message) self->h_.on_message(text);
            self->do_read(); });
    }

    void do_write()
    {
        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(outbox_.front()), [self](auto ec, auto)
                        {
            if (ec)
            {
                Log::warn("session", "upstream write failed: " + ec.message());
                self->outbox_.clear();
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) self->do_write(); });
    }
};
