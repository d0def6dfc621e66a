/*
 * File: src/relay_broadcast.hpp
 * Project: OBS Relay
 * Purpose: Fan-out of bus events to connected clients and bridges
 * Notes:
 *  - Subscribers are owned by their adapter; the broadcaster keeps weak registrations
 *  - offer() never blocks: bounded queue, oldest entry dropped on overflow
 *  - Expired or closed subscribers are unregistered on the next delivery
 * Last updated: 2026-10-17
 */

#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/event.hpp"
#include "common/log.hpp"
#include "relay_bus.hpp"

class Subscriber
{
public:
    Subscriber(std::string id, std::size_t capacity) : id_(std::move(id)), capacity_(capacity ? capacity : 1) {}
    virtual ~Subscriber() = default;

    Subscriber(const Subscriber &) = delete;
    Subscriber &operator=(const Subscriber &) = delete;

    const std::string &id() const { return id_; }

    // Queues ev for this subscriber. Returns false if the transport is gone.
    bool offer(const Event &ev)
    {
        if (!is_open())
            return false;
        {
            std::scoped_lock lk(mtx_);
            if (queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(ev);
        }
        on_ready();
        return true;
    }

    std::optional<Event> next()
    {
        std::scoped_lock lk(mtx_);
        if (queue_.empty())
            return std::nullopt;
        Event ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    std::size_t queued() const
    {
        std::scoped_lock lk(mtx_);
        return queue_.size();
    }

    std::uint64_t dropped() const
    {
        std::scoped_lock lk(mtx_);
        return dropped_;
    }

    virtual bool is_open() const = 0;
    virtual void close() = 0;

protected:
    // Something was queued; the adapter schedules its own write.
    virtual void on_ready() = 0;

private:
    std::string id_;
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<Event> queue_;
    std::uint64_t dropped_ = 0;
};

class Broadcaster
{
public:
    explicit Broadcaster(EventBus &bus) : bus_(bus)
    {
        token_ = bus_.subscribe_all([this](const Event &ev)
                                    { publish(ev); });
    }
    ~Broadcaster() { bus_.unsubscribe(token_); }

    Broadcaster(const Broadcaster &) = delete;
    Broadcaster &operator=(const Broadcaster &) = delete;

    void add(const std::shared_ptr<Subscriber> &s)
    {
        std::scoped_lock lk(mtx_);
        subs_.push_back(s);
        Log::info("broadcast", "subscriber " + s->id() + " registered (" + std::to_string(subs_.size()) + " total)");
    }

    void remove(const std::string &id)
    {
        std::scoped_lock lk(mtx_);
        for (auto it = subs_.begin(); it != subs_.end(); ++it)
        {
            auto s = it->lock();
            if (s && s->id() == id)
            {
                subs_.erase(it);
                Log::info("broadcast", "subscriber " + id + " unregistered");
                return;
            }
        }
    }

    void publish(const Event &ev)
    {
        std::vector<std::shared_ptr<Subscriber>> live;
        {
            std::scoped_lock lk(mtx_);
            live.reserve(subs_.size());
            for (auto it = subs_.begin(); it != subs_.end();)
            {
                if (auto s = it->lock())
                {
                    live.push_back(std::move(s));
                    ++it;
                }
                else
                    it = subs_.erase(it);
            }
        }
        for (const auto &s : live)
        {
            if (!s->offer(ev))
            {
                Log::info("broadcast", "delivery to " + s->id() + " failed, unregistering");
                remove(s->id());
            }
        }
    }

    // Shutdown: close every transport and forget all registrations.
    void close_all()
    {
        std::vector<std::weak_ptr<Subscriber>> subs;
        {
            std::scoped_lock lk(mtx_);
            subs.swap(subs_);
        }
        for (auto &w : subs)
            if (auto s = w.lock())
                s->close();
        Log::info("broadcast", "closed " + std::to_string(subs.size()) + " subscribers");
    }

    std::size_t count() const
    {
        std::scoped_lock lk(mtx_);
        std::size_t n = 0;
        for (const auto &w : subs_)
            n += w.expired() ? 0 : 1;
        return n;
    }

private:
    EventBus &bus_;
    EventBus::Token token_ = 0;
    mutable std::mutex mtx_;
    std::vector<std::weak_ptr<Subscriber>> subs_;
};
