/*
 * File: src/relay_bus.hpp
 * Project: OBS Relay
 * Purpose: In-process publish/subscribe channel for internal events
 * Notes:
 *  - Handlers run in registration order, outside the bus lock
 *  - Events are queued; one dispatcher at a time drains the queue in publish order,
 *    so an event published from inside a handler is delivered after the current one
 *  - Handlers must not block; slow consumers queue (see relay_broadcast.hpp)
 * Last updated: 2026-10-17
 */

#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "common/event.hpp"
#include "common/log.hpp"

class EventBus
{
public:
    using Handler = std::function<void(const Event &)>;
    using Token = std::uint64_t;

    // Subscribe to one event type.
    Token subscribe(EventType type, Handler h) { return add(type, std::move(h)); }

    // Subscribe to every event type.
    Token subscribe_all(Handler h) { return add(std::nullopt, std::move(h)); }

    void unsubscribe(Token t)
    {
        std::scoped_lock lk(mtx_);
        for (auto it = subs_.begin(); it != subs_.end(); ++it)
        {
            if (it->token == t)
            {
                subs_.erase(it);
                return;
            }
        }
    }

    void publish(const Event &ev)
    {
        post(ev);
        dispatch();
    }

    // Queues ev behind everything already posted without delivering it.
    void post(const Event &ev)
    {
        std::scoped_lock lk(mtx_);
        pending_.push_back(ev);
    }

    // Delivers queued events until the queue is empty. Returns at once when another
    // caller is already dispatching; that caller delivers them.
    void dispatch()
    {
        {
            std::scoped_lock lk(mtx_);
            if (dispatching_)
                return;
            dispatching_ = true;
        }
        for (;;)
        {
            std::vector<Handler> targets;
            std::optional<Event> next;
            {
                std::scoped_lock lk(mtx_);
                if (pending_.empty())
                {
                    dispatching_ = false;
                    return;
                }
                next.emplace(std::move(pending_.front()));
                pending_.pop_front();
                for (const auto &s : subs_)
                    if (!s.type || *s.type == next->type)
                        targets.push_back(s.handler);
            }
            deliver(*next, targets);
        }
    }

    // Dispatches at scope exit. Declared before a component's own lock, so events
    // posted under that lock are delivered after it is released.
    class DispatchGuard
    {
    public:
        explicit DispatchGuard(EventBus &bus) : bus_(bus) {}
        ~DispatchGuard() { bus_.dispatch(); }
        DispatchGuard(const DispatchGuard &) = delete;
        DispatchGuard &operator=(const DispatchGuard &) = delete;

    private:
        EventBus &bus_;
    };

private:
    static void deliver(const Event &ev, const std::vector<Handler> &targets)
    {
        Log::debug("bus", std::string("publish ") + event_name(ev.type));
        for (const auto &h : targets)
        {
            try
            {
                h(ev);
            }
            catch (const std::exception &e)
            {
                Log::error("bus", std::string("handler for ") + event_name(ev.type) + " threw: " + e.what());
            }
        }
    }

    struct Sub
    {
        Token token;
        std::optional<EventType> type;
        Handler handler;
    };

    Token add(std::optional<EventType> type, Handler h)
    {
        std::scoped_lock lk(mtx_);
        Token t = next_++;
        subs_.push_back(Sub{t, type, std::move(h)});
        return t;
    }

    std::mutex mtx_;
    std::vector<Sub> subs_;
    std::deque<Event> pending_;
    bool dispatching_ = false;
    Token next_ = 1;
};
