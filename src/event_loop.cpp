#include "event_loop.hpp"

#include <stdexcept>

namespace qdist
{
    EventBasePtr make_event_base()
    {
        EventBasePtr base(event_base_new(), &event_base_free);
        if (!base)
            throw std::runtime_error("event_base_new failed");
        return base;
    }

    EventPtr make_timer(event_base *base, event_callback_fn cb, void *arg)
    {
        EventPtr ev(evtimer_new(base, cb, arg), &event_free);
        if (!ev)
            throw std::runtime_error("evtimer_new failed");
        return ev;
    }

    timeval to_timeval(std::chrono::microseconds d)
    {
        if (d.count() < 0)
            d = std::chrono::microseconds::zero();
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(d.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(d.count() % 1000000);
        return tv;
    }

    void arm_timer(event *ev, std::chrono::microseconds d)
    {
        timeval tv = to_timeval(d);
        if (evtimer_add(ev, &tv) != 0)
            throw std::runtime_error("evtimer_add failed");
    }
} // namespace qdist
