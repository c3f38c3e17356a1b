#pragma once
#include <chrono>
#include <memory>
#include <sys/time.h>

#include <event2/event.h>

namespace qdist
{
    using EventBasePtr = std::unique_ptr<event_base, decltype(&event_base_free)>;
    using EventPtr = std::unique_ptr<event, decltype(&event_free)>;

    // Throws std::runtime_error when libevent cannot create a base.
    EventBasePtr make_event_base();

    // Timer event not yet added to the loop. Throws std::runtime_error on failure.
    EventPtr make_timer(event_base *base, event_callback_fn cb, void *arg);

    timeval to_timeval(std::chrono::microseconds d);

    // Negative durations are clamped to zero. Throws std::runtime_error when the timer cannot be added.
    void arm_timer(event *ev, std::chrono::microseconds d);
} // namespace qdist
