#pragma once
#include <cstdint>
#include <functional>
#include <limits>

#include "socket_address.hpp"

namespace qdist
{
    // Round-trip time in microseconds, or kUnreachable.
    using SampleResult = std::uint64_t;
    constexpr SampleResult kUnreachable = std::numeric_limits<SampleResult>::max();

    // One timed connection attempt against a remote endpoint.
    class Pinger
    {
    public:
        using PingId = std::uint64_t;
        using Callback = std::function<void(SampleResult rtt_us)>;

        virtual ~Pinger() = default;

        // Starts an attempt. `done` runs later from the event loop, never from
        // inside ping(), with kUnreachable when the attempt fails.
        // Throws std::runtime_error when the attempt cannot be set up at all.
        virtual PingId ping(const SocketAddress &target, Callback done) = 0;

        // Abandons an attempt; its callback will not run.
        virtual void cancel(PingId id) = 0;
    };
} // namespace qdist
