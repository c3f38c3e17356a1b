#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "diag_logger.hpp"
#include "event_loop.hpp"
#include "pinger.hpp"
#include "socket_address.hpp"

namespace qdist
{
    // One leader window of the remote cluster: 4 slots of 400 ms.
    constexpr std::chrono::milliseconds kSlotDuration{400};
    constexpr std::chrono::microseconds kLeaderWindow = 4 * kSlotDuration;

    struct SamplerOptions
    {
        std::size_t attempts = 5;
        bool temporize = false;
        // Spacing between attempts and per-attempt timeout.
        std::chrono::microseconds window = kLeaderWindow;
    };

    // Samples the handshake RTT of one target: `attempts` attempts spaced
    // exactly one window apart (measured from the first attempt's start),
    // keeping the minimum. Runs on the event loop; owns nothing shared.
    class RttSampler
    {
    public:
        using clk = std::chrono::steady_clock;
        // nullopt: the task itself failed (an attempt could not be set up).
        using Completion = std::function<void(std::optional<SampleResult>)>;

        // Throws std::invalid_argument when opts.attempts is 0.
        RttSampler(event_base *base, Pinger &pinger, const SocketAddress &target, SamplerOptions opts,
                   DiagLogger *diag = nullptr);
        ~RttSampler();

        RttSampler(const RttSampler &) = delete;
        RttSampler &operator=(const RttSampler &) = delete;

        void start(Completion done);

        std::chrono::microseconds start_delay() const { return start_delay_; }
        const std::vector<clk::time_point> &scheduled_starts() const { return scheduled_; }
        std::size_t attempts_made() const { return made_; }
        bool finished() const { return finished_; }

    private:
        static void on_timer(evutil_socket_t fd, short what, void *arg);
        static void on_timeout(evutil_socket_t fd, short what, void *arg);

        std::chrono::microseconds window_offset(std::size_t n) const;
        void begin_attempt();
        void end_attempt(SampleResult rtt);
        bool rearm(event *ev, std::chrono::microseconds d);
        void complete(std::optional<SampleResult> result);

        Pinger &pinger_;
        SocketAddress target_;
        SamplerOptions opts_;
        DiagLogger *diag_;

        EventPtr timer_;
        EventPtr timeout_;
        Completion done_;
        std::mt19937_64 rng_;

        std::chrono::microseconds start_delay_{0};
        std::vector<clk::time_point> scheduled_;
        std::optional<Pinger::PingId> in_flight_;
        std::size_t made_ = 0;
        SampleResult best_ = kUnreachable;
        bool finished_ = false;
    };
} // namespace qdist
