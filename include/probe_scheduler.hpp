#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

#include "aggregator.hpp"
#include "diag_logger.hpp"
#include "event_loop.hpp"
#include "pinger.hpp"
#include "rtt_sampler.hpp"
#include "socket_address.hpp"

namespace qdist
{
    // Runs one RttSampler per target concurrently on the given loop and
    // blocks until every sampler has reported.
    class ProbeScheduler
    {
    public:
        ProbeScheduler(event_base *base, Pinger &pinger, DiagLogger *diag = nullptr);

        // Start times are spread over one window when there is more than one
        // target. Outcomes come back in the order of `targets`.
        // Throws std::runtime_error when the event loop fails.
        std::vector<ProbeOutcome> run(const std::vector<SocketAddress> &targets, std::size_t attempts,
                                      std::chrono::microseconds window = kLeaderWindow);

    private:
        event_base *base_;
        Pinger &pinger_;
        DiagLogger *diag_;
    };
} // namespace qdist
