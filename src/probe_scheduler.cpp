#include "probe_scheduler.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace qdist
{
    ProbeScheduler::ProbeScheduler(event_base *base, Pinger &pinger, DiagLogger *diag)
        : base_(base), pinger_(pinger), diag_(diag)
    {
    }

    std::vector<ProbeOutcome> ProbeScheduler::run(const std::vector<SocketAddress> &targets, std::size_t attempts,
                                                  std::chrono::microseconds window)
    {
        std::vector<ProbeOutcome> outcomes;
        outcomes.reserve(targets.size());
        for (const auto &t : targets)
            outcomes.push_back(ProbeOutcome{t, std::nullopt});
        if (targets.empty())
            return outcomes;

        SamplerOptions opts;
        opts.attempts = attempts;
        opts.temporize = targets.size() > 1;
        opts.window = window;

        std::vector<std::unique_ptr<RttSampler>> samplers;
        samplers.reserve(targets.size());
        std::size_t remaining = targets.size();

        for (std::size_t i = 0; i < targets.size(); ++i)
        {
            samplers.push_back(std::make_unique<RttSampler>(base_, pinger_, targets[i], opts, diag_));
            samplers.back()->start([this, &outcomes, &remaining, i](std::optional<SampleResult> r) {
                outcomes[i].result = r;
                if (--remaining == 0)
                    event_base_loopexit(base_, nullptr);
            });
        }

        if (diag_)
            diag_->log("SCHED", "RUN targets=" + std::to_string(targets.size()) +
                                    " attempts=" + std::to_string(attempts) +
                                    " temporize=" + (opts.temporize ? "1" : "0"));

        if (event_base_dispatch(base_) < 0)
            throw std::runtime_error("event loop failed");
        if (remaining != 0)
            throw std::runtime_error("event loop stopped with " + std::to_string(remaining) + " probes pending");

        if (diag_)
            diag_->log("SCHED", "DONE");
        return outcomes;
    }
} // namespace qdist
