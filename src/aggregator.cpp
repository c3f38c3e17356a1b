#include "aggregator.hpp"

#include <utility>

namespace qdist
{
    Aggregator::Aggregator(std::uint64_t total_stake, ErrorLedger ledger)
        : total_stake_(total_stake), ledger_(std::move(ledger))
    {
    }

    void Aggregator::add(const Target &target, std::optional<SampleResult> result)
    {
        if (!result)
        {
            ledger_.record(ErrorKind::ConnectionError, target.stake);
            return;
        }
        if (*result == kUnreachable)
        {
            ledger_.record(ErrorKind::ConnectionFailed, target.stake);
            return;
        }
        const std::uint64_t distance = *result / 2;
        sum_ += distance;
        ++count_;
        if (total_stake_ > 0)
        {
            weighted_sum_ += static_cast<unsigned __int128>(distance) * target.stake;
            weighted_stake_ += target.stake;
        }
    }

    std::optional<AggregateStats> Aggregator::stats() const
    {
        if (count_ == 0)
            return std::nullopt;
        AggregateStats s;
        s.simple_mean_us = static_cast<std::uint64_t>(sum_ / count_);
        s.samples = count_;
        s.weighted_stake = weighted_stake_;
        if (total_stake_ > 0 && weighted_stake_ > 0)
            s.weighted_mean_us = static_cast<std::uint64_t>(weighted_sum_ / weighted_stake_);
        return s;
    }

    AggregateResult aggregate(const TargetSet &set, const std::vector<ProbeOutcome> &outcomes, ErrorLedger ledger)
    {
        Aggregator agg(set.total_stake, std::move(ledger));
        for (const auto &o : outcomes)
        {
            auto it = set.targets.find(o.address);
            if (it == set.targets.end())
                continue;
            agg.add(it->second, o.result);
        }
        return AggregateResult{agg.stats(), agg.ledger()};
    }
} // namespace qdist
