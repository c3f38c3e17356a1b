#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "error_ledger.hpp"
#include "pinger.hpp"
#include "socket_address.hpp"
#include "target_set.hpp"

namespace qdist
{
    // Per-target sampling outcome. nullopt: the sampling task failed.
    struct ProbeOutcome
    {
        SocketAddress address;
        std::optional<SampleResult> result;
    };

    struct AggregateStats
    {
        std::uint64_t simple_mean_us = 0;
        std::uint64_t samples = 0;
        std::optional<std::uint64_t> weighted_mean_us;
        std::uint64_t weighted_stake = 0;
    };

    // Folds per-target outcomes into distances (rtt / 2) and error counts.
    // The result does not depend on the order of add() calls.
    class Aggregator
    {
    public:
        explicit Aggregator(std::uint64_t total_stake, ErrorLedger ledger = {});

        void add(const Target &target, std::optional<SampleResult> result);

        // nullopt when no target produced a sample.
        std::optional<AggregateStats> stats() const;
        const ErrorLedger &ledger() const { return ledger_; }

    private:
        std::uint64_t total_stake_;
        ErrorLedger ledger_;
        unsigned __int128 sum_ = 0;
        unsigned __int128 weighted_sum_ = 0;
        std::uint64_t count_ = 0;
        std::uint64_t weighted_stake_ = 0;
    };

    struct AggregateResult
    {
        std::optional<AggregateStats> stats;
        ErrorLedger ledger;
    };

    // Outcomes for addresses missing from the set are ignored.
    AggregateResult aggregate(const TargetSet &set, const std::vector<ProbeOutcome> &outcomes,
                              ErrorLedger ledger = {});
} // namespace qdist
