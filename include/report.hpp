#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "aggregator.hpp"
#include "error_ledger.hpp"
#include "target_set.hpp"

namespace qdist
{
    // ["id1", "id2"]
    std::string format_ids(const std::vector<std::string> &ids);

    // One line per probed target; stake column only when stake is tracked.
    void print_detail(std::ostream &os, const SocketAddress &addr, const Target &target, bool stake_tracked,
                      const std::optional<SampleResult> &result);

    // Nothing is printed when no target answered.
    void print_summary(std::ostream &os, const std::optional<AggregateStats> &stats);

    void print_errors(std::ostream &os, const ErrorLedger &ledger, std::uint64_t total_stake);

    void print_report(std::ostream &os, const TargetSet &set, const std::vector<ProbeOutcome> &outcomes,
                      const AggregateResult &result, bool details);
} // namespace qdist
