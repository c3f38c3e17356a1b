// ===================== src/report.cpp =====================
#include "report.hpp"

#include <iomanip>
#include <sstream>

using namespace std;

namespace qdist {

string format_ids(const vector<string>& ids) {
    string out = "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out += ", ";
        out += '"' + ids[i] + '"';
    }
    out += ']';
    return out;
}

void print_detail(ostream& os, const SocketAddress& addr, const Target& target, bool stake_tracked,
                  const optional<SampleResult>& result) {
    os << left << setw(21) << addr.to_string() << right;
    if (stake_tracked) os << ' ' << setw(9) << target.stake / kLamportsPerSol << " SOL";
    os << ' ' << format_ids(target.ids);

    if (!result)
        os << " Error\n";
    else if (*result == kUnreachable)
        os << " Failed\n";
    else
        os << ' ' << *result / 2 << " µs\n";
}

void print_summary(ostream& os, const optional<AggregateStats>& stats) {
    if (!stats) return;
    os << "Simple distance: " << stats->simple_mean_us << " µs\n";
    os << "Connection successful: " << stats->samples << '\n';
    if (stats->weighted_mean_us) {
        os << "Stake-weighted distance: " << *stats->weighted_mean_us << " µs\n";
        os << "Total stake: " << stats->weighted_stake / kLamportsPerSol << " SOL\n";
    }
}

void print_errors(ostream& os, const ErrorLedger& ledger, uint64_t total_stake) {
    for (const auto& [kind, e] : ledger.entries()) {
        os << to_string(kind) << ": " << e.count;
        if (total_stake > 0 && kind != ErrorKind::NotAStakedNode) {
            ostringstream pct;
            pct << fixed << setprecision(2) << 100.0 * static_cast<double>(e.stake) / static_cast<double>(total_stake);
            os << " (" << pct.str() << "% of total stake)";
        }
        os << '\n';
    }
}

void print_report(ostream& os, const TargetSet& set, const vector<ProbeOutcome>& outcomes,
                  const AggregateResult& result, bool details) {
    if (details) {
        const bool stake_tracked = set.total_stake > 0;
        for (const auto& o : outcomes) {
            auto it = set.targets.find(o.address);
            if (it == set.targets.end()) continue;
            print_detail(os, o.address, it->second, stake_tracked, o.result);
        }
    }
    print_summary(os, result.stats);
    print_errors(os, result.ledger, set.total_stake);
}

} // namespace qdist
