/**
 * # build the prober
 * cmake -S . -B build && cmake --build build
 *
 * Examples:
 *   ./build/qdist                              # whole cluster, stake-weighted
 *   ./build/qdist -s -c 3                      # whole cluster, simple mean, 3 attempts
 *   ./build/qdist -d 1.2.3.4:8009 5.6.7.8:8009 # two TPU addresses, one line each
 *   ./build/qdist -2 testnet --log=diag_dz.txt # Doublezero testnet validators
 */

#include <iostream>
#include <string>
#include <vector>

#include "aggregator.hpp"
#include "client_identity.hpp"
#include "cluster_directory.hpp"
#include "diag_logger.hpp"
#include "event_loop.hpp"
#include "http_client.hpp"
#include "key_pair.hpp"
#include "probe_options.hpp"
#include "probe_scheduler.hpp"
#include "quic_endpoint.hpp"
#include "report.hpp"
#include "target_set.hpp"

using namespace std;
using namespace qdist;

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    ProbeOptions opts;
    try {
        opts = parse_probe_options(argc, argv);
    } catch (const UsageError &e) {
        cerr << e.what() << "\n";
        print_usage(cerr, argv[0]);
        return 1;
    }
    if (opts.help) { print_usage(cout, argv[0]); return 0; }

    try {
        // Optional diagnostics
        DiagLogger diag(opts.log_path);
        DiagLogger* dptr = (diag.ok() && !opts.log_path.empty()) ? &diag : nullptr;
        if (!opts.log_path.empty() && !diag.ok()) {
            cerr << "Warning: couldn't open log file: " << opts.log_path << "\n";
        }

        vector<string> raw = opts.destinations;
        if (!opts.file.empty()) {
            vector<string> more = read_destination_file(opts.file);
            raw.insert(raw.end(), more.begin(), more.end());
        }
        if (opts.doublezero) {
            const string network = doublezero_network(raw);
            HttpClient http(dptr);
            raw = fetch_doublezero_validators(http, network);
        }

        const Destinations dest = Destinations::split(raw);
        // A single destination has nothing to weigh against.
        const bool weighting = !opts.no_stake_weighting && dest.size() != 1;

        ErrorLedger ledger;
        TargetSet set;
        if (needs_directory(dest, weighting)) {
            ClusterDirectory directory(opts.rpc, dptr);
            set = build_target_set(directory.snapshot(weighting), dest, weighting, ledger, dptr);
        } else {
            set = targets_from_addresses(dest.addresses);
        }

        EventBasePtr base = make_event_base();
        const ClientIdentity identity = build_client_identity(KeyPair::generate());
        QuicEndpoint endpoint(base.get(), identity, opts.port, dptr);
        ProbeScheduler scheduler(base.get(), endpoint, dptr);

        const vector<ProbeOutcome> outcomes = scheduler.run(set.addresses(), opts.count);
        const AggregateResult result = aggregate(set, outcomes, ledger);
        print_report(cout, set, outcomes, result, opts.details);
        return 0;
    } catch (const exception &e) {
        cout.flush();
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
