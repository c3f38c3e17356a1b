// ===================== src/probe_options.cpp =====================
#include "probe_options.hpp"

#include <fstream>
#include <limits>

using namespace std;

namespace qdist {

namespace {

size_t parse_count(const string& v) {
    size_t used = 0;
    unsigned long long n = 0;
    try {
        n = stoull(v, &used);
    } catch (const logic_error&) {
        throw UsageError("invalid count: " + v);
    }
    if (used != v.size() || n == 0 || v[0] == '-') throw UsageError("count must be a positive integer: " + v);
    return static_cast<size_t>(n);
}

uint16_t parse_port(const string& v) {
    size_t used = 0;
    unsigned long n = 0;
    try {
        n = stoul(v, &used);
    } catch (const logic_error&) {
        throw UsageError("invalid port: " + v);
    }
    if (used != v.size() || n > numeric_limits<uint16_t>::max() || v[0] == '-')
        throw UsageError("invalid port: " + v);
    return static_cast<uint16_t>(n);
}

string trim(const string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == string::npos) return string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // namespace

ProbeOptions parse_probe_options(int argc, const char* const argv[]) {
    ProbeOptions o;
    bool only_positional = false;

    // Value of an option taking an argument: inline ("--rpc=URL", "-rURL") or the next argv entry.
    auto take = [&](int& i, const string& inline_value, bool has_inline, const string& name) -> string {
        if (has_inline) return inline_value;
        if (i + 1 >= argc) throw UsageError("option " + name + " needs a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (only_positional || a.size() < 2 || a[0] != '-') {
            o.destinations.push_back(a);
            continue;
        }
        if (a == "--") {
            only_positional = true;
            continue;
        }

        if (a.rfind("--", 0) == 0) {
            size_t eq = a.find('=');
            string name = a.substr(2, eq == string::npos ? string::npos : eq - 2);
            bool has_value = eq != string::npos;
            string value = has_value ? a.substr(eq + 1) : string();

            if (name == "details" && !has_value) o.details = true;
            else if (name == "no-stake-weighting" && !has_value) o.no_stake_weighting = true;
            else if (name == "doublezero" && !has_value) o.doublezero = true;
            else if (name == "help" && !has_value) o.help = true;
            else if (name == "file") o.file = take(i, value, has_value, a);
            else if (name == "count") o.count = parse_count(take(i, value, has_value, a));
            else if (name == "rpc") o.rpc = take(i, value, has_value, a);
            else if (name == "port") o.port = parse_port(take(i, value, has_value, a));
            else if (name == "log") o.log_path = take(i, value, has_value, a);
            else throw UsageError("unknown option: " + a);
            continue;
        }

        for (size_t k = 1; k < a.size(); ++k) {
            const char c = a[k];
            const string rest = a.substr(k + 1);
            const string name = string("-") + c;
            switch (c) {
            case 'd': o.details = true; break;
            case 's': o.no_stake_weighting = true; break;
            case '2': o.doublezero = true; break;
            case 'h': o.help = true; break;
            case 'f': o.file = take(i, rest, !rest.empty(), name); k = a.size(); break;
            case 'c': o.count = parse_count(take(i, rest, !rest.empty(), name)); k = a.size(); break;
            case 'r': o.rpc = take(i, rest, !rest.empty(), name); k = a.size(); break;
            default: throw UsageError("unknown option: " + name);
            }
        }
    }
    return o;
}

void print_usage(ostream& os, const char* argv0) {
    os << "Measure the distance in µs to the Solana cluster, to Doublezero, or to individual validators\n\n"
       << "Usage:\n"
       << "  " << argv0 << " [destination...] [options]\n"
       << "\nDestinations:\n"
       << "  validator identity pubkeys or TPU ip:port addresses,\n"
       << "  or a Doublezero network name when -2 is given\n"
       << "\nOptions:\n"
       << "  -d, --details              print details for each validator we connect to\n"
       << "  -f, --file=PATH            read more destinations from PATH, one per line\n"
       << "  -s, --no-stake-weighting   disable the stake-weighting of the average distance\n"
       << "  -c, --count=N              connection attempts per target, one every 1.6 s [default: 5]\n"
       << "  -r, --rpc=URL              RPC node the cluster info is fetched from\n"
       << "                             [default: https://api.mainnet-beta.solana.com]\n"
       << "  -2, --doublezero           measure the distance to a Doublezero network [default: mainnet]\n"
       << "      --port=N               local UDP port [default: ephemeral]\n"
       << "      --log=PATH             write diagnostics to PATH\n"
       << "  -h, --help                 print this help\n";
}

vector<string> read_destination_file(const string& path) {
    ifstream in(path);
    if (!in) throw runtime_error("Failed to open specified file " + path);
    vector<string> out;
    string line;
    while (getline(in, line)) {
        string t = trim(line);
        if (!t.empty()) out.push_back(t);
    }
    if (in.bad()) throw runtime_error("Failed to read specified file " + path);
    return out;
}

string doublezero_network(vector<string>& destinations) {
    string network = "mainnet";
    if (!destinations.empty()) {
        network = destinations.back();
        destinations.pop_back();
    }
    if (!destinations.empty()) throw runtime_error("Only one Doublezero network name can be specified");
    return network;
}

} // namespace qdist
