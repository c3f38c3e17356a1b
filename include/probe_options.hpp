// ===================== include/probe_options.hpp =====================
#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qdist
{
    struct UsageError : std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    struct ProbeOptions
    {
        std::vector<std::string> destinations; // identities, ip:port, or a Doublezero network with -2
        bool details = false;
        std::string file;
        bool no_stake_weighting = false;
        std::size_t count = 5;
        std::string rpc = "https://api.mainnet-beta.solana.com";
        bool doublezero = false;
        uint16_t port = 0;
        std::string log_path;
        bool help = false;
    };

    // Accepts "-c 3", "-c3", "--count=3", "--count 3" and grouped short flags ("-ds").
    // Throws UsageError for unknown options, missing or bad values.
    ProbeOptions parse_probe_options(int argc, const char *const argv[]);

    void print_usage(std::ostream &os, const char *argv0);

    // One destination per non-blank line, surrounding whitespace removed.
    // Throws std::runtime_error when the file cannot be read.
    std::vector<std::string> read_destination_file(const std::string &path);

    // With -2 the destinations name the Doublezero network: the last one is taken
    // ("mainnet" when there is none). Throws std::runtime_error when more than one is named.
    std::string doublezero_network(std::vector<std::string> &destinations);
} // namespace qdist
