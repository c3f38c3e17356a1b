#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "diag_logger.hpp"
#include "error_ledger.hpp"
#include "socket_address.hpp"

namespace qdist
{
    constexpr std::uint64_t kLamportsPerSol = 1000000000ULL;

    // One probed endpoint. Several identities may share one TPU address;
    // stake is the sum of theirs.
    struct Target
    {
        std::uint64_t stake = 0;
        std::vector<std::string> ids;
    };

    struct TargetSet
    {
        std::map<SocketAddress, Target> targets;
        std::uint64_t total_stake = 0;

        std::vector<SocketAddress> addresses() const;
    };

    // Directory records as published by the cluster RPC.
    struct ContactInfo
    {
        std::string pubkey;
        std::optional<SocketAddress> tpu_quic;
    };

    struct VoteAccount
    {
        std::string node_pubkey;
        std::uint64_t activated_stake = 0;
    };

    struct ClusterSnapshot
    {
        std::vector<ContactInfo> nodes;
        std::vector<VoteAccount> vote_accounts; // current (non-delinquent) accounts
    };

    // Caller-supplied destinations, split into identities and ip:port addresses.
    struct Destinations
    {
        std::vector<std::string> identities;
        std::vector<SocketAddress> addresses;

        // Anything that parses as a socket address is an address; duplicates are dropped.
        static Destinations split(const std::vector<std::string> &raw);

        std::size_t size() const { return identities.size() + addresses.size(); }
        bool empty() const { return identities.empty() && addresses.empty(); }
    };

    // Resolves destinations (or the whole cluster when there are none) into
    // targets, recording structural resolution errors in the ledger. Errors
    // never abort the construction; the offending entry is just left out.
    TargetSet build_target_set(const ClusterSnapshot &cluster, const Destinations &dest, bool stake_weighting,
                               ErrorLedger &ledger, DiagLogger *diag = nullptr);

    // Without stake weighting, explicit addresses need no directory lookup.
    bool needs_directory(const Destinations &dest, bool stake_weighting);
    TargetSet targets_from_addresses(const std::vector<SocketAddress> &addresses);
} // namespace qdist
