// ===================== include/cluster_directory.hpp =====================
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "diag_logger.hpp"
#include "http_client.hpp"
#include "target_set.hpp"

namespace qdist
{
    constexpr const char *kDefaultRpcUrl = "https://api.mainnet-beta.solana.com";

    // Decoders for JSON-RPC 2.0 response bodies. Throw std::runtime_error on
    // an RPC error object or an unexpected shape.
    std::vector<ContactInfo> parse_cluster_nodes(const std::string &body);
    std::vector<VoteAccount> parse_vote_accounts(const std::string &body);

    // Read-only view of the cluster as published by one RPC node.
    class ClusterDirectory
    {
    public:
        explicit ClusterDirectory(std::string rpc_url, DiagLogger *diag = nullptr);

        std::vector<ContactInfo> cluster_nodes() const;
        // Current (non-delinquent) vote accounts only.
        std::vector<VoteAccount> vote_accounts() const;
        // Vote accounts are only fetched when they are needed for stake.
        ClusterSnapshot snapshot(bool with_stake) const;

    private:
        std::string call(const char *method) const;

        std::string rpc_url_;
        HttpClient http_;
        DiagLogger *diag_;
    };

    // Decodes a Doublezero validator listing into validator identities.
    // Throws DoublezeroError carrying the reason ("Invalid JSON", "Failed", ...).
    struct DoublezeroError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
    std::vector<std::string> parse_doublezero_validators(const std::string &body);
    std::string doublezero_url(const std::string &network);
    std::vector<std::string> fetch_doublezero_validators(const HttpClient &http, const std::string &network);
} // namespace qdist
