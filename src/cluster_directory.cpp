// ===================== src/cluster_directory.cpp =====================
#include "cluster_directory.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace qdist
{
    using json = nlohmann::json;

    namespace
    {
        // Unwraps {"jsonrpc":"2.0","result":...,"id":1}.
        json rpc_result(const std::string &body, const char *method)
        {
            json root = json::parse(body, nullptr, false);
            if (root.is_discarded() || !root.is_object())
                throw std::runtime_error(std::string(method) + ": response is not a JSON object");
            auto err = root.find("error");
            if (err != root.end())
            {
                std::string msg = err->dump();
                if (err->is_object())
                {
                    auto m = err->find("message");
                    if (m != err->end())
                        msg = m->is_string() ? m->get<std::string>() : m->dump();
                }
                throw std::runtime_error(std::string(method) + ": RPC error: " + msg);
            }
            auto result = root.find("result");
            if (result == root.end())
                throw std::runtime_error(std::string(method) + ": response has no result");
            return std::move(*result);
        }
    } // namespace

    std::vector<ContactInfo> parse_cluster_nodes(const std::string &body)
    {
        const json result = rpc_result(body, "getClusterNodes");
        if (!result.is_array())
            throw std::runtime_error("getClusterNodes: result is not an array");

        std::vector<ContactInfo> nodes;
        for (const auto &item : result)
        {
            if (!item.is_object())
                throw std::runtime_error("getClusterNodes: node is not an object");
            auto pk = item.find("pubkey");
            if (pk == item.end() || !pk->is_string())
                throw std::runtime_error("getClusterNodes: node without pubkey");
            ContactInfo ci;
            ci.pubkey = pk->get<std::string>();
            // "tpuQuic" is null or absent for nodes that do not publish it.
            auto tpu = item.find("tpuQuic");
            if (tpu != item.end() && tpu->is_string())
                ci.tpu_quic = SocketAddress::parse(tpu->get<std::string>());
            nodes.push_back(std::move(ci));
        }
        return nodes;
    }

    std::vector<VoteAccount> parse_vote_accounts(const std::string &body)
    {
        const json result = rpc_result(body, "getVoteAccounts");
        if (!result.is_object())
            throw std::runtime_error("getVoteAccounts: result is not an object");
        auto current = result.find("current");
        if (current == result.end() || !current->is_array())
            throw std::runtime_error("getVoteAccounts: no current vote accounts");

        std::vector<VoteAccount> accounts;
        for (const auto &item : *current)
        {
            if (!item.is_object())
                throw std::runtime_error("getVoteAccounts: malformed vote account");
            auto node = item.find("nodePubkey");
            auto stake = item.find("activatedStake");
            if (node == item.end() || !node->is_string() || stake == item.end() || !stake->is_number_unsigned())
                throw std::runtime_error("getVoteAccounts: malformed vote account");
            accounts.push_back(VoteAccount{node->get<std::string>(), stake->get<std::uint64_t>()});
        }
        return accounts;
    }

    ClusterDirectory::ClusterDirectory(std::string rpc_url, DiagLogger *diag)
        : rpc_url_(std::move(rpc_url)), http_(diag), diag_(diag)
    {
    }

    std::string ClusterDirectory::call(const char *method) const
    {
        const std::string req = std::string(R"({"jsonrpc":"2.0","id":1,"method":")") + method + R"("})";
        if (diag_)
            diag_->log("RPC", std::string(method) + " -> " + rpc_url_);
        return http_.post(rpc_url_, req);
    }

    std::vector<ContactInfo> ClusterDirectory::cluster_nodes() const
    {
        try
        {
            return parse_cluster_nodes(call("getClusterNodes"));
        }
        catch (const std::exception &e)
        {
            throw std::runtime_error(std::string("Failed to get cluster nodes: ") + e.what());
        }
    }

    std::vector<VoteAccount> ClusterDirectory::vote_accounts() const
    {
        try
        {
            return parse_vote_accounts(call("getVoteAccounts"));
        }
        catch (const std::exception &e)
        {
            throw std::runtime_error(std::string("Failed to get vote accounts: ") + e.what());
        }
    }

    ClusterSnapshot ClusterDirectory::snapshot(bool with_stake) const
    {
        ClusterSnapshot snap;
        snap.nodes = cluster_nodes();
        if (with_stake)
            snap.vote_accounts = vote_accounts();
        if (diag_)
            diag_->log("RPC", "SNAPSHOT nodes=" + std::to_string(snap.nodes.size()) +
                                  " vote_accounts=" + std::to_string(snap.vote_accounts.size()));
        return snap;
    }

    std::vector<std::string> parse_doublezero_validators(const std::string &body)
    {
        const json root = json::parse(body, nullptr, false);
        if (root.is_discarded())
            throw DoublezeroError("Invalid JSON");
        if (!root.is_object())
            throw DoublezeroError("Not an object");
        auto success = root.find("success");
        if (success == root.end() || !success->is_boolean() || !success->get<bool>())
            throw DoublezeroError("Failed");
        auto data = root.find("data");
        if (data == root.end())
            throw DoublezeroError("No data");
        if (!data->is_object())
            throw DoublezeroError("data is not an object");
        auto validators = data->find("validators");
        if (validators == data->end())
            throw DoublezeroError("No validators");
        if (!validators->is_array())
            throw DoublezeroError("validators is not an array");

        std::vector<std::string> ids;
        for (const auto &v : *validators)
        {
            if (!v.is_object())
                throw DoublezeroError("validators is not an array of objects");
            auto account = v.find("account");
            if (account == v.end())
                throw DoublezeroError("validator has no account");
            if (!account->is_string())
                throw DoublezeroError("validator account is not a string");
            ids.push_back(account->get<std::string>());
        }
        if (ids.empty())
            throw DoublezeroError("No validators");
        return ids;
    }

    std::string doublezero_url(const std::string &network)
    {
        return "https://doublezero.xyz/api/dz-validators?network=" + network;
    }

    std::vector<std::string> fetch_doublezero_validators(const HttpClient &http, const std::string &network)
    {
        std::string body;
        try
        {
            body = http.get(doublezero_url(network));
        }
        catch (const std::exception &e)
        {
            throw std::runtime_error(std::string("Cannot send request to Doublezero API: ") + e.what());
        }
        try
        {
            return parse_doublezero_validators(body);
        }
        catch (const DoublezeroError &e)
        {
            throw std::runtime_error(std::string("Failed to decode Doublezero API response: ") + e.what());
        }
    }
} // namespace qdist
