#include "target_set.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace qdist {

std::vector<SocketAddress> TargetSet::addresses() const {
    std::vector<SocketAddress> out;
    out.reserve(targets.size());
    for (const auto &kv : targets) out.push_back(kv.first);
    return out;
}

Destinations Destinations::split(const std::vector<std::string> &raw) {
    Destinations d;
    std::set<std::string> seen_ids;
    std::set<SocketAddress> seen_addrs;
    for (const auto &s : raw) {
        if (s.empty()) continue;
        if (auto sa = SocketAddress::parse(s)) {
            if (seen_addrs.insert(*sa).second) d.addresses.push_back(*sa);
        } else if (seen_ids.insert(s).second) {
            d.identities.push_back(s);
        }
    }
    return d;
}

bool needs_directory(const Destinations &dest, bool stake_weighting) {
    return stake_weighting || dest.empty() || !dest.identities.empty();
}

TargetSet targets_from_addresses(const std::vector<SocketAddress> &addresses) {
    TargetSet set;
    for (const auto &a : addresses) set.targets[a];
    return set;
}

namespace {

// Returns false when the identity was already attached to this target.
bool join(TargetSet &set, const SocketAddress &addr, const std::string &id, std::uint64_t stake) {
    Target &t = set.targets[addr];
    if (std::find(t.ids.begin(), t.ids.end(), id) != t.ids.end()) return false;
    t.ids.push_back(id);
    t.stake += stake;
    return true;
}

struct Index {
    std::unordered_map<std::string, const ContactInfo *> by_pubkey;
    std::unordered_map<std::string, std::uint64_t> stake_of;
    std::map<SocketAddress, std::vector<const ContactInfo *>> by_address;

    explicit Index(const ClusterSnapshot &c) {
        for (const auto &ci : c.nodes) {
            by_pubkey.emplace(ci.pubkey, &ci);
            if (ci.tpu_quic) by_address[*ci.tpu_quic].push_back(&ci);
        }
        for (const auto &va : c.vote_accounts) stake_of[va.node_pubkey] += va.activated_stake;
    }
};

void log_drop(DiagLogger *diag, ErrorKind kind, const std::string &what) {
    if (diag) diag->log("TARGETS", std::string("DROP ") + to_string(kind) + " " + what);
}

void whole_cluster_weighted(const ClusterSnapshot &c, const Index &idx, TargetSet &set, ErrorLedger &ledger,
                            DiagLogger *diag) {
    for (const auto &va : c.vote_accounts) {
        if (va.activated_stake == 0) continue;
        set.total_stake += va.activated_stake;
        auto it = idx.by_pubkey.find(va.node_pubkey);
        if (it == idx.by_pubkey.end()) {
            ledger.record(ErrorKind::NoContactInfo, va.activated_stake);
            log_drop(diag, ErrorKind::NoContactInfo, va.node_pubkey);
        } else if (!it->second->tpu_quic) {
            ledger.record(ErrorKind::NoTPU, va.activated_stake);
            log_drop(diag, ErrorKind::NoTPU, va.node_pubkey);
        } else if (!join(set, *it->second->tpu_quic, va.node_pubkey, va.activated_stake)) {
            // Another vote account of a node already on this target.
            set.targets[*it->second->tpu_quic].stake += va.activated_stake;
        }
    }
}

void whole_cluster_unweighted(const ClusterSnapshot &c, TargetSet &set, ErrorLedger &ledger, DiagLogger *diag) {
    for (const auto &ci : c.nodes) {
        if (!ci.tpu_quic) {
            ledger.record(ErrorKind::NoTPU, 0);
            log_drop(diag, ErrorKind::NoTPU, ci.pubkey);
            continue;
        }
        join(set, *ci.tpu_quic, ci.pubkey, 0);
    }
}

void destinations_weighted(const Destinations &dest, const Index &idx, TargetSet &set, ErrorLedger &ledger,
                           DiagLogger *diag) {
    for (const auto &pk : dest.identities) {
        auto st = idx.stake_of.find(pk);
        if (st == idx.stake_of.end() || st->second == 0) {
            ledger.record(ErrorKind::NotAStakedNode, 0);
            log_drop(diag, ErrorKind::NotAStakedNode, pk);
            continue;
        }
        auto it = idx.by_pubkey.find(pk);
        if (it == idx.by_pubkey.end()) {
            ledger.record(ErrorKind::NoContactInfo, st->second);
            log_drop(diag, ErrorKind::NoContactInfo, pk);
        } else if (!it->second->tpu_quic) {
            ledger.record(ErrorKind::NoTPU, st->second);
            log_drop(diag, ErrorKind::NoTPU, pk);
        } else if (join(set, *it->second->tpu_quic, pk, st->second)) {
            set.total_stake += st->second;
        }
    }

    for (const auto &addr : dest.addresses) {
        bool staked = set.targets.count(addr) && set.targets[addr].stake > 0;
        auto nodes = idx.by_address.find(addr);
        if (nodes != idx.by_address.end()) {
            for (const ContactInfo *ci : nodes->second) {
                auto st = idx.stake_of.find(ci->pubkey);
                if (st == idx.stake_of.end() || st->second == 0) continue;
                if (join(set, addr, ci->pubkey, st->second)) set.total_stake += st->second;
                staked = true;
            }
        }
        if (!staked) {
            set.targets.erase(addr);
            ledger.record(ErrorKind::NotAStakedNode, 0);
            log_drop(diag, ErrorKind::NotAStakedNode, addr.to_string());
        }
    }
}

void destinations_unweighted(const Destinations &dest, const Index &idx, TargetSet &set, ErrorLedger &ledger,
                             DiagLogger *diag) {
    for (const auto &pk : dest.identities) {
        auto it = idx.by_pubkey.find(pk);
        if (it == idx.by_pubkey.end()) {
            ledger.record(ErrorKind::NoContactInfo, 0);
            log_drop(diag, ErrorKind::NoContactInfo, pk);
        } else if (!it->second->tpu_quic) {
            ledger.record(ErrorKind::NoTPU, 0);
            log_drop(diag, ErrorKind::NoTPU, pk);
        } else {
            join(set, *it->second->tpu_quic, pk, 0);
        }
    }

    for (const auto &addr : dest.addresses) {
        set.targets[addr];
        auto nodes = idx.by_address.find(addr);
        if (nodes == idx.by_address.end()) continue;
        for (const ContactInfo *ci : nodes->second) join(set, addr, ci->pubkey, 0);
    }
}

} // namespace

TargetSet build_target_set(const ClusterSnapshot &cluster, const Destinations &dest, bool stake_weighting,
                           ErrorLedger &ledger, DiagLogger *diag) {
    TargetSet set;
    Index idx(cluster);

    if (dest.empty()) {
        if (stake_weighting)
            whole_cluster_weighted(cluster, idx, set, ledger, diag);
        else
            whole_cluster_unweighted(cluster, set, ledger, diag);
    } else {
        if (stake_weighting)
            destinations_weighted(dest, idx, set, ledger, diag);
        else
            destinations_unweighted(dest, idx, set, ledger, diag);
    }

    if (diag)
        diag->log("TARGETS", "BUILT targets=" + std::to_string(set.targets.size()) +
                                 " total_stake=" + std::to_string(set.total_stake));
    return set;
}

} // namespace qdist
