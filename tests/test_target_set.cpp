#undef NDEBUG
#include"target_set.hpp"
#include<assert.h>
#include<string>
#include<vector>

using namespace qdist;

namespace {

auto const SOL = kLamportsPerSol;

SocketAddress addr(char const* s) {
	return *SocketAddress::parse(s);
}

/*
 * A, D share 10.0.0.1:8009; B at 10.0.0.2:8009; C publishes no TPU;
 * E is unstaked at 10.0.0.5:8009; F is staked but not gossiping;
 * G has a vote account with no active stake.
 */
ClusterSnapshot cluster() {
	auto c = ClusterSnapshot();
	c.nodes = {
		{"A", addr("10.0.0.1:8009")},
		{"B", addr("10.0.0.2:8009")},
		{"C", std::nullopt},
		{"D", addr("10.0.0.1:8009")},
		{"E", addr("10.0.0.5:8009")},
	};
	c.vote_accounts = {
		{"A", 100 * SOL},
		{"B", 50 * SOL},
		{"C", 20 * SOL},
		{"D", 30 * SOL},
		{"F", 40 * SOL},
		{"G", 0},
	};
	return c;
}

void test_split() {
	auto d = Destinations::split({"A", "1.2.3.4:5", "A", "", "1.2.3.4:5", "B"});
	assert(d.identities == std::vector<std::string>({"A", "B"}));
	assert(d.addresses.size() == 1);
	assert(d.addresses[0] == addr("1.2.3.4:5"));
	assert(d.size() == 3);
	assert(!d.empty());
	assert(Destinations::split({}).empty());
}

void test_needs_directory() {
	auto none = Destinations();
	auto only_addrs = Destinations::split({"1.2.3.4:5"});
	auto with_id = Destinations::split({"1.2.3.4:5", "A"});
	assert(needs_directory(none, false));
	assert(needs_directory(none, true));
	assert(!needs_directory(only_addrs, false));
	assert(needs_directory(only_addrs, true));
	assert(needs_directory(with_id, false));

	auto set = targets_from_addresses(only_addrs.addresses);
	assert(set.targets.size() == 1);
	assert(set.targets.begin()->second.ids.empty());
	assert(set.total_stake == 0);
}

void test_whole_cluster_weighted() {
	auto ledger = ErrorLedger();
	auto set = build_target_set(cluster(), Destinations(), true, ledger);

	assert(set.total_stake == 240 * SOL);
	assert(set.targets.size() == 2);
	auto const& shared = set.targets.at(addr("10.0.0.1:8009"));
	assert(shared.ids == std::vector<std::string>({"A", "D"}));
	assert(shared.stake == 130 * SOL);
	assert(set.targets.at(addr("10.0.0.2:8009")).stake == 50 * SOL);

	assert(ledger.count(ErrorKind::NoTPU) == 1);
	assert(ledger.stake(ErrorKind::NoTPU) == 20 * SOL);
	/* Staked, absent from the directory: counted, never probed.  */
	assert(ledger.count(ErrorKind::NoContactInfo) == 1);
	assert(ledger.stake(ErrorKind::NoContactInfo) == 40 * SOL);
	assert(ledger.count(ErrorKind::NotAStakedNode) == 0);
}

void test_whole_cluster_unweighted() {
	auto ledger = ErrorLedger();
	auto set = build_target_set(cluster(), Destinations(), false, ledger);

	assert(set.total_stake == 0);
	assert(set.targets.size() == 3);
	assert(set.targets.at(addr("10.0.0.1:8009")).ids.size() == 2);
	assert(set.targets.at(addr("10.0.0.5:8009")).ids == std::vector<std::string>({"E"}));
	for (auto const& kv : set.targets)
		assert(kv.second.stake == 0);
	assert(ledger.count(ErrorKind::NoTPU) == 1);
	assert(ledger.stake(ErrorKind::NoTPU) == 0);
	assert(ledger.count(ErrorKind::NoContactInfo) == 0);
}

void test_destinations_weighted() {
	auto ledger = ErrorLedger();
	auto dest = Destinations::split({
		"A", "C", "F", "E", "G", "Z",
		"10.0.0.2:8009", "10.0.0.5:8009", "10.9.9.9:1"
	});
	auto set = build_target_set(cluster(), dest, true, ledger);

	assert(set.targets.size() == 2);
	assert(set.targets.at(addr("10.0.0.1:8009")).ids == std::vector<std::string>({"A"}));
	assert(set.targets.at(addr("10.0.0.1:8009")).stake == 100 * SOL);
	assert(set.targets.at(addr("10.0.0.2:8009")).ids == std::vector<std::string>({"B"}));
	assert(set.total_stake == 150 * SOL);

	assert(ledger.count(ErrorKind::NoTPU) == 1);
	assert(ledger.stake(ErrorKind::NoTPU) == 20 * SOL);
	assert(ledger.count(ErrorKind::NoContactInfo) == 1);
	assert(ledger.stake(ErrorKind::NoContactInfo) == 40 * SOL);
	/* E, G and Z as identities, the unstaked and the unknown address.
	 * G votes with no active stake and is not probed either.  */
	assert(ledger.count(ErrorKind::NotAStakedNode) == 5);
	assert(ledger.stake(ErrorKind::NotAStakedNode) == 0);
}

/* An identity and the address it publishes name the same target once.  */
void test_destinations_weighted_shared_address() {
	auto ledger = ErrorLedger();
	auto dest = Destinations::split({"A", "10.0.0.1:8009"});
	auto set = build_target_set(cluster(), dest, true, ledger);

	assert(set.targets.size() == 1);
	auto const& t = set.targets.at(addr("10.0.0.1:8009"));
	assert(t.ids == std::vector<std::string>({"A", "D"}));
	assert(t.stake == 130 * SOL);
	assert(set.total_stake == 130 * SOL);
	assert(ledger.empty());
}

/* A node voting through two accounts carries the stake of both.  */
void test_node_with_two_vote_accounts() {
	auto c = ClusterSnapshot();
	c.nodes = {{"node", addr("10.0.0.1:8009")}};
	c.vote_accounts = {{"node", 3 * SOL}, {"node", 2 * SOL}};

	auto ledger = ErrorLedger();
	auto whole = build_target_set(c, Destinations(), true, ledger);
	assert(whole.targets.size() == 1);
	auto const& t = whole.targets.at(addr("10.0.0.1:8009"));
	assert(t.ids == std::vector<std::string>({"node"}));
	assert(t.stake == 5 * SOL);
	assert(whole.total_stake == 5 * SOL);
	assert(ledger.empty());

	auto picked = build_target_set(c, Destinations::split({"node"}), true, ledger);
	assert(picked.targets.at(addr("10.0.0.1:8009")).stake == 5 * SOL);
	assert(picked.total_stake == 5 * SOL);
	assert(ledger.empty());
}

void test_destinations_unweighted() {
	auto ledger = ErrorLedger();
	auto dest = Destinations::split({"A", "C", "Z", "10.0.0.2:8009", "10.9.9.9:1"});
	auto set = build_target_set(cluster(), dest, false, ledger);

	assert(set.total_stake == 0);
	assert(set.targets.size() == 3);
	assert(set.targets.at(addr("10.0.0.1:8009")).ids == std::vector<std::string>({"A"}));
	assert(set.targets.at(addr("10.0.0.1:8009")).stake == 0);
	assert(set.targets.at(addr("10.0.0.2:8009")).ids == std::vector<std::string>({"B"}));
	/* Unknown addresses are still probed.  */
	assert(set.targets.at(addr("10.9.9.9:1")).ids.empty());

	assert(ledger.count(ErrorKind::NoTPU) == 1);
	assert(ledger.stake(ErrorKind::NoTPU) == 0);
	assert(ledger.count(ErrorKind::NoContactInfo) == 1);
	assert(ledger.count(ErrorKind::NotAStakedNode) == 0);
}

}

int main() {
	test_split();
	test_needs_directory();
	test_whole_cluster_weighted();
	test_whole_cluster_unweighted();
	test_destinations_weighted();
	test_destinations_weighted_shared_address();
	test_node_with_two_vote_accounts();
	test_destinations_unweighted();
	return 0;
}
