#undef NDEBUG
#include"aggregator.hpp"
#include<assert.h>
#include<vector>

using namespace qdist;

namespace {

SocketAddress addr(char const* s) {
	return *SocketAddress::parse(s);
}

/* One target, three attempts: the sampler keeps the minimum RTT, the
 * distance is half of it.  */
void test_single_target_success() {
	auto agg = Aggregator(0);
	auto t = Target{0, {"A"}};
	/* min(200, 150, 300) */
	agg.add(t, SampleResult(150));
	auto s = agg.stats();
	assert(s);
	assert(s->simple_mean_us == 75);
	assert(s->samples == 1);
	assert(!s->weighted_mean_us);
	assert(agg.ledger().empty());
}

void test_all_attempts_timed_out() {
	auto agg = Aggregator(5000000000ULL);
	auto t = Target{2000000000ULL, {"A"}};
	agg.add(t, kUnreachable);
	assert(!agg.stats());
	assert(agg.ledger().count(ErrorKind::ConnectionFailed) == 1);
	assert(agg.ledger().stake(ErrorKind::ConnectionFailed) == 2000000000ULL);
}

void test_task_failure() {
	auto agg = Aggregator(10);
	agg.add(Target{7, {}}, std::nullopt);
	assert(!agg.stats());
	assert(agg.ledger().count(ErrorKind::ConnectionError) == 1);
	assert(agg.ledger().stake(ErrorKind::ConnectionError) == 7);
	assert(agg.ledger().count(ErrorKind::ConnectionFailed) == 0);
}

/* A staked target at 100us and an unstaked one at 50us.  */
void test_weighted_mean_ignores_unstaked() {
	auto agg = Aggregator(1000000000ULL);
	agg.add(Target{1000000000ULL, {"A"}}, SampleResult(200));
	agg.add(Target{0, {"B"}}, SampleResult(100));
	auto s = agg.stats();
	assert(s);
	assert(s->simple_mean_us == 75);
	assert(s->samples == 2);
	assert(s->weighted_mean_us);
	assert(*s->weighted_mean_us == 100);
	assert(s->weighted_stake == 1000000000ULL);
}

void test_weighted_omitted_without_staked_success() {
	auto agg = Aggregator(1000);
	agg.add(Target{1000, {"A"}}, kUnreachable);
	agg.add(Target{0, {"B"}}, SampleResult(40));
	auto s = agg.stats();
	assert(s);
	assert(s->simple_mean_us == 20);
	assert(!s->weighted_mean_us);
}

/* Integer division truncates.  */
void test_truncation() {
	auto agg = Aggregator(3);
	agg.add(Target{1, {}}, SampleResult(3));  /* distance 1 */
	agg.add(Target{2, {}}, SampleResult(8));  /* distance 4 */
	auto s = agg.stats();
	assert(s->simple_mean_us == 2);           /* 5 / 2 */
	assert(*s->weighted_mean_us == 3);        /* (1 + 8) / 3 */
}

/* Huge stakes times large distances do not overflow.  */
void test_wide_sums() {
	auto agg = Aggregator(~0ULL);
	agg.add(Target{1ULL << 62, {}}, SampleResult(2000000000ULL));
	agg.add(Target{1ULL << 62, {}}, SampleResult(4000000000ULL));
	auto s = agg.stats();
	assert(*s->weighted_mean_us == 1500000000ULL);
}

void test_order_independent() {
	auto set = TargetSet();
	set.total_stake = 600;
	set.targets[addr("10.0.0.1:1")] = Target{100, {"A"}};
	set.targets[addr("10.0.0.2:1")] = Target{200, {"B"}};
	set.targets[addr("10.0.0.3:1")] = Target{300, {"C"}};
	set.targets[addr("10.0.0.4:1")] = Target{0, {"D"}};

	auto outcomes = std::vector<ProbeOutcome>{
		{addr("10.0.0.1:1"), SampleResult(1000)},
		{addr("10.0.0.2:1"), kUnreachable},
		{addr("10.0.0.3:1"), SampleResult(333)},
		{addr("10.0.0.4:1"), std::nullopt},
		/* Not part of the set.  */
		{addr("10.0.0.9:1"), SampleResult(1)},
	};
	auto reversed = std::vector<ProbeOutcome>(outcomes.rbegin(), outcomes.rend());

	auto r1 = aggregate(set, outcomes);
	auto r2 = aggregate(set, reversed);
	assert(r1.stats && r2.stats);
	assert(r1.stats->simple_mean_us == r2.stats->simple_mean_us);
	assert(r1.stats->samples == 2);
	assert(r1.stats->simple_mean_us == (500 + 166) / 2);
	assert(*r1.stats->weighted_mean_us == *r2.stats->weighted_mean_us);
	assert(*r1.stats->weighted_mean_us == (500 * 100 + 166 * 300) / 400);
	assert(r1.ledger == r2.ledger);
	assert(r1.ledger.count(ErrorKind::ConnectionFailed) == 1);
	assert(r1.ledger.stake(ErrorKind::ConnectionFailed) == 200);
	assert(r1.ledger.count(ErrorKind::ConnectionError) == 1);
}

/* Resolution errors recorded earlier are carried through.  */
void test_keeps_earlier_errors() {
	auto ledger = ErrorLedger();
	ledger.record(ErrorKind::NoContactInfo, 42);
	auto set = TargetSet();
	set.total_stake = 100;
	auto r = aggregate(set, {}, ledger);
	assert(!r.stats);
	assert(r.ledger.count(ErrorKind::NoContactInfo) == 1);
	assert(r.ledger.stake(ErrorKind::NoContactInfo) == 42);
}

}

int main() {
	test_single_target_success();
	test_all_attempts_timed_out();
	test_task_failure();
	test_weighted_mean_ignores_unstaked();
	test_weighted_omitted_without_staked_success();
	test_truncation();
	test_wide_sums();
	test_order_independent();
	test_keeps_earlier_errors();
	return 0;
}
