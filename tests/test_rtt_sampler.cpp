#undef NDEBUG
#include"probe_scheduler.hpp"
#include"rtt_sampler.hpp"
#include<algorithm>
#include<assert.h>
#include<chrono>
#include<functional>
#include<list>
#include<map>
#include<optional>
#include<stdexcept>
#include<string>
#include<vector>

using namespace qdist;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::milliseconds;

namespace {

/* Replies are scripted per call: after `delay` with `rtt`; a negative
 * delay never replies; `fail` makes ping() throw.  */
struct Reply {
	milliseconds delay;
	SampleResult rtt;
	bool fail;
};

Reply after(int ms, SampleResult rtt) { return Reply{milliseconds(ms), rtt, false}; }
Reply silent() { return Reply{milliseconds(-1), 0, false}; }
Reply broken() { return Reply{milliseconds(0), 0, true}; }

class FakePinger : public Pinger {
public:
	explicit FakePinger(event_base* base) : base_(base) { }

	/* Script for one target; the last entry repeats.  */
	std::map<SocketAddress, std::vector<Reply>> script;
	std::map<SocketAddress, std::vector<RttSampler::clk::time_point>> starts;
	std::size_t cancels = 0;

	PingId ping(SocketAddress const& target, Callback done) override {
		auto& s = script.at(target);
		auto n = starts[target].size();
		auto const& r = s[n < s.size() ? n : s.size() - 1];
		if (r.fail)
			throw std::runtime_error("cannot set up attempt");
		starts[target].push_back(RttSampler::clk::now());

		auto id = next_++;
		live_[id] = std::move(done);
		if (r.delay.count() >= 0) {
			pending_.push_back(Pending{this, id, r.rtt});
			auto tv = to_timeval(duration_cast<microseconds>(r.delay));
			auto rv = event_base_once(base_, -1, EV_TIMEOUT, &FakePinger::fire, &pending_.back(), &tv);
			assert(rv == 0);
		}
		return id;
	}
	void cancel(PingId id) override {
		if (live_.erase(id))
			++cancels;
	}

private:
	struct Pending {
		FakePinger* self;
		PingId id;
		SampleResult rtt;
	};
	static void fire(evutil_socket_t, short, void* arg) {
		auto* p = static_cast<Pending*>(arg);
		auto it = p->self->live_.find(p->id);
		if (it == p->self->live_.end())
			return;
		auto cb = std::move(it->second);
		p->self->live_.erase(it);
		cb(p->rtt);
	}

	event_base* base_;
	PingId next_ = 1;
	std::map<PingId, Callback> live_;
	std::list<Pending> pending_;
};

SocketAddress addr(char const* s) {
	return *SocketAddress::parse(s);
}

struct Run {
	std::optional<SampleResult> result;
	bool called = false;
};

Run sample(event_base* base, FakePinger& pinger, SocketAddress const& target, SamplerOptions opts) {
	auto run = Run();
	auto sampler = RttSampler(base, pinger, target, opts);
	sampler.start([&run](std::optional<SampleResult> r) {
		assert(!run.called);
		run.called = true;
		run.result = r;
	});
	assert(event_base_dispatch(base) >= 0);
	assert(sampler.finished());
	assert(run.called);
	return run;
}

SamplerOptions options(std::size_t attempts, int window_ms, bool temporize = false) {
	auto o = SamplerOptions();
	o.attempts = attempts;
	o.window = milliseconds(window_ms);
	o.temporize = temporize;
	return o;
}

void test_minimum_of_attempts() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {after(2, 200), after(2, 150), after(2, 300)};

	auto r = sample(base.get(), pinger, t, options(3, 20));
	assert(r.result);
	assert(*r.result == 150);
	assert(pinger.starts[t].size() == 3);
}

void test_all_attempts_time_out() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {silent()};

	auto r = sample(base.get(), pinger, t, options(2, 20));
	assert(r.result);
	assert(*r.result == kUnreachable);
	assert(pinger.starts[t].size() == 2);
	assert(pinger.cancels == 2);
}

void test_timeout_then_success() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {silent(), after(1, 120)};

	auto r = sample(base.get(), pinger, t, options(2, 20));
	assert(*r.result == 120);
}

/* Attempts stay on a fixed grid anchored at the first one, even when
 * each attempt takes most of a window.  */
void test_schedule_does_not_drift() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {after(70, 500)};

	auto run = Run();
	auto sampler = RttSampler(base.get(), pinger, t, options(3, 100));
	sampler.start([&run](std::optional<SampleResult> r) {
		run.called = true;
		run.result = r;
	});
	assert(event_base_dispatch(base.get()) >= 0);
	assert(run.called && *run.result == 500);

	auto const& due = sampler.scheduled_starts();
	assert(due.size() == 3);
	assert(due[1] - due[0] == milliseconds(100));
	assert(due[2] - due[0] == milliseconds(200));

	auto const& st = pinger.starts[t];
	assert(st.size() == 3);
	assert(st[1] - st[0] >= milliseconds(95));
	assert(st[1] - st[0] < milliseconds(160));
	assert(st[2] - st[0] >= milliseconds(195));
	assert(st[2] - st[0] < milliseconds(260));
}

void test_temporization() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {after(1, 10)};

	for (auto i = 0; i < 8; ++i) {
		auto sampler = RttSampler(base.get(), pinger, t, options(1, 50, true));
		auto begun = RttSampler::clk::now();
		auto done = false;
		sampler.start([&done](std::optional<SampleResult>) { done = true; });
		assert(sampler.start_delay() >= microseconds(0));
		assert(sampler.start_delay() < milliseconds(50));
		assert(event_base_dispatch(base.get()) >= 0);
		assert(done);
		assert(pinger.starts[t].back() - begun >= sampler.start_delay() - milliseconds(2));
	}

	auto plain = RttSampler(base.get(), pinger, t, options(1, 50, false));
	plain.start([](std::optional<SampleResult>) { });
	assert(plain.start_delay() == microseconds(0));
	assert(event_base_dispatch(base.get()) >= 0);
}

void test_task_failure() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto t = addr("10.0.0.1:8009");
	pinger.script[t] = {after(1, 90), broken()};

	auto run = Run();
	auto sampler = RttSampler(base.get(), pinger, t, options(3, 10));
	sampler.start([&run](std::optional<SampleResult> r) {
		run.called = true;
		run.result = r;
	});
	assert(event_base_dispatch(base.get()) >= 0);
	assert(run.called);
	assert(!run.result);
	assert(sampler.attempts_made() == 1);
}

void test_zero_attempts_rejected() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto flag = bool();
	try {
		RttSampler(base.get(), pinger, addr("10.0.0.1:1"), options(0, 10));
		flag = false;
	} catch (std::invalid_argument const&) {
		flag = true;
	}
	assert(flag);
}

void test_scheduler_fan_out() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto a = addr("10.0.0.1:1");
	auto b = addr("10.0.0.2:1");
	auto c = addr("10.0.0.3:1");
	pinger.script[a] = {after(1, 400), after(1, 300)};
	pinger.script[b] = {silent()};
	pinger.script[c] = {broken()};

	auto sched = ProbeScheduler(base.get(), pinger);
	auto out = sched.run({a, b, c}, 2, milliseconds(30));
	assert(out.size() == 3);
	assert(out[0].address == a && out[0].result && *out[0].result == 300);
	assert(out[1].address == b && out[1].result && *out[1].result == kUnreachable);
	assert(out[2].address == c && !out[2].result);

	assert(sched.run({}, 2).empty());
}


/* One target starts at once; several are spread over the first window.  */
void test_scheduler_start_spread() {
	auto base = make_event_base();
	auto pinger = FakePinger(base.get());
	auto sched = ProbeScheduler(base.get(), pinger);
	auto window = milliseconds(200);

	auto lone = addr("10.0.1.1:1");
	pinger.script[lone] = {after(1, 10)};
	auto begun = RttSampler::clk::now();
	auto out = sched.run({lone}, 1, window);
	assert(out.size() == 1 && out[0].result && *out[0].result == 10);
	assert(pinger.starts[lone].size() == 1);
	assert(pinger.starts[lone][0] - begun < milliseconds(20));

	auto targets = std::vector<SocketAddress>();
	for (auto i = 1; i <= 8; ++i) {
		auto t = addr(("10.0.2." + std::to_string(i) + ":1").c_str());
		pinger.script[t] = {after(1, 10)};
		targets.push_back(t);
	}
	begun = RttSampler::clk::now();
	out = sched.run(targets, 1, window);
	assert(out.size() == 8);
	auto first = RttSampler::clk::time_point::max();
	auto last = RttSampler::clk::time_point::min();
	for (auto const& t : targets) {
		assert(pinger.starts[t].size() == 1);
		auto at = pinger.starts[t][0];
		assert(at >= begun);
		assert(at - begun < window + milliseconds(20));
		first = std::min(first, at);
		last = std::max(last, at);
	}
	/* Eight uniform delays all within 5 ms of each other is vanishingly rare.  */
	assert(last - first > milliseconds(5));
}

}

int main() {
	test_minimum_of_attempts();
	test_all_attempts_time_out();
	test_timeout_then_success();
	test_schedule_does_not_drift();
	test_temporization();
	test_task_failure();
	test_zero_attempts_rejected();
	test_scheduler_fan_out();
	test_scheduler_start_spread();
	return 0;
}
