#include "doctest.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "resource.hpp"

using namespace SEQ;

TEST_CASE("[propagation] earliest starts and starts of a short chain") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 15);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	CHECK(t1.earliest_start() == 0);
	CHECK(t2.earliest_start() == 5);
	CHECK(t2.start() == 15);
	CHECK(t1.start() == 10);
	CHECK(t1.end() == 15);
	CHECK(t1.slack() == 10);
	CHECK(r.score() == 0);
	CHECK_FALSE(t1.is_dirty());
	CHECK_FALSE(t1.is_start_dirty());
}

TEST_CASE("[propagation] a start is pulled back by its successor") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 8), t3("T3", 4, 20);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.add_tail(t3);

	CHECK(r.schedule() == 0);
	CHECK(t1.start() == 3);
	CHECK(t2.start() == 8);
	CHECK(t3.start() == 20);
	CHECK(t1.slack() == 3);
	CHECK(t1.successor_bound() == 8);
	CHECK(t3.successor_bound() == Time_model::constants<dtime_t>::infinity());
}

TEST_CASE("[propagation] late tasks start at their earliest start") {
	Task<dtime_t> t1("T1", 10, 10), t2("T2", 3, 0);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	CHECK(t2.start() == 10);
	CHECK(t2.lateness() == 10);
	CHECK(t2.slack() == 0);
	CHECK(t1.start() == 0);
	CHECK(t1.lateness() == -10);
	CHECK(r.score() == 10);
}

TEST_CASE("[propagation] margins") {
	Task<dtime_t> t1("T1", 5, 0, 4), t2("T2", 3, 0, 2);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	// the margin of the first task has nothing to keep a distance from
	CHECK(t1.earliest_start() == 0);
	CHECK(t2.earliest_start() == 7);
	CHECK(t2.start() == 7);
	CHECK(r.score() == 7);

	t1.drop();
	CHECK(t2.earliest_start() == 0);
	CHECK(r.score() == 0);
}

TEST_CASE("[propagation] changing a target") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 15);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.schedule();

	t2.set_target(20);
	CHECK_FALSE(t2.is_start_dirty());
	CHECK(t2.start() == 20);
	CHECK(t1.start() == 10);

	t2.set_target(6);
	CHECK(t2.start() == 6);
	CHECK(t1.start() == 1);

	t2.set_target(2);
	CHECK(t2.start() == 5);
	CHECK(t2.lateness() == 3);
	CHECK(t1.start() == 0);
	CHECK(r.score() == 3);
}

TEST_CASE("[propagation] changing the target of a task that was never scheduled") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 20);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	t1.set_target(12);
	CHECK(t1.is_start_dirty());
	CHECK(t1.start() == 12);
	CHECK(t2.start() == 20);
}

TEST_CASE("[propagation] appending invalidates the starts in front") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 15), t3("T3", 4, 7);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.schedule();
	CHECK(t1.start() == 10);

	// T3 is late and pins T2 to its earliest start
	r.add_tail(t3);
	CHECK(t2.is_start_dirty());
	CHECK(t3.start() == 8);
	CHECK(t2.start() == 5);
	CHECK(t1.start() == 0);
}

static void check_against_fresh(Resource<dtime_t>& r)
{
	dtime_t total = 0;
	for (const auto& timing : view_timeline(r.get_head())) {
		CHECK(timing.task->earliest_start() == timing.earliest_start);
		CHECK(timing.task->start() == timing.start);
		total += late(timing.start, timing.task->get_target());
	}
	CHECK(r.score() == total);
}

TEST_CASE("[propagation] cached timing matches a full recomputation") {
	std::mt19937 gen(20240917);
	std::uniform_int_distribution<int> op(0, 5);
	std::uniform_int_distribution<dtime_t> duration(1, 6);
	std::uniform_int_distribution<dtime_t> target(0, 40);
	std::uniform_int_distribution<dtime_t> margin(0, 2);

	std::vector<std::unique_ptr<Task<dtime_t>>> pool;
	for (int i = 0; i < 12; i++) {
		dtime_t d = duration(gen);
		dtime_t t = target(gen);
		dtime_t m = margin(gen);
		pool.emplace_back(new Task<dtime_t>("T" + std::to_string(i), d, t, m));
	}
	std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);

	Resource<dtime_t> r("R1");
	for (int i = 0; i < 8; i++)
		r.add_tail(*pool[i]);

	for (int step = 0; step < 400; step++) {
		Task<dtime_t>& a = *pool[pick(gen)];
		Task<dtime_t>& b = *pool[pick(gen)];

		switch (op(gen)) {
			case 0:
				r.add_tail(a);
				break;
			case 1:
				a.drop();
				break;
			case 2:
				if (b.get_resource() && &a != &b)
					a.insert(&b);
				break;
			case 3:
				a.move_out();
				break;
			case 4:
				a.move_in();
				break;
			default:
				a.set_target(target(gen));
				break;
		}
		REQUIRE(r.check_links());

		// leave the caches partly stale most of the time
		if (step % 4 == 0) {
			check_against_fresh(r);
		} else if (b.get_resource()) {
			auto timing = view_timeline(&b);
			for (const auto& tt : timing)
				if (tt.task == &b)
					CHECK(b.start() == tt.start);
		}
	}
	check_against_fresh(r);
}
