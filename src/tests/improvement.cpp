#include "doctest.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "resource.hpp"

using namespace SEQ;

static std::vector<std::string> ids_of(const Resource<dtime_t>& r)
{
	std::vector<std::string> ids;
	for (const Task<dtime_t>& t : r.tasks())
		ids.push_back(t.get_id());
	return ids;
}

TEST_CASE("[improve] nothing to gain") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 8), t3("T3", 4, 20);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.add_tail(t3);
	r.schedule();

	auto imp = r.improve();
	CHECK(imp.improvement == 0);
	CHECK(imp.swaps == 0);
	CHECK(imp.branch.empty());
	CHECK(ids_of(r) == std::vector<std::string>{"T1", "T2", "T3"});
	CHECK(t1.start() == 3);
	CHECK(t2.start() == 8);
	CHECK(t3.start() == 20);
}

TEST_CASE("[improve] evaluating a swap leaves the chain alone") {
	Task<dtime_t> t1("T1", 10, 10), t2("T2", 3, 0);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	CHECK(r.score() == 10);
	CHECK(improvement_move_in(&t2) == -10);
	CHECK(ids_of(r) == std::vector<std::string>{"T1", "T2"});

	// the head has no predecessor to swap with
	CHECK(improvement_move_in(&t1) == 0);
}

TEST_CASE("[improve] an urgent task moves to the front") {
	Task<dtime_t> t1("T1", 10, 10), t2("T2", 3, 0);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);

	auto imp = r.improve();
	CHECK(imp.improvement == -10);
	CHECK(imp.swaps == 1);
	CHECK(ids_of(r) == std::vector<std::string>{"T2", "T1"});
	CHECK(r.score() == 0);
	CHECK(t2.start() == 0);
	CHECK(t1.start() == 10);
	CHECK(r.check_links());
}

TEST_CASE("[improve] a late task overtakes its predecessor") {
	Task<dtime_t> t1("T1", 5, 10), t2("T2", 3, 0), t3("T3", 4, 20);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.add_tail(t3);

	CHECK(r.schedule() == 5);

	auto imp = r.improve();
	CHECK(imp.improvement == -5);
	CHECK(imp.swaps == 1);
	CHECK(ids_of(r) == std::vector<std::string>{"T2", "T1", "T3"});
	CHECK(r.score() == 0);
	CHECK(t2.start() == 0);
	CHECK(t1.start() == 10);
	CHECK(t3.start() == 20);
}

TEST_CASE("[improve] swapping at the head with different margins shifts the rest") {
	Task<dtime_t> t1("T1", 2, 0), t2("T2", 2, 0, 3), t3("T3", 1, 4);
	Resource<dtime_t> r("R1");
	r.add_tail(t1);
	r.add_tail(t2);
	r.add_tail(t3);

	CHECK(r.score() == 8);

	// T2 loses its margin at the head, which also pulls T3 forward
	CHECK(improvement_move_in(&t2, true) == -6);
	CHECK(ids_of(r) == std::vector<std::string>{"T2", "T1", "T3"});
	CHECK(r.score() == 2);
	CHECK(t2.earliest_start() == 0);
	CHECK(t1.earliest_start() == 2);
	CHECK(t3.earliest_start() == 4);
	CHECK(t3.start() == 4);
}

TEST_CASE("[improve] the score never gets worse") {
	std::mt19937 gen(7);
	std::uniform_int_distribution<dtime_t> duration(1, 8);
	std::uniform_int_distribution<dtime_t> target(0, 60);
	std::uniform_int_distribution<dtime_t> margin(0, 3);

	for (int round = 0; round < 25; round++) {
		std::vector<std::unique_ptr<Task<dtime_t>>> tasks;
		Resource<dtime_t> r("R" + std::to_string(round));
		for (int i = 0; i < 10; i++) {
			dtime_t d = duration(gen);
			dtime_t t = target(gen);
			dtime_t m = margin(gen);
			tasks.emplace_back(new Task<dtime_t>("T" + std::to_string(i), d, t, m));
			r.add_tail(*tasks.back());
		}

		dtime_t before = r.schedule();
		auto imp = r.improve();

		CHECK(imp.improvement <= 0);
		CHECK(r.score() == before + imp.improvement);
		CHECK(r.size() == 10);
		CHECK(r.check_links());

		for (const auto& timing : view_timeline(r.get_head()))
			CHECK(timing.task->start() == timing.start);
	}
}
