#include "doctest.h"

#include <sstream>
#include <string>
#include <vector>

#include "io.hpp"
#include "problem.hpp"
#include "problem_builder.hpp"
#include "sequencer.hpp"
#include "sequencing_config.hpp"
#include "sequencing_result.hpp"

using namespace SEQ;

const std::string two_resources =
"resources:\n"
"  - id: R1\n"
"    tasks:\n"
"      - {Project ID: P1, Task ID: T1, Duration: 5, Target: 10}\n"
"      - {Project ID: P1, Task ID: T2, Duration: 3, Target: 0}\n"
"      - {Project ID: P1, Task ID: T3, Duration: 4, Target: 20}\n"
"  - id: R2\n"
"    tasks:\n"
"      - {Project ID: P2, Task ID: A, Duration: 2, Target: 0}\n"
"      - {Project ID: P2, Task ID: C, Duration: 2, Target: 20}\n"
"    insert:\n"
"      - {Project ID: P3, Task ID: B, Duration: 3, Target: 10}\n";

static Sequencing_problem<dtime_t> load(const std::string& yaml)
{
	auto in = std::istringstream(yaml);
	return Sequencing_problem<dtime_t>{parse_yaml_problem<dtime_t>(in)};
}

TEST_CASE("[sequencer] two resources") {
	auto prob = load(two_resources);
	Sequencing_options opts;

	auto seq = Sequencer<dtime_t>::sequence(prob, opts);
	const auto& results = seq->get_results();
	REQUIRE(results.size() == 2);

	CHECK(results[0].id == "R1");
	CHECK(results[0].score_before == 5);
	CHECK(results[0].score_after == 0);
	CHECK(results[0].swaps == 1);
	REQUIRE(results[0].solution.size() == 3);
	CHECK(results[0].solution[0].task == "T2");
	CHECK(results[0].solution[0].start == 0);
	CHECK(results[0].solution[0].end == 3);
	CHECK(results[0].solution[1].task == "T1");
	CHECK(results[0].solution[1].start == 10);
	CHECK(results[0].solution[2].task == "T3");
	CHECK(results[0].solution[2].start == 20);

	CHECK(results[1].id == "R2");
	CHECK(results[1].score_before == 0);
	CHECK(results[1].score_after == 0);
	CHECK(results[1].swaps == 0);
	REQUIRE(results[1].solution.size() == 3);
	CHECK(results[1].solution[0].task == "A");
	CHECK(results[1].solution[1].task == "B");
	CHECK(results[1].solution[1].project == "P3");
	CHECK(results[1].solution[1].start == 10);
	CHECK(results[1].solution[1].end == 13);
	CHECK(results[1].solution[2].task == "C");
	CHECK(results[1].solution[2].start == 20);

	const auto& stats = seq->get_statistics();
	CHECK(stats.get_num_resources() == 2);
	CHECK(stats.get_num_tasks() == 5);
	CHECK(stats.get_num_insertions() == 1);
	CHECK(stats.get_num_swaps() == 1);

	CHECK(seq->get_score_before() == 5);
	CHECK(seq->get_score_after() == 0);
	CHECK(seq->get_solution().size() == 6);
	CHECK_FALSE(seq->was_timed_out());
}

TEST_CASE("[sequencer] improving in a branch") {
	auto prob = load(two_resources);
	Sequencing_options opts;
	opts.use_branch = true;

	auto seq = Sequencer<dtime_t>::sequence(prob, opts);
	const auto& results = seq->get_results();
	REQUIRE(results.size() == 2);

	CHECK(results[0].branch_merged);
	CHECK(results[0].swaps == 1);
	CHECK(results[0].score_after == 0);
	CHECK(results[0].solution[0].task == "T2");

	// nothing to gain on R2, so its branch is dropped
	CHECK_FALSE(results[1].branch_merged);
	CHECK(results[1].solution[1].task == "B");
}

TEST_CASE("[sequencer] without improvement") {
	auto prob = load(two_resources);
	Sequencing_options opts;
	opts.improve = false;

	auto seq = Sequencer<dtime_t>::sequence(prob, opts);
	const auto& results = seq->get_results();

	CHECK(results[0].swaps == 0);
	CHECK(results[0].score_after == 5);
	CHECK(results[0].solution[0].task == "T1");
	CHECK(results[0].solution[1].task == "T2");
	CHECK(results[0].solution[1].start == 5);
}

TEST_CASE("[sequencer] every task is placed when time runs out") {
	std::vector<Task_row<dtime_t>> chain;
	for (int i = 0; i < 200; i++)
		chain.push_back(Task_row<dtime_t>{"R1", {"P1", "T" + std::to_string(i), 2, 3 * i, 0}});
	std::vector<Task_row<dtime_t>> inserted;
	for (int i = 0; i < 5; i++)
		inserted.push_back(Task_row<dtime_t>{"R1", {"P2", "X" + std::to_string(i), 1, 10 * i, 0}});
	Sequencing_problem<dtime_t> prob{chain, inserted};

	Sequencing_options opts;
	opts.timeout = 1e-9;

	auto seq = Sequencer<dtime_t>::sequence(prob, opts);
	const auto& result = seq->get_results()[0];

	CHECK(seq->get_solution().size() == 205);
	CHECK(result.appended.size() + seq->get_statistics().get_num_insertions() == 5);
	if (seq->was_timed_out())
		CHECK(result.appended.size() > 0);
	for (const auto& s : seq->get_solution())
		CHECK(s.end > s.start);
}

TEST_CASE("[sequencer] building a problem from CSV files") {
	auto in = std::istringstream(
		"Resource, Project ID, Task ID, Duration, Target\n"
		"R1, P1, T1, 10, 10\n"
		"R1, P1, T2, 3, 0\n");
	Sequencing_config config;

	auto prob = problem_builder<dtime_t>(in, false, config);
	REQUIRE(prob->resources.size() == 1);
	CHECK(prob->number_of_tasks() == 2);

	auto seq = Sequencer<dtime_t>::sequence(*prob, make_sequencing_options(config));
	config.want_solution_file = true;
	auto result = get_sequencing_result<dtime_t>(seq, config);

	CHECK(result.number_of_resources == 1);
	CHECK(result.number_of_tasks == 2);
	CHECK(result.score_before == 10);
	CHECK(result.score_after == 0);
	CHECK(result.number_of_swaps == 1);
	CHECK(result.solution_csv ==
		"Resource, Project ID, Task ID, Start, End\n"
		"R1, P1, T2, 0, 3\n"
		"R1, P1, T1, 10, 20\n");
	CHECK(result.trace_csv.empty());

	std::ostringstream out;
	print_result("plan.csv", result, out);
	CHECK(out.str().find("plan.csv,  1,  2,  0,  10,  0,  1") == 0);
}

TEST_CASE("[sequencer] missing insertion file") {
	auto in = std::istringstream(
		"Resource, Project ID, Task ID, Duration, Target\n"
		"R1, P1, T1, 10, 10\n");
	Sequencing_config config;
	config.want_insertions = true;
	config.insertions_file = "/nonexistent/insertions.csv";

	CHECK_THROWS_AS(problem_builder<dtime_t>(in, false, config), std::ios_base::failure);
}

TEST_CASE("[sequencer] trace of the engine") {
	auto prob = load(two_resources);
	Sequencing_options opts;
	opts.collect_trace = true;
	opts.trace_level = trace_info;

	auto seq = Sequencer<dtime_t>::sequence(prob, opts);

	std::ostringstream out;
	seq->print_trace_csv(out);
	std::string trace = out.str();
	CHECK(trace.find("Resource, Level, Event, Task ID, Value\n") == 0);
	CHECK(trace.find("R1, info, swap, T2, 0") != std::string::npos);
	CHECK(trace.find("R2, info, insert, B, 0") != std::string::npos);
	CHECK(trace.find("debug") == std::string::npos);
}
