#include <iostream>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include "yaml-cpp/yaml.h"

#include "OptionParser.h"
#include "config.h"
#include "problem.hpp"
#include "problem_builder.hpp"
#include "sequencing_config.hpp"
#include "sequencing_result.hpp"
#include "sequencer.hpp"
#include "io.hpp"

using namespace SEQ;

static Sequencing_config seq_config;

static Sequencing_result sequence(std::istream& in, bool in_is_yaml)
{
	// Parse input files and create the sequencing problem description
	auto problem = problem_builder<dtime_t>(in, in_is_yaml, seq_config);

	if (seq_config.want_verbose)
		std::cerr << "Sequencing " << problem->resources.size() << " resources, "
		          << problem->number_of_tasks() << " tasks, "
		          << problem->number_of_insertions() << " to insert" << std::endl;

	// Actually call the sequencing engine
	auto seq = Sequencer<dtime_t>::sequence(*problem, make_sequencing_options(seq_config));

	return get_sequencing_result<dtime_t>(seq, seq_config);
}

static void process_file(const std::string& fname)
{
	try {
		Sequencing_result result;

		if (fname == "-") {
			result = sequence(std::cin, false);
		} else {
			auto in = open_file_stream(fname);
			result = sequence(in, is_yaml(fname));
			save_result_files(fname, result, seq_config);
		}

		if (seq_config.want_header) {
			print_header();
			seq_config.want_header = false; // only print header once
		}

		print_result(fname, result);
	} catch (std::ios_base::failure& ex) {
		std::cerr << fname;
		if (seq_config.want_insertions)
			std::cerr << " + " << seq_config.insertions_file;
		std::cerr << ": parse error" << std::endl;
		exit(1);
	} catch (InvalidTaskReference& ex) {
		std::cerr << fname << ": bad task reference: task " << ex.ref
		          << " appears twice on resource " << ex.resource
		          << std::endl;
		exit(3);
	} catch (InvalidTaskParameter& ex) {
		std::cerr << fname << ": invalid task parameter: " << ex.what()
		          << std::endl;
		exit(4);
	} catch (std::exception& ex) {
		std::cerr << fname << ": '" << ex.what() << "'" << std::endl;
		exit(1);
	}
}

int main(int argc, char** argv)
{
	auto parser = optparse::OptionParser();

	parser.description("Single-resource task sequencer");
	parser.usage("usage: %prog [OPTIONS]... [TASK FILES]...");

	// add an option to show the version
	parser.add_option("-v", "--version").dest("version")
		.action("store_true").set_default("0")
		.help("show program's version number and exit");

	parser.add_option("--config").dest("config_file")
		.metavar("CONFIG-FILE")
		.help("path to YAML configuration file")
		.set_default("");

	parser.add_option("-i", "--insert").dest("insertions_file")
		.help("name of the file that contains the tasks to insert into the chains")
		.set_default("");

	parser.add_option("--no-improve").dest("no_improve").set_default("0")
		.action("store_const").set_const("1")
		.help("do not run the local search after the insertions");

	parser.add_option("-b", "--branch").dest("branch").set_default("0")
		.action("store_const").set_const("1")
		.help("improve in a branch and commit it only if it lowers the lateness (default: off)");

	parser.add_option("-l", "--time-limit").dest("timeout")
		.help("maximum CPU time allowed (e.g. 90, 2m30s; zero means no limit)")
		.set_default("0");

	parser.add_option("-r", "--report").dest("report").set_default("0")
		.action("store_const").set_const("1")
		.help("store the start and end of every task in <file>.sol.csv (default: off)");

	parser.add_option("-g", "--trace").dest("trace").set_default("0")
		.action("store_const").set_const("1")
		.help("store a trace of the engine in <file>.trace.csv (default: off)");

	parser.add_option("--trace-level").dest("trace_level")
		.choices({"off", "info", "debug"}).set_default("info")
		.help("amount of detail in the trace: 'off', 'info' or 'debug' (default: info)");

	parser.add_option("--header").dest("print_header")
		.help("print a column header")
		.action("store_const").set_const("1")
		.set_default("0");

	parser.add_option("--verbose").dest("verbose").set_default("0")
		.action("store_const").set_const("1")
		.help("show the current status of the sequencing (default: off)");

	parser.add_option("--parallel").dest("parallel").set_default("1")
		.action("store_const").set_const("1")
		.help("sequence resources in parallel (default: on when compiled with CONFIG_PARALLEL)");

	parser.add_option("--no-parallel").dest("parallel").set_default("1")
		.action("store_const").set_const("0")
		.help("disable parallel execution");

	parser.add_option("--threads").dest("num_threads")
		.help("number of threads to use (0 = auto-detect)")
		.set_default("0");

	auto options = parser.parse_args(argc, argv);

	if (options.get("version")) {
		std::cout << parser.prog() << " version "
		          << VERSION_MAJOR << "."
		          << VERSION_MINOR << "."
		          << VERSION_PATCH << std::endl;
		return 0;
	}

	// Parse config file if provided (command line args take precedence)
	try {
		std::string config_file = (const std::string&)options.get("config_file");
		if (!config_file.empty())
			seq_config = parse_config_file(config_file);
		parse_input_options(options, seq_config);
	} catch (InvalidConfiguration& ex) {
		std::cerr << "Error: " << ex.what() << std::endl;
		return 1;
	}

#ifndef CONFIG_COLLECT_TRACE
	if (seq_config.want_trace_file) {
		std::cerr << "Error: trace collection support must be enabled "
		          << "during compilation (CONFIG_COLLECT_TRACE "
		          << "is not set)." << std::endl;
		return 2;
	}
#endif

	if (seq_config.want_insertions && parser.args().size() > 1) {
		std::cerr << "[!!] Warning: multiple task files "
		          << "with a single insertion file specified."
		          << std::endl;
	}

	// process_file is given the arguments that have been passed
	if (!parser.args().empty()) {
		for (auto f : parser.args())
			process_file(f);
	} else if (!seq_config.tasks_file.empty()) {
		process_file(seq_config.tasks_file);
	} else {
		process_file("-");
	}

	return 0;
}
