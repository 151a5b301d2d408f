#ifndef SEQ_SEQUENCING_RESULT_HPP
#define SEQ_SEQUENCING_RESULT_HPP

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "sequencing_config.hpp"
#include "sequencer.hpp"
#include "problem.hpp"
#include "io.hpp"

namespace SEQ {

	/**
	 * @brief Structure to hold the results of a sequencing run
	 */
	struct Sequencing_result {
		unsigned long number_of_resources;
		unsigned long number_of_tasks;
		unsigned long number_of_insertions;
		long long score_before;
		long long score_after;
		unsigned long number_of_swaps;
		double cpu_time;
		bool timeout;
		std::string solution_csv;
		std::string trace_csv;
	};

	/**
	 * @brief print the header for the sequencing result output
	 */
	inline void print_header(std::ostream& out = std::cout)
	{
		out << "# file name"
		    << ", #resources"
		    << ", #tasks"
		    << ", #inserted"
		    << ", score before"
		    << ", score after"
		    << ", #swaps"
		    << ", CPU time"
		    << ", timeout"
		    << std::endl;
	}

	/**
	 * @brief print the sequencing result
	 * @param fname Name of the task file
	 * @param result Sequencing result to print
	 */
	inline void print_result(const std::string& fname, const Sequencing_result& result,
	                         std::ostream& out = std::cout)
	{
		out << fname
		    << ",  " << result.number_of_resources
		    << ",  " << result.number_of_tasks
		    << ",  " << result.number_of_insertions
		    << ",  " << result.score_before
		    << ",  " << result.score_after
		    << ",  " << result.number_of_swaps
		    << ",  " << std::fixed << result.cpu_time
		    << ",  " << (int) result.timeout
		    << std::endl;
	}

	/**
	 * @brief Save content next to the input file, replacing its extension
	 * @param fname Name of the input file
	 * @param extension Extension of the output file (e.g. ".sol.csv")
	 * @param content Content to write to the file
	 */
	inline void save_file_with_extension(const std::string& fname,
	                                     const std::string& extension,
	                                     const std::string& content)
	{
		if (content.empty() || fname.empty())
			return;

		std::string output_name = fname;
		auto p = output_name.find_last_of(".");
		if (p != std::string::npos)
			output_name.erase(p);
		output_name.append(extension);
		std::ofstream out(output_name, std::ios::out);
		out << content;
	}

	inline void save_result_files(const std::string& fname, const Sequencing_result& result,
	                              const Sequencing_config& config)
	{
		if (config.want_solution_file)
			save_file_with_extension(fname, ".sol.csv", result.solution_csv);
		if (config.want_trace_file)
			save_file_with_extension(fname, ".trace.csv", result.trace_csv);
	}

	/**
	 * @brief Extract the result of a sequencing run
	 */
	template<class Time>
	Sequencing_result get_sequencing_result(const std::unique_ptr<Sequencer<Time>>& seq,
	                                        const Sequencing_config& config)
	{
		const Sequencing_statistics& stats = seq->get_statistics();

		Sequencing_result result;
		result.number_of_resources = stats.get_num_resources();
		result.number_of_tasks = stats.get_num_tasks();
		result.number_of_insertions = stats.get_num_insertions();
		result.score_before = seq->get_score_before();
		result.score_after = seq->get_score_after();
		result.number_of_swaps = stats.get_num_swaps();
		result.cpu_time = seq->get_cpu_time();
		result.timeout = seq->was_timed_out();

		if (config.want_solution_file) {
			std::ostringstream sol;
			write_solution_csv(sol, seq->get_solution());
			result.solution_csv = sol.str();
		}
		if (config.want_trace_file) {
			std::ostringstream trace;
			seq->print_trace_csv(trace);
			result.trace_csv = trace.str();
		}
		return result;
	}

	inline Sequencing_options make_sequencing_options(const Sequencing_config& config)
	{
		Sequencing_options opts;
		opts.timeout = config.timeout;
		opts.improve = config.want_improve;
		opts.use_branch = config.want_branch;
		opts.collect_trace = config.want_trace_file;
		opts.trace_level = config.trace_level;
		opts.verbose = config.want_verbose;
#ifdef CONFIG_PARALLEL
		opts.parallel_enabled = config.want_parallel;
		opts.num_threads = config.num_threads;
#endif
		return opts;
	}
}

#endif
