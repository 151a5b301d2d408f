#ifndef SEQ_SEQUENCING_CONFIG_HPP
#define SEQ_SEQUENCING_CONFIG_HPP

#include <cctype>
#include <exception>
#include <iostream>
#include <string>

#include "config.h"
#include "logger.hpp"
#include "yaml-cpp/yaml.h"
#include "OptionParser.h"

namespace SEQ {

	/**
	 * @brief Structure to hold the options of a sequencing run
	 */
	struct Sequencing_config {
		// Input files
		std::string tasks_file;
		bool want_insertions = false;
		std::string insertions_file;

		// Sequencing
		bool want_improve = true;
		bool want_branch = false;

		// Limits
		unsigned long long timeout = 0; // in seconds

		// Output options
		bool want_solution_file = false;
		bool want_trace_file = false;
		Trace_level trace_level = trace_info;
		bool want_header = false;
		bool want_verbose = false;

#ifdef CONFIG_PARALLEL
		bool want_parallel = true;
		unsigned int num_threads = 0;
#endif
	};

	class InvalidConfiguration : public std::exception
	{
	public:

		InvalidConfiguration(const std::string& source, const std::string& reason)
		: ref(source)
		, msg(source + ": " + reason)
		{}

		const std::string ref;

		virtual const char* what() const noexcept override
		{
			return msg.c_str();
		}

	private:
		std::string msg;
	};

	/**
	 * @brief Parse time limit string and convert to seconds
	 * @param time_str Time limit string (e.g., "1d2h15m30s" or "3600")
	 *                 Supported units: d (days), h (hours), m (minutes), s (seconds)
	 *                 Numbers without units are treated as seconds
	 * @return Time limit in seconds, or 0 if empty/invalid
	 * @note Logs error to stderr for unknown time units
	 */
	inline unsigned long long parse_time_limit(const std::string& time_str)
	{
		if (time_str.empty() || time_str == "none")
			return 0;

		unsigned long long total_seconds = 0;
		std::string num_str;

		for (char c : time_str) {
			if (isdigit(c) || c == '.') {
				num_str += c;
			} else if (!num_str.empty()) {
				double value = std::stod(num_str);
				switch (c) {
					case 'd': total_seconds += static_cast<unsigned long long>(value * 86400); break;
					case 'h': total_seconds += static_cast<unsigned long long>(value * 3600); break;
					case 'm': total_seconds += static_cast<unsigned long long>(value * 60); break;
					case 's': total_seconds += static_cast<unsigned long long>(value); break;
					default:
						std::cerr << "Error: Unknown time unit '" << c << "' in time limit string" << std::endl;
						return 0;
				}
				num_str.clear();
			}
		}

		// If there's a remaining number without unit, treat it as seconds
		if (!num_str.empty())
			total_seconds += static_cast<unsigned long long>(std::stod(num_str));

		return total_seconds;
	}

	inline Trace_level parse_trace_level(const std::string& level)
	{
		if (level == "off")
			return trace_off;
		if (level == "info")
			return trace_info;
		if (level == "debug")
			return trace_debug;
		throw InvalidConfiguration(level, "unknown trace level (use 'off', 'info' or 'debug')");
	}

	/**
	 * @brief Populate a configuration from a parsed YAML document
	 * @throws InvalidConfiguration if a value has the wrong type
	 */
	inline Sequencing_config parse_config(const YAML::Node& config, const std::string& source = "config")
	{
		Sequencing_config seq_config;
		try {
			// Parse input section
			if (config["input"]) {
				auto input = config["input"];
				if (input["tasks"]) {
					std::string tasks = input["tasks"].as<std::string>();
					if (!tasks.empty() && tasks != "none")
						seq_config.tasks_file = tasks;
				}
				if (input["insertions"]) {
					std::string ins = input["insertions"].as<std::string>();
					if (!ins.empty() && ins != "none") {
						seq_config.insertions_file = ins;
						seq_config.want_insertions = true;
					}
					else {
						seq_config.want_insertions = false;
					}
				}
			}

			// Parse sequencing section
			if (config["sequencing"]) {
				auto seq = config["sequencing"];
				if (seq["improve"])
					seq_config.want_improve = seq["improve"].as<bool>();
				if (seq["branch"])
					seq_config.want_branch = seq["branch"].as<bool>();
			}

			// Parse limits section
			if (config["limits"]) {
				auto limits = config["limits"];
				if (limits["runtime"])
					seq_config.timeout = parse_time_limit(limits["runtime"].as<std::string>());
			}

			// Parse output section
			if (config["output"]) {
				auto output = config["output"];
				if (output["solution"])
					seq_config.want_solution_file = output["solution"].as<bool>();
				if (output["trace"])
					seq_config.want_trace_file = output["trace"].as<bool>();
				if (output["trace_level"])
					seq_config.trace_level = parse_trace_level(output["trace_level"].as<std::string>());
			}

			// Parse pretty_printing section
			if (config["pretty_printing"]) {
				auto pp = config["pretty_printing"];
				if (pp["header"])
					seq_config.want_header = pp["header"].as<bool>();
				if (pp["verbose"])
					seq_config.want_verbose = pp["verbose"].as<bool>();
			}

#ifdef CONFIG_PARALLEL
			// Parse parallel_exploration section
			if (config["parallel_exploration"]) {
				auto parallel = config["parallel_exploration"];
				if (parallel["active"])
					seq_config.want_parallel = parallel["active"].as<bool>();
				if (parallel["threads"])
					seq_config.num_threads = parallel["threads"].as<unsigned int>();
			}
#endif
		} catch (const YAML::Exception& e) {
			throw InvalidConfiguration(source, e.what());
		}
		return seq_config;
	}

	inline Sequencing_config parse_config_file(const std::string& config_file)
	{
		YAML::Node config;
		try {
			config = YAML::LoadFile(config_file);
		} catch (const YAML::Exception& e) {
			throw InvalidConfiguration(config_file, e.what());
		}
		return parse_config(config, config_file);
	}

	/**
	 * @brief Override a configuration with the options given on the command line
	 * @param options Parsed command-line options
	 * @param seq_config Sequencing_config structure to populate
	 */
	inline void parse_input_options(const optparse::Values& options, Sequencing_config& seq_config)
	{
		if (options.is_set_by_user("insertions_file")) {
			std::string ins = (const std::string&)options.get("insertions_file");
			if (ins.empty())
				throw InvalidConfiguration("--insert", "insertion file not specified");
			seq_config.insertions_file = ins;
			seq_config.want_insertions = true;
		}

		if (options.is_set_by_user("no_improve"))
			seq_config.want_improve = false;
		if (options.is_set_by_user("branch"))
			seq_config.want_branch = true;

		if (options.is_set_by_user("timeout"))
			seq_config.timeout = parse_time_limit((const std::string&)options.get("timeout"));

		if (options.is_set_by_user("report"))
			seq_config.want_solution_file = true;
		if (options.is_set_by_user("trace"))
			seq_config.want_trace_file = true;
		if (options.is_set_by_user("trace_level"))
			seq_config.trace_level = parse_trace_level((const std::string&)options.get("trace_level"));

		if (options.is_set_by_user("print_header"))
			seq_config.want_header = true;
		if (options.is_set_by_user("verbose"))
			seq_config.want_verbose = true;

#ifdef CONFIG_PARALLEL
		if (options.is_set_by_user("parallel"))
			seq_config.want_parallel = options.get("parallel");
		if (options.is_set_by_user("num_threads"))
			seq_config.num_threads = options.get("num_threads");
#else
		if (options.is_set_by_user("parallel") || options.is_set_by_user("num_threads"))
			throw InvalidConfiguration("--parallel", "parallel execution support must be enabled "
			                           "during compilation (CONFIG_PARALLEL is not set)");
#endif
	}
}

#endif
