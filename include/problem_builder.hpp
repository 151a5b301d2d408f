#ifndef SEQ_PROBLEM_BUILDER_HPP
#define SEQ_PROBLEM_BUILDER_HPP

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "problem.hpp"
#include "sequencing_config.hpp"
#include "io.hpp"

namespace SEQ {

	/**
	 * @brief Utility function to open a file stream and handle errors
	 * @param filename Name of the file to open
	 * @return Opened ifstream
	 * @throws std::ios_base::failure if the file cannot be opened
	 */
	inline std::ifstream open_file_stream(const std::string& filename)
	{
		std::ifstream file_stream(filename);
		if (!file_stream) {
			std::cerr << "Error: could not open file: " << filename << std::endl;
			throw std::ios_base::failure("could not open " + filename);
		}
		return file_stream;
	}

	/**
	 * @brief Utility function to determine if a file is in YAML format based on its extension
	 * @param fname Filename to check
	 */
	inline bool is_yaml(const std::string& fname)
	{
		std::string ext = fname.substr(fname.find_last_of(".") + 1);
		return (ext == "yaml" || ext == "yml" || ext == "YAML" || ext == "YML");
	}

	// rows to insert, read from a CSV file or from the insert lists of a YAML file
	template<class Time>
	std::vector<Task_row<Time>> parse_insertion_file(const std::string& fname)
	{
		auto in = open_file_stream(fname);
		if (!is_yaml(fname))
			return parse_csv_task_file<Time>(in);

		std::vector<Task_row<Time>> rows;
		for (const auto& r : parse_yaml_problem<Time>(in))
			for (const auto& t : r.insertions)
				rows.push_back(Task_row<Time>{r.id, t});
		return rows;
	}

	/**
	 * @brief Build a Sequencing_problem from a task stream and the
	 *        insertion file named in the configuration
	 */
	template<class Time>
	std::unique_ptr<Sequencing_problem<Time>> problem_builder(
		std::istream& in, bool in_is_yaml, const Sequencing_config& config)
	{
		std::vector<Task_row<Time>> chains;
		std::vector<Task_row<Time>> insertions;

		if (in_is_yaml) {
			auto resources = parse_yaml_problem<Time>(in);
			if (!config.want_insertions)
				return std::make_unique<Sequencing_problem<Time>>(resources);
			for (const auto& r : resources) {
				for (const auto& t : r.tasks)
					chains.push_back(Task_row<Time>{r.id, t});
				for (const auto& t : r.insertions)
					insertions.push_back(Task_row<Time>{r.id, t});
			}
		} else {
			chains = parse_csv_task_file<Time>(in);
		}

		if (config.want_insertions) {
			auto extra = parse_insertion_file<Time>(config.insertions_file);
			insertions.insert(insertions.end(), extra.begin(), extra.end());
		}
		return std::make_unique<Sequencing_problem<Time>>(chains, insertions);
	}

	template<class Time>
	std::unique_ptr<Sequencing_problem<Time>> problem_builder(
		const std::string& tasks_file, const Sequencing_config& config)
	{
		auto in = open_file_stream(tasks_file);
		return problem_builder<Time>(in, is_yaml(tasks_file), config);
	}
}

#endif
