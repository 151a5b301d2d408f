#ifndef SEQ_IO_HPP
#define SEQ_IO_HPP

#include <iostream>
#include <string>
#include <vector>

#include "time.hpp"
#include "problem.hpp"
#include "yaml-cpp/yaml.h"

namespace SEQ {

	inline void skip_over(std::istream& in, char c)
	{
		while (in.good() && in.get() != (int) c)
			/* skip */;
	}

	inline bool skip_one(std::istream& in, char c)
	{
		if (in.good() && in.peek() == (int) c) {
			in.get(); /* skip */
			return true;
		} else
			return false;
	}

	inline void skip_all(std::istream& in, char c)
	{
		while (skip_one(in, c))
			/* skip */;
	}

	inline bool more_data(std::istream& in)
	{
		in.peek();
		return !in.eof();
	}

	inline bool more_fields_in_line(std::istream& in)
	{
		if (!in.good() || in.peek() == (int)'\n' || in.peek() == (int)'\r')
			return false;
		else
			return true;
	}

	inline void next_field(std::istream& in)
	{
		while (in.good() && (in.peek() == ',' || in.peek() == ' '))
		{
			// eat up any trailing spaces
			skip_all(in, ' ');
			// eat up field separator
			skip_one(in, ',');
		}
	}

	inline void next_line(std::istream& in)
	{
		skip_over(in, '\n');
	}

	// reads a text field up to the next separator, without surrounding blanks
	inline std::string parse_text_field(std::istream& in)
	{
		std::string field;
		skip_all(in, ' ');
		while (in.good()) {
			int c = in.peek();
			if (c == ',' || c == '\n' || c == '\r' || c == std::char_traits<char>::eof())
				break;
			field.push_back((char) in.get());
		}
		auto last = field.find_last_not_of(" \t");
		field.erase(last == std::string::npos ? 0 : last + 1);
		if (field.empty())
			throw std::ios_base::failure("empty field");
		return field;
	}

	/**
	 * @brief Parses one task row: Resource, Project ID, Task ID, Duration,
	 *        Target[, Margin]. A missing margin means 0.
	 */
	template<class Time>
	Task_row<Time> parse_task_row(std::istream& in)
	{
		Task_row<Time> row;
		row.task.margin = 0;

		std::ios_base::iostate state_before = in.exceptions();

		in.exceptions(std::istream::failbit | std::istream::badbit);

		row.resource = parse_text_field(in);
		next_field(in);
		row.task.project = parse_text_field(in);
		next_field(in);
		row.task.id = parse_text_field(in);
		next_field(in);
		in >> row.task.duration;
		next_field(in);
		in >> row.task.target;
		next_field(in);
		if (more_fields_in_line(in))
			in >> row.task.margin;

		in.exceptions(state_before);

		return row;
	}

	template<class Time>
	std::vector<Task_row<Time>> parse_csv_task_file(std::istream& in)
	{
		// first row contains the column headers, just skip it
		next_line(in);

		std::vector<Task_row<Time>> rows;

		while (more_data(in)) {
			rows.push_back(parse_task_row<Time>(in));
			// munge any trailing whitespace or extra columns
			next_line(in);
		}

		return rows;
	}

	template<class Time>
	Task_spec<Time> parse_yaml_task(const YAML::Node& t)
	{
		Task_spec<Time> spec;
		spec.project = t["Project ID"] ? t["Project ID"].as<std::string>() : std::string();
		spec.id = t["Task ID"].as<std::string>();
		spec.duration = t["Duration"].as<Time>();
		spec.target = t["Target"].as<Time>();
		spec.margin = t["Margin"] ? t["Margin"].as<Time>() : 0;
		return spec;
	}

	/**
	 * @brief Parses a YAML problem description:
	 *
	 *   resources:
	 *     - id: R1
	 *       tasks:   [ {Project ID: P, Task ID: T1, Duration: 5, Target: 10}, ... ]
	 *       insert:  [ ... ]
	 *
	 * @throws std::ios_base::failure if the document is malformed.
	 */
	template<class Time>
	typename Sequencing_problem<Time>::Resources parse_yaml_problem(std::istream& in)
	{
		typename Sequencing_problem<Time>::Resources resources;
		try {
			YAML::Node doc = YAML::Load(in);

			for (auto const &r : doc["resources"]) {
				Resource_spec<Time> spec;
				spec.id = r["id"].as<std::string>();
				if (r["tasks"])
					for (auto const &t : r["tasks"])
						spec.tasks.push_back(parse_yaml_task<Time>(t));
				if (r["insert"])
					for (auto const &t : r["insert"])
						spec.insertions.push_back(parse_yaml_task<Time>(t));
				resources.push_back(spec);
			}
		} catch (const YAML::Exception& e) {
			std::cerr << "Error reading YAML file: " << e.what() << std::endl;
			throw std::ios_base::failure(e.what());
		}
		return resources;
	}

	// Where and when a task ends up, as reported to the caller
	template<class Time>
	struct Task_solution {
		std::string resource;
		std::string project;
		std::string task;
		Time start;
		Time end;
	};

	template<class Time>
	void write_solution_csv(std::ostream& out, const std::vector<Task_solution<Time>>& solution)
	{
		out << "Resource, Project ID, Task ID, Start, End" << std::endl;
		for (const auto& s : solution) {
			out << s.resource << ", "
			    << s.project << ", "
			    << s.task << ", "
			    << s.start << ", "
			    << s.end << std::endl;
		}
	}
}

#endif
