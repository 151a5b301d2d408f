#ifndef SEQ_PROBLEM_HPP
#define SEQ_PROBLEM_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "time.hpp"
#include "resource.hpp"

namespace SEQ {

	// Description of one task as it appears in the input
	template<class Time>
	struct Task_spec {
		std::string project;
		std::string id;
		Time duration;
		Time target;
		Time margin;
	};

	// One row of a task file: a task and the resource it is assigned to
	template<class Time>
	struct Task_row {
		std::string resource;
		Task_spec<Time> task;
	};

	// A resource, its committed chain (in order) and the tasks to add to it
	template<class Time>
	struct Resource_spec {
		std::string id;
		std::vector<Task_spec<Time>> tasks;
		std::vector<Task_spec<Time>> insertions;
	};

	class InvalidTaskReference : public std::exception
	{
	public:

		InvalidTaskReference(const std::string& resource, const std::string& bad_id)
		: resource(resource)
		, ref(bad_id)
		{}

		const std::string resource;
		const std::string ref;

		virtual const char* what() const noexcept override
		{
			return "task identifier used twice on the same resource";
		}
	};

	template<class Time>
	void validate_task(const Task_spec<Time>& t)
	{
		if (t.duration < 1)
			throw InvalidTaskParameter(t.id, "duration");
		if (t.target < 0)
			throw InvalidTaskParameter(t.id, "target");
		if (t.margin < 0)
			throw InvalidTaskParameter(t.id, "margin");
	}

	// Description of a sequencing problem: independent resources
	template<class Time>
	struct Sequencing_problem {

		typedef std::vector<Resource_spec<Time>> Resources;

		Resources resources;

		// task identifiers are unique per resource, parameters in range
		void post_init_checks()
		{
			for (const auto& r : resources) {
				std::unordered_set<std::string> seen;
				for (const auto& t : r.tasks) {
					validate_task(t);
					if (!seen.insert(t.id).second)
						throw InvalidTaskReference(r.id, t.id);
				}
				for (const auto& t : r.insertions) {
					validate_task(t);
					if (!seen.insert(t.id).second)
						throw InvalidTaskReference(r.id, t.id);
				}
			}
		}

		Sequencing_problem(const Resources& resources)
		: resources(resources)
		{
			post_init_checks();
		}

		// groups rows by resource, keeping the order of first appearance
		Sequencing_problem(const std::vector<Task_row<Time>>& chains,
		                   const std::vector<Task_row<Time>>& insertions = {})
		{
			std::unordered_map<std::string, std::size_t> index;
			auto lookup = [&](const std::string& id) -> Resource_spec<Time>& {
				auto it = index.find(id);
				if (it != index.end())
					return resources[it->second];
				index.emplace(id, resources.size());
				resources.push_back(Resource_spec<Time>{id, {}, {}});
				return resources.back();
			};

			for (const auto& row : chains)
				lookup(row.resource).tasks.push_back(row.task);
			for (const auto& row : insertions)
				lookup(row.resource).insertions.push_back(row.task);

			post_init_checks();
		}

		std::size_t number_of_tasks() const
		{
			std::size_t n = 0;
			for (const auto& r : resources)
				n += r.tasks.size();
			return n;
		}

		std::size_t number_of_insertions() const
		{
			std::size_t n = 0;
			for (const auto& r : resources)
				n += r.insertions.size();
			return n;
		}
	};

	// Common options to pass to the sequencer
	struct Sequencing_options {
		// After how many seconds of CPU time should we stop improving?
		// Zero means unlimited.
		double timeout;

		// Run the local search after the insertions
		bool improve;

		// Improve in a branch and commit it only if it lowers the score
		bool use_branch;

		// Collect a trace of the engine (needs CONFIG_COLLECT_TRACE)
		bool collect_trace;
		Trace_level trace_level;

		// Should we write where we are in the sequencing?
		bool verbose;

#ifdef CONFIG_PARALLEL
		// Parallel execution options
		bool parallel_enabled = true;
		unsigned int num_threads = 0;  // 0 = auto-detect
#endif

		Sequencing_options()
		: timeout(0)
		, improve(true)
		, use_branch(false)
		, collect_trace(false)
		, trace_level(trace_info)
		, verbose(false)
#ifdef CONFIG_PARALLEL
		, parallel_enabled(true)
		, num_threads(0)
#endif
		{
		}
	};
}

#endif
