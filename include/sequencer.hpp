#ifndef SEQ_SEQUENCER_HPP
#define SEQ_SEQUENCER_HPP

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.h"
#include "clock.hpp"
#include "problem.hpp"
#include "io.hpp"
#include "logger.hpp"
#include "resource.hpp"

namespace SEQ {

	/**
	 * @brief Enforces the CPU time limit of a sequencing run.
	 *
	 * The engine itself cannot be interrupted; the limit is checked between
	 * two engine calls (insertions, improvement passes).
	 */
	class Limit_monitor
	{
	public:
		/**
		 * @param max_cpu_time Maximum CPU time in seconds (0 = unlimited)
		 */
		explicit Limit_monitor(double max_cpu_time = 0)
		: max_cpu_time(max_cpu_time)
		, timed_out(false)
		{
		}

		void start_timing()
		{
			cpu_clock.start();
		}

		void stop_timing()
		{
			cpu_clock.stop();
		}

		double get_cpu_time() const
		{
			return cpu_clock;
		}

		/**
		 * @brief Check if CPU time limit has been exceeded.
		 * @return true if timeout occurred, false otherwise
		 */
		bool check_timeout()
		{
			if (max_cpu_time > 0 && get_cpu_time() > max_cpu_time)
				timed_out = true;
			return timed_out;
		}

		bool is_timed_out() const
		{
			return timed_out;
		}

	private:
		const double max_cpu_time;
		Processor_clock cpu_clock;
#ifdef CONFIG_PARALLEL
		std::atomic<bool> timed_out;
#else
		bool timed_out;
#endif
	};

	/**
	 * @brief Counters of a sequencing run.
	 *
	 * Thread-safe when CONFIG_PARALLEL is defined.
	 */
	class Sequencing_statistics
	{
	public:
		Sequencing_statistics()
		: num_resources(0)
		, num_tasks(0)
		, num_insertions(0)
		, num_swaps(0)
		{
		}

		void count_resource(unsigned long tasks)
		{
#ifdef CONFIG_PARALLEL
			num_resources.fetch_add(1, std::memory_order_relaxed);
			num_tasks.fetch_add(tasks, std::memory_order_relaxed);
#else
			++num_resources;
			num_tasks += tasks;
#endif
		}

		void count_insertion()
		{
#ifdef CONFIG_PARALLEL
			num_insertions.fetch_add(1, std::memory_order_relaxed);
#else
			++num_insertions;
#endif
		}

		void count_swaps(unsigned long swaps)
		{
#ifdef CONFIG_PARALLEL
			num_swaps.fetch_add(swaps, std::memory_order_relaxed);
#else
			num_swaps += swaps;
#endif
		}

		unsigned long get_num_resources() const
		{
			return num_resources;
		}

		unsigned long get_num_tasks() const
		{
			return num_tasks;
		}

		unsigned long get_num_insertions() const
		{
			return num_insertions;
		}

		unsigned long get_num_swaps() const
		{
			return num_swaps;
		}

	private:
#ifdef CONFIG_PARALLEL
		std::atomic<unsigned long> num_resources;
		std::atomic<unsigned long> num_tasks;
		std::atomic<unsigned long> num_insertions;
		std::atomic<unsigned long> num_swaps;
#else
		unsigned long num_resources;
		unsigned long num_tasks;
		unsigned long num_insertions;
		unsigned long num_swaps;
#endif
	};

	// outcome for one resource
	template<class Time>
	struct Resource_result {
		std::string id;
		Time score_before;
		Time score_after;
		unsigned int swaps;
		bool branch_merged;
		// tasks appended without a slot search because time ran out
		std::vector<std::string> appended;
		std::vector<Task_solution<Time>> solution;
		std::string trace_csv;
	};

	/**
	 * @brief Sequences every resource of a problem: builds the committed
	 *        chain, inserts the pending tasks, improves the chain and reads
	 *        out the result.
	 */
	template<class Time>
	class Sequencer
	{
	public:

		static std::unique_ptr<Sequencer<Time>> sequence(
			const Sequencing_problem<Time>& problem,
			const Sequencing_options& opts = Sequencing_options())
		{
			auto s = std::unique_ptr<Sequencer<Time>>(new Sequencer<Time>(problem, opts));
			s->run();
			return s;
		}

		const std::vector<Resource_result<Time>>& get_results() const
		{
			return results;
		}

		const Sequencing_statistics& get_statistics() const
		{
			return stats;
		}

		std::vector<Task_solution<Time>> get_solution() const
		{
			std::vector<Task_solution<Time>> all;
			for (const auto& r : results)
				all.insert(all.end(), r.solution.begin(), r.solution.end());
			return all;
		}

		Time get_score_before() const
		{
			Time total = 0;
			for (const auto& r : results)
				total += r.score_before;
			return total;
		}

		Time get_score_after() const
		{
			Time total = 0;
			for (const auto& r : results)
				total += r.score_after;
			return total;
		}

		bool was_timed_out() const
		{
			return monitor.is_timed_out();
		}

		double get_cpu_time() const
		{
			return monitor.get_cpu_time();
		}

		void print_trace_csv(std::ostream& out) const
		{
			out << "Resource, Level, Event, Task ID, Value" << std::endl;
			for (const auto& r : results)
				out << r.trace_csv;
		}

	private:

		const Sequencing_problem<Time> problem;
		const Sequencing_options options;
		std::vector<Resource_result<Time>> results;
		Sequencing_statistics stats;
		Limit_monitor monitor;

		Sequencer(const Sequencing_problem<Time>& problem, const Sequencing_options& opts)
		: problem(problem)
		, options(opts)
		, results(problem.resources.size())
		, monitor(opts.timeout)
		{
		}

		void run()
		{
			monitor.start_timing();
			std::size_t n = problem.resources.size();

#ifdef CONFIG_PARALLEL
			if (options.parallel_enabled && n > 1) {
				std::unique_ptr<tbb::task_arena> task_arena;
				if (options.num_threads > 0)
					task_arena = std::make_unique<tbb::task_arena>(options.num_threads);
				else
					task_arena = std::make_unique<tbb::task_arena>(tbb::task_arena::automatic);
				task_arena->execute([&]() {
					tbb::parallel_for(tbb::blocked_range<std::size_t>(0, n),
						[&](const tbb::blocked_range<std::size_t>& range) {
							for (std::size_t i = range.begin(); i != range.end(); ++i)
								sequence_resource(i);
						});
				});
			} else
#endif
			for (std::size_t i = 0; i < n; i++)
				sequence_resource(i);

			monitor.stop_timing();
		}

		void sequence_resource(std::size_t i)
		{
			const Resource_spec<Time>& spec = problem.resources[i];
			Resource_result<Time>& result = results[i];
			result.id = spec.id;
			result.swaps = 0;
			result.branch_merged = false;

			if (options.verbose)
				std::cerr << "Sequencing " << spec.id << ": "
				          << spec.tasks.size() << " tasks, "
				          << spec.insertions.size() << " to insert" << std::endl;

			// the resource is declared last so that it is gone before its tasks
			std::vector<std::unique_ptr<Task<Time>>> tasks;
			std::unordered_map<std::string, std::string> project_of;
			Sequencing_logger<Time> logger(options.trace_level);
			Resource<Time> resource(spec.id);
#ifdef CONFIG_COLLECT_TRACE
			if (options.collect_trace)
				resource.set_logger(&logger);
#endif

			for (const auto& t : spec.tasks) {
				tasks.emplace_back(new Task<Time>(t.id, t.duration, t.target, t.margin));
				project_of[t.id] = t.project;
				resource.add_tail(*tasks.back());
			}
			stats.count_resource(spec.tasks.size());
			result.score_before = resource.schedule();

			for (const auto& t : spec.insertions) {
				tasks.emplace_back(new Task<Time>(t.id, t.duration, t.target, t.margin));
				project_of[t.id] = t.project;
				if (monitor.check_timeout()) {
					// still part of the solution, just not placed
					resource.add_tail(*tasks.back());
					result.appended.push_back(t.id);
					continue;
				}
				resource.insert_best(*tasks.back());
				stats.count_insertion();
			}

			if (options.improve && !monitor.check_timeout()) {
				if (options.use_branch) {
					Improvement<Time> imp = resource.improve(true);
					// commit only what actually lowers the score
					if (imp.improvement < 0) {
						imp.branch.merge();
						result.swaps = imp.swaps;
						result.branch_merged = true;
					}
				} else {
					result.swaps = resource.improve().swaps;
				}
				stats.count_swaps(result.swaps);
			}

			result.score_after = resource.score();

			for (Task<Time>& t : resource.tasks())
				result.solution.push_back(Task_solution<Time>{
					spec.id, project_of[t.get_id()], t.get_id(), t.start(), t.end()});

			std::ostringstream trace;
			logger.print_csv(trace, spec.id);
			result.trace_csv = trace.str();
		}
	};
}

#endif
