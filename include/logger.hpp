#ifndef SEQ_LOGGER_HPP
#define SEQ_LOGGER_HPP

#include <deque>
#include <ostream>
#include <string>

#include "config.h"

// Runtime trace of the sequencing engine. Events are only emitted when the
// engine is compiled with CONFIG_COLLECT_TRACE; otherwise SEQ_TRACE expands
// to nothing and the engine carries no logging cost.
#ifdef CONFIG_COLLECT_TRACE
#define SEQ_TRACE(task, level, kind, value) (task)->trace(level, kind, value)
#else
#define SEQ_TRACE(task, level, kind, value)
#endif

namespace SEQ {

	enum Trace_level {
		trace_off = 0,
		trace_info = 1,
		trace_debug = 2
	};

	enum Trace_kind {
		recompute_earliest_start,
		recompute_start,
		swap_tasks,
		insert_task,
		drop_task,
		fork_task,
		merge_branch
	};

	inline const char* trace_kind_name(Trace_kind kind)
	{
		switch (kind) {
			case recompute_earliest_start: return "earliest_start";
			case recompute_start: return "start";
			case swap_tasks: return "swap";
			case insert_task: return "insert";
			case drop_task: return "drop";
			case fork_task: return "fork";
			case merge_branch: return "merge";
		}
		return "unknown";
	}

	inline const char* trace_level_name(Trace_level level)
	{
		switch (level) {
			case trace_off: return "off";
			case trace_info: return "info";
			case trace_debug: return "debug";
		}
		return "unknown";
	}

	template<class Time>
	struct Trace_event {
		Trace_level level;
		Trace_kind kind;
		std::string task;
		Time value;
	};

	/**
	 * @brief Collects the trace events emitted by the tasks of one resource.
	 *
	 * Recomputations are reported at trace_debug (they are frequent), structural
	 * changes at trace_info. Events above the threshold are dropped on arrival.
	 * A logger is attached to a single resource, so it needs no locking even
	 * when resources are sequenced in parallel.
	 */
	template<class Time>
	class Sequencing_logger {
		std::deque<Trace_event<Time>> events;
		Trace_level threshold;

	public:
		explicit Sequencing_logger(Trace_level threshold = trace_info)
		: threshold(threshold)
		{
		}

		bool enabled(Trace_level level) const
		{
			return level != trace_off && level <= threshold;
		}

		void set_threshold(Trace_level level)
		{
			threshold = level;
		}

		Trace_level get_threshold() const
		{
			return threshold;
		}

		void log(Trace_level level, Trace_kind kind, const std::string& task, Time value)
		{
			if (enabled(level))
				events.push_back(Trace_event<Time>{level, kind, task, value});
		}

		const std::deque<Trace_event<Time>>& get_events() const
		{
			return events;
		}

		std::size_t size() const
		{
			return events.size();
		}

		void clear()
		{
			events.clear();
		}

		// one row per event, prefixed with the name of the traced resource
		void print_csv(std::ostream& out, const std::string& resource) const
		{
			for (const auto& e : events) {
				out << resource << ", "
				    << trace_level_name(e.level) << ", "
				    << trace_kind_name(e.kind) << ", "
				    << e.task << ", "
				    << e.value << std::endl;
			}
		}
	};
}

#endif
