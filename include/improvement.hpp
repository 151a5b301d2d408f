#ifndef SEQ_IMPROVEMENT_HPP
#define SEQ_IMPROVEMENT_HPP

#include <algorithm>
#include <vector>

#include "tasks.hpp"

namespace SEQ {

	template<class Time>
	inline Time late(Time start, Time target)
	{
		return std::max<Time>(0, start - target);
	}

	template<class Time>
	struct Task_timing {
		Task<Time>* task;
		Time earliest_start;
		Time start;
	};

	/**
	 * @brief Timing of every task of the chain view containing t, computed
	 *        from scratch without reading or writing any cache.
	 *
	 * This is the authoritative read-out for a branch: the committed tasks in
	 * front of a branch keep the starts of the committed chain in their caches.
	 */
	template<class Time>
	std::vector<Task_timing<Time>> view_timeline(Task<Time>* t)
	{
		std::vector<Task<Time>*> view = chain_view(t);
		std::vector<Task_timing<Time>> timing(view.size());

		for (std::size_t i = 0; i < view.size(); i++) {
			timing[i].task = view[i];
			if (i == 0)
				timing[i].earliest_start = 0;
			else
				timing[i].earliest_start = timing[i - 1].earliest_start
				                         + view[i - 1]->get_duration()
				                         + view[i]->get_margin();
		}

		Time bound = Time_model::constants<Time>::infinity();
		for (std::size_t i = view.size(); i-- > 0;) {
			Task<Time>* task = view[i];
			timing[i].start = std::max(timing[i].earliest_start,
			                           std::min(task->get_target(), bound - task->get_duration()));
			bound = timing[i].start - task->get_margin();
		}
		return timing;
	}

	/**
	 * @brief Total lateness of the chain view containing t.
	 *
	 * A task is late only if its earliest start is past its target (the start
	 * is then pinned to the earliest start), so the score only needs the
	 * forward recurrence.
	 */
	template<class Time>
	Time score(Task<Time>* t)
	{
		Time total = 0;
		Time es = 0;
		Task<Time>* prev = nullptr;
		for (Task<Time>* task : chain_view(t)) {
			if (prev)
				es += prev->get_duration() + task->get_margin();
			total += late(es, task->get_target());
			prev = task;
		}
		return total;
	}

	/**
	 * @brief Change of the score if task swapped places with its predecessor.
	 *
	 * Negative values are improvements. With execute set, an improving swap
	 * is carried out.
	 */
	template<class Time>
	Time improvement_move_in(Task<Time>* task, bool execute = false)
	{
		Task<Time>* t1 = task->previous_in_branch();
		if (!t1)
			return 0;
		Task<Time>* t2 = task;

		Time m1 = t1->get_margin();
		Time m2 = t2->get_margin();
		Time d2 = t2->get_duration();

		// current t1 -> t2
		Time current = late(t1->start(), t1->get_target()) + late(t2->start(), t2->get_target());

		// alternative t2 -> t1
		bool at_head = t1->get_previous() == nullptr;
		Time slot = at_head ? 0 : t1->earliest_start() - m1 + m2;
		Time alternative = late(slot, t2->get_target()) + late(slot + d2 + m1, t1->get_target());

		Time delta = alternative - current;

		// at the head the margin of the first task is void, so swapping tasks
		// with different margins shifts everything behind the pair
		if (at_head && m1 != m2) {
			Time shift = m1 - m2;
			Time es = t2->earliest_start() + d2;
			for (Task<Time>* s = t2->get_next(); s; s = s->get_next()) {
				es += s->get_margin();
				delta += late(es + shift, s->get_target()) - late(es, s->get_target());
				es += s->get_duration();
			}
		}

		if (execute && delta < 0)
			task->move_in();

		return delta;
	}

	template<class Time>
	struct Improvement {
		Time improvement;
		unsigned int swaps;
		Branch<Time> branch;
	};
}

#endif
