#ifndef SEQ_TASKS_HPP
#define SEQ_TASKS_HPP

#include <algorithm>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config.h"
#include "time.hpp"
#include "logger.hpp"
#include "branch.hpp"

// Task nodes are only usable together with their resource: include
// "resource.hpp" rather than this header.

namespace SEQ {

	class InvalidTaskParameter : public std::exception
	{
	public:

		InvalidTaskParameter(const std::string& bad_id, const std::string& field)
		: ref(bad_id)
		, msg("invalid " + field + " for task " + bad_id)
		{}

		const std::string ref;

		virtual const char* what() const noexcept override
		{
			return msg.c_str();
		}

	private:
		std::string msg;
	};

	class InvalidMerge : public std::exception
	{
	public:

		InvalidMerge(const std::string& bad_id)
		: ref(bad_id)
		{}

		const std::string ref;

		virtual const char* what() const noexcept override
		{
			return "cannot merge a branch that is not attached to a resource";
		}
	};

	/**
	 * @brief A schedulable unit of work in the chain of a resource.
	 *
	 * Tasks form an intrusive doubly linked chain. Each task caches its
	 * earliest start (which depends on its predecessors) and its start (which
	 * depends on its successors) and recomputes them lazily: a cleared dirty
	 * flag guarantees the cached value matches the current chain.
	 *
	 * A task without branch tag belongs to the committed chain of its
	 * resource. A tagged task belongs to a branch; its links may point to
	 * nodes of the chain it was forked from, which are copied into the branch
	 * the first time they are crossed by next_in_branch() / previous_in_branch().
	 * Nodes of a different tag are never written to.
	 *
	 * Dirty flags obey two rules that the propagation relies on: a task whose
	 * earliest start is dirty also has a dirty start, and the tasks with a
	 * dirty start form a prefix of each run of equally tagged tasks.
	 */
	template<class Time>
	class Task {

		std::string id;
		Time duration;
		Time target;
		Time margin; // minimal gap after the end of the predecessor

		Time es;
		Time st;
		bool dirty;
		bool dirty_start;

		Task<Time>* next;
		Task<Time>* previous;
		Resource<Time>* resource;
		Branch_store<Time>* tag;

		friend class Branch_store<Time>;
		friend class Resource<Time>;

		// only branch stores duplicate tasks
		Task(const Task<Time>&) = default;

	public:

		/**
		 * @brief Creates a detached task.
		 * @param id Identifier, unique within a committed chain.
		 * @param duration Duration in days, at least 1.
		 * @param target Day on which the task should ideally start.
		 * @param min_margin_before Minimal gap after the end of the preceding task.
		 * @throws InvalidTaskParameter if a parameter is out of range.
		 */
		Task(const std::string& id, Time duration, Time target, Time min_margin_before = 0)
		: id(id)
		, duration(duration)
		, target(target)
		, margin(min_margin_before)
		, es(0)
		, st(target)
		, dirty(true)
		, dirty_start(true)
		, next(nullptr)
		, previous(nullptr)
		, resource(nullptr)
		, tag(nullptr)
		{
			if (duration < 1)
				throw InvalidTaskParameter(id, "duration");
			if (target < 0)
				throw InvalidTaskParameter(id, "target");
			if (min_margin_before < 0)
				throw InvalidTaskParameter(id, "margin");
		}

		Task<Time>& operator=(const Task<Time>&) = delete;

		const std::string& get_id() const
		{
			return id;
		}

		Time get_duration() const
		{
			return duration;
		}

		Time get_target() const
		{
			return target;
		}

		Time get_margin() const
		{
			return margin;
		}

		Task<Time>* get_next() const
		{
			return next;
		}

		Task<Time>* get_previous() const
		{
			return previous;
		}

		Resource<Time>* get_resource() const
		{
			return resource;
		}

		const Branch_store<Time>* get_branch_tag() const
		{
			return tag;
		}

		bool is_root() const
		{
			return tag == nullptr;
		}

		bool is_dirty() const
		{
			return dirty;
		}

		bool is_start_dirty() const
		{
			return dirty_start;
		}

		/**
		 * @brief Earliest start: 0 at the head of the chain, otherwise the end
		 *        of the predecessor plus this task's margin.
		 */
		Time earliest_start()
		{
			if (!dirty)
				return es;

			// collect the dirty run back to the first clean (or foreign) predecessor
			std::vector<Task<Time>*> work;
			for (Task<Time>* t = this; t && t->dirty; t = t->previous) {
				work.push_back(t);
				if (!t->previous || t->previous->tag != t->tag)
					break;
			}

			for (auto it = work.rbegin(); it != work.rend(); ++it) {
				Task<Time>* t = *it;
				Task<Time>* p = t->previous;
				t->es = p ? p->earliest_start() + p->duration + t->margin : 0;
				t->dirty = false;
				DM("earliest start of " << t->id << " = " << t->es << std::endl);
				SEQ_TRACE(t, trace_debug, recompute_earliest_start, t->es);
			}
			return es;
		}

		/**
		 * @brief Scheduled start: as close to the target as the successor
		 *        allows, never before the earliest start.
		 */
		Time start()
		{
			if (!dirty_start && !dirty)
				return st;

			std::vector<Task<Time>*> work;
			Task<Time>* t = this;
			while (true) {
				work.push_back(t);
				Task<Time>* s = t->next;
				if (!s)
					break;
				if (s->tag != t->tag) {
					// A foreign successor can be reused as long as it starts from
					// the same earliest start in this view as in its own chain.
					if (s->earliest_start() == t->earliest_start() + t->duration + s->margin)
						break;
					s = t->next_in_branch();
				}
				if (!s->dirty_start && !s->dirty)
					break;
				t = s;
			}

			for (auto it = work.rbegin(); it != work.rend(); ++it)
				(*it)->resolve_start((*it)->successor_bound());
			return st;
		}

		Time end()
		{
			return start() + duration;
		}

		Time slack()
		{
			return start() - earliest_start();
		}

		Time lateness()
		{
			return start() - target;
		}

		// latest start allowed by the successor
		Time successor_bound()
		{
			if (next)
				return next->start() - next->margin;
			return Time_model::constants<Time>::infinity();
		}

		void set_target(Time new_target)
		{
			if (new_target < 0)
				throw InvalidTaskParameter(id, "target");
			target = new_target;
			if (!dirty_start)
				invalidate_start(successor_bound());
		}

		// Marks the earliest start of this task and of its successors as stale,
		// and the start of its predecessors.
		void invalidate()
		{
			Task<Time>* t = this;
			while (true) {
				t->dirty = true;
				t->dirty_start = true;
				if (!t->next || t->next->tag != t->tag)
					break;
				t = t->next;
			}
			if (previous && previous->tag == tag)
				previous->invalidate_start();
		}

		// Marks the start of this task and of its predecessors as stale.
		void invalidate_start()
		{
			Task<Time>* t = this;
			while (!t->dirty_start) {
				t->dirty_start = true;
				if (!t->previous || t->previous->tag != t->tag)
					break;
				t = t->previous;
			}
		}

		/**
		 * @brief Recomputes the start immediately against a known successor
		 *        bound and propagates backward only while starts change.
		 */
		void invalidate_start(Time next_needed)
		{
			Task<Time>* t = this;
			Time bound = next_needed;
			while (true) {
				Time old = t->st;
				t->resolve_start(bound);
				Task<Time>* p = t->previous;
				if (t->st == old || !p || p->tag != t->tag || p->dirty_start)
					break;
				bound = t->st - t->margin;
				t = p;
			}
		}

		// successor as seen from this task's branch
		Task<Time>* next_in_branch()
		{
			Task<Time>* s = next;
			if (s && tag && s->tag != tag) {
				Task<Time>* copy = tag->acquire(*s);
				copy->tag = tag;
				copy->previous = this;
				copy->dirty = true;
				copy->dirty_start = true;
				next = copy;
				invalidate_start();
				SEQ_TRACE(copy, trace_debug, fork_task, 0);
				return copy;
			}
			return s;
		}

		// predecessor as seen from this task's branch
		Task<Time>* previous_in_branch()
		{
			Task<Time>* p = previous;
			if (p && tag && p->tag != tag) {
				Task<Time>* copy = tag->acquire(*p);
				copy->tag = tag;
				copy->next = this;
				copy->dirty_start = true;
				previous = copy;
				SEQ_TRACE(copy, trace_debug, fork_task, 0);
				return copy;
			}
			return p;
		}

		/**
		 * @brief Removes the task from its chain and closes the gap.
		 *
		 * Only neighbors of the same branch are relinked. The task keeps its
		 * branch tag but loses its links and resource.
		 */
		void drop()
		{
			Task<Time>* p = previous;
			Task<Time>* n = next;

			SEQ_TRACE(this, trace_info, drop_task, es);

			if (p && p->tag == tag)
				p->next = n;
			if (n && n->tag == tag)
				n->previous = p;
			if (!tag && resource) {
				if (resource->head == this)
					resource->head = n;
				if (resource->tail == this)
					resource->tail = p;
			}

			next = nullptr;
			previous = nullptr;
			resource = nullptr;
			dirty = true;
			dirty_start = true;

			if (n && n->tag == tag)
				n->invalidate();
			else if (p && p->tag == tag)
				p->invalidate_start();
		}

		/**
		 * @brief Detaches the task and links it immediately before anchor,
		 *        adopting the anchor's branch and resource.
		 */
		void insert(Task<Time>* anchor)
		{
			if (!anchor || anchor == this)
				return;

			drop();
			tag = anchor->tag;
			resource = anchor->resource;
			if (tag)
				tag->enlist(this);

			Task<Time>* p = anchor->previous_in_branch();
			previous = p;
			next = anchor;
			if (p)
				p->next = this;
			anchor->previous = this;
			if (!tag && resource && resource->head == anchor)
				resource->head = this;

			invalidate();
			SEQ_TRACE(this, trace_info, insert_task, 0);
		}

		// swaps this task with its successor; the swap is reported by the
		// successor, which moves forward
		void move_out()
		{
			Task<Time>* nxt = next_in_branch();
			if (!nxt)
				return;

			Task<Time>* p = previous;
			Task<Time>* after = nxt->next;

			if (p && p->tag == tag)
				p->next = nxt;
			nxt->previous = p;
			nxt->next = this;
			previous = nxt;
			next = after;
			if (after && after->tag == tag)
				after->previous = this;

			if (!tag && resource) {
				if (resource->head == this)
					resource->head = nxt;
				if (resource->tail == nxt)
					resource->tail = this;
			}

			// Away from the head the pair occupies the same span in either
			// order, so nothing after it moves. At the head the margin of the
			// first task is ignored and the tail of the chain may shift.
			if (!p && nxt->margin != margin) {
				nxt->invalidate();
			} else {
				nxt->dirty = true;
				nxt->dirty_start = true;
				dirty = true;
				dirty_start = true;
				if (p && p->tag == tag)
					p->invalidate_start();
			}
			SEQ_TRACE(nxt, trace_info, swap_tasks, 0);
		}

		// swaps this task with its predecessor
		void move_in()
		{
			Task<Time>* p = previous_in_branch();
			if (p)
				p->move_out();
		}

		/**
		 * @brief Forks a private copy of this task. The committed chain,
		 *        its resource and its neighbors are left untouched.
		 */
		Branch<Time> branch() const
		{
			std::unique_ptr<Branch_store<Time>> store(new Branch_store<Time>());
			Task<Time>* copy = store->acquire(*this);
			copy->tag = store.get();
			return Branch<Time>(std::move(store), copy);
		}

		/**
		 * @brief Commits the run of branch nodes around this task into the
		 *        committed chain of its resource, replacing the committed
		 *        segment it stands for.
		 * @throws InvalidMerge if the task has no resource.
		 */
		void merge()
		{
			if (!tag)
				return;
			if (!resource)
				throw InvalidMerge(id);

			Resource<Time>* owner = resource;
			Branch_store<Time>* store = tag;

			Task<Time>* first = this;
			while (first->previous && first->previous->tag)
				first = first->previous_in_branch();
			Task<Time>* last = this;
			while (last->next && last->next->tag)
				last = last->next_in_branch();

			Task<Time>* link_head = first->previous;
			Task<Time>* link_tail = last->next;

			// committed tasks replaced by the branch leave the chain
			Task<Time>* t = link_head ? link_head->next : owner->head;
			while (t && t != link_tail) {
				Task<Time>* following = t->next;
				t->detach();
				t = following;
			}

			for (t = first; ; t = t->next) {
				t->tag = nullptr;
				t->resource = owner;
				if (t == last)
					break;
			}

			if (link_head)
				link_head->next = first;
			else
				owner->head = first;
			if (link_tail)
				link_tail->previous = last;
			else
				owner->tail = last;

			owner->retain(store->release());
			first->invalidate();
			SEQ_TRACE(first, trace_info, merge_branch, 0);
		}

		// forwards an engine event to the logger of the resource
		void trace(Trace_level level, Trace_kind kind, Time value) const;

		friend std::ostream& operator<< (std::ostream& stream, const Task<Time>& t)
		{
			stream << t.id << "[d=";
			if (t.margin != 0)
				stream << t.margin << "+";
			stream << t.duration << ", t=" << t.target << ", s=";
			if (t.dirty_start)
				stream << "...";
			else
				stream << t.st;
			stream << "]";
			return stream;
		}

	private:

		void resolve_start(Time bound)
		{
			st = std::max(earliest_start(), std::min(target, bound - duration));
			dirty_start = false;
			DM("start of " << id << " = " << st << std::endl);
			SEQ_TRACE(this, trace_debug, recompute_start, st);
		}

		// leaves any chain without touching the neighbors
		void detach()
		{
			next = nullptr;
			previous = nullptr;
			resource = nullptr;
			tag = nullptr;
			dirty = true;
			dirty_start = true;
		}
	};

	/**
	 * @brief The chain as seen from t, in order: the predecessors reached
	 *        backward from t, t, and the successors reached forward.
	 */
	template<class Time>
	std::vector<Task<Time>*> chain_view(Task<Time>* t)
	{
		std::vector<Task<Time>*> view;
		if (!t)
			return view;
		for (Task<Time>* p = t; p; p = p->get_previous())
			view.push_back(p);
		std::reverse(view.begin(), view.end());
		for (Task<Time>* s = t->get_next(); s; s = s->get_next())
			view.push_back(s);
		return view;
	}
}

#endif
