#ifndef SEQ_RESOURCE_HPP
#define SEQ_RESOURCE_HPP

#include <exception>
#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "config.h"
#include "logger.hpp"
#include "tasks.hpp"
#include "improvement.hpp"

namespace SEQ {

	class InvalidAttachment : public std::exception
	{
	public:

		InvalidAttachment(const std::string& bad_id)
		: ref(bad_id)
		{}

		const std::string ref;

		virtual const char* what() const noexcept override
		{
			return "only committed tasks can be attached to a resource";
		}
	};

	// forward iteration over a committed chain
	template<class Time>
	class Task_iterator {
		Task<Time>* current;

	public:
		typedef std::forward_iterator_tag iterator_category;
		typedef Task<Time> value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Task<Time>* pointer;
		typedef Task<Time>& reference;

		explicit Task_iterator(Task<Time>* t)
		: current(t)
		{
		}

		Task<Time>& operator*() const
		{
			return *current;
		}

		Task<Time>* operator->() const
		{
			return current;
		}

		Task_iterator& operator++()
		{
			current = current->get_next();
			return *this;
		}

		Task_iterator operator++(int)
		{
			Task_iterator old = *this;
			++(*this);
			return old;
		}

		bool operator==(const Task_iterator& other) const
		{
			return current == other.current;
		}

		bool operator!=(const Task_iterator& other) const
		{
			return current != other.current;
		}
	};

	template<class Time>
	class Task_range {
		Task<Time>* first;

	public:
		explicit Task_range(Task<Time>* first)
		: first(first)
		{
		}

		Task_iterator<Time> begin() const
		{
			return Task_iterator<Time>(first);
		}

		Task_iterator<Time> end() const
		{
			return Task_iterator<Time>(nullptr);
		}

		bool empty() const
		{
			return first == nullptr;
		}
	};

	/**
	 * @brief A resource and the committed chain of tasks it executes.
	 *
	 * The resource does not own the tasks it was given; it owns the task
	 * copies that entered its chain through a merged branch.
	 */
	template<class Time>
	class Resource {

		std::string id;
		Task<Time>* head;
		Task<Time>* tail;
		std::vector<std::unique_ptr<Task<Time>>> retained;
		Sequencing_logger<Time>* logger;

		friend class Task<Time>;

	public:

		explicit Resource(const std::string& id)
		: id(id)
		, head(nullptr)
		, tail(nullptr)
		, logger(nullptr)
		{
		}

		Resource(const Resource<Time>&) = delete;
		Resource<Time>& operator=(const Resource<Time>&) = delete;

		const std::string& get_id() const
		{
			return id;
		}

		Task<Time>* get_head() const
		{
			return head;
		}

		Task<Time>* get_tail() const
		{
			return tail;
		}

		bool empty() const
		{
			return head == nullptr;
		}

		std::size_t size() const
		{
			std::size_t n = 0;
			for (Task<Time>* t = head; t; t = t->next)
				n++;
			return n;
		}

		void set_logger(Sequencing_logger<Time>* l)
		{
			logger = l;
		}

		Sequencing_logger<Time>* get_logger() const
		{
			return logger;
		}

		// the committed chain in order
		Task_range<Time> tasks() const
		{
			return Task_range<Time>(head);
		}

		/**
		 * @brief Appends a committed task to the chain.
		 * @throws InvalidAttachment if the task belongs to a branch.
		 */
		void add_tail(Task<Time>& task)
		{
			if (!task.is_root())
				throw InvalidAttachment(task.get_id());

			task.drop();
			task.resource = this;
			task.previous = tail;
			task.next = nullptr;
			if (tail)
				tail->next = &task;
			else
				head = &task;
			tail = &task;
			task.invalidate();
		}

		/**
		 * @brief Prepends a committed task to the chain.
		 * @throws InvalidAttachment if the task belongs to a branch.
		 */
		void add_head(Task<Time>& task)
		{
			if (!task.is_root())
				throw InvalidAttachment(task.get_id());

			task.drop();
			task.resource = this;
			task.previous = nullptr;
			task.next = head;
			if (head)
				head->previous = &task;
			else
				tail = &task;
			head = &task;
			task.invalidate();
		}

		// recomputes the whole chain from scratch
		Time schedule()
		{
			if (!head)
				return 0;
			head->invalidate();
			head->start();
			return score();
		}

		Time score() const
		{
			return head ? SEQ::score(head) : 0;
		}

		/**
		 * @brief Greedy local search: walks from the tail to the head and swaps
		 *        a task with its predecessor whenever that lowers the score.
		 * @param in_branch Work on a branch forked from the tail and leave the
		 *        committed chain untouched; the branch is returned for merging.
		 */
		Improvement<Time> improve(bool in_branch = false)
		{
			Improvement<Time> result{0, 0, Branch<Time>()};
			if (!tail)
				return result;

			Task<Time>* t = tail;
			if (in_branch) {
				result.branch = tail->branch();
				t = result.branch.root();
			}

			while (t->get_previous()) {
				Time delta = improvement_move_in(t, true);
				if (delta < 0) {
					result.improvement += delta;
					result.swaps++;
				} else {
					t = t->previous_in_branch();
				}
			}
			return result;
		}

		// earliest task of the chain that starts after the given day
		Task<Time>* find_after(Time after)
		{
			Task<Time>* found = nullptr;
			for (Task<Time>* t = tail; t && t->start() > after; t = t->previous)
				found = t;
			return found;
		}

		// first task starting after the given day with at least amount of slack
		Task<Time>* find_slack(Time after, Time amount)
		{
			Task<Time>* t = find_after(after);
			while (t && t->slack() < amount)
				t = t->next;
			return t;
		}

		/**
		 * @brief Inserts a new task where it costs the least slack, then lets
		 *        it sink further back while that lowers the score.
		 *
		 * In branch mode the committed chain is not touched: the insertion
		 * happens in a branch that is returned to the caller. Without a
		 * suitable slot the task goes to the end of the chain.
		 *
		 * @throws InvalidAttachment if the task belongs to a branch and is
		 *         inserted without branching.
		 */
		Branch<Time> insert_best(Task<Time>& task, bool in_branch = false)
		{
			if (!in_branch && !task.is_root())
				throw InvalidAttachment(task.get_id());

			Time needed = task.get_margin() + task.get_duration();
			Task<Time>* slot = find_slack(task.get_target(), needed);
			while (slot && slot->get_target() <= task.get_target())
				slot = slot->next;

			if (!slot) {
				if (!in_branch) {
					add_tail(task);
					SEQ_TRACE(&task, trace_info, insert_task, 0);
					return Branch<Time>();
				}
				return graft(task);
			}

			Branch<Time> result;
			Task<Time>* anchor = slot;
			if (in_branch) {
				result = slot->branch();
				anchor = result.root();
			}
			task.insert(anchor);

			Task<Time>* n = task.next_in_branch();
			while (n && improvement_move_in(n, true) < 0)
				n = task.next_in_branch();

			return result;
		}

		// verifies that the committed chain is properly doubly linked
		bool check_links() const
		{
			if (!head || !tail)
				return head == tail;
			if (head->previous || tail->next)
				return false;
			for (Task<Time>* t = head; t; t = t->next) {
				if (!t->is_root() || t->resource != this)
					return false;
				if (t->next && t->next->previous != t)
					return false;
				if (!t->next && t != tail)
					return false;
			}
			return true;
		}

		// takes over tasks created by a merged branch
		void retain(typename Branch_store<Time>::Nodes&& nodes)
		{
			for (auto& n : nodes)
				retained.push_back(std::move(n));
		}

		friend std::ostream& operator<< (std::ostream& stream, const Resource<Time>& r)
		{
			stream << r.id << "[";
			for (Task<Time>* t = r.head; t; t = t->next) {
				if (t != r.head)
					stream << ", ";
				stream << *t;
			}
			stream << "]";
			return stream;
		}

	private:

		// links the task behind the tail in a new branch
		Branch<Time> graft(Task<Time>& task)
		{
			std::unique_ptr<Branch_store<Time>> store(new Branch_store<Time>());
			task.drop();
			task.tag = store.get();
			store->enlist(&task);
			task.resource = this;
			task.previous = tail;
			task.next = nullptr;
			task.invalidate();
			SEQ_TRACE(&task, trace_info, insert_task, 0);
			return Branch<Time>(std::move(store), &task);
		}
	};

	template<class Time>
	void Task<Time>::trace(Trace_level level, Trace_kind kind, Time value) const
	{
		if (resource && resource->logger)
			resource->logger->log(level, kind, id, value);
	}
}

#endif
