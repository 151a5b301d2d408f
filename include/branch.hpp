#ifndef SEQ_BRANCH_HPP
#define SEQ_BRANCH_HPP

#include <deque>
#include <memory>
#include <utility>
#include <vector>

namespace SEQ {

	template<class Time> class Task;
	template<class Time> class Resource;

	template<class Time> struct Task_timing;

	template<class Time>
	std::vector<Task<Time>*> chain_view(Task<Time>* t);

	template<class Time>
	std::vector<Task_timing<Time>> view_timeline(Task<Time>* t);

	template<class Time>
	Time score(Task<Time>* t);

	/**
	 * @brief Owner of the nodes materialized for one branch.
	 *
	 * The address of the store is the branch tag carried by every node of the
	 * branch. Nodes are copied into the store the first time a traversal of
	 * the branch crosses into a node that belongs to another chain. Tasks owned
	 * by the caller that join the branch (insert, graft) are enlisted so that
	 * discarding the branch leaves them detached instead of dangling.
	 */
	template<class Time>
	class Branch_store {
	public:
		typedef std::deque<std::unique_ptr<Task<Time>>> Nodes;

	private:
		Nodes pool;
		std::vector<Task<Time>*> enlisted;

	public:
		Branch_store() = default;
		Branch_store(const Branch_store&) = delete;
		Branch_store& operator=(const Branch_store&) = delete;

		~Branch_store()
		{
			for (Task<Time>* t : enlisted)
				if (t->get_branch_tag() == this)
					t->detach();
		}

		// field-wise copy of the original, owned by this store
		Task<Time>* acquire(const Task<Time>& original)
		{
			pool.emplace_back(new Task<Time>(original));
			return pool.back().get();
		}

		void enlist(Task<Time>* t)
		{
			enlisted.push_back(t);
		}

		// hands all materialized nodes over (used when the branch is merged)
		Nodes release()
		{
			Nodes out;
			out.swap(pool);
			enlisted.clear();
			return out;
		}

		std::size_t size() const
		{
			return pool.size();
		}
	};

	/**
	 * @brief Move-only handle on a speculative copy of part of a chain.
	 *
	 * Destroying the handle discards the branch; merge() commits it into the
	 * resource the branch was forked from. A branch must not outlive the chain
	 * (committed or branched) it was forked from.
	 */
	template<class Time>
	class Branch {
		std::unique_ptr<Branch_store<Time>> store;
		Task<Time>* entry;

	public:
		Branch()
		: entry(nullptr)
		{
		}

		Branch(std::unique_ptr<Branch_store<Time>> store, Task<Time>* entry)
		: store(std::move(store))
		, entry(entry)
		{
		}

		Branch(Branch&& other)
		: store(std::move(other.store))
		, entry(other.entry)
		{
			other.entry = nullptr;
		}

		Branch& operator=(Branch&& other)
		{
			if (this != &other) {
				store = std::move(other.store);
				entry = other.entry;
				other.entry = nullptr;
			}
			return *this;
		}

		Branch(const Branch&) = delete;
		Branch& operator=(const Branch&) = delete;

		bool empty() const
		{
			return entry == nullptr;
		}

		explicit operator bool() const
		{
			return !empty();
		}

		const Branch_store<Time>* tag() const
		{
			return store.get();
		}

		// the node the branch was created from
		Task<Time>* root() const
		{
			return entry;
		}

		// first node of the branch's view of the chain
		Task<Time>* head() const
		{
			Task<Time>* t = entry;
			while (t && t->get_previous())
				t = t->get_previous();
			return t;
		}

		std::vector<Task<Time>*> tasks() const
		{
			return chain_view(entry);
		}

		// starts and earliest starts of the whole view, as the branch sees them
		std::vector<Task_timing<Time>> timeline() const
		{
			return view_timeline(entry);
		}

		Time score() const
		{
			return entry ? SEQ::score(entry) : 0;
		}

		// Commits the branch. The handle stays usable for reading; its nodes
		// are now part of the committed chain.
		void merge()
		{
			if (entry)
				entry->merge();
		}
	};
}

#endif
