#ifndef GRAPH_KSHORTEST_HPP
#define GRAPH_KSHORTEST_HPP

#include<cstddef>
#include<functional>
#include<map>
#include<memory>
#include<queue>
#include<vector>

namespace Graph {

/** class Graph::KShortest<Node, Cost>
 *
 * @brief a label-setting search that finds up
 * to `k` cheapest walks from the root to each
 * node.
 *
 * @desc like a Dijkstra search, this uses a data
 * interface: it waits for the client to feed it
 * the neighbors of the `current()` label.
 *
 * Unlike Dijkstra, each node can be settled up
 * to `k` times, and every settled label is kept
 * as a separate `TreeNode`, so the parent chain of
 * a label is the exact walk that reached it.
 *
 * The client gives each neighbor the total cost of
 * the extended walk rather than an edge weight, so
 * costs need not be additive.
 * The client can also refuse to extend a label, e.g.
 * to keep walks simple, by not reporting the
 * neighbor at all.
 */
template< typename Node
	, typename Cost = double
	, typename CmpN = std::less<Node>
	, typename CmpC = std::less<Cost>
	>
class KShortest {
public:
	struct Label {
		Node node;
		Cost cost;
	};
	/* Labels do not own their parents; the search
	 * keeps every label alive until it is destroyed.  */
	struct TreeNode {
		Label data;
		TreeNode const* parent = nullptr;
	};

	KShortest() =delete;
	KShortest(KShortest&&) =default;
	/* Labels point to each other, so copies would
	 * need a deep rebuild; nobody needs one.  */
	KShortest(KShortest const&) =delete;

	explicit
	KShortest( Node root
		 , std::size_t k_
		 , Cost root_cost = Cost()
		 , CmpN cmp_n_ = CmpN()
		 , CmpC cmp_c_ = CmpC()
		 ) : k(k_)
		   , cmp_c(cmp_c_)
		   , q(WrappedCmpC(cmp_c_))
		   , settled(cmp_n_)
		   , seq(0)
		   , cur(nullptr)
		   {
		if (k == 0)
			return;
		auto& root_label = create_label(std::move(root), std::move(root_cost));
		push(root_label);
		select();
	}

	/** Graph::KShortest<Node, Cost>::current
	 *
	 * @brief return the label currently being
	 * considered, or `nullptr` if the search has
	 * run out of labels.
	 */
	TreeNode const* current() const {
		return cur;
	}
	/** Graph::KShortest<Node, Cost>::neighbor
	 *
	 * @brief inform the algorithm that the walk
	 * ending in the `current()` label can be
	 * extended to `n`, with total cost `c`.
	 *
	 * @desc do not call this if `current()` returns
	 * `nullptr`.
	 */
	void neighbor(Node n, Cost c) {
		if (count(n) >= k)
			return;
		auto& label = create_label(std::move(n), std::move(c));
		label.parent = cur;
		push(label);
	}
	/** Graph::KShortest<Node, Cost>::end_neighbors
	 *
	 * @brief inform the algorithm that the `current()`
	 * label has no more neighbors.
	 *
	 * @desc do not call this if `current()` returns
	 * `nullptr`.
	 * After this call, `current()` will change.
	 */
	void end_neighbors() {
		++settled[cur->data.node];
		select();
	}

	/* Number of times a label of `n` has been settled.  */
	std::size_t count(Node const& n) const {
		auto it = settled.find(n);
		if (it == settled.end())
			return 0;
		return it->second;
	}

private:
	struct Entry {
		TreeNode* label;
		/* Earlier-pushed labels win ties, so results
		 * do not depend on heap internals.  */
		std::size_t seq;
	};
	class WrappedCmpC {
	private:
		CmpC cmp_c;
	public:
		explicit
		WrappedCmpC(CmpC cmp_c_) : cmp_c(cmp_c_) { }
		bool operator()(Entry const& a, Entry const& b) const {
			/* std::priority_queue returns the highest,
			 * so flip the args.  */
			auto const& ca = a.label->data.cost;
			auto const& cb = b.label->data.cost;
			if (cmp_c(cb, ca))
				return true;
			if (cmp_c(ca, cb))
				return false;
			return b.seq < a.seq;
		}
	};

	std::size_t k;
	CmpC cmp_c;
	std::priority_queue< Entry
			   , std::vector<Entry>
			   , WrappedCmpC
			   > q;
	std::map<Node, std::size_t, CmpN> settled;
	std::vector<std::unique_ptr<TreeNode>> labels;
	std::size_t seq;
	/* Label being expanded.  It is out of the queue, so
	 * neighbors cheaper than it cannot displace it.  */
	TreeNode* cur;

	TreeNode& create_label(Node n, Cost c) {
		auto tn = std::make_unique<TreeNode>();
		tn->data.node = std::move(n);
		tn->data.cost = std::move(c);
		labels.push_back(std::move(tn));
		return *labels.back();
	}
	void push(TreeNode& label) {
		q.push(Entry{&label, seq++});
	}
	/* Take the cheapest label whose node may still be
	 * settled, or nothing.  */
	void select() {
		cur = nullptr;
		while (!q.empty()) {
			auto label = q.top().label;
			q.pop();
			if (count(label->data.node) < k) {
				cur = label;
				return;
			}
		}
	}
};

}

#endif /* !defined(GRAPH_KSHORTEST_HPP) */
