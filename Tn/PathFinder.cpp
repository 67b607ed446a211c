#include"Graph/KShortest.hpp"
#include"Tn/MediationFee.hpp"
#include"Tn/Network.hpp"
#include"Tn/PathFinder.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<tuple>

namespace {

/* Search node: a participant and the hop after it.
 * The target, which has no next hop, is paired with
 * itself.  */
typedef std::pair<Tn::Address, Tn::Address> State;

/* Amount the state's node must send to its next hop,
 * then the number of hops to the target.  */
struct Cost {
	Tn::Amount amount;
	std::size_t hops = 0;

	bool operator<(Cost const& o) const {
		return std::tie(amount, hops) < std::tie(o.amount, o.hops);
	}
};

typedef Graph::KShortest<State, Cost> Search;

bool on_chain(Search::TreeNode const* label, Tn::Address const& node) {
	for (auto p = label; p; p = p->parent) {
		if (p->data.node.first == node)
			return true;
	}
	return false;
}

Tn::Path make_path(Search::TreeNode const* label, Tn::Amount value) {
	auto path = Tn::Path();
	for (auto p = label; p; p = p->parent) {
		path.nodes.push_back(p->data.node.first);
		/* Fee of the next node is what this node sends
		 * minus what the next node sends.  */
		if (p->parent && p->parent->parent) {
			path.hop_fees.push_back(
				p->data.cost.amount - p->parent->data.cost.amount
			);
		}
	}
	path.fee = label->data.cost.amount - value;
	return path;
}

}

namespace Tn {

std::vector<Path> PathFinder::find_paths( Address const& source
					, Address const& target
					, Amount value
					, std::size_t max_paths
					) const {
	if (value <= Amount())
		throw InvalidQuery("Value must be positive");
	if (max_paths == 0)
		throw InvalidQuery("max_paths must be positive");
	if (max_paths > max_paths_limit)
		throw InvalidQuery(Util::Str::fmt(
			"max_paths must be at most %zu", max_paths_limit
		));
	if (source == target)
		throw InvalidQuery("Source and target must differ");

	auto view = network.view();
	if (!view.has_node(source))
		throw InvalidQuery(
			"Source not in network: " + std::string(source)
		);
	if (!view.has_node(target))
		throw InvalidQuery(
			"Target not in network: " + std::string(target)
		);

	auto k = fanout == 0 ? max_paths : fanout;
	auto search = Search( State(target, target)
			    , k
			    , Cost{value, 0}
			    );
	auto paths = std::vector<Path>();

	while (auto label = search.current()) {
		if (paths.size() >= max_paths)
			break;
		auto const& node = label->data.node.first;
		auto const& next = label->data.node.second;
		auto const& amount = label->data.cost.amount;
		auto const hops = label->data.cost.hops;

		if (node == source) {
			paths.push_back(make_path(label, value));
			search.end_neighbors();
			continue;
		}

		/* A label (node, next) means node sends `amount`
		 * to next.  Find who can send node what it needs.
		 * The target needs exactly the value.  */
		auto const is_target = (node == next);
		auto const* out_view = is_target ? nullptr
						 : view.view(node, next)
						 ;
		for (auto const& e : *view.peers(node)) {
			auto const& prev = e.first;
			auto const& back_view = e.second;
			if (on_chain(label, prev))
				continue;
			if ( prev != source
			  && view.reachability(prev) != Reachability::Reachable
			   )
				continue;
			auto const* in_view = view.view(prev, node);
			if (!in_view)
				continue;

			auto needed = amount;
			if (!is_target) {
				auto med = MediationFee( back_view.fee_schedule
						       , back_view.capacity
						       , out_view->fee_schedule
						       , out_view->capacity
						       );
				auto entering = med.entering_amount(amount);
				if (!entering)
					continue;
				needed = *entering;
			}
			if (needed > in_view->capacity)
				continue;

			search.neighbor(State(prev, node), Cost{needed, hops + 1});
		}
		search.end_neighbors();
	}

	std::stable_sort( paths.begin(), paths.end()
			, [](Path const& a, Path const& b) {
		return std::make_pair(a.fee, a.nodes.size())
		     < std::make_pair(b.fee, b.nodes.size())
		     ;
	});
	return paths;
}

}
