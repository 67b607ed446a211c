#ifndef TN_PATHFINDER_HPP
#define TN_PATHFINDER_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<stdexcept>
#include<string>
#include<vector>

namespace Tn { class Network; }

namespace Tn {

/* Thrown for queries that cannot be answered at all,
 * as opposed to queries that have no feasible path.  */
class InvalidQuery
	: public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	InvalidQuery(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

/** struct Tn::Path
 *
 * @brief a feasible route and what it costs.
 *
 * @desc `nodes` starts with the source and ends with
 * the target.
 * `hop_fees[i]` is the fee charged by `nodes[i + 1]`,
 * so it has one entry per mediator.
 * `fee` is the sum of `hop_fees`, i.e. what the source
 * pays on top of the value.
 */
struct Path {
	std::vector<Address> nodes;
	Amount fee;
	std::vector<Amount> hop_fees;
};

/** class Tn::PathFinder
 *
 * @brief finds cheap routes through a `Tn::Network`.
 *
 * @desc the search runs backwards from the target,
 * computing at each mediator how much it must receive
 * so that the amount after it is exactly what the
 * rest of the route needs.
 * A search state is a (node, next hop) pair, because
 * a mediator's fee depends on both of its channels.
 * Each state is settled at most `fanout` times.
 */
class PathFinder {
private:
	Network const& network;
	std::size_t max_paths_limit;
	std::size_t fanout;

public:
	/* `fanout` of 0 means: the number of requested
	 * paths.  */
	explicit
	PathFinder( Network const& network_
		  , std::size_t max_paths_limit_ = 25
		  , std::size_t fanout_ = 0
		  ) : network(network_)
		    , max_paths_limit(max_paths_limit_)
		    , fanout(fanout_)
		    { }

	/** Tn::PathFinder::find_paths
	 *
	 * @brief returns up to `max_paths` distinct simple
	 * paths from `source` to `target` that can carry
	 * `value`, cheapest first, then shortest first.
	 *
	 * @desc an empty result means no route is feasible.
	 * Throws `InvalidQuery` if the source or target is
	 * not in the network, if they are equal, if `value`
	 * is not positive, or if `max_paths` is 0 or above
	 * the configured limit.
	 */
	std::vector<Path> find_paths( Address const& source
				    , Address const& target
				    , Amount value
				    , std::size_t max_paths
				    ) const;
};

}

#endif /* !defined(TN_PATHFINDER_HPP) */
