#ifndef PFS_MOD_PATHQUERYHANDLER_HPP
#define PFS_MOD_PATHQUERYHANDLER_HPP

#include<cstddef>

namespace Ev { class ThreadPool; }
namespace S { class Bus; }
namespace Tn { class Network; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::PathQueryHandler
 *
 * @brief module that serves the `find_paths` command.
 *
 * @desc `find_paths {from, to, value, max_paths?}` answers
 * with an array of `{path, estimated_fee}` objects, cheapest
 * first.
 * The search runs on the threadpool under a read view of
 * the network, so events keep being read meanwhile.
 *
 * Options:
 * `--max-paths` (25) upper limit a query may ask for,
 * `--default-max-paths` (3) used when a query does not say,
 * `--search-fanout` (0, meaning the number asked for)
 * number of partial routes kept per node and next hop.
 */
class PathQueryHandler {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	Tn::Network const& network;

	std::size_t max_paths;
	std::size_t default_max_paths;
	std::size_t search_fanout;

	void start();

public:
	PathQueryHandler() =delete;
	PathQueryHandler(PathQueryHandler const&) =delete;

	PathQueryHandler( S::Bus& bus
			, Ev::ThreadPool& threadpool
			, Tn::Network const& network
			);
};

}}

#endif /* !defined(PFS_MOD_PATHQUERYHANDLER_HPP) */
