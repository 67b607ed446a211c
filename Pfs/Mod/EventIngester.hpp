#ifndef PFS_MOD_EVENTINGESTER_HPP
#define PFS_MOD_EVENTINGESTER_HPP

#include<functional>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Tn { class Network; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::EventIngester
 *
 * @brief module that applies network events to the
 * channel graph.
 *
 * @desc events that do not fit the current graph
 * (duplicate opens, updates to unknown channels, fee
 * updates from outsiders) are logged and skipped; they
 * never stop ingestion.
 */
class EventIngester {
private:
	S::Bus& bus;
	Tn::Network& network;

	/* Runs the mutation, which returns a description of
	 * what it did, and logs the outcome.  */
	Ev::Io<void> apply( char const* event
			  , std::function<std::string()> mutation
			  );

public:
	EventIngester() =delete;
	EventIngester(EventIngester const&) =delete;

	EventIngester(S::Bus& bus, Tn::Network& network);
};

}}

#endif /* !defined(PFS_MOD_EVENTINGESTER_HPP) */
