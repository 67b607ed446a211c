#ifndef PFS_MOD_EVENTPARSER_HPP
#define PFS_MOD_EVENTPARSER_HPP

namespace S { class Bus; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::EventParser
 *
 * @brief module that decodes network event notifications
 * into the typed event messages.
 *
 * @desc handles the notifications `channel_opened`,
 * `channel_capacity_changed`, `fee_update`,
 * `channel_closed` and `reachability_changed`.
 * Malformed events are logged and dropped.
 */
class EventParser {
private:
	S::Bus& bus;

public:
	EventParser() =delete;
	EventParser(EventParser const&) =delete;

	explicit
	EventParser(S::Bus& bus);
};

}}

#endif /* !defined(PFS_MOD_EVENTPARSER_HPP) */
