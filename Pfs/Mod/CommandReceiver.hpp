#ifndef PFS_MOD_COMMANDRECEIVER_HPP
#define PFS_MOD_COMMANDRECEIVER_HPP

#include<set>
#include<string>
#include<utility>

namespace Jsmn { class Object; }
namespace S { class Bus; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::CommandReceiver
 *
 * @brief module that classifies JSON-RPC input into
 * notifications and commands, and formats the responses
 * to commands.
 *
 * @desc notifications (no `id`) are raised as
 * Pfs::Msg::Notification and handled in arrival order.
 * Commands are raised as Pfs::Msg::CommandRequest in the
 * background; if no module answers a command, it fails
 * with "Method not found".
 */
class CommandReceiver {
private:
	S::Bus& bus;

	/* (is_string, text) of each command id in flight.  */
	typedef std::pair<bool, std::string> Key;
	std::set<Key> pendings;

	static Key key_of(Jsmn::Object const& id);

public:
	CommandReceiver() =delete;
	CommandReceiver(CommandReceiver const&) =delete;

	explicit
	CommandReceiver(S::Bus& bus);
};

}}

#endif /* !defined(PFS_MOD_COMMANDRECEIVER_HPP) */
