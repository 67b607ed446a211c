#ifndef PFS_MOD_INFOCOMMAND_HPP
#define PFS_MOD_INFOCOMMAND_HPP

#include"Pfs/Msg/QueryLimits.hpp"

namespace S { class Bus; }
namespace Tn { class Network; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::InfoCommand
 *
 * @brief module that serves the `info` command: the size
 * of the channel graph and the configured query limits.
 */
class InfoCommand {
private:
	S::Bus& bus;
	Tn::Network const& network;
	Msg::QueryLimits limits;

public:
	InfoCommand() =delete;
	InfoCommand(InfoCommand const&) =delete;

	InfoCommand(S::Bus& bus, Tn::Network const& network);
};

}}

#endif /* !defined(PFS_MOD_INFOCOMMAND_HPP) */
