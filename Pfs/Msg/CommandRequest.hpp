#ifndef PFS_MSG_COMMANDREQUEST_HPP
#define PFS_MSG_COMMANDREQUEST_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::CommandRequest
 *
 * @brief emitted whenever a command is received on
 * stdin.
 * Respond by Pfs::Msg::CommandResponse or
 * Pfs::Msg::CommandFail before the handler completes;
 * a command nobody responded to is failed as an
 * unknown method.
 *
 * @desc `id` is the JSON-RPC id as given, a number or
 * a string.
 */
struct CommandRequest {
	std::string command;
	Jsmn::Object params;
	Jsmn::Object id;
};

}}

#endif /* !defined(PFS_MSG_COMMANDREQUEST_HPP) */
