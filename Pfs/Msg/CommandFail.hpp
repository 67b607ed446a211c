#ifndef PFS_MSG_COMMANDFAIL_HPP
#define PFS_MSG_COMMANDFAIL_HPP

#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::CommandFail
 *
 * @brief Emit in response to a `Pfs::Msg::CommandRequest`,
 * to indicate that the command failed.
 * Same rules as `Pfs::Msg::CommandResponse` for duplicate
 * or unknown IDs.
 */
struct CommandFail {
	Jsmn::Object id;
	int code;
	std::string message;
	Json::Out data;
};

}}

#endif /* !defined(PFS_MSG_COMMANDFAIL_HPP) */
