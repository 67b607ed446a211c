#ifndef PFS_MSG_COMMANDRESPONSE_HPP
#define PFS_MSG_COMMANDRESPONSE_HPP

#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::CommandResponse
 *
 * @brief Emit in response to a Pfs::Msg::CommandRequest.
 * If multiple responses for the same ID are emitted, or
 * for a nonexistent ID, the extras/nonexistent are
 * silently ignored.
 */
struct CommandResponse {
	Jsmn::Object id;
	Json::Out response;
};

}}

#endif /* !defined(PFS_MSG_COMMANDRESPONSE_HPP) */
