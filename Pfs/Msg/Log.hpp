#ifndef PFS_MSG_LOG_HPP
#define PFS_MSG_LOG_HPP

#include"Pfs/log.hpp"
#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::Log
 *
 * @brief emitted by `Pfs::log`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(PFS_MSG_LOG_HPP) */
