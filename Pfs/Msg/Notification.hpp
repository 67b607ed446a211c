#ifndef PFS_MSG_NOTIFICATION_HPP
#define PFS_MSG_NOTIFICATION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::Notification
 *
 * @brief emitted whenever a notification, i.e. a
 * request without an `id`, is received on stdin.
 */
struct Notification {
	std::string notification;
	Jsmn::Object params;
};

}}

#endif /* PFS_MSG_NOTIFICATION_HPP */
