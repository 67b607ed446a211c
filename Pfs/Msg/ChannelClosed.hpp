#ifndef PFS_MSG_CHANNELCLOSED_HPP
#define PFS_MSG_CHANNELCLOSED_HPP

#include"Tn/ChannelId.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::ChannelClosed
 *
 * @brief emitted when a channel is closed or settled.
 */
struct ChannelClosed {
	Tn::ChannelId channel_id;
};

}}

#endif /* !defined(PFS_MSG_CHANNELCLOSED_HPP) */
