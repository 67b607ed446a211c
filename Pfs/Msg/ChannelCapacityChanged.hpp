#ifndef PFS_MSG_CHANNELCAPACITYCHANGED_HPP
#define PFS_MSG_CHANNELCAPACITYCHANGED_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Tn/ChannelId.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::ChannelCapacityChanged
 *
 * @brief emitted after a deposit, withdrawal or
 * balance update changes what `participant` can
 * send through the channel.
 */
struct ChannelCapacityChanged {
	Tn::ChannelId channel_id;
	Tn::Address participant;
	Tn::Amount new_capacity;
};

}}

#endif /* !defined(PFS_MSG_CHANNELCAPACITYCHANGED_HPP) */
