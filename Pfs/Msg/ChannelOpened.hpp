#ifndef PFS_MSG_CHANNELOPENED_HPP
#define PFS_MSG_CHANNELOPENED_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Tn/ChannelId.hpp"
#include<cstdint>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::ChannelOpened
 *
 * @brief emitted when the on-chain listener reports a
 * new channel.
 * Capacities are zero unless the event gave them.
 */
struct ChannelOpened {
	Tn::ChannelId channel_id;
	Tn::Address participant1;
	Tn::Address participant2;
	std::uint64_t settle_timeout;
	Tn::Amount capacity1;
	Tn::Amount capacity2;
};

}}

#endif /* !defined(PFS_MSG_CHANNELOPENED_HPP) */
