#ifndef PFS_MSG_FEEUPDATE_HPP
#define PFS_MSG_FEEUPDATE_HPP

#include"Tn/Address.hpp"
#include"Tn/ChannelId.hpp"
#include"Tn/FeeSchedule.hpp"
#include<cstdint>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::FeeUpdate
 *
 * @brief emitted when a participant announces new
 * fees for its direction of a channel.
 */
struct FeeUpdate {
	Tn::ChannelId channel_id;
	Tn::Address updating_participant;
	Tn::FeeSchedule fee_schedule;
	std::uint64_t timestamp;
};

}}

#endif /* !defined(PFS_MSG_FEEUPDATE_HPP) */
