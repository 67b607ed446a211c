#ifndef TN_CHANNELVIEW_HPP
#define TN_CHANNELVIEW_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Tn/ChannelId.hpp"
#include"Tn/FeeSchedule.hpp"
#include<cstdint>
#include<optional>

namespace Tn {

/** struct Tn::ChannelView
 *
 * @brief one direction of a channel, as seen by
 * its `owner`.
 *
 * @desc `capacity` is how much the owner can
 * currently send toward `partner`.
 * `fee_schedule` is what the owner charges for
 * that direction, and `fee_timestamp` is the
 * timestamp of the fee update that set it (empty
 * if none was applied yet).
 */
struct ChannelView {
	ChannelId channel_id;
	Address owner;
	Address partner;
	Amount capacity;
	FeeSchedule fee_schedule;
	std::optional<std::uint64_t> fee_timestamp;
	std::uint64_t settle_timeout;
};

}

#endif /* !defined(TN_CHANNELVIEW_HPP) */
