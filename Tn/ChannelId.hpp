#ifndef TN_CHANNELID_HPP
#define TN_CHANNELID_HPP

#include<cstdint>

namespace Tn {

/* Identifies a channel within one token network; shared
 * by both directions of the channel.  */
typedef std::uint64_t ChannelId;

}

#endif /* !defined(TN_CHANNELID_HPP) */
