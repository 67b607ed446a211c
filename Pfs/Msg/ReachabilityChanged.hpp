#ifndef PFS_MSG_REACHABILITYCHANGED_HPP
#define PFS_MSG_REACHABILITYCHANGED_HPP

#include"Tn/Address.hpp"
#include"Tn/Reachability.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::ReachabilityChanged
 *
 * @brief emitted when the transport learns whether a
 * participant is online.
 */
struct ReachabilityChanged {
	Tn::Address address;
	Tn::Reachability status;
};

}}

#endif /* !defined(PFS_MSG_REACHABILITYCHANGED_HPP) */
