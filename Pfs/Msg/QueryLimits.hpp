#ifndef PFS_MSG_QUERYLIMITS_HPP
#define PFS_MSG_QUERYLIMITS_HPP

#include<cstddef>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::QueryLimits
 *
 * @brief broadcast once options have been processed,
 * with the limits path queries will be served under.
 */
struct QueryLimits {
	std::size_t max_paths;
	std::size_t default_max_paths;
	/* 0 means the requested number of paths.  */
	std::size_t search_fanout;
};

}}

#endif /* !defined(PFS_MSG_QUERYLIMITS_HPP) */
