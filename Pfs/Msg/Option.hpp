#ifndef PFS_MSG_OPTION_HPP
#define PFS_MSG_OPTION_HPP

#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::Option
 *
 * @brief emitted at startup for each declared option
 * given on the command line.
 *
 * @desc a handler that rejects the value should throw
 * `std::invalid_argument`, which stops startup.
 */
struct Option {
	std::string name;
	std::string value;
};

}}

#endif /* !defined(PFS_MSG_OPTION_HPP) */
