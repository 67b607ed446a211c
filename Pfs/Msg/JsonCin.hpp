#ifndef PFS_MSG_JSONCIN_HPP
#define PFS_MSG_JSONCIN_HPP

#include"Jsmn/Object.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::JsonCin
 *
 * @brief emitted for each line of JSON read from
 * stdin.
 */
struct JsonCin {
	Jsmn::Object obj;
};

}}

#endif /* !defined(PFS_MSG_JSONCIN_HPP) */
