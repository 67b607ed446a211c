#ifndef PFS_MSG_JSONCOUT_HPP
#define PFS_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::JsonCout
 *
 * @brief raise to write one JSON object to stdout,
 * on a line of its own.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(PFS_MSG_JSONCOUT_HPP) */
