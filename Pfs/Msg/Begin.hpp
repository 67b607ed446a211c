#ifndef PFS_MSG_BEGIN_HPP
#define PFS_MSG_BEGIN_HPP

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::Begin
 *
 * @brief raised just before input starts being read.
 */
struct Begin { };

}}

#endif /* !defined(PFS_MSG_BEGIN_HPP) */
