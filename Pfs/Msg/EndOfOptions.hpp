#ifndef PFS_MSG_ENDOFOPTIONS_HPP
#define PFS_MSG_ENDOFOPTIONS_HPP

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::EndOfOptions
 *
 * @brief Raised at initialization, after all `Pfs::Msg::Option`
 * messages have been sent.
 */
struct EndOfOptions { };

}}

#endif /* !defined(PFS_MSG_ENDOFOPTIONS_HPP) */
