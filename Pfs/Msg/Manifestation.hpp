#ifndef PFS_MSG_MANIFESTATION_HPP
#define PFS_MSG_MANIFESTATION_HPP

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::Manifestation
 *
 * @brief raised once at startup, before the command
 * line is parsed.
 * Modules respond by raising `Pfs::Msg::ManifestOption`
 * for each option they accept.
 */
struct Manifestation { };

}}

#endif /* !defined(PFS_MSG_MANIFESTATION_HPP) */
