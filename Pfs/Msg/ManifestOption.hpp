#ifndef PFS_MSG_MANIFESTOPTION_HPP
#define PFS_MSG_MANIFESTOPTION_HPP

#include<string>

namespace Pfs { namespace Msg {

/** struct Pfs::Msg::ManifestOption
 *
 * @brief declares a `--name=value` command line
 * option, during `Pfs::Msg::Manifestation`.
 */
struct ManifestOption {
	std::string name;
	std::string default_value;
	std::string description;
};

}}

#endif /* !defined(PFS_MSG_MANIFESTOPTION_HPP) */
