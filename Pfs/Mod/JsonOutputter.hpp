#ifndef PFS_MOD_JSONOUTPUTTER_HPP
#define PFS_MOD_JSONOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::JsonOutputter
 *
 * @brief module that writes Pfs::Msg::JsonCout objects,
 * one per line.
 *
 * @desc outputs are queued and written from a single
 * loop, so that lines from concurrent handlers are never
 * interleaved.
 */
class JsonOutputter {
private:
	std::ostream& cout;
	std::queue<std::string> outs;

	Ev::Io<void> loop();

public:
	JsonOutputter( std::ostream& cout_
		     , S::Bus& bus_
		     );
};

}}

#endif /* !defined(PFS_MOD_JSONOUTPUTTER_HPP) */
