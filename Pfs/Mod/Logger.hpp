#ifndef PFS_MOD_LOGGER_HPP
#define PFS_MOD_LOGGER_HPP

#include"Pfs/log.hpp"

namespace S { class Bus; }

namespace Pfs { namespace Mod {

/** class Pfs::Mod::Logger
 *
 * @brief module that turns Pfs::Msg::Log into JSON-RPC
 * `log` notifications on the output.
 *
 * @desc messages below the `--log-level` option
 * (default `info`) are discarded.
 */
class Logger {
private:
	S::Bus& bus;
	LogLevel threshold;

public:
	Logger() =delete;
	Logger(Logger const&) =delete;

	explicit
	Logger(S::Bus& bus);
};

}}

#endif /* !defined(PFS_MOD_LOGGER_HPP) */
