#ifndef PFS_LOG_HPP
#define PFS_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Pfs {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* Raises a Pfs::Msg::Log; whether and where it is written
 * is up to Pfs::Mod::Logger.  */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* PFS_LOG_HPP */
