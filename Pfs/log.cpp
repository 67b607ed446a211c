#include"Pfs/Msg/Log.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Pfs {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Pfs::Msg::Log{l, std::move(msg)});
}

}
