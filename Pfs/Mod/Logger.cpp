#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Pfs/Mod/Logger.hpp"
#include"Pfs/Msg/JsonCout.hpp"
#include"Pfs/Msg/Log.hpp"
#include"Pfs/Msg/ManifestOption.hpp"
#include"Pfs/Msg/Manifestation.hpp"
#include"Pfs/Msg/Option.hpp"
#include"S/Bus.hpp"
#include<stdexcept>

namespace {

char const* const level_names[] = {
	"trace", "debug", "info", "warn", "error"
};

Pfs::LogLevel level_from_string(std::string const& s) {
	for (auto i = 0; i <= int(Pfs::Error); ++i)
		if (s == level_names[i])
			return Pfs::LogLevel(i);
	throw std::invalid_argument(
		"log-level must be one of trace, debug, info, warn, error"
	);
}

}

namespace Pfs { namespace Mod {

Logger::Logger(S::Bus& bus_) : bus(bus_), threshold(Info) {
	bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
		return bus.raise(Msg::ManifestOption{
			"log-level", "info",
			"Minimum level of log messages to emit: "
			"trace, debug, info, warn or error."
		});
	});
	bus.subscribe<Msg::Option>([this](Msg::Option const& o) {
		if (o.name != "log-level")
			return Ev::lift();
		threshold = level_from_string(o.value);
		return Ev::lift();
	});
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < threshold)
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("method", std::string("log"))
				.start_object("params")
					.field( "level"
					      , std::string(level_names[l.level])
					      )
					.field("message", l.message)
				.end_object()
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	});
}

}}
