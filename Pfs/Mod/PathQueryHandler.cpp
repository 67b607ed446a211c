#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Pfs/Mod/PathQueryHandler.hpp"
#include"Pfs/Msg/CommandFail.hpp"
#include"Pfs/Msg/CommandRequest.hpp"
#include"Pfs/Msg/CommandResponse.hpp"
#include"Pfs/Msg/EndOfOptions.hpp"
#include"Pfs/Msg/ManifestOption.hpp"
#include"Pfs/Msg/Manifestation.hpp"
#include"Pfs/Msg/Option.hpp"
#include"Pfs/Msg/QueryLimits.hpp"
#include"Pfs/Params.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"
#include"Tn/PathFinder.hpp"
#include"Util/Str.hpp"
#include<cstdlib>
#include<sstream>
#include<stdexcept>

namespace {

auto const invalid_params = int(-32602);

std::size_t parse_count( std::string const& name
		       , std::string const& value
		       , bool allow_zero
		       ) {
	auto v = Util::Str::trim(value);
	if (v.empty() || v[0] == '-' || !Util::Str::isdecimal(v))
		throw std::invalid_argument(
			name + " must be a non-negative integer"
		);
	auto ret = std::size_t(std::strtoull(v.c_str(), nullptr, 10));
	if (ret == 0 && !allow_zero)
		throw std::invalid_argument(name + " must be positive");
	return ret;
}

std::string describe(Tn::Path const& p) {
	auto os = std::ostringstream();
	for (auto i = std::size_t(0); i < p.nodes.size(); ++i) {
		if (i != 0)
			os << " -> ";
		os << p.nodes[i];
		if (i != 0 && i + 1 < p.nodes.size())
			os << " (" << p.hop_fees[i - 1] << ")";
	}
	return os.str();
}

Json::Out fail_data(char const* type) {
	return Json::Out()
		.start_object()
			.field("type", std::string(type))
		.end_object()
		;
}

}

namespace Pfs { namespace Mod {

PathQueryHandler::PathQueryHandler( S::Bus& bus_
				  , Ev::ThreadPool& threadpool_
				  , Tn::Network const& network_
				  ) : bus(bus_)
				    , threadpool(threadpool_)
				    , network(network_)
				    , max_paths(25)
				    , default_max_paths(3)
				    , search_fanout(0)
				    { start(); }

void PathQueryHandler::start() {
	bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
		return bus.raise(Msg::ManifestOption{
			"max-paths", "25",
			"Largest number of paths one find_paths "
			"query may ask for."
		})
		     + bus.raise(Msg::ManifestOption{
			"default-max-paths", "3",
			"Number of paths returned when find_paths "
			"does not give max_paths."
		})
		     + bus.raise(Msg::ManifestOption{
			"search-fanout", "0",
			"Partial routes kept per node and next hop "
			"during search; 0 to keep as many as paths "
			"requested."
		});
	});
	bus.subscribe<Msg::Option>([this](Msg::Option const& o) {
		if (o.name == "max-paths")
			max_paths = parse_count(o.name, o.value, false);
		else if (o.name == "default-max-paths")
			default_max_paths = parse_count(o.name, o.value, false);
		else if (o.name == "search-fanout")
			search_fanout = parse_count(o.name, o.value, true);
		else
			return Ev::lift();
		return Pfs::log( bus, Info, "Option %s set to %s."
			       , o.name.c_str(), o.value.c_str()
			       );
	});
	bus.subscribe<Msg::EndOfOptions>([this](Msg::EndOfOptions const&) {
		if (default_max_paths > max_paths)
			throw std::invalid_argument(
				"default-max-paths must not exceed max-paths"
			);
		return bus.raise(Msg::QueryLimits{
			max_paths, default_max_paths, search_fanout
		});
	});

	bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
		if (req.command != "find_paths")
			return Ev::lift();
		auto id = req.id;

		auto source = Tn::Address();
		auto target = Tn::Address();
		auto value = Tn::Amount();
		auto count = default_max_paths;
		try {
			Params::require_object(req.params);
			source = Params::address(req.params, "from");
			target = Params::address(req.params, "to");
			value = Params::amount(req.params, "value");
			if (Params::has(req.params, "max_paths"))
				count = std::size_t(Params::uint( req.params
								, "max_paths"
								));
		} catch (std::invalid_argument const& e) {
			return bus.raise(Msg::CommandFail{
				id, invalid_params, e.what(),
				fail_data("InvalidParams")
			});
		}

		auto& net = network;
		auto limit = max_paths;
		auto fanout = search_fanout;
		auto search = threadpool.background<std::vector<Tn::Path>>(
			[&net, limit, fanout, source, target, value, count]() {
			auto finder = Tn::PathFinder(net, limit, fanout);
			return finder.find_paths(source, target, value, count);
		});
		return search.then([this, id](std::vector<Tn::Path> paths) {
			auto act = Ev::lift();
			auto result = Json::Out();
			auto arr = result.start_array();
			for (auto const& p : paths) {
				auto obj = arr.start_object();
				auto nodes = obj.start_array("path");
				for (auto const& n : p.nodes)
					nodes.entry(std::string(n));
				nodes.end_array();
				obj.field("estimated_fee", p.fee.to_int64());
				obj.end_object();

				act += Pfs::log( bus, Debug
					       , "find_paths: fee %lld: %s"
					       , (long long) p.fee.to_int64()
					       , describe(p).c_str()
					       );
			}
			arr.end_array();
			return std::move(act)
			     + bus.raise(Msg::CommandResponse{
					id, std::move(result)
			       });
		}).catching<Tn::InvalidQuery>([this, id](Tn::InvalidQuery const& e) {
			return bus.raise(Msg::CommandFail{
				id, invalid_params, e.what(),
				fail_data("InvalidQuery")
			});
		});
	});
}

}}
