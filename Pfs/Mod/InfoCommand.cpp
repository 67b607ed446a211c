#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Pfs/Mod/InfoCommand.hpp"
#include"Pfs/Msg/CommandRequest.hpp"
#include"Pfs/Msg/CommandResponse.hpp"
#include"S/Bus.hpp"
#include"Tn/Network.hpp"

namespace Pfs { namespace Mod {

InfoCommand::InfoCommand( S::Bus& bus_
			, Tn::Network const& network_
			) : bus(bus_)
			  , network(network_)
			  , limits{25, 3, 0} {
	bus.subscribe<Msg::QueryLimits>([this](Msg::QueryLimits const& l) {
		limits = l;
		return Ev::lift();
	});
	bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
		if (req.command != "info")
			return Ev::lift();
		auto result = Json::Out();
		{
			auto view = network.view();
			result.start_object()
				.field("nodes", std::uint64_t(view.num_nodes()))
				.field("channels", std::uint64_t(view.num_channels()))
				.field( "reachable_nodes"
				      , std::uint64_t(view.num_reachable())
				      )
				.field("max_paths", std::uint64_t(limits.max_paths))
				.field( "default_max_paths"
				      , std::uint64_t(limits.default_max_paths)
				      )
				.field( "search_fanout"
				      , std::uint64_t(limits.search_fanout)
				      )
			.end_object();
		}
		return bus.raise(Msg::CommandResponse{
			req.id, std::move(result)
		});
	});
}

}}
