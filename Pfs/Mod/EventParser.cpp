#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Pfs/Mod/EventParser.hpp"
#include"Pfs/Msg/ChannelCapacityChanged.hpp"
#include"Pfs/Msg/ChannelClosed.hpp"
#include"Pfs/Msg/ChannelOpened.hpp"
#include"Pfs/Msg/FeeUpdate.hpp"
#include"Pfs/Msg/Notification.hpp"
#include"Pfs/Msg/ReachabilityChanged.hpp"
#include"Pfs/Params.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"
#include"Tn/Reachability.hpp"
#include<functional>
#include<map>
#include<stdexcept>

namespace {

/* Capacities are given as balances and can never be
 * negative, unlike fees.  */
Tn::Amount capacity(Jsmn::Object const& p, std::string const& key) {
	auto ret = Tn::Amount();
	if (!Pfs::Params::has(p, key))
		return ret;
	ret = Pfs::Params::amount(p, key);
	if (ret < Tn::Amount())
		throw std::invalid_argument(
			"Field '" + key + "': must not be negative"
		);
	return ret;
}

typedef std::function<Ev::Io<void>(S::Bus&, Jsmn::Object const&)>
	Decoder;

std::map<std::string, Decoder> const decoders = {
	{ "channel_opened"
	, [](S::Bus& bus, Jsmn::Object const& p) {
		return bus.raise(Pfs::Msg::ChannelOpened{
			Pfs::Params::uint(p, "channel_id"),
			Pfs::Params::address(p, "participant1"),
			Pfs::Params::address(p, "participant2"),
			Pfs::Params::uint(p, "settle_timeout"),
			capacity(p, "capacity1"),
			capacity(p, "capacity2")
		});
	  }
	},
	{ "channel_capacity_changed"
	, [](S::Bus& bus, Jsmn::Object const& p) {
		auto cap = Pfs::Params::amount(p, "new_capacity");
		if (cap < Tn::Amount())
			throw std::invalid_argument(
				"Field 'new_capacity': must not be negative"
			);
		return bus.raise(Pfs::Msg::ChannelCapacityChanged{
			Pfs::Params::uint(p, "channel_id"),
			Pfs::Params::address(p, "participant"),
			cap
		});
	  }
	},
	{ "fee_update"
	, [](S::Bus& bus, Jsmn::Object const& p) {
		auto schedule = Tn::FeeSchedule(
			Pfs::Params::amount(p, "flat"),
			Pfs::Params::amount(p, "proportional").to_int64(),
			Pfs::Params::penalty_table(p, "imbalance_penalty")
		);
		return bus.raise(Pfs::Msg::FeeUpdate{
			Pfs::Params::uint(p, "channel_id"),
			Pfs::Params::address(p, "updating_participant"),
			std::move(schedule),
			Pfs::Params::uint(p, "timestamp")
		});
	  }
	},
	{ "channel_closed"
	, [](S::Bus& bus, Jsmn::Object const& p) {
		return bus.raise(Pfs::Msg::ChannelClosed{
			Pfs::Params::uint(p, "channel_id")
		});
	  }
	},
	{ "reachability_changed"
	, [](S::Bus& bus, Jsmn::Object const& p) {
		return bus.raise(Pfs::Msg::ReachabilityChanged{
			Pfs::Params::address(p, "address"),
			Tn::reachability_from_string(
				Pfs::Params::string(p, "status")
			)
		});
	  }
	}
};

}

namespace Pfs { namespace Mod {

EventParser::EventParser(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Msg::Notification>([this](Msg::Notification const& n) {
		auto it = decoders.find(n.notification);
		if (it == decoders.end())
			return Pfs::log( bus, Debug
				       , "Ignoring unknown notification %s."
				       , n.notification.c_str()
				       );
		auto act = Ev::lift();
		try {
			Pfs::Params::require_object(n.params);
			act = it->second(bus, n.params);
		} catch (std::invalid_argument const& e) {
			return Pfs::log( bus, Error
				       , "Dropping malformed %s event: %s"
				       , n.notification.c_str()
				       , e.what()
				       );
		}
		return act;
	});
}

}}
