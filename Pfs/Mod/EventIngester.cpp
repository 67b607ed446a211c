#include"Ev/Io.hpp"
#include"Pfs/Mod/EventIngester.hpp"
#include"Pfs/Msg/ChannelCapacityChanged.hpp"
#include"Pfs/Msg/ChannelClosed.hpp"
#include"Pfs/Msg/ChannelOpened.hpp"
#include"Pfs/Msg/FeeUpdate.hpp"
#include"Pfs/Msg/ReachabilityChanged.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"
#include"Tn/Network.hpp"
#include"Util/Str.hpp"
#include<sstream>

namespace {

std::string str(Tn::Address const& a) {
	return std::string(a);
}

}

namespace Pfs { namespace Mod {

Ev::Io<void>
EventIngester::apply( char const* event
		    , std::function<std::string()> mutation
		    ) {
	try {
		auto done = mutation();
		return Pfs::log(bus, Debug, "%s: %s", event, done.c_str());
	} catch (Tn::DuplicateChannel const& e) {
		return Pfs::log(bus, Warn, "%s: %s", event, e.what());
	} catch (Tn::UnknownChannel const& e) {
		return Pfs::log(bus, Warn, "%s: %s", event, e.what());
	} catch (Tn::UnauthorizedFeeUpdate const& e) {
		return Pfs::log(bus, Warn, "%s: %s", event, e.what());
	} catch (std::invalid_argument const& e) {
		return Pfs::log(bus, Error, "%s: %s", event, e.what());
	}
}

EventIngester::EventIngester( S::Bus& bus_
			    , Tn::Network& network_
			    ) : bus(bus_), network(network_) {
	bus.subscribe<Msg::ChannelOpened>([this](Msg::ChannelOpened const& m) {
		return apply("channel_opened", [this, &m]() {
			network.open_channel( m.channel_id
					    , m.participant1, m.participant2
					    , m.settle_timeout
					    , m.capacity1, m.capacity2
					    );
			return Util::Str::fmt( "opened %llu between %s and %s"
					     , (unsigned long long) m.channel_id
					     , str(m.participant1).c_str()
					     , str(m.participant2).c_str()
					     );
		});
	});
	bus.subscribe<Msg::ChannelCapacityChanged>([this](Msg::ChannelCapacityChanged const& m) {
		return apply("channel_capacity_changed", [this, &m]() {
			network.update_capacity( m.channel_id
					       , m.participant
					       , m.new_capacity
					       );
			auto os = std::ostringstream();
			os << "capacity of " << m.participant
			   << " in " << m.channel_id
			   << " now " << m.new_capacity;
			return os.str();
		});
	});
	bus.subscribe<Msg::FeeUpdate>([this](Msg::FeeUpdate const& m) {
		return apply("fee_update", [this, &m]() {
			auto applied = network.update_fee_schedule(
				m.channel_id, m.updating_participant,
				m.fee_schedule, m.timestamp
			);
			if (!applied)
				return Util::Str::fmt( "ignored stale update "
						       "at %llu for %llu"
						     , (unsigned long long) m.timestamp
						     , (unsigned long long) m.channel_id
						     );
			return Util::Str::fmt( "%s updated fees of %llu"
					     , str(m.updating_participant).c_str()
					     , (unsigned long long) m.channel_id
					     );
		});
	});
	bus.subscribe<Msg::ChannelClosed>([this](Msg::ChannelClosed const& m) {
		return apply("channel_closed", [this, &m]() {
			if (!network.close_channel(m.channel_id))
				return Util::Str::fmt( "%llu was not open"
						     , (unsigned long long) m.channel_id
						     );
			return Util::Str::fmt( "closed %llu"
					     , (unsigned long long) m.channel_id
					     );
		});
	});
	bus.subscribe<Msg::ReachabilityChanged>([this](Msg::ReachabilityChanged const& m) {
		return apply("reachability_changed", [this, &m]() {
			network.set_reachability(m.address, m.status);
			return Util::Str::fmt( "%s is %s"
					     , str(m.address).c_str()
					     , Tn::to_string(m.status)
					     );
		});
	});
}

}}
