#include"Tn/Network.hpp"
#include"Util/Str.hpp"
#include<mutex>

namespace {

std::string id_str(Tn::ChannelId id) {
	return std::to_string(id);
}

}

namespace Tn {

ChannelView*
Network::find_view(Address const& owner, Address const& partner) {
	auto it = graph.find(owner);
	if (it == graph.end())
		return nullptr;
	auto it2 = it->second.find(partner);
	if (it2 == it->second.end())
		return nullptr;
	return &it2->second;
}

void Network::open_channel( ChannelId channel_id
			  , Address const& p1
			  , Address const& p2
			  , std::uint64_t settle_timeout
			  , Amount capacity1
			  , Amount capacity2
			  ) {
	if (p1 == p2)
		throw std::invalid_argument(
			"Channel " + id_str(channel_id)
			+ " has the same participant on both ends"
		);
	if (capacity1 < Amount() || capacity2 < Amount())
		throw std::invalid_argument(
			"Channel " + id_str(channel_id)
			+ " opened with negative capacity"
		);

	auto lock = std::unique_lock<std::shared_mutex>(mtx);
	if (channels.count(channel_id) != 0)
		throw DuplicateChannel(
			"Channel " + id_str(channel_id) + " already open"
		);
	if (find_view(p1, p2))
		throw DuplicateChannel(Util::Str::fmt(
			"Channel %s between %s and %s, but they already "
			"have channel %s"
			, id_str(channel_id).c_str()
			, std::string(p1).c_str()
			, std::string(p2).c_str()
			, id_str(find_view(p1, p2)->channel_id).c_str()
		));

	graph[p1][p2] = ChannelView{
		channel_id, p1, p2, capacity1, FeeSchedule(), std::nullopt, settle_timeout
	};
	graph[p2][p1] = ChannelView{
		channel_id, p2, p1, capacity2, FeeSchedule(), std::nullopt, settle_timeout
	};
	channels[channel_id] = std::make_pair(p1, p2);
}

void Network::update_capacity( ChannelId channel_id
			     , Address const& owner
			     , Amount new_capacity
			     ) {
	if (new_capacity < Amount())
		throw std::invalid_argument(
			"Negative capacity for channel " + id_str(channel_id)
		);

	auto lock = std::unique_lock<std::shared_mutex>(mtx);
	auto it = channels.find(channel_id);
	if (it == channels.end())
		throw UnknownChannel(
			"Capacity update for unknown channel "
			+ id_str(channel_id)
		);
	auto const& parts = it->second;
	if (owner != parts.first && owner != parts.second)
		throw UnknownChannel(
			std::string(owner) + " is not in channel "
			+ id_str(channel_id)
		);
	auto const& partner = (owner == parts.first) ? parts.second
						     : parts.first
						     ;
	find_view(owner, partner)->capacity = new_capacity;
}

bool Network::update_fee_schedule( ChannelId channel_id
				 , Address const& updater
				 , FeeSchedule schedule
				 , std::uint64_t timestamp
				 ) {
	auto lock = std::unique_lock<std::shared_mutex>(mtx);
	auto it = channels.find(channel_id);
	if (it == channels.end())
		throw UnknownChannel(
			"Fee update for unknown channel "
			+ id_str(channel_id)
		);
	auto const& parts = it->second;
	if (updater != parts.first && updater != parts.second)
		throw UnauthorizedFeeUpdate(
			std::string(updater) + " cannot set fees of channel "
			+ id_str(channel_id)
		);
	auto const& partner = (updater == parts.first) ? parts.second
						       : parts.first
						       ;
	auto& view = *find_view(updater, partner);
	if (view.fee_timestamp && timestamp <= *view.fee_timestamp)
		return false;
	view.fee_schedule = std::move(schedule);
	view.fee_timestamp = timestamp;
	return true;
}

bool Network::close_channel(ChannelId channel_id) {
	auto lock = std::unique_lock<std::shared_mutex>(mtx);
	auto it = channels.find(channel_id);
	if (it == channels.end())
		return false;
	auto p1 = it->second.first;
	auto p2 = it->second.second;
	channels.erase(it);

	auto erase_direction = [this](Address const& a, Address const& b) {
		auto git = graph.find(a);
		if (git == graph.end())
			return;
		git->second.erase(b);
		if (git->second.empty())
			graph.erase(git);
	};
	erase_direction(p1, p2);
	erase_direction(p2, p1);
	return true;
}

void Network::set_reachability(Address const& node, Reachability status) {
	auto lock = std::unique_lock<std::shared_mutex>(mtx);
	reachability[node] = status;
}

bool Network::View::has_node(Address const& node) const {
	return net.graph.count(node) != 0;
}
Network::Peers const* Network::View::peers(Address const& node) const {
	auto it = net.graph.find(node);
	if (it == net.graph.end())
		return nullptr;
	return &it->second;
}
ChannelView const*
Network::View::view(Address const& owner, Address const& partner) const {
	auto ps = peers(owner);
	if (!ps)
		return nullptr;
	auto it = ps->find(partner);
	if (it == ps->end())
		return nullptr;
	return &it->second;
}
Reachability Network::View::reachability(Address const& node) const {
	auto it = net.reachability.find(node);
	if (it == net.reachability.end())
		return Reachability::Unknown;
	return it->second;
}

std::size_t Network::View::num_nodes() const {
	return net.graph.size();
}
std::size_t Network::View::num_channels() const {
	return net.channels.size();
}
std::size_t Network::View::num_reachable() const {
	auto count = std::size_t(0);
	for (auto const& e : net.graph) {
		if (reachability(e.first) == Reachability::Reachable)
			++count;
	}
	return count;
}

}
