#ifndef TN_NETWORK_HPP
#define TN_NETWORK_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Tn/ChannelId.hpp"
#include"Tn/ChannelView.hpp"
#include"Tn/FeeSchedule.hpp"
#include"Tn/Reachability.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<map>
#include<memory>
#include<shared_mutex>
#include<stdexcept>
#include<string>

namespace Tn {

/* Thrown when opening a channel that already exists, or
 * a second channel between the same pair.  */
class DuplicateChannel
	: public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	DuplicateChannel(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
/* Thrown when a mutation refers to a channel, or a
 * participant of a channel, that does not exist.  */
class UnknownChannel
	: public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	UnknownChannel(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
/* Thrown when a fee update comes from someone who
 * does not own a direction of the channel.  */
class UnauthorizedFeeUpdate
	: public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	UnauthorizedFeeUpdate(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Tn::Network
 *
 * @brief the directed channel graph of one token
 * network, plus the liveness of its participants.
 *
 * @desc every channel is stored as two `ChannelView`s,
 * one per direction, in an adjacency map
 * `owner -> partner -> view`.
 * The nodes of the graph are exactly the endpoints of
 * open channels.
 *
 * Mutations take an exclusive lock.
 * Readers obtain a `Network::View`, which holds a
 * shared lock for as long as it lives, so a reader sees
 * one consistent state from start to end.
 */
class Network {
public:
	typedef std::map<Address, ChannelView> Peers;

private:
	mutable std::shared_mutex mtx;
	std::map<Address, Peers> graph;
	/* Participants of each open channel.  */
	std::map<ChannelId, std::pair<Address, Address>> channels;
	std::map<Address, Reachability> reachability;

	ChannelView* find_view(Address const& owner, Address const& partner);

public:
	Network() =default;
	Network(Network const&) =delete;
	Network(Network&&) =delete;

	/** Tn::Network::open_channel
	 *
	 * @brief adds both directions of a new channel,
	 * with zero-cost fee schedules.
	 *
	 * @desc throws `DuplicateChannel` if the id is
	 * already open or the two participants already
	 * share a channel, and `std::invalid_argument` if
	 * both participants are the same or a capacity is
	 * negative.
	 */
	void open_channel( ChannelId channel_id
			 , Address const& participant1
			 , Address const& participant2
			 , std::uint64_t settle_timeout
			 , Amount capacity1 = Amount()
			 , Amount capacity2 = Amount()
			 );
	/* Sets what `owner` can send through the channel.
	 * Throws `UnknownChannel` if the channel is not open
	 * or `owner` is not in it.  */
	void update_capacity( ChannelId channel_id
			    , Address const& owner
			    , Amount new_capacity
			    );
	/** Tn::Network::update_fee_schedule
	 *
	 * @brief replaces the schedule of the direction owned
	 * by `updating_participant`.
	 *
	 * @desc returns false, and changes nothing, if
	 * `timestamp` is not newer than that of the update
	 * currently applied.
	 * Throws `UnknownChannel` or `UnauthorizedFeeUpdate`.
	 */
	bool update_fee_schedule( ChannelId channel_id
				, Address const& updating_participant
				, FeeSchedule schedule
				, std::uint64_t timestamp
				);
	/* Removes both directions.  Returns false if the
	 * channel was not open.  */
	bool close_channel(ChannelId channel_id);

	void set_reachability(Address const& node, Reachability status);

	class View {
	private:
		std::shared_lock<std::shared_mutex> lock;
		Network const& net;

	public:
		explicit
		View(Network const& net_) : lock(net_.mtx), net(net_) { }
		View(View&&) =default;

		bool has_node(Address const& node) const;
		/* nullptr if `node` has no channels.  */
		Peers const* peers(Address const& node) const;
		/* nullptr if there is no such direction.  */
		ChannelView const* view( Address const& owner
				       , Address const& partner
				       ) const;
		Reachability reachability(Address const& node) const;

		std::size_t num_nodes() const;
		std::size_t num_channels() const;
		std::size_t num_reachable() const;
	};
	View view() const { return View(*this); }
};

}

#endif /* !defined(TN_NETWORK_HPP) */
