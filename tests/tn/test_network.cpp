#undef NDEBUG
#include"Tn/Network.hpp"
#include<assert.h>

namespace {

Tn::Amount A(std::int64_t v) { return Tn::Amount::of(v); }
Tn::Address a(std::uint8_t n) { return Tn::Address::from_index(n); }

template<typename E, typename F>
bool throws(F f) {
	try {
		f();
	} catch (E const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto net = Tn::Network();

	net.open_channel(1, a(1), a(2), 500, A(100), A(50));
	{
		auto v = net.view();
		assert(v.has_node(a(1)));
		assert(v.has_node(a(2)));
		assert(!v.has_node(a(3)));
		assert(v.num_nodes() == 2);
		assert(v.num_channels() == 1);

		auto fwd = v.view(a(1), a(2));
		auto bwd = v.view(a(2), a(1));
		assert(fwd && bwd);
		assert(fwd->channel_id == 1 && bwd->channel_id == 1);
		assert(fwd->owner == a(1) && fwd->partner == a(2));
		assert(fwd->capacity == A(100));
		assert(bwd->capacity == A(50));
		assert(fwd->settle_timeout == 500);
		assert(fwd->fee_schedule.is_zero());
		assert(bwd->fee_schedule.is_zero());
	}

	/* Same id, or same pair in either order.  */
	assert(throws<Tn::DuplicateChannel>([&]() {
		net.open_channel(1, a(3), a(4), 500);
	}));
	assert(throws<Tn::DuplicateChannel>([&]() {
		net.open_channel(2, a(2), a(1), 500);
	}));
	/* Malformed.  */
	assert(throws<std::invalid_argument>([&]() {
		net.open_channel(3, a(3), a(3), 500);
	}));
	assert(throws<std::invalid_argument>([&]() {
		net.open_channel(3, a(3), a(4), 500, A(-1));
	}));
	/* Failed opens leave nothing behind.  */
	assert(net.view().num_channels() == 1);
	assert(!net.view().has_node(a(3)));

	/* Capacity updates touch one direction only.  */
	net.update_capacity(1, a(2), A(75));
	assert(net.view().view(a(2), a(1))->capacity == A(75));
	assert(net.view().view(a(1), a(2))->capacity == A(100));
	assert(throws<Tn::UnknownChannel>([&]() {
		net.update_capacity(9, a(1), A(1));
	}));
	assert(throws<Tn::UnknownChannel>([&]() {
		net.update_capacity(1, a(3), A(1));
	}));

	/* Fee updates.  */
	auto sched = Tn::FeeSchedule(A(5), 1000);
	assert(net.update_fee_schedule(1, a(1), sched, 10));
	assert(net.view().view(a(1), a(2))->fee_schedule == sched);
	assert(*net.view().view(a(1), a(2))->fee_timestamp == 10);
	assert(net.view().view(a(2), a(1))->fee_schedule.is_zero());
	/* Stale and equal timestamps are ignored.  */
	assert(!net.update_fee_schedule(1, a(1), Tn::FeeSchedule(), 10));
	assert(!net.update_fee_schedule(1, a(1), Tn::FeeSchedule(), 9));
	assert(net.view().view(a(1), a(2))->fee_schedule == sched);
	/* Newer replaces wholesale.  */
	assert(net.update_fee_schedule(1, a(1), Tn::FeeSchedule(), 11));
	assert(net.view().view(a(1), a(2))->fee_schedule.is_zero());
	/* Other direction has its own timestamp.  */
	assert(!net.view().view(a(2), a(1))->fee_timestamp);
	assert(net.update_fee_schedule(1, a(2), sched, 0));
	assert(net.view().view(a(2), a(1))->fee_schedule == sched);
	assert(*net.view().view(a(2), a(1))->fee_timestamp == 0);
	assert(!net.update_fee_schedule(1, a(2), Tn::FeeSchedule(), 0));
	assert(net.update_fee_schedule(1, a(2), sched, 1));

	assert(throws<Tn::UnknownChannel>([&]() {
		net.update_fee_schedule(9, a(1), sched, 100);
	}));
	assert(throws<Tn::UnauthorizedFeeUpdate>([&]() {
		net.update_fee_schedule(1, a(3), sched, 100);
	}));

	/* Reachability.  */
	assert(net.view().reachability(a(1)) == Tn::Reachability::Unknown);
	net.set_reachability(a(1), Tn::Reachability::Reachable);
	net.set_reachability(a(2), Tn::Reachability::Unreachable);
	assert(net.view().reachability(a(1)) == Tn::Reachability::Reachable);
	assert(net.view().num_reachable() == 1);

	/* Close, then close again.  */
	net.open_channel(2, a(2), a(3), 500);
	assert(net.view().num_nodes() == 3);
	assert(net.close_channel(1));
	assert(!net.close_channel(1));
	{
		auto v = net.view();
		assert(v.num_channels() == 1);
		assert(!v.has_node(a(1)));
		assert(v.has_node(a(2)));
		assert(!v.view(a(1), a(2)));
		assert(!v.view(a(2), a(1)));
	}
	/* The pair can reopen with a new id.  */
	net.open_channel(4, a(1), a(2), 500);
	assert(net.view().view(a(1), a(2))->channel_id == 4);
	assert(!net.view().view(a(1), a(2))->fee_timestamp);

	/* Reachability is kept for nodes without channels.  */
	assert(net.close_channel(4));
	assert(net.view().reachability(a(1)) == Tn::Reachability::Reachable);

	return 0;
}
