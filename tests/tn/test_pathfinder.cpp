#undef NDEBUG
#include"Tn/Network.hpp"
#include"Tn/PathFinder.hpp"
#include<assert.h>
#include<set>
#include<vector>

namespace {

Tn::Amount A(std::int64_t v) { return Tn::Amount::of(v); }
Tn::Address a(std::uint8_t n) { return Tn::Address::from_index(n); }

typedef std::vector<Tn::Address> Nodes;

template<typename F>
bool invalid(F f) {
	try {
		f();
	} catch (Tn::InvalidQuery const&) {
		return true;
	}
	return false;
}

/*
 *     2
 *    / \
 *   1   4 -- 5
 *    \ /
 *     3
 *
 * plus a direct channel 1 -- 4 with little capacity.
 */
void build(Tn::Network& net) {
	auto id = Tn::ChannelId(1);
	auto open = [&](std::uint8_t x, std::uint8_t y, std::int64_t cap) {
		net.open_channel(id++, a(x), a(y), 100, A(cap), A(cap));
	};
	open(1, 2, 1000);
	open(2, 4, 1000);
	open(1, 3, 1000);
	open(3, 4, 1000);
	open(1, 4, 5);
	open(4, 5, 1000);
	for (auto n = 1; n <= 5; ++n)
		net.set_reachability(a(n), Tn::Reachability::Reachable);
}

void check_valid(std::vector<Tn::Path> const& paths, Tn::Address s, Tn::Address t) {
	auto seen = std::set<Nodes>();
	for (auto const& p : paths) {
		assert(p.nodes.size() >= 2);
		assert(p.nodes.front() == s);
		assert(p.nodes.back() == t);
		/* Simple.  */
		auto uniq = std::set<Tn::Address>(p.nodes.begin(), p.nodes.end());
		assert(uniq.size() == p.nodes.size());
		/* Distinct.  */
		assert(seen.insert(p.nodes).second);
		/* One fee per mediator, summing to the total.  */
		assert(p.hop_fees.size() == p.nodes.size() - 2);
		auto sum = Tn::Amount();
		for (auto const& f : p.hop_fees)
			sum += f;
		assert(sum == p.fee);
	}
	for (auto i = std::size_t(1); i < paths.size(); ++i) {
		auto const& x = paths[i - 1];
		auto const& y = paths[i];
		assert( x.fee < y.fee
		     || (x.fee == y.fee && x.nodes.size() <= y.nodes.size())
		      );
	}
}

void test_multiple_paths() {
	auto net = Tn::Network();
	build(net);
	auto finder = Tn::PathFinder(net);

	/* Direct channel has too little capacity for 10.  */
	auto paths = finder.find_paths(a(1), a(4), A(10), 5);
	check_valid(paths, a(1), a(4));
	assert(paths.size() == 2);

	/* Direct channel wins for small values.  */
	paths = finder.find_paths(a(1), a(4), A(5), 5);
	check_valid(paths, a(1), a(4));
	assert(paths.size() == 3);
	assert((paths[0].nodes == Nodes{a(1), a(4)}));
	assert(paths[0].fee == A(0));
	assert(paths[0].hop_fees.empty());

	/* Make 3 expensive, so the route over 2 comes first.  */
	assert(net.update_fee_schedule(4, a(3), Tn::FeeSchedule(A(7), 0), 1));
	paths = finder.find_paths(a(1), a(4), A(10), 5);
	check_valid(paths, a(1), a(4));
	assert(paths.size() == 2);
	assert((paths[0].nodes == Nodes{a(1), a(2), a(4)}));
	assert(paths[0].fee == A(0));
	assert((paths[1].nodes == Nodes{a(1), a(3), a(4)}));
	assert(paths[1].fee == A(7));
	assert(paths[1].hop_fees.size() == 1);
	assert(paths[1].hop_fees[0] == A(7));

	/* max_paths limits the count.  */
	paths = finder.find_paths(a(1), a(4), A(10), 1);
	assert(paths.size() == 1);
	assert((paths[0].nodes == Nodes{a(1), a(2), a(4)}));

	/* Longer routes.  */
	paths = finder.find_paths(a(1), a(5), A(10), 5);
	check_valid(paths, a(1), a(5));
	assert(paths.size() == 2);
	assert((paths[0].nodes == Nodes{a(1), a(2), a(4), a(5)}));
}

void test_reachability() {
	auto net = Tn::Network();
	build(net);
	auto finder = Tn::PathFinder(net);

	net.set_reachability(a(2), Tn::Reachability::Unreachable);
	auto paths = finder.find_paths(a(1), a(4), A(10), 5);
	assert(paths.size() == 1);
	assert((paths[0].nodes == Nodes{a(1), a(3), a(4)}));

	net.set_reachability(a(3), Tn::Reachability::Unknown);
	paths = finder.find_paths(a(1), a(4), A(10), 5);
	assert(paths.empty());

	/* Source and target need not be reachable.  */
	net.set_reachability(a(2), Tn::Reachability::Reachable);
	net.set_reachability(a(1), Tn::Reachability::Unreachable);
	net.set_reachability(a(4), Tn::Reachability::Unreachable);
	paths = finder.find_paths(a(1), a(4), A(10), 5);
	assert(paths.size() == 1);
}

void test_invalid_queries() {
	auto net = Tn::Network();
	build(net);
	auto finder = Tn::PathFinder(net, 10);

	assert(invalid([&]() { finder.find_paths(a(1), a(9), A(10), 1); }));
	assert(invalid([&]() { finder.find_paths(a(9), a(1), A(10), 1); }));
	assert(invalid([&]() { finder.find_paths(a(1), a(1), A(10), 1); }));
	assert(invalid([&]() { finder.find_paths(a(1), a(4), A(0), 1); }));
	assert(invalid([&]() { finder.find_paths(a(1), a(4), A(-5), 1); }));
	assert(invalid([&]() { finder.find_paths(a(1), a(4), A(10), 0); }));
	assert(invalid([&]() { finder.find_paths(a(1), a(4), A(10), 11); }));
	assert(!invalid([&]() { finder.find_paths(a(1), a(4), A(10), 10); }));
}

void test_infeasible() {
	auto net = Tn::Network();
	build(net);
	auto finder = Tn::PathFinder(net);

	/* More than any channel can carry.  */
	auto paths = finder.find_paths(a(1), a(4), A(5000), 3);
	assert(paths.empty());

	/* Disconnected components.  */
	net.open_channel(99, a(20), a(21), 100, A(1000), A(1000));
	paths = finder.find_paths(a(1), a(20), A(1), 3);
	assert(paths.empty());
}

void test_fanout() {
	auto net = Tn::Network();
	build(net);
	/* With one settlement per state, paths still come
	 * out distinct and valid.  */
	auto finder = Tn::PathFinder(net, 25, 1);
	auto paths = finder.find_paths(a(1), a(5), A(10), 5);
	check_valid(paths, a(1), a(5));
	assert(!paths.empty());
}

void test_negative_fees() {
	auto net = Tn::Network();
	auto id = Tn::ChannelId(1);
	auto open = [&](std::uint8_t x, std::uint8_t y) {
		net.open_channel(id++, a(x), a(y), 100, A(100), A(100));
	};
	open(1, 2);
	open(2, 4);
	open(1, 3);
	open(3, 4);
	for (auto n = 1; n <= 4; ++n)
		net.set_reachability(a(n), Tn::Reachability::Reachable);

	auto ok = net.update_fee_schedule( 2, a(2)
					 , Tn::FeeSchedule(A(1), 0)
					 , 1
					 );
	assert(ok);
	/* 3 pays 10 to have its channel to 4 drained by 10,
	 * more than its flat fee.  */
	auto table = std::vector<Tn::FeeSchedule::Breakpoint>{
		{A(0), A(200)}, {A(200), A(0)}
	};
	ok = net.update_fee_schedule( 4, a(3)
				    , Tn::FeeSchedule(A(5), 0, table)
				    , 1
				    );
	assert(ok);

	auto finder = Tn::PathFinder(net);
	auto paths = finder.find_paths(a(1), a(4), A(10), 3);
	check_valid(paths, a(1), a(4));
	assert(paths.size() == 2);
	assert(paths[0].nodes == Nodes({a(1), a(3), a(4)}));
	assert(paths[0].fee == A(-5));
	assert(paths[0].hop_fees[0] == A(-5));
	assert(paths[1].nodes == Nodes({a(1), a(2), a(4)}));
	assert(paths[1].fee == A(1));

	paths = finder.find_paths(a(1), a(4), A(10), 1);
	assert(paths.size() == 1);
	assert(paths[0].nodes == Nodes({a(1), a(3), a(4)}));
}

}

int main() {
	test_multiple_paths();
	test_reachability();
	test_invalid_queries();
	test_infeasible();
	test_fanout();
	test_negative_fees();
	return 0;
}
