#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Pfs/Mod/InfoCommand.hpp"
#include"Pfs/Mod/PathQueryHandler.hpp"
#include"Pfs/Msg/CommandFail.hpp"
#include"Pfs/Msg/CommandRequest.hpp"
#include"Pfs/Msg/CommandResponse.hpp"
#include"Pfs/Msg/EndOfOptions.hpp"
#include"Pfs/Msg/Option.hpp"
#include"Pfs/Msg/QueryLimits.hpp"
#include"S/Bus.hpp"
#include"Tn/Network.hpp"
#include<assert.h>
#include<map>
#include<memory>
#include<string>

namespace {

Tn::Amount A(std::int64_t v) { return Tn::Amount::of(v); }
Tn::Address a(std::uint8_t n) { return Tn::Address::from_index(n); }

std::string addr(std::uint8_t n) {
	return "\"" + std::string(a(n)) + "\"";
}

/* Line 1 -- 2 -- 3 -- 4, where 2 and 3 charge.  */
void build(Tn::Network& net) {
	net.open_channel(1, a(1), a(2), 100, A(10000), A(10000));
	net.open_channel(2, a(2), a(3), 100, A(10000), A(10000));
	net.open_channel(3, a(3), a(4), 100, A(10000), A(10000));
	net.update_fee_schedule(2, a(2), Tn::FeeSchedule(A(1), 10000), 1);
	net.update_fee_schedule(3, a(3), Tn::FeeSchedule(A(2), 0), 1);
	for (auto n = 1; n <= 4; ++n)
		net.set_reachability(a(n), Tn::Reachability::Reachable);
}

struct Answer {
	bool ok;
	Jsmn::Object body;
	int code;
	std::string type;
};

}

int main() {
	auto bus = S::Bus();
	auto threadpool = Ev::ThreadPool();
	auto network = Tn::Network();
	build(network);

	auto handler = Pfs::Mod::PathQueryHandler(bus, threadpool, network);
	auto info = Pfs::Mod::InfoCommand(bus, network);

	auto answers = std::make_shared<std::map<std::string, Answer>>();
	auto limits = std::make_shared<Pfs::Msg::QueryLimits>();
	bus.subscribe<Pfs::Msg::CommandResponse>([answers](Pfs::Msg::CommandResponse const& r) {
		(*answers)[r.id.direct_text()] = Answer{
			true, Jsmn::Parser::parse(r.response.output()), 0, ""
		};
		return Ev::lift();
	});
	bus.subscribe<Pfs::Msg::CommandFail>([answers](Pfs::Msg::CommandFail const& f) {
		auto d = Jsmn::Parser::parse(f.data.output());
		(*answers)[f.id.direct_text()] = Answer{
			false, Jsmn::Object(), f.code, std::string(d["type"])
		};
		return Ev::lift();
	});
	bus.subscribe<Pfs::Msg::QueryLimits>([limits](Pfs::Msg::QueryLimits const& l) {
		*limits = l;
		return Ev::lift();
	});

	auto request = [&bus](int id, std::string const& command, std::string const& params) {
		return bus.raise(Pfs::Msg::CommandRequest{
			command, Jsmn::Parser::parse(params),
			Jsmn::Parser::parse(std::to_string(id))
		});
	};
	auto query = [&](int id, int from, int to, std::string const& extra) {
		return request(id, "find_paths",
			R"({"from": )" + addr(from) + R"(, "to": )" + addr(to)
		      + extra + "}"
		);
	};

	auto code = Ev::lift().then([&]() {
		return bus.raise(Pfs::Msg::Option{"max-paths", "5"})
		     + bus.raise(Pfs::Msg::Option{"default-max-paths", "2"})
		     + bus.raise(Pfs::Msg::Option{"search-fanout", "4"})
		     + bus.raise(Pfs::Msg::EndOfOptions{});
	}).then([&]() {
		assert(limits->max_paths == 5);
		assert(limits->default_max_paths == 2);
		assert(limits->search_fanout == 4);

		return query(1, 1, 4, R"(, "value": 1000)")
		     + query(2, 4, 1, R"(, "value": "1000")")
		     + query(3, 1, 4, R"(, "value": 1000, "max_paths": 6)")
		     + query(4, 1, 1, R"(, "value": 1000)")
		     + query(5, 1, 4, R"(, "value": 0)")
		     + query(6, 1, 4, "")
		     + request(7, "find_paths", "[1, 2]")
		     + query(8, 1, 4, R"(, "value": 100000)")
		     + request(9, "info", "{}")
		     /* Not ours.  */
		     + request(10, "something", "{}")
		     ;
	}).then([]() {
		return Ev::lift(0);
	});
	/* Searches run on the threadpool; the loop exits once
	 * they are answered.  */
	assert(Ev::start(code) == 0);

	assert(answers->size() == 9);
	assert(answers->count("10") == 0);

	/* 3 forwards 1000 for a flat 2; 2 forwards 1002 for
	 * 1 + 1% of 1002.  */
	auto const& r1 = (*answers)["1"];
	assert(r1.ok);
	assert(r1.body.size() == 1);
	assert(r1.body[0]["path"].size() == 4);
	assert(r1.body[0]["path"][0].direct_text() == std::string(a(1)));
	assert(r1.body[0]["path"][3].direct_text() == std::string(a(4)));
	assert(r1.body[0]["estimated_fee"].direct_text() == "13");

	/* Schedules also charge for payments coming in
	 * through their channel, so the way back costs the
	 * same.  */
	auto const& r2 = (*answers)["2"];
	assert(r2.ok);
	assert(r2.body.size() == 1);
	assert(r2.body[0]["estimated_fee"].direct_text() == "13");

	/* Over the configured limit.  */
	assert(!(*answers)["3"].ok);
	assert((*answers)["3"].code == -32602);
	assert((*answers)["3"].type == "InvalidQuery");
	assert((*answers)["4"].type == "InvalidQuery");
	assert((*answers)["5"].type == "InvalidQuery");
	assert((*answers)["6"].type == "InvalidParams");
	assert((*answers)["7"].type == "InvalidParams");

	/* No route carries that much: an empty result, not
	 * an error.  */
	assert((*answers)["8"].ok);
	assert((*answers)["8"].body.is_array());
	assert((*answers)["8"].body.size() == 0);

	auto const& r9 = (*answers)["9"];
	assert(r9.ok);
	assert(r9.body["nodes"].direct_text() == "4");
	assert(r9.body["channels"].direct_text() == "3");
	assert(r9.body["reachable_nodes"].direct_text() == "4");
	assert(r9.body["max_paths"].direct_text() == "5");
	assert(r9.body["default_max_paths"].direct_text() == "2");
	assert(r9.body["search_fanout"].direct_text() == "4");

	return 0;
}
