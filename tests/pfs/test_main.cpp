#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Pfs/Main.hpp"
#include"Tn/Address.hpp"
#include<assert.h>
#include<sstream>
#include<string>
#include<vector>

namespace {

std::string addr(std::uint8_t n) {
	return "\"" + std::string(Tn::Address::from_index(n)) + "\"";
}

std::string open(int id, int x, int y, std::string const& cap) {
	return R"({"jsonrpc":"2.0","method":"channel_opened","params":{)"
	       R"("channel_id":)" + std::to_string(id)
	     + R"(,"participant1":)" + addr(x)
	     + R"(,"participant2":)" + addr(y)
	     + R"(,"settle_timeout":500,"capacity1":)" + cap
	     + R"(,"capacity2":)" + cap
	     + "}}\n";
}

std::string reachable(int x) {
	return R"({"jsonrpc":"2.0","method":"reachability_changed","params":{)"
	       R"("address":)" + addr(x)
	     + R"(,"status":"reachable"}})" "\n";
}

std::string find_paths( std::string const& id
		      , int from, int to
		      , std::string const& extra
		      ) {
	return R"({"jsonrpc":"2.0","id":)" + id
	     + R"(,"method":"find_paths","params":{"from":)" + addr(from)
	     + R"(,"to":)" + addr(to)
	     + extra
	     + "}}\n";
}

std::vector<Jsmn::Object> parse_lines(std::string const& text) {
	auto ret = std::vector<Jsmn::Object>();
	auto is = std::istringstream(text);
	auto line = std::string();
	while (std::getline(is, line))
		ret.push_back(Jsmn::Parser::parse(line));
	return ret;
}

Jsmn::Object response( std::vector<Jsmn::Object> const& outs
		     , std::string const& id
		     ) {
	for (auto const& o : outs) {
		if (!o.has("id"))
			continue;
		if (o["id"].direct_text() == id)
			return o;
	}
	assert(false);
	return Jsmn::Object();
}

}

int main() {
	auto argv = std::vector<std::string>{"pathfinder", "--max-paths=10"};

	auto input = std::string()
		   + open(1, 1, 2, "1000")
		   /* Amounts may be strings.  */
		   + open(2, 2, 3, "\"1000\"")
		   + open(3, 1, 3, "50")
		   + reachable(1) + reachable(2) + reachable(3)
		   + R"({"jsonrpc":"2.0","method":"fee_update","params":{)"
		     R"("channel_id":2,"updating_participant":)" + addr(2)
		   + R"(,"flat":10,"proportional":0,"timestamp":1}})" "\n"
		   + "\n"
		   + "this is not json\n"
		   + R"({"jsonrpc":"2.0","method":"fee_update","params":{}})" "\n"
		   + find_paths("1", 1, 3, R"(,"value":100)")
		   + find_paths("\"two\"", 1, 3, R"(,"value":10,"max_paths":5)")
		   + find_paths("3", 1, 1, R"(,"value":10)")
		   + find_paths("4", 1, 3, R"(,"value":10,"max_paths":11)")
		   + find_paths("5", 1, 3, R"(,"value":"many")")
		   + R"({"jsonrpc":"2.0","id":6,"method":"no_such_method","params":{}})" "\n"
		   + R"({"jsonrpc":"2.0","id":7,"method":"info"})" "\n"
		   ;
	auto cin = std::stringstream(input);
	auto cout = std::stringstream("");
	auto cerr = std::stringstream("");

	auto main = Pfs::Main(argv, cin, cout, cerr);
	auto ec = Ev::start(main.run().then([](int ec) {
		return Ev::lift(ec);
	}));
	assert(ec == 0);
	assert(cerr.str() == "");

	auto outs = parse_lines(cout.str());

	/* Only the direct channel is too small for 100.  */
	auto r1 = response(outs, "1")["result"];
	assert(r1.is_array());
	assert(r1.size() == 1);
	assert(r1[0]["path"].size() == 3);
	assert(r1[0]["path"][0].direct_text() == std::string(Tn::Address::from_index(1)));
	assert(r1[0]["path"][1].direct_text() == std::string(Tn::Address::from_index(2)));
	assert(r1[0]["path"][2].direct_text() == std::string(Tn::Address::from_index(3)));
	assert(r1[0]["estimated_fee"].direct_text() == "10");

	/* Cheapest first.  */
	auto r2 = response(outs, "two")["result"];
	assert(r2.size() == 2);
	assert(r2[0]["path"].size() == 2);
	assert(r2[0]["estimated_fee"].direct_text() == "0");
	assert(r2[1]["path"].size() == 3);
	assert(r2[1]["estimated_fee"].direct_text() == "10");

	for (auto id : {"3", "4", "5"}) {
		auto err = response(outs, id)["error"];
		assert(err.is_object());
		assert(err["code"].direct_text() == "-32602");
	}
	assert(std::string(response(outs, "3")["error"]["data"]["type"]) == "InvalidQuery");
	assert(std::string(response(outs, "5")["error"]["data"]["type"]) == "InvalidParams");

	auto r6 = response(outs, "6");
	assert(r6["error"]["code"].direct_text() == "-32601");

	auto r7 = response(outs, "7")["result"];
	assert(r7["nodes"].direct_text() == "3");
	assert(r7["channels"].direct_text() == "3");
	assert(r7["reachable_nodes"].direct_text() == "3");
	assert(r7["max_paths"].direct_text() == "10");
	assert(r7["default_max_paths"].direct_text() == "3");

	/* The unparseable line gets a parse error, and the
	 * malformed event is reported in the log.  */
	auto parse_errors = 0;
	auto error_logs = 0;
	for (auto const& o : outs) {
		if (o.has("error") && o["id"].is_null()) {
			assert(o["error"]["code"].direct_text() == "-32700");
			++parse_errors;
		}
		if ( o.has("method") && std::string(o["method"]) == "log"
		  && std::string(o["params"]["level"]) == "error"
		   )
			++error_logs;
	}
	assert(parse_errors == 1);
	assert(error_logs == 1);

	return 0;
}
