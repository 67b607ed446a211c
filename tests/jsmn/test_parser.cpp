#undef NDEBUG
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>

namespace {

bool parse_fails(std::string const& s) {
	try {
		Jsmn::Parser::parse(s);
	} catch (Jsmn::ParseError const&) {
		return true;
	}
	return false;
}

}

int main() {
	{
		auto o = Jsmn::Parser::parse(R"JSON(
			{ "jsonrpc": "2.0"
			, "method": "fee_update"
			, "params": { "flat": 5, "imbalance_penalty": [[0, 1], [100, 0]] }
			}
		)JSON");
		assert(o.is_object());
		assert(o.size() == 3);
		assert(o.has("params"));
		assert(!o.has("id"));
		assert(o["id"].is_null());
		assert(std::string(o["method"]) == "fee_update");
		auto params = o["params"];
		assert(params["flat"].is_number());
		assert(Jsmn::Detail::Str::to_int64(params["flat"].direct_text()) == 5);
		assert(params["imbalance_penalty"].is_array());
		assert(params["imbalance_penalty"].size() == 2);
		assert(params["imbalance_penalty"][1][0].direct_text() == "100");
		assert(params["imbalance_penalty"][2].is_null());
		auto keys = o.keys();
		assert(keys.size() == 3);
		assert(keys[1] == "method");
	}

	/* Escapes.  */
	{
		auto o = Jsmn::Parser::parse(R"JSON(["a\"b\\c\n", "é"])JSON");
		assert(std::string(o[0]) == "a\"b\\c\n");
		assert(std::string(o[1]) == "\xc3\xa9");
	}

	/* Primitives at top level.  */
	assert(Jsmn::Parser::parse("42").is_number());
	assert(Jsmn::Parser::parse(" true ").is_boolean());
	assert(Jsmn::Parser::parse("\"x\"").is_string());

	/* Exactly one datum.  */
	assert(parse_fails(""));
	assert(parse_fails("   "));
	assert(parse_fails("{"));
	assert(parse_fails("{} {}"));
	assert(parse_fails("[1] 2"));
	assert(parse_fails("]"));
	assert(parse_fails("\"unterminated"));

	/* Wrong types.  */
	{
		auto o = Jsmn::Parser::parse("{\"a\": \"1\"}");
		auto thrown = false;
		try {
			(void) o["a"].size();
		} catch (Jsmn::TypeError const&) {
			thrown = true;
		}
		assert(thrown);
	}

	/* Output is one line, as given.  */
	{
		auto o = Jsmn::Parser::parse(R"({"a": [1, "x\"y"], "b": null})");
		auto os = std::ostringstream();
		os << o["a"] << "|" << o["a"][1] << "|" << o["b"] << "|" << o["c"];
		assert(os.str() == R"([1, "x\"y"]|"x\"y"|null|null)");
		assert(std::string(o["a"][1]) == "x\"y");
	}

	/* Integers.  */
	assert(Jsmn::Detail::Str::to_int64("-12") == -12);
	assert(Jsmn::Detail::Str::to_int64("9223372036854775807") == INT64_MAX);
	{
		auto bad = 0;
		for (auto s : {"1.5", "1e3", "", "99999999999999999999"}) {
			try {
				Jsmn::Detail::Str::to_int64(s);
			} catch (std::invalid_argument const&) {
				++bad;
			}
		}
		assert(bad == 4);
	}

	return 0;
}
