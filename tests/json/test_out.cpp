#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<cstdint>
#include<optional>

int main() {
	{
		auto js = Json::Out();
		auto arr = js.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("id", std::int64_t(7))
			.start_array("result")
		;
		for (auto i = 0; i < 3; ++i) {
			arr.start_object()
				.start_array("path")
					.entry(std::string("0x01"))
					.entry(std::string("0x02"))
				.end_array()
				.field("estimated_fee", std::int64_t(-i))
			.end_object();
		}
		arr.end_array().end_object();

		auto o = Jsmn::Parser::parse(js.output());
		assert(o.is_object());
		assert(std::string(o["jsonrpc"]) == "2.0");
		assert(o["id"].direct_text() == "7");
		assert(o["result"].size() == 3);
		assert(o["result"][2]["estimated_fee"].direct_text() == "-2");
		assert(std::string(o["result"][0]["path"][1]) == "0x02");
	}

	{
		auto none = std::optional<std::int64_t>();
		auto s = Json::Out()
			.start_object()
				.field("missing", none)
				.field("flag", false)
				.field("text", "a\"b")
				.field("max", std::uint64_t(18446744073709551615ULL))
			.end_object()
			.output()
			;
		auto o = Jsmn::Parser::parse(s);
		assert(o["missing"].is_null());
		assert(!bool(o["flag"]));
		assert(std::string(o["text"]) == "a\"b");
		assert(o["max"].direct_text() == "18446744073709551615");
	}

	{
		auto s = Json::Out::empty_object().output();
		assert(s == "{}");
	}

	return 0;
}
