#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Pfs/Params.hpp"
#include<stdexcept>

namespace {

std::invalid_argument bad(std::string const& key, std::string const& why) {
	return std::invalid_argument("Field '" + key + "': " + why);
}

Jsmn::Object get(Jsmn::Object const& params, std::string const& key) {
	auto v = params[key];
	if (v.is_null())
		throw bad(key, "missing");
	return v;
}

Tn::Amount to_amount(Jsmn::Object const& v, std::string const& key) {
	if (v.is_number()) {
		try {
			return Tn::Amount::of(Jsmn::Detail::Str::to_int64(
				v.direct_text()
			));
		} catch (std::invalid_argument const& e) {
			throw bad(key, e.what());
		}
	}
	if (v.is_string()) {
		auto s = std::string(v);
		if (!Tn::Amount::valid_string(s))
			throw bad(key, "not an integer: " + s);
		return Tn::Amount(s);
	}
	throw bad(key, "expected an integer");
}

}

namespace Pfs { namespace Params {

void require_object(Jsmn::Object const& params) {
	if (!params.is_object())
		throw std::invalid_argument("params must be an object");
}

bool has(Jsmn::Object const& params, std::string const& key) {
	return !params[key].is_null();
}

Tn::Address address(Jsmn::Object const& params, std::string const& key) {
	auto v = get(params, key);
	if (!v.is_string())
		throw bad(key, "expected an address string");
	auto s = std::string(v);
	if (!Tn::Address::valid_string(s))
		throw bad(key, "not an address: " + s);
	return Tn::Address(s);
}

Tn::Amount amount(Jsmn::Object const& params, std::string const& key) {
	return to_amount(get(params, key), key);
}

std::uint64_t uint(Jsmn::Object const& params, std::string const& key) {
	auto a = amount(params, key);
	if (a < Tn::Amount())
		throw bad(key, "must not be negative");
	return std::uint64_t(a.to_int64());
}

std::string string(Jsmn::Object const& params, std::string const& key) {
	auto v = get(params, key);
	if (!v.is_string())
		throw bad(key, "expected a string");
	return std::string(v);
}

std::vector<Tn::FeeSchedule::Breakpoint>
penalty_table(Jsmn::Object const& params, std::string const& key) {
	auto ret = std::vector<Tn::FeeSchedule::Breakpoint>();
	if (!has(params, key))
		return ret;
	auto table = params[key];
	if (!table.is_array())
		throw bad(key, "expected an array of [capacity, penalty]");
	for (auto i = std::size_t(0); i < table.size(); ++i) {
		auto point = table[i];
		if (!point.is_array() || point.size() != 2)
			throw bad(key, "expected an array of [capacity, penalty]");
		ret.emplace_back( to_amount(point[0], key)
				, to_amount(point[1], key)
				);
	}
	return ret;
}

}}
