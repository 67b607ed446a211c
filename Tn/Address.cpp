#include"Tn/Address.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace {

bool has_prefix(std::string const& s) {
	return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

}

namespace Tn {

bool Address::valid_string(std::string const& s) {
	if (s.size() != 42 || !has_prefix(s))
		return false;
	auto tmp = std::array<std::uint8_t, 20>();
	auto bin_len = std::size_t(0);
	auto end = (char const*) nullptr;
	auto rv = sodium_hex2bin( tmp.data(), tmp.size()
				, s.c_str() + 2, s.size() - 2
				, nullptr, &bin_len, &end
				);
	return rv == 0 && bin_len == tmp.size() && *end == '\0';
}

Address::Address(std::string const& s) : raw() {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Tn::Address: not an address: ") + s
		);
	sodium_hex2bin( raw.data(), raw.size()
		      , s.c_str() + 2, s.size() - 2
		      , nullptr, nullptr, nullptr
		      );
}

Address::operator std::string() const {
	char hex[sizeof(raw) * 2 + 1];
	sodium_bin2hex(hex, sizeof(hex), raw.data(), raw.size());
	return std::string("0x") + hex;
}

std::ostream& operator<<(std::ostream& os, Address const& a) {
	return os << std::string(a);
}

}
