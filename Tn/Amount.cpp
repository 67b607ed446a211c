#include"Tn/Amount.hpp"
#include"Util/Str.hpp"
#include<cerrno>
#include<cstdlib>
#include<stdexcept>

namespace Tn {

bool Amount::valid_string(std::string const& s) {
	if (!Util::Str::isdecimal(s))
		return false;
	errno = 0;
	std::strtoll(s.c_str(), nullptr, 10);
	return errno != ERANGE;
}

Amount::Amount(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Tn::Amount: not an amount: ") + s
		);
	v = std::int64_t(std::strtoll(s.c_str(), nullptr, 10));
}

Amount::operator std::string() const {
	return std::to_string(v);
}

std::ostream& operator<<(std::ostream& os, Amount const& a) {
	return os << std::string(a);
}

}
