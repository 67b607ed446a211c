#ifndef TN_ADDRESS_HPP
#define TN_ADDRESS_HPP

#include<array>
#include<cstdint>
#include<iostream>
#include<string>

namespace Tn {

/** class Tn::Address
 *
 * @brief the 20-byte identifier of a network
 * participant.
 *
 * @desc written as "0x" followed by 40 hex
 * digits; either case is accepted on input,
 * output is lowercase.
 */
class Address {
private:
	std::array<std::uint8_t, 20> raw;

public:
	/* All zeros.  */
	Address() : raw() { }
	Address(Address const&) =default;
	Address& operator=(Address const&) =default;

	explicit
	Address(std::string const&);
	static
	bool valid_string(std::string const&);

	explicit
	operator std::string() const;

	/* Convenience for tests: the address whose last
	 * byte is `n` and all other bytes zero.  */
	static
	Address from_index(std::uint8_t n) {
		auto ret = Address();
		ret.raw[19] = n;
		return ret;
	}

	bool operator==(Address const& o) const { return raw == o.raw; }
	bool operator!=(Address const& o) const { return raw != o.raw; }
	bool operator<(Address const& o) const { return raw < o.raw; }
	bool operator>(Address const& o) const { return o < *this; }
	bool operator<=(Address const& o) const { return !(o < *this); }
	bool operator>=(Address const& o) const { return !(*this < o); }
};

std::ostream& operator<<(std::ostream&, Address const&);

}

#endif /* !defined(TN_ADDRESS_HPP) */
