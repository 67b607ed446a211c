#ifndef TN_AMOUNT_HPP
#define TN_AMOUNT_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<iostream>
#include<stdexcept>
#include<string>

namespace Tn {

/* Thrown when amount arithmetic leaves the int64 range.  */
class AmountOverflow
	: public Util::BacktraceException<std::overflow_error> {
public:
	explicit
	AmountOverflow(char const* op)
		: Util::BacktraceException<std::overflow_error>(
			std::string("Tn::Amount: overflow in ") + op
		  ) { }
};

/** class Tn::Amount
 *
 * @brief represents an amount of tokens, in the
 * smallest token unit.
 *
 * @desc signed, because fees can be negative when
 * a mediator is paid to rebalance its channels.
 * Arithmetic throws Tn::AmountOverflow instead of
 * wrapping.
 */
class Amount {
private:
	std::int64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	/* Parses a decimal string, optionally negative.
	 * Throws std::invalid_argument on failure.  */
	explicit
	Amount(std::string const&);
	explicit
	operator std::string() const;
	static
	bool valid_string(std::string const&);

	static
	Amount of(std::int64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}
	std::int64_t to_int64() const { return v; }

	Amount& operator+=(Amount const& i) {
		auto r = std::int64_t();
		if (__builtin_add_overflow(v, i.v, &r))
			throw AmountOverflow("+");
		v = r;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i) {
		auto r = std::int64_t();
		if (__builtin_sub_overflow(v, i.v, &r))
			throw AmountOverflow("-");
		v = r;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}
	Amount operator-() const {
		return Amount() - *this;
	}

	bool operator==(Amount const& i) const { return v == i.v; }
	bool operator!=(Amount const& i) const { return v != i.v; }
	bool operator<(Amount const& i) const { return v < i.v; }
	bool operator>(Amount const& i) const { return v > i.v; }
	bool operator<=(Amount const& i) const { return v <= i.v; }
	bool operator>=(Amount const& i) const { return v >= i.v; }
};

std::ostream& operator<<(std::ostream&, Amount const&);

}

#endif /* !defined(TN_AMOUNT_HPP) */
