#include"Tn/FeeSchedule.hpp"
#include"Util/Str.hpp"
#include<limits>

namespace {

/* Wide enough for the product of any two table or
 * amount values.  */
typedef __int128 Wide;

Wide const ppm = 1000000;

Wide abs_wide(Wide x) { return x < 0 ? -x : x; }

/* n / d rounded to nearest, halves away from zero.
 * d must be positive.  */
Wide round_div(Wide n, Wide d) {
	auto q = n / d;
	auto r = n % d;
	if (2 * abs_wide(r) >= d)
		q += (n < 0) ? -1 : 1;
	return q;
}

bool fits_int64(Wide x) {
	return x >= std::numeric_limits<std::int64_t>::min()
	    && x <= std::numeric_limits<std::int64_t>::max()
	     ;
}

/* Exact interpolated penalty: whole + rem / den, with
 * 0 <= rem < den.  */
struct Penalty {
	Wide whole;
	Wide rem;
	Wide den;
};

}

namespace Tn {

FeeSchedule::FeeSchedule( Amount flat_
			, std::int64_t proportional_
			, std::vector<Breakpoint> imbalance_penalty_
			) : flat(flat_)
			  , proportional(proportional_)
			  , imbalance_penalty(std::move(imbalance_penalty_))
			  {
	if (proportional < 0)
		throw InvalidFeeSchedule("negative proportional fee");
	if (imbalance_penalty.empty())
		return;
	if (imbalance_penalty.size() < 2)
		throw InvalidFeeSchedule(
			"imbalance penalty needs at least two points"
		);
	auto const bound = Amount::of(max_table_value);
	for (auto const& b : imbalance_penalty) {
		if ( b.first < -bound || b.first > bound
		  || b.second < -bound || b.second > bound
		   )
			throw InvalidFeeSchedule(Util::Str::fmt(
				"imbalance penalty point (%s, %s) out of range"
				, std::string(b.first).c_str()
				, std::string(b.second).c_str()
			));
	}
	for (auto i = std::size_t(1); i < imbalance_penalty.size(); ++i) {
		auto const& prev = imbalance_penalty[i - 1].first;
		auto const& cur = imbalance_penalty[i].first;
		if (cur <= prev)
			throw InvalidFeeSchedule(Util::Str::fmt(
				"imbalance penalty capacities must increase, "
				"got %s after %s"
				, std::string(cur).c_str()
				, std::string(prev).c_str()
			));
	}
}

Amount FeeSchedule::proportional_fee(Amount amount) const {
	auto fee = round_div( Wide(proportional) * amount.to_int64()
			    , ppm
			    );
	if (!fits_int64(fee))
		throw AmountOverflow("proportional fee");
	return Amount::of(std::int64_t(fee));
}

namespace {

std::optional<Penalty>
penalty_at_position( std::vector<FeeSchedule::Breakpoint> const& table
		   , Wide x
		   ) {
	if (table.empty())
		return Penalty{0, 0, 1};
	if (x < table.front().first.to_int64())
		return std::nullopt;
	if (x > table.back().first.to_int64())
		return std::nullopt;

	auto i = std::size_t(1);
	while (table[i].first.to_int64() < x)
		++i;
	auto x0 = Wide(table[i - 1].first.to_int64());
	auto y0 = Wide(table[i - 1].second.to_int64());
	auto x1 = Wide(table[i].first.to_int64());
	auto y1 = Wide(table[i].second.to_int64());

	auto den = x1 - x0;
	auto num = (y1 - y0) * (x - x0);
	auto q = num / den;
	auto r = num % den;
	if (r < 0) {
		q -= 1;
		r += den;
	}
	return Penalty{y0 + q, r, den};
}

}

std::optional<double> FeeSchedule::penalty_at(Amount x) const {
	auto p = penalty_at_position(imbalance_penalty, x.to_int64());
	if (!p)
		return std::nullopt;
	return double(p->whole) + double(p->rem) / double(p->den);
}

std::optional<Amount>
FeeSchedule::imbalance_fee(Amount capacity, Amount shift) const {
	if (imbalance_penalty.empty())
		return Amount();
	auto x = Wide(imbalance_penalty.back().first.to_int64())
	       - capacity.to_int64()
	       ;
	auto before = penalty_at_position(imbalance_penalty, x);
	auto after = penalty_at_position(imbalance_penalty, x + shift.to_int64());
	if (!before || !after)
		return std::nullopt;

	/* after - before = whole + num / den, |num| < den.  */
	auto whole = after->whole - before->whole;
	auto num = after->rem * before->den - before->rem * after->den;
	auto den = after->den * before->den;
	if (whole > 0 && num < 0) {
		whole -= 1;
		num += den;
	} else if (whole < 0 && num > 0) {
		whole += 1;
		num -= den;
	}
	if (2 * abs_wide(num) >= den)
		whole += (num < 0) ? -1 : 1;

	if (!fits_int64(whole))
		return std::nullopt;
	return Amount::of(std::int64_t(whole));
}

std::optional<Amount>
FeeSchedule::outgoing_fee(Amount capacity, Amount amount) const {
	auto imbalance = imbalance_fee(capacity, amount);
	if (!imbalance)
		return std::nullopt;
	return flat + proportional_fee(amount) + *imbalance;
}

}
