#ifndef TN_FEESCHEDULE_HPP
#define TN_FEESCHEDULE_HPP

#include"Tn/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<optional>
#include<stdexcept>
#include<utility>
#include<vector>

namespace Tn {

/* Thrown when constructing a FeeSchedule from bad
 * parameters.  */
class InvalidFeeSchedule
	: public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	InvalidFeeSchedule(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid fee schedule: " + msg
		  ) { }
};

/** class Tn::FeeSchedule
 *
 * @brief the fees one participant charges for moving
 * tokens through one direction of a channel.
 *
 * @desc a fee has three parts:
 *
 * - a flat fee per transfer.
 * - a proportional fee, in parts per million of the
 *   moved amount, rounded to the nearest unit with
 *   halves away from zero.
 * - an imbalance fee: the change of a piecewise-linear
 *   penalty function caused by the capacity shift.
 *
 * The penalty table is a list of (capacity, penalty)
 * breakpoints with strictly increasing capacities.
 * It is indexed by `x = last_capacity - capacity`, so
 * that a channel with more room to send sits further
 * left on the table.
 * Moving `a` out of the channel shifts `x` by `+a`,
 * moving `a` into it shifts `x` by `-a`.
 * A shift that leaves the closed interval covered by
 * the table makes the transfer infeasible.
 */
class FeeSchedule {
public:
	typedef std::pair<Amount, Amount> Breakpoint;

	/* Largest magnitude of a table capacity or penalty,
	 * so that interpolation is exact in 128 bits.  */
	static constexpr std::int64_t max_table_value
		= std::int64_t(1) << 62;

private:
	Amount flat;
	std::int64_t proportional;
	std::vector<Breakpoint> imbalance_penalty;

public:
	/* Zero-cost schedule.  */
	FeeSchedule() : flat(), proportional(0), imbalance_penalty() { }
	FeeSchedule(FeeSchedule const&) =default;
	FeeSchedule(FeeSchedule&&) =default;
	FeeSchedule& operator=(FeeSchedule const&) =default;
	FeeSchedule& operator=(FeeSchedule&&) =default;

	/* Throws InvalidFeeSchedule if the table has fewer
	 * than two points, non-increasing capacities or a
	 * value beyond max_table_value, or if the
	 * proportional rate is negative.  An empty table
	 * means no imbalance fee.  */
	FeeSchedule( Amount flat
		   , std::int64_t proportional
		   , std::vector<Breakpoint> imbalance_penalty = {}
		   );

	Amount get_flat() const { return flat; }
	std::int64_t get_proportional() const { return proportional; }
	std::vector<Breakpoint> const& get_imbalance_penalty() const {
		return imbalance_penalty;
	}
	bool is_zero() const {
		return flat == Amount() && proportional == 0
		    && imbalance_penalty.empty()
		     ;
	}

	/* round(proportional * amount / 1_000_000), computed
	 * exactly.  Throws Tn::AmountOverflow if the fee does
	 * not fit an Amount.  */
	Amount proportional_fee(Amount amount) const;

	/* Interpolated penalty at table position x, or
	 * nothing if x is outside the table.  Zero everywhere
	 * if there is no table.  */
	std::optional<double> penalty_at(Amount x) const;

	/* Rounded change of the penalty when the capacity
	 * `capacity` shifts table position by `shift`.
	 * Nothing if either position is outside the table,
	 * or if the change does not fit an Amount.  */
	std::optional<Amount> imbalance_fee(Amount capacity, Amount shift) const;

	/* Fee for sending `amount` out through this
	 * direction, which currently has `capacity`.
	 * Throws Tn::AmountOverflow if the sum overflows.  */
	std::optional<Amount> outgoing_fee(Amount capacity, Amount amount) const;

	bool operator==(FeeSchedule const& o) const {
		return flat == o.flat && proportional == o.proportional
		    && imbalance_penalty == o.imbalance_penalty
		     ;
	}
	bool operator!=(FeeSchedule const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(TN_FEESCHEDULE_HPP) */
