#ifndef TN_MEDIATIONFEE_HPP
#define TN_MEDIATIONFEE_HPP

#include"Tn/Amount.hpp"
#include<cstddef>
#include<optional>

namespace Tn { class FeeSchedule; }

namespace Tn {

/** Tn::MediationFee
 *
 * @brief computes how much a mediator must receive
 * so that, after its fees, exactly a given amount
 * leaves toward the next hop.
 *
 * @desc a mediator charges twice: on the direction
 * back toward the previous hop (incoming) and on the
 * direction toward the next hop (outgoing).
 * Both schedules and capacities are the mediator's
 * own.
 */
class MediationFee {
public:
	/* Refinement steps before giving up.  */
	static constexpr std::size_t max_iterations = 100;

	MediationFee( FeeSchedule const& incoming
		    , Amount incoming_capacity
		    , FeeSchedule const& outgoing
		    , Amount outgoing_capacity
		    ) : incoming(incoming)
		      , incoming_capacity(incoming_capacity)
		      , outgoing(outgoing)
		      , outgoing_capacity(outgoing_capacity)
		      { }

	/** Tn::MediationFee::entering_amount
	 *
	 * @brief returns the amount that must enter the
	 * mediator for `out` to leave it, or nothing if
	 * no such amount exists.
	 *
	 * @desc the incoming proportional fee applies to
	 * the entering amount itself, so this is solved by
	 * fixed-point refinement, starting from `out` plus
	 * the outgoing fee.
	 * Nothing is returned if an imbalance shift leaves
	 * a penalty table, if the refinement does not
	 * settle within `max_iterations` steps, if the
	 * result is negative, or if any step overflows.
	 */
	std::optional<Amount> entering_amount(Amount out) const;

private:
	/* entering_amount, but overflow throws.  */
	std::optional<Amount> solve(Amount out) const;

	FeeSchedule const& incoming;
	Amount incoming_capacity;
	FeeSchedule const& outgoing;
	Amount outgoing_capacity;
};

}

#endif /* !defined(TN_MEDIATIONFEE_HPP) */
