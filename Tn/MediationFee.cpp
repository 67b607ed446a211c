#include"Tn/FeeSchedule.hpp"
#include"Tn/MediationFee.hpp"

namespace Tn {

std::optional<Amount> MediationFee::entering_amount(Amount out) const {
	try {
		return solve(out);
	} catch (AmountOverflow const&) {
		/* No amount that fits can be charged.  */
		return std::nullopt;
	}
}

std::optional<Amount> MediationFee::solve(Amount out) const {
	auto out_fee = outgoing.outgoing_fee(outgoing_capacity, out);
	if (!out_fee)
		return std::nullopt;
	/* Tokens arriving over the incoming direction
	 * move the table position of that direction by
	 * the forwarded amount.  */
	auto in_imbalance = incoming.imbalance_fee(incoming_capacity, -out);
	if (!in_imbalance)
		return std::nullopt;

	auto mid = out + *out_fee;
	auto base = mid + incoming.get_flat() + *in_imbalance;

	auto x = mid;
	for (auto i = std::size_t(0); i < max_iterations; ++i) {
		auto next = base + incoming.proportional_fee(x);
		if (next == x) {
			if (x < Amount())
				return std::nullopt;
			return x;
		}
		x = next;
	}
	return std::nullopt;
}

}
