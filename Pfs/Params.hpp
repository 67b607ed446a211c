#ifndef PFS_PARAMS_HPP
#define PFS_PARAMS_HPP

#include"Tn/Address.hpp"
#include"Tn/Amount.hpp"
#include"Tn/FeeSchedule.hpp"
#include<cstdint>
#include<optional>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Pfs {

/** Pfs::Params
 *
 * @brief typed access to fields of JSON-RPC `params`
 * objects.
 *
 * @desc every getter throws `std::invalid_argument`
 * (or a subclass) naming the field if the field is
 * missing or has the wrong shape.
 * Amounts may be given as JSON integers or as decimal
 * strings, so that values above 2^53 survive clients
 * that use doubles.
 */
namespace Params {

/* Throws unless params is an object.  */
void require_object(Jsmn::Object const& params);

bool has(Jsmn::Object const& params, std::string const& key);

Tn::Address address(Jsmn::Object const& params, std::string const& key);
Tn::Amount amount(Jsmn::Object const& params, std::string const& key);
/* Like amount, but must not be negative.  */
std::uint64_t uint(Jsmn::Object const& params, std::string const& key);
std::string string(Jsmn::Object const& params, std::string const& key);

/* An array of [capacity, penalty] pairs; empty if the
 * field is missing or null.  */
std::vector<Tn::FeeSchedule::Breakpoint>
penalty_table(Jsmn::Object const& params, std::string const& key);

}

}

#endif /* !defined(PFS_PARAMS_HPP) */
