#ifndef TN_REACHABILITY_HPP
#define TN_REACHABILITY_HPP

#include<string>

namespace Tn {

/* Liveness of a participant, as reported by the
 * transport.  */
enum class Reachability
{ Unknown
, Reachable
, Unreachable
};

/* "reachable", "unreachable" or "unknown".
 * Throws std::invalid_argument for other strings.  */
Reachability reachability_from_string(std::string const&);
char const* to_string(Reachability);

}

#endif /* !defined(TN_REACHABILITY_HPP) */
